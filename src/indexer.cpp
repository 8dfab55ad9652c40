#include <metatree/indexer.h>

#include <stdexcept>
#include <utility>

namespace metatree {

FlatIndexer::FlatIndexer(std::string separator)
    : separator_(std::move(separator)) {
  if (separator_.empty()) {
    throw std::invalid_argument("Index key separator cannot be empty");
  }
}

FlatMetadata FlatIndexer::Index(const MetadataRecord &record) {
  FlatMetadata flat;
  Flatten(record.extracted_metadata, "", flat);
  return flat;
}

void FlatIndexer::Flatten(const nlohmann::json &value, const std::string &key,
                          FlatMetadata &target) const {
  const auto child_key = [&](const std::string &name) {
    return key.empty() ? name : key + separator_ + name;
  };

  if (value.is_object()) {
    for (const auto &[name, child] : value.items()) {
      Flatten(child, child_key(name), target);
    }
    return;
  }
  if (value.is_array()) {
    for (std::size_t i = 0; i < value.size(); ++i) {
      Flatten(value[i], child_key(std::to_string(i)), target);
    }
    return;
  }
  const auto name = key.empty() ? std::string("value") : key;
  target[name] = value.is_string() ? value.get<std::string>() : value.dump();
}

} // namespace metatree
