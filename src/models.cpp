#include <metatree/models.h>

#include <stdexcept>

namespace metatree {

std::string ToString(RecordType type) {
  switch (type) {
  case RecordType::kDataset:
    return "dataset";
  case RecordType::kFile:
    return "file";
  }
  return "unknown";
}

RecordType ParseRecordType(std::string_view text) {
  if (text == "dataset") {
    return RecordType::kDataset;
  }
  if (text == "file") {
    return RecordType::kFile;
  }
  throw std::invalid_argument("Unknown record type: " + std::string(text));
}

std::string ToString(EntryKind kind) {
  return kind == EntryKind::kDataset ? "dataset" : "file";
}

bool ObjectRef::IsValidHex(std::string_view hex) {
  if (hex.size() != kHexLength) {
    return false;
  }
  for (const auto character : hex) {
    const bool digit = character >= '0' && character <= '9';
    const bool lower = character >= 'a' && character <= 'f';
    if (!digit && !lower) {
      return false;
    }
  }
  return true;
}

ObjectRef ObjectRef::FromHex(std::string_view hex) {
  if (!IsValidHex(hex)) {
    throw std::invalid_argument("Not an object reference: '" +
                                std::string(hex) + "'");
  }
  return ObjectRef(std::string(hex));
}

} // namespace metatree
