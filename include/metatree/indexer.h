#pragma once

#include <metatree/models.h>

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace metatree {

using FlatMetadata = std::map<std::string, std::string>;

// Turns the extracted metadata of a record into a string-keyed mapping for
// search engines.
class Indexer {
public:
  virtual ~Indexer() = default;
  virtual FlatMetadata Index(const MetadataRecord &record) = 0;
};

// Nested objects become dotted keys, array elements are keyed by position:
//   {"a": {"b": [1, "x"]}}  ->  a.b.0 = 1, a.b.1 = x
// Strings are kept unquoted, other scalars in their JSON form. A scalar
// document is stored under the key "value".
class FlatIndexer : public Indexer {
public:
  explicit FlatIndexer(std::string separator = ".");

  FlatMetadata Index(const MetadataRecord &record) override;

private:
  void Flatten(const nlohmann::json &value, const std::string &key,
               FlatMetadata &target) const;

  std::string separator_;
};

} // namespace metatree
