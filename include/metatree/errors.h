#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace metatree {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// An object, index or dataset that was asked for does not exist.
class NotFoundError : public Error {
public:
  using Error::Error;
};

// Stored state contradicts itself: digest collision, dangling reference,
// unreadable index snapshot, unsupported layout version.
class ConsistencyError : public Error {
public:
  using Error::Error;
};

// Unknown component name, missing or malformed component parameter.
class ConfigurationError : public Error {
public:
  using Error::Error;
};

// An extractor process failed, exited non-zero or timed out.
class ExternalFailure : public Error {
public:
  using Error::Error;
};

class MetadataKeyError : public Error {
public:
  MetadataKeyError(const std::string &message, std::vector<std::string> keys)
      : Error(FormatMessage(message, keys)), keys_(std::move(keys)) {}

  const std::vector<std::string> &Keys() const { return keys_; }

private:
  static std::string FormatMessage(const std::string &message,
                                   const std::vector<std::string> &keys) {
    if (keys.empty()) {
      return message;
    }
    std::string text = message + ": ";
    for (std::size_t i = 0; i < keys.size(); ++i) {
      text += keys[i];
      if (i + 1 < keys.size()) {
        text += ", ";
      }
    }
    return text;
  }

  std::vector<std::string> keys_;
};

} // namespace metatree
