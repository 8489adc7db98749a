#pragma once

#include <stdexcept>
#include <string>

namespace idsync::util {

/*
  Central error types.

  Everything the engine rejects up front is a ConfigurationError; nothing
  in here is retried internally.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingColumn : public ConfigurationError {
 public:
  MissingColumn(const std::string& provider, const std::string& column)
      : ConfigurationError("provider " + provider + " is missing required column `" + column + "`"), column_(column) {
  }

  const std::string& column() const {
    return column_;
  }

 private:
  std::string column_;
};

class DuplicateProvider : public ConfigurationError {
 public:
  explicit DuplicateProvider(const std::string& provider)
      : ConfigurationError("provider tag `" + provider + "` appears more than once") {
  }
};

} // namespace idsync::util
