#include "log_scan/errors.hpp"
#include <cstring>

namespace lscan {

const char* to_string(ConfigErrc c) noexcept {
  switch (c) {
    case ConfigErrc::MissingFilename:           return "MissingFilename";
    case ConfigErrc::InvalidFilterType:         return "InvalidFilterType";
    case ConfigErrc::InvalidMapperType:         return "InvalidMapperType";
    case ConfigErrc::InvalidFieldSpecification: return "InvalidFieldSpecification";
    case ConfigErrc::MissingBound:              return "MissingBound";
    case ConfigErrc::InvalidBound:              return "InvalidBound";
  }
  return "Unknown";
}

ConfigError::ConfigError(ConfigErrc code, const std::string& detail)
  : Error(std::string(to_string(code)) + ": " + detail), code_(code) {}

DecodeError::DecodeError(std::uint64_t line, const std::string& detail)
  : Error("line " + std::to_string(line) + ": " + detail), line_(line) {}

SourceError::SourceError(const std::string& path, int err)
  : Error("cannot read '" + path + "': " + std::strerror(err)), err_(err) {}

}
