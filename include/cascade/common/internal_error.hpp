#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace cascade::common {

// Exception type for internal cascade errors (library bugs, not user errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in cascade, not in the calling code.",
                context, detail)) {
  }
};

}  // namespace cascade::common
