#include "witkit/common/unsupported_error.hpp"

#include <string>
#include <utility>

#include <fmt/core.h>

namespace witkit::common {

UnsupportedTypeError::UnsupportedTypeError(std::string tag)
    : tag_(std::move(tag)),
      message_(fmt::format("Unsupported type: {}", tag_)) {
}

}  // namespace witkit::common
