#pragma once

#include <tl/expected.hpp>

#include "excode/core/error.hpp"

namespace excode {

template <class T>
using Expected = tl::expected<T, Error>;

}  // namespace excode
