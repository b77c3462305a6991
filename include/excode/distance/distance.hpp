#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "excode/core/types.hpp"

namespace excode {

// Number of positions at which `a` and `b` differ. Both must have the same
// length; otherwise throws Error{ErrorCode::InvalidArgument}.
size_t hamming_distance(std::string_view a, std::string_view b);

// True when `candidate` is at least `min_distance` away from every code in
// `accepted`. Stops at the first code that is too close.
bool is_admissible(std::string_view candidate,
                   std::span<const Code> accepted,
                   size_t min_distance);

}  // namespace excode
