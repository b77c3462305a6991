#include "excode/distance/distance.hpp"

#include <algorithm>
#include <format>

#include "excode/core/error.hpp"

namespace excode {

size_t hamming_distance(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    throw Error{ErrorCode::InvalidArgument,
                std::format("hamming distance needs equal lengths: '{}' has {}, '{}' has {}",
                            a, a.size(), b, b.size())};
  }
  size_t diff = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i] != b[i]) {
      ++diff;
    }
  }
  return diff;
}

bool is_admissible(std::string_view candidate,
                   std::span<const Code> accepted,
                   size_t min_distance) {
  if (min_distance == 0) {
    return true;
  }
  return std::all_of(accepted.begin(), accepted.end(), [&](const Code& c) {
    return hamming_distance(candidate, c) >= min_distance;
  });
}

}  // namespace excode
