#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace excode {

// A generated code: prefix followed by a fixed number of decimal digits.
using Code = std::string;

struct GroupSpec {
  std::string prefix{};
  size_t count{};
};

struct GenerationParams {
  size_t digit_count{1};
  size_t min_distance{0};
  // Consecutive rejections tolerated before giving up; 0 means never give up.
  uint64_t max_consecutive_failures{0};
};

struct GroupResult {
  std::vector<Code> codes{};
  uint64_t attempts{};
  uint64_t rejections{};
};

}  // namespace excode
