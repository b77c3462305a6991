#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "excode/core/types.hpp"

namespace excode::app {

struct Config {
  size_t min_distance{0};
  size_t digit_count{0};
  std::vector<GroupSpec> groups;

  std::optional<uint64_t> seed;
  std::vector<std::filesystem::path> existing;
  std::filesystem::path output_dir{"."};

  uint32_t threads{1};
  uint64_t max_failures{0};
  bool quiet{false};

  std::string executable_path;
};

struct RunSummary {
  uint64_t seed{0};
  std::vector<std::filesystem::path> files;
  std::vector<uint64_t> digests;
};

}  // namespace excode::app
