#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "excode/core/expected.hpp"
#include "excode/core/types.hpp"

namespace excode::app {

struct WrittenFile {
  std::filesystem::path path{};
  size_t lines{0};
  uint64_t digest{0};
};

// XXH64 of `bytes` with seed 0.
uint64_t fingerprint(std::string_view bytes);

// Writes one group's codes to <output_dir>/prefix_<P>.txt.
class CodeFileSink {
 public:
  explicit CodeFileSink(std::filesystem::path output_dir);

  static std::string file_name_for(std::string_view prefix);
  std::filesystem::path path_for(std::string_view prefix) const;

  Expected<void> ensure_output_dir() const;
  Expected<WrittenFile> write(std::string_view prefix, std::span<const Code> codes) const;

 private:
  std::filesystem::path output_dir_;
};

// Reads a previously written code file, one code per line.
Expected<std::vector<Code>> read_code_file(const std::filesystem::path& path);

}  // namespace excode::app
