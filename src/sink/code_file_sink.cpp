#include "sink/code_file_sink.hpp"

#include <format>
#include <fstream>
#include <system_error>
#include <utility>

#include <xxhash.h>

namespace excode::app {

uint64_t fingerprint(std::string_view bytes) {
  return XXH64(bytes.data(), bytes.size(), 0);
}

CodeFileSink::CodeFileSink(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {}

std::string CodeFileSink::file_name_for(std::string_view prefix) {
  return std::format("prefix_{}.txt", prefix);
}

std::filesystem::path CodeFileSink::path_for(std::string_view prefix) const {
  return output_dir_ / file_name_for(prefix);
}

Expected<void> CodeFileSink::ensure_output_dir() const {
  if (output_dir_.empty()) {
    return {};
  }
  std::error_code ec;
  std::filesystem::create_directories(output_dir_, ec);
  if (ec) {
    return tl::make_unexpected(Error{
        ErrorCode::IoError,
        std::format("cannot create output directory {}: {}", output_dir_.string(), ec.message())});
  }
  return {};
}

Expected<WrittenFile> CodeFileSink::write(std::string_view prefix,
                                          std::span<const Code> codes) const {
  std::string body;
  for (const auto& c : codes) {
    body += c;
    body += '\n';
  }

  WrittenFile out{};
  out.path = path_for(prefix);
  out.lines = codes.size();
  out.digest = fingerprint(body);

  std::ofstream f(out.path, std::ios::binary | std::ios::trunc);
  if (!f) {
    return tl::make_unexpected(
        Error{ErrorCode::IoError, std::format("cannot create {}", out.path.string())});
  }
  f.write(body.data(), static_cast<std::streamsize>(body.size()));
  f.close();
  if (!f) {
    return tl::make_unexpected(
        Error{ErrorCode::IoError, std::format("write failed for {}", out.path.string())});
  }
  return out;
}

Expected<std::vector<Code>> read_code_file(const std::filesystem::path& path) {
  std::ifstream f(path);
  if (!f) {
    return tl::make_unexpected(
        Error{ErrorCode::IoError, std::format("cannot open {}", path.string())});
  }
  std::vector<Code> out;
  std::string line;
  while (std::getline(f, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    out.push_back(line);
  }
  if (f.bad()) {
    return tl::make_unexpected(
        Error{ErrorCode::IoError, std::format("read failed for {}", path.string())});
  }
  return out;
}

}  // namespace excode::app
