#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "app/cli_runner.hpp"
#include "excode/distance/distance.hpp"

namespace {

namespace fs = std::filesystem;

int run(std::vector<std::string> args) {
  args.insert(args.begin(), "excode");
  std::vector<char*> argv;
  for (auto& a : args) {
    argv.push_back(a.data());
  }
  return run_cli_impl(static_cast<int>(argv.size()), argv.data());
}

std::vector<std::string> read_lines(const fs::path& p) {
  std::vector<std::string> out;
  std::ifstream f(p);
  std::string line;
  while (std::getline(f, line)) {
    out.push_back(line);
  }
  return out;
}

std::string slurp(const fs::path& p) {
  std::ifstream f(p, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

bool check_codes(const std::vector<std::string>& codes,
                 const std::string& prefix,
                 size_t digits,
                 size_t min_distance) {
  for (const auto& c : codes) {
    if (c.size() != prefix.size() + digits || c.rfind(prefix, 0) != 0) {
      std::cerr << std::format("code '{}' is not '{}' + {} digits\n", c, prefix, digits);
      return false;
    }
    for (size_t i = prefix.size(); i < c.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(c[i]))) {
        std::cerr << std::format("code '{}' has a non-digit\n", c);
        return false;
      }
    }
  }
  for (size_t i = 0; i < codes.size(); ++i) {
    for (size_t j = i + 1; j < codes.size(); ++j) {
      if (excode::hamming_distance(codes[i], codes[j]) < min_distance) {
        std::cerr << std::format("{} and {} closer than {}\n", codes[i], codes[j], min_distance);
        return false;
      }
    }
  }
  return true;
}

bool test_default_group(const fs::path& root) {
  const auto dir = root / "default";
  const int rc = run({"--quiet", "--seed", "7", "--output-dir", dir.string(), "3", "5"});
  if (rc != 0) {
    std::cerr << std::format("expected exit 0, got {}\n", rc);
    return false;
  }
  const auto lines = read_lines(dir / "prefix_.txt");
  if (lines.size() != 100) {
    std::cerr << std::format("expected 100 lines in prefix_.txt, got {}\n", lines.size());
    return false;
  }
  const std::string body = slurp(dir / "prefix_.txt");
  if (body.empty() || body.back() != '\n') {
    std::cerr << std::format("prefix_.txt is not newline-terminated\n");
    return false;
  }
  return check_codes(lines, "", 5, 3);
}

bool test_multi_group(const fs::path& root) {
  const auto dir = root / "multi";
  const int rc =
      run({"--quiet", "--seed", "11", "--output-dir", dir.string(), "3", "6", "S0:10", "P0:10"});
  if (rc != 0) {
    std::cerr << std::format("expected exit 0, got {}\n", rc);
    return false;
  }
  for (const std::string prefix : {"S0", "P0"}) {
    const auto lines = read_lines(dir / std::format("prefix_{}.txt", prefix));
    if (lines.size() != 10) {
      std::cerr << std::format("expected 10 lines for {}, got {}\n", prefix, lines.size());
      return false;
    }
    if (!check_codes(lines, prefix, 6, 3)) {
      return false;
    }
  }
  return true;
}

bool test_help_writes_nothing(const fs::path& root) {
  const auto dir = root / "help";
  const int rc = run({"--output-dir", dir.string(), "--help"});
  if (rc != 0 || fs::exists(dir)) {
    std::cerr << std::format("--help should exit 0 without output, got {}\n", rc);
    return false;
  }
  return true;
}

bool test_bad_arguments_write_nothing(const fs::path& root) {
  const auto dir = root / "bad";
  const std::vector<std::vector<std::string>> cases = {
      {"--quiet", "--output-dir", dir.string(), "x", "5"},
      {"--quiet", "--output-dir", dir.string(), "3", "5", "A:zz"},
      {"--quiet", "--output-dir", dir.string(), "3", "0"},
  };
  for (const auto& args : cases) {
    const int rc = run(args);
    if (rc != 2) {
      std::cerr << std::format("expected exit 2 for malformed arguments, got {}\n", rc);
      return false;
    }
    if (fs::exists(dir)) {
      std::cerr << std::format("malformed arguments created output\n");
      return false;
    }
  }

  const int rc = run({"--quiet", "--output-dir", dir.string(), "--existing",
                      (root / "no_such_file.txt").string(), "3", "5"});
  if (rc != 1 || fs::exists(dir)) {
    std::cerr << std::format("missing --existing file should exit 1 before output, got {}\n", rc);
    return false;
  }
  return true;
}

bool test_parallel_matches_sequential(const fs::path& root) {
  const auto seq = root / "seq";
  const auto par = root / "par";
  const std::vector<std::string> groups{"S0:20", "P0:20", "S1:20", "P1:5"};

  std::vector<std::string> a{"--quiet", "--seed", "99", "--output-dir", seq.string(), "3", "6"};
  std::vector<std::string> b{"--quiet", "--seed", "99", "--threads", "3",
                             "--output-dir", par.string(), "3", "6"};
  a.insert(a.end(), groups.begin(), groups.end());
  b.insert(b.end(), groups.begin(), groups.end());

  if (run(a) != 0 || run(b) != 0) {
    std::cerr << std::format("generation failed\n");
    return false;
  }
  for (const std::string prefix : {"S0", "P0", "S1", "P1"}) {
    const auto name = std::format("prefix_{}.txt", prefix);
    if (slurp(seq / name) != slurp(par / name) || slurp(seq / name).empty()) {
      std::cerr << std::format("{} differs between sequential and parallel runs\n", name);
      return false;
    }
  }
  return true;
}

bool test_existing_codes_avoided(const fs::path& root) {
  const auto first = root / "first";
  const auto second = root / "second";
  if (run({"--quiet", "--seed", "1", "--output-dir", first.string(), "3", "5", "S0:30"}) != 0) {
    std::cerr << std::format("first run failed\n");
    return false;
  }
  if (run({"--quiet", "--seed", "2", "--output-dir", second.string(), "--existing",
           (first / "prefix_S0.txt").string(), "3", "5", "S0:30"}) != 0) {
    std::cerr << std::format("second run failed\n");
    return false;
  }
  auto all = read_lines(first / "prefix_S0.txt");
  const auto more = read_lines(second / "prefix_S0.txt");
  if (more.size() != 30) {
    std::cerr << std::format("expected 30 new codes, got {}\n", more.size());
    return false;
  }
  all.insert(all.end(), more.begin(), more.end());
  return check_codes(all, "S0", 5, 3);
}

bool test_stall_limit(const fs::path& root) {
  const auto dir = root / "stall";
  const int rc =
      run({"--quiet", "--seed", "5", "--max-failures", "20000", "--output-dir", dir.string(), "1",
           "1", ":11"});
  if (rc != 3) {
    std::cerr << std::format("expected exit 3 for an impossible request, got {}\n", rc);
    return false;
  }
  if (fs::exists(dir / "prefix_.txt")) {
    std::cerr << std::format("an unfinished group must not be written\n");
    return false;
  }
  return true;
}

bool test_repeated_prefix_rejected(const fs::path& root) {
  const auto dir = root / "repeated";
  for (const std::string threads : {"1", "2"}) {
    const int rc = run({"--quiet", "--threads", threads, "--output-dir", dir.string(), "3", "5",
                        "A:5", "A:10"});
    if (rc != 2 || fs::exists(dir)) {
      std::cerr << std::format("repeated prefix should exit 2 without output, got {}\n", rc);
      return false;
    }
  }
  return true;
}

// Counts far beyond what fits in memory must not be allocated up front; with a
// rejection limit they end like any other unreachable request.
bool test_huge_count_stalls_cleanly(const fs::path& root) {
  const auto dir = root / "huge";
  for (const std::string count : {":1000000000000", ":18446744073709551615"}) {
    const int rc =
        run({"--quiet", "--max-failures", "1000", "--output-dir", dir.string(), "1", "1", count});
    if (rc != 3) {
      std::cerr << std::format("count {} should stall with exit 3, got {}\n", count, rc);
      return false;
    }
  }
  return true;
}

bool test_infeasible_distance_warns(const fs::path& root) {
  const auto dir = root / "warn";
  std::ostringstream captured;
  auto* old = std::cerr.rdbuf(captured.rdbuf());
  const int rc =
      run({"--quiet", "--max-failures", "100", "--output-dir", dir.string(), "9", "2", "Q:2"});
  std::cerr.rdbuf(old);

  if (rc != 3) {
    std::cerr << std::format("expected exit 3 for distance 9 on 3-character codes, got {}\n", rc);
    return false;
  }
  const std::string text = captured.str();
  if (text.find("[warn] prefix 'Q'") == std::string::npos) {
    std::cerr << std::format("missing infeasibility warning, stderr was:\n{}", text);
    return false;
  }
  return true;
}

}  // namespace

int main() {
  const auto root = fs::temp_directory_path() / "excode_cli_tests";
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root);

  int rc = 0;
  if (!test_default_group(root) || !test_multi_group(root) || !test_help_writes_nothing(root) ||
      !test_bad_arguments_write_nothing(root) || !test_parallel_matches_sequential(root) ||
      !test_existing_codes_avoided(root) || !test_stall_limit(root) ||
      !test_repeated_prefix_rejected(root) || !test_huge_count_stalls_cleanly(root) ||
      !test_infeasible_distance_warns(root)) {
    rc = 1;
  }

  fs::remove_all(root, ec);
  return rc;
}
