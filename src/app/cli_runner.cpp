#include "app/cli_runner.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <argparse/argparse.hpp>

#include "app/math_utils.hpp"
#include "excode/core/error.hpp"
#include "excode/core/rng.hpp"
#include "excode/generator/generator.hpp"
#include "sink/code_file_sink.hpp"
#include "sink/console_progress.hpp"

namespace {

using excode::Code;
using excode::Error;
using excode::ErrorCode;
using excode::GroupSpec;
using excode::app::CodeFileSink;
using excode::app::Config;
using excode::app::RunSummary;
using excode::app::WrittenFile;

template <typename T>
using Result = excode::Expected<T>;

using Say = std::function<void(const std::string&)>;

bool has_help_flag(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      return true;
    }
  }
  return false;
}

void print_cli_help(const std::string& exe_path) {
  const std::string exe = exe_path.empty() ? "excode" : exe_path;
  std::cout << "Usage:\n"
            << "  " << exe << " [options] <min_hamming_distance> <digit_count> [<prefix>:<count> ...]\n\n"
            << "Generates random numeric codes such that any two codes written to the same\n"
            << "file differ in at least <min_hamming_distance> character positions.\n\n"
            << "Positional arguments:\n"
            << "  <min_hamming_distance>          Minimum number of differing characters\n"
            << "  <digit_count>                   Digits per code, after the prefix (>= 1)\n"
            << "  <prefix>:<count>                Generate <count> codes starting with <prefix>,\n"
            << "                                  stored in prefix_<prefix>.txt. A bare <count>\n"
            << "                                  means no prefix. Default: 100 codes, no prefix\n\n"
            << "Options:\n"
            << "  --seed <u64>                    Seed for a reproducible list (default: random)\n"
            << "  --existing <path>               Codes to stay away from, one per line; may repeat\n"
            << "  --output-dir <path>             Directory for output files (default: .)\n"
            << "  --threads <u32>                 Groups generated in parallel (default: 1)\n"
            << "  --max-failures <u64>            Give up after this many rejections in a row;\n"
            << "                                  0 retries forever (default: 0)\n"
            << "  --quiet                         No progress or informational output\n\n"
            << "Help:\n"
            << "  -h, --help                      Show this help and exit\n\n"
            << "Progress prints '+' for each accepted code and '.' for each rejected candidate.\n"
            << "A request that cannot be satisfied keeps printing '.' until interrupted,\n"
            << "unless --max-failures is set.\n\n"
            << "Examples:\n"
            << "  " << exe << " 3 5\n"
            << "  " << exe << " 3 6 S0:600 P0:250 S1:100 P1:50\n"
            << "  " << exe << " --seed 42 --existing prefix_S0.txt 3 6 S0:200\n";
}

size_t code_length(const Config& cfg, const GroupSpec& g) {
  return g.prefix.size() + cfg.digit_count;
}

void warn_if_infeasible(const Config& cfg) {
  for (const auto& g : cfg.groups) {
    const size_t len = code_length(cfg, g);
    if (g.count > 1 && cfg.min_distance > len) {
      std::cerr << std::format(
          "[warn] prefix '{}': minimum distance {} exceeds code length {}; "
          "no two codes can be found\n",
          g.prefix, cfg.min_distance, len);
    }
  }
}

Result<WrittenFile> generate_and_write(const Config& cfg,
                                       size_t index,
                                       uint64_t seed,
                                       std::span<const Code> reserved,
                                       const CodeFileSink& sink,
                                       excode::IProgressSink& progress,
                                       const Say& say) {
  const GroupSpec& g = cfg.groups[index];
  say(std::format("Processing prefix {} trying to find {}.", g.prefix, g.count));

  excode::GenerationParams params{};
  params.digit_count = cfg.digit_count;
  params.min_distance = cfg.min_distance;
  params.max_consecutive_failures = cfg.max_failures;

  excode::Rng rng(excode::app::mix_seed(seed, index));
  excode::CodeGenerator gen(params, rng, progress);
  gen.set_reserved(std::vector<Code>(reserved.begin(), reserved.end()));

  auto res = gen.generate(g);
  if (!res) {
    return tl::make_unexpected(res.error());
  }

  auto file = sink.write(g.prefix, res->codes);
  if (!file) {
    return tl::make_unexpected(file.error());
  }
  say(std::format("\nWrote {} ({} codes, xxh64={:016x})", file->path.string(), file->lines,
                  file->digest));
  return file;
}

// Failures that surface as exceptions (allocation for huge requests, for
// instance) are turned into errors so the CLI can report them.
Result<WrittenFile> run_one_group(const Config& cfg,
                                  size_t index,
                                  uint64_t seed,
                                  std::span<const Code> reserved,
                                  const CodeFileSink& sink,
                                  excode::IProgressSink& progress,
                                  const Say& say) {
  try {
    return generate_and_write(cfg, index, seed, reserved, sink, progress, say);
  } catch (const Error& e) {
    return tl::make_unexpected(e);
  } catch (const std::exception& ex) {
    return tl::make_unexpected(Error{
        ErrorCode::Internal,
        std::format("prefix '{}': {}", cfg.groups[index].prefix, ex.what())});
  }
}

Result<std::vector<WrittenFile>> run_sequential(const Config& cfg,
                                                uint64_t seed,
                                                std::span<const Code> reserved,
                                                const CodeFileSink& sink,
                                                excode::IProgressSink& progress,
                                                const Say& say) {
  std::vector<WrittenFile> out;
  for (size_t i = 0; i < cfg.groups.size(); ++i) {
    auto file = run_one_group(cfg, i, seed, reserved, sink, progress, say);
    if (!file) {
      return tl::make_unexpected(file.error());
    }
    out.push_back(*file);
  }
  return out;
}

Result<std::vector<WrittenFile>> run_parallel(const Config& cfg,
                                              uint64_t seed,
                                              std::span<const Code> reserved,
                                              const CodeFileSink& sink,
                                              excode::IProgressSink& progress,
                                              const Say& say) {
  const size_t n = cfg.groups.size();
  std::vector<std::optional<Error>> failures(n);
  std::vector<WrittenFile> written(n);
  std::atomic<size_t> next{0};
  std::atomic<bool> abort{false};

  auto worker = [&]() {
    for (;;) {
      if (abort.load(std::memory_order_relaxed)) {
        return;
      }
      const size_t i = next.fetch_add(1, std::memory_order_relaxed);
      if (i >= n) {
        return;
      }
      auto file = run_one_group(cfg, i, seed, reserved, sink, progress, say);
      if (file) {
        written[i] = std::move(*file);
      } else {
        failures[i] = file.error();
        abort.store(true, std::memory_order_relaxed);
      }
    }
  };

  const size_t thread_count = std::min<size_t>(cfg.threads, n);
  std::vector<std::thread> workers;
  workers.reserve(thread_count);
  for (size_t t = 0; t < thread_count; ++t) {
    workers.emplace_back(worker);
  }
  for (auto& w : workers) {
    w.join();
  }

  // Report the first failure in caller order; groups that finished keep their files.
  for (size_t i = 0; i < n; ++i) {
    if (failures[i]) {
      return tl::make_unexpected(*failures[i]);
    }
  }
  return written;
}

}  // namespace

namespace excode::app {

Expected<uint64_t> parse_uint(std::string_view text, std::string_view what) {
  uint64_t v = 0;
  const char* first = text.data();
  const char* last = first + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, v);
  if (text.empty() || ec != std::errc{} || ptr != last) {
    return tl::make_unexpected(
        Error{ErrorCode::InvalidArgument,
              std::format("invalid {} '{}': expected a non-negative integer", what, text)});
  }
  return v;
}

Expected<GroupSpec> parse_group_token(std::string_view token) {
  GroupSpec out{};
  std::string_view count_text = token;
  const auto colon = token.find(':');
  if (colon != std::string_view::npos) {
    out.prefix = std::string(token.substr(0, colon));
    count_text = token.substr(colon + 1);
  }
  auto count = parse_uint(count_text, std::format("count in group '{}'", token));
  if (!count) {
    return tl::make_unexpected(count.error());
  }
  out.count = static_cast<size_t>(*count);
  return out;
}

Expected<Config> parse_args(int argc, char** argv) {
  Config cfg{};
  if (argc > 0) {
    cfg.executable_path = argv[0];
  }

  argparse::ArgumentParser program("excode", "", argparse::default_arguments::none);
  program.add_argument("min_hamming_distance");
  program.add_argument("digit_count");
  program.add_argument("groups").nargs(argparse::nargs_pattern::any);
  program.add_argument("--seed").scan<'u', uint64_t>();
  program.add_argument("--existing").append();
  program.add_argument("--output-dir").default_value(std::string("."));
  program.add_argument("--threads").scan<'u', uint32_t>().default_value(static_cast<uint32_t>(1));
  program.add_argument("--max-failures").scan<'u', uint64_t>().default_value(static_cast<uint64_t>(0));
  program.add_argument("--quiet").default_value(false).implicit_value(true);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << program;
    return tl::make_unexpected(Error{ErrorCode::InvalidArgument, ex.what()});
  }

  auto dist = parse_uint(program.get<std::string>("min_hamming_distance"), "min_hamming_distance");
  if (!dist) {
    return tl::make_unexpected(dist.error());
  }
  cfg.min_distance = static_cast<size_t>(*dist);

  auto digits = parse_uint(program.get<std::string>("digit_count"), "digit_count");
  if (!digits) {
    return tl::make_unexpected(digits.error());
  }
  if (*digits == 0) {
    return tl::make_unexpected(Error{ErrorCode::InvalidArgument, "digit_count must be at least 1"});
  }
  cfg.digit_count = static_cast<size_t>(*digits);

  if (const auto tokens = program.present<std::vector<std::string>>("groups")) {
    std::set<std::string> seen;
    for (const auto& token : *tokens) {
      auto group = parse_group_token(token);
      if (!group) {
        return tl::make_unexpected(group.error());
      }
      // Each prefix owns one output file.
      if (!seen.insert(group->prefix).second) {
        return tl::make_unexpected(Error{
            ErrorCode::InvalidArgument,
            std::format("prefix '{}' appears in more than one group", group->prefix)});
      }
      cfg.groups.push_back(std::move(*group));
    }
  }
  if (cfg.groups.empty()) {
    cfg.groups.push_back(GroupSpec{.prefix = "", .count = 100});
  }

  cfg.seed = program.present<uint64_t>("--seed");
  if (const auto existing = program.present<std::vector<std::string>>("--existing")) {
    for (const auto& p : *existing) {
      cfg.existing.emplace_back(p);
    }
  }
  cfg.output_dir = program.get<std::string>("--output-dir");
  cfg.threads = std::max(1u, program.get<uint32_t>("--threads"));
  cfg.max_failures = program.get<uint64_t>("--max-failures");
  cfg.quiet = program.get<bool>("--quiet");
  return cfg;
}

Expected<std::vector<Code>> load_reserved(const Config& cfg, std::ostream& info) {
  std::vector<Code> out;
  for (const auto& path : cfg.existing) {
    auto codes = read_code_file(path);
    if (!codes) {
      return tl::make_unexpected(codes.error());
    }
    if (!cfg.quiet) {
      info << std::format("Read file {} containing {} entries\n", path.string(), codes->size());
    }
    out.insert(out.end(), codes->begin(), codes->end());
  }
  return out;
}

Expected<RunSummary> run_groups(const Config& cfg,
                                std::span<const Code> reserved,
                                std::ostream& info,
                                IProgressSink& progress) {
  CodeFileSink sink(cfg.output_dir);
  auto dir = sink.ensure_output_dir();
  if (!dir) {
    return tl::make_unexpected(dir.error());
  }

  warn_if_infeasible(cfg);

  RunSummary summary{};
  summary.seed = cfg.seed ? *cfg.seed : Rng::entropy_seed();

  std::mutex info_mu;
  const Say say = [&](const std::string& line) {
    if (cfg.quiet) {
      return;
    }
    std::scoped_lock lock(info_mu);
    info << line << '\n';
  };
  say(std::format("Seed: {}", summary.seed));

  auto files = (cfg.threads > 1 && cfg.groups.size() > 1)
                   ? run_parallel(cfg, summary.seed, reserved, sink, progress, say)
                   : run_sequential(cfg, summary.seed, reserved, sink, progress, say);
  if (!files) {
    return tl::make_unexpected(files.error());
  }
  for (const auto& f : *files) {
    summary.files.push_back(f.path);
    summary.digests.push_back(f.digest);
  }
  return summary;
}

}  // namespace excode::app

int run_cli_impl(int argc, char** argv) {
  if (has_help_flag(argc, argv)) {
    print_cli_help(argc > 0 ? std::string(argv[0]) : std::string("excode"));
    return 0;
  }

  auto cfg = excode::app::parse_args(argc, argv);
  if (!cfg) {
    std::cerr << std::format("error: {}\n", cfg.error().message());
    return 2;
  }

  auto reserved = excode::app::load_reserved(*cfg, std::cout);
  if (!reserved) {
    std::cerr << std::format("error: {}\n", reserved.error().message());
    return 1;
  }

  excode::app::ConsoleProgress console(std::cout);
  excode::NullProgress silent;
  excode::IProgressSink& progress = cfg->quiet ? static_cast<excode::IProgressSink&>(silent)
                                               : static_cast<excode::IProgressSink&>(console);

  auto run = excode::app::run_groups(*cfg, *reserved, std::cout, progress);
  if (!run) {
    std::cerr << std::format("error ({}): {}\n", excode::to_string(run.error().code()),
                             run.error().message());
    return run.error().code() == excode::ErrorCode::Stalled ? 3 : 1;
  }

  if (!cfg->quiet) {
    std::cout << "All finished!\n";
  }
  return 0;
}
