#include "excode/generator/generator.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "excode/distance/distance.hpp"

namespace excode {
namespace {

constexpr size_t kMaxReservedCodes = 4096;

}  // namespace

CodeGenerator::CodeGenerator(GenerationParams params, Rng& rng, IProgressSink& progress)
    : params_(params), rng_(rng), progress_(progress) {}

void CodeGenerator::set_reserved(std::vector<Code> reserved) {
  reserved_ = std::move(reserved);
}

Code CodeGenerator::draw_candidate(std::string_view prefix) {
  Code out;
  out.reserve(prefix.size() + params_.digit_count);
  out.append(prefix);
  for (size_t i = 0; i < params_.digit_count; ++i) {
    out.push_back(static_cast<char>('0' + rng_.below(10)));
  }
  return out;
}

Expected<GroupResult> CodeGenerator::generate(const GroupSpec& group) {
  if (params_.digit_count == 0) {
    return tl::make_unexpected(Error{ErrorCode::InvalidArgument, "digit count must be at least 1"});
  }

  GroupResult out{};
  // The count is caller-supplied and may be far beyond what can be found.
  out.codes.reserve(std::min<size_t>(group.count, kMaxReservedCodes));

  // Reserved codes of a different length can never be mistaken for ours.
  const size_t code_len = group.prefix.size() + params_.digit_count;
  std::vector<Code> reserved;
  for (const auto& r : reserved_) {
    if (r.size() == code_len) {
      reserved.push_back(r);
    }
  }

  uint64_t failures_in_row = 0;
  while (out.codes.size() < group.count) {
    Code candidate = draw_candidate(group.prefix);
    ++out.attempts;

    const bool ok = is_admissible(candidate, out.codes, params_.min_distance) &&
                    is_admissible(candidate, reserved, params_.min_distance);
    progress_.on_attempt(group.prefix, ok);

    if (ok) {
      out.codes.push_back(std::move(candidate));
      failures_in_row = 0;
      continue;
    }

    ++out.rejections;
    ++failures_in_row;
    if (params_.max_consecutive_failures != 0 &&
        failures_in_row >= params_.max_consecutive_failures) {
      return tl::make_unexpected(Error{
          ErrorCode::Stalled,
          std::format("prefix '{}': gave up after {} consecutive rejections with {} of {} codes found",
                      group.prefix, failures_in_row, out.codes.size(), group.count)});
    }
  }
  return out;
}

Expected<GroupResult> generate_group(const GroupSpec& group,
                                     const GenerationParams& params,
                                     Rng& rng,
                                     IProgressSink& progress) {
  CodeGenerator gen(params, rng, progress);
  return gen.generate(group);
}

}  // namespace excode
