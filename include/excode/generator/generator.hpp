#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "excode/core/expected.hpp"
#include "excode/core/rng.hpp"
#include "excode/core/types.hpp"
#include "excode/generator/progress.hpp"

namespace excode {

// Greedy random generator: draws candidates and keeps the ones that stay at
// least `min_distance` away from everything accepted so far in the group.
// Groups are independent; reserved codes apply to every group.
class CodeGenerator {
 public:
  CodeGenerator(GenerationParams params, Rng& rng, IProgressSink& progress);

  void set_reserved(std::vector<Code> reserved);
  const std::vector<Code>& reserved() const { return reserved_; }

  const GenerationParams& params() const { return params_; }

  // Prefix followed by `digit_count` uniform random digits.
  Code draw_candidate(std::string_view prefix);

  // Runs until the group holds `group.count` codes. With
  // max_consecutive_failures == 0 this never gives up, even when the
  // request is infeasible.
  Expected<GroupResult> generate(const GroupSpec& group);

 private:
  GenerationParams params_;
  Rng& rng_;
  IProgressSink& progress_;
  std::vector<Code> reserved_{};
};

Expected<GroupResult> generate_group(const GroupSpec& group,
                                     const GenerationParams& params,
                                     Rng& rng,
                                     IProgressSink& progress);

}  // namespace excode
