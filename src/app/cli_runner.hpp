#pragma once

#include <cstdint>
#include <ostream>
#include <span>
#include <string_view>

#include "app/config_types.hpp"
#include "excode/core/expected.hpp"
#include "excode/generator/progress.hpp"

int run_cli_impl(int argc, char** argv);

namespace excode::app {

Expected<uint64_t> parse_uint(std::string_view text, std::string_view what);
// "<prefix>:<count>" or a bare "<count>" for the empty prefix.
Expected<GroupSpec> parse_group_token(std::string_view token);
Expected<Config> parse_args(int argc, char** argv);

Expected<std::vector<Code>> load_reserved(const Config& cfg, std::ostream& info);

Expected<RunSummary> run_groups(const Config& cfg,
                                std::span<const Code> reserved,
                                std::ostream& info,
                                IProgressSink& progress);

}  // namespace excode::app
