#pragma once

#include <cstddef>
#include <cstdint>

namespace excode::app {

uint64_t xorshift64(uint64_t& s);
uint64_t splitmix64(uint64_t v);
uint64_t mix_seed(uint64_t seed, uint64_t stream);

}  // namespace excode::app
