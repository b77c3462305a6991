#pragma once

#include <cstdint>

namespace excode {

// xorshift64 state update (13/7/17 shifts) with a multiplicative output
// scramble. Not for cryptographic use.
class Rng {
 public:
  explicit Rng(uint64_t seed);

  static Rng from_entropy();
  static uint64_t entropy_seed();

  uint64_t next();
  // Uniform in [0, bound). bound must be non-zero.
  uint64_t below(uint64_t bound);

 private:
  uint64_t state_;
};

}  // namespace excode
