#include "excode/core/rng.hpp"

#include <random>

#include "app/math_utils.hpp"
#include "excode/core/error.hpp"

namespace excode {

Rng::Rng(uint64_t seed) : state_(app::splitmix64(seed)) {
  if (state_ == 0) {
    state_ = 0x9e3779b97f4a7c15ULL;
  }
}

uint64_t Rng::entropy_seed() {
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

Rng Rng::from_entropy() { return Rng(entropy_seed()); }

uint64_t Rng::next() {
  return app::xorshift64(state_) * 0x2545f4914f6cdd1dULL;
}

uint64_t Rng::below(uint64_t bound) {
  if (bound == 0) {
    throw Error{ErrorCode::InvalidArgument, "Rng::below requires a non-zero bound"};
  }
  // Reject the low values that would make the modulo uneven.
  const uint64_t threshold = (0 - bound) % bound;
  for (;;) {
    const uint64_t r = next();
    if (r >= threshold) {
      return r % bound;
    }
  }
}

}  // namespace excode
