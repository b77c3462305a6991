#include "app/math_utils.hpp"

namespace excode::app {

uint64_t xorshift64(uint64_t& s) {
  s ^= s << 13;
  s ^= s >> 7;
  s ^= s << 17;
  return s;
}

uint64_t splitmix64(uint64_t v) {
  v += 0x9e3779b97f4a7c15ULL;
  v = (v ^ (v >> 30)) * 0xbf58476d1ce4e5b9ULL;
  v = (v ^ (v >> 27)) * 0x94d049bb133111ebULL;
  return v ^ (v >> 31);
}

uint64_t mix_seed(uint64_t seed, uint64_t stream) {
  return splitmix64(seed ^ (stream * 0x9e3779b97f4a7c15ULL));
}

}  // namespace excode::app
