#include "Ids.hpp"

#include <cstdint>
#include <random>

namespace skya {

std::string uuid4() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto rnd64 = [&]() { return static_cast<uint64_t>(rng()); };
  auto hexn = [](uint64_t v, int n) {
    static const char* k = "0123456789abcdef";
    std::string s(n, '0');
    for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
    return s;
  };
  const uint64_t hi = rnd64();
  uint64_t lo = rnd64();
  // version 4 in the high nibble of the third group
  const uint64_t timeHi = ((hi & 0xffffULL) & 0x0fffULL) | 0x4000ULL;
  // variant 10xx
  lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  return hexn(hi >> 32, 8) + "-" + hexn((hi >> 16) & 0xffffULL, 4) + "-" +
         hexn(timeHi, 4) + "-" + hexn(lo >> 48, 4) + "-" +
         hexn(lo & 0xffffffffffffULL, 12);
}

} // namespace skya
