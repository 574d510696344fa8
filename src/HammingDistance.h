/*
 * BKTree
 *
 * Copyright (c) 2016 "0of" Magnus
 * Licensed under the MIT license.
 * https://github.com/0of/bktree-leveldb/blob/master/LICENSE
 */

#ifndef HAMMINGDISTANCE
#define HAMMINGDISTANCE

#include <cstdint>
#include <type_traits>

class HammingDistancePolicy {
public:
  // number of differing bits
  template<typename Integral>
  static std::enable_if_t<std::is_integral<Integral>::value && !std::is_same<Integral, bool>::value, std::uint32_t> distance(Integral a, Integral b) {
    using Bits = std::make_unsigned_t<Integral>;

    auto diff = static_cast<Bits>(static_cast<Bits>(a) ^ static_cast<Bits>(b));

    std::uint32_t count = 0;
    for (; diff != 0; ++count) {
      // clear the lowest set bit
      diff = static_cast<Bits>(diff & (diff - 1));
    }

    return count;
  }

  template<typename Integral>
  std::uint32_t operator ()(Integral a, Integral b) const {
    return distance(a, b);
  }
};

#endif // HAMMINGDISTANCE
