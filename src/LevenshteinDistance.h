/*
 * BKTree
 *
 * Copyright (c) 2016 "0of" Magnus
 * Licensed under the MIT license.
 * https://github.com/0of/bktree-leveldb/blob/master/LICENSE
 */
 
#ifndef LEVENSHTEINDISTANCE
#define LEVENSHTEINDISTANCE

#include <vector>
#include <string>
#include <cstdint>
#include <algorithm>

class LevenshteinDistancePolicy {
public:
  // edit distance over bytes, insertion, deletion and substitution all cost 1
  static std::uint32_t distance(const std::string& s1, const std::string& s2) {
    if (s1 == s2)
      return 0;

    auto len1 = s1.size();
    auto len2 = s2.size();

    if (0 == len1)
      return static_cast<std::uint32_t>(len2);
    if (0 == len2)
      return static_cast<std::uint32_t>(len1);

    // two columns of the edit matrix
    std::vector<std::uint32_t> col(len2 + 1);
    std::vector<std::uint32_t> prevCol(len2 + 1);

    for (std::size_t i = 0; i != prevCol.size(); ++i)
      prevCol[i] = static_cast<std::uint32_t>(i);

    for (std::size_t i = 0; i != len1; ++i) {
      col[0] = static_cast<std::uint32_t>(i + 1);
      for (std::size_t j = 0; j != len2; ++j)
        col[j + 1] = std::min({ prevCol[1 + j] + 1, col[j] + 1, prevCol[j] + (s1[i] == s2[j] ? 0u : 1u) });
      col.swap(prevCol);
    }

    return prevCol[len2];
  }

  std::uint32_t operator ()(const std::string& s1, const std::string& s2) const {
    return distance(s1, s2);
  }
};

#endif // LEVENSHTEINDISTANCE
