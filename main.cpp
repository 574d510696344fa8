/*
 * BKTree
 *
 * Copyright (c) 2016 "0of" Magnus
 * Licensed under the MIT license.
 * https://github.com/0of/bktree-leveldb/blob/master/LICENSE
 */
 
#include <iostream>
#include <string>
#include <cstdint>
#include <cstdlib>

#include "LevenshteinDistance.h"
#include "BKTree.h"

int main(int argc, char *argv[]) {  

  try {
    BKTree<std::string, LevenshteinDistancePolicy> bktree;
    bktree.insertAll({ "book", "books", "boo", "boon", "cook", "cake", "cape", "cart" });

    std::string query = argc > 1 ? argv[1] : "bo";
    std::uint32_t threshold = argc > 2 ? static_cast<std::uint32_t>(std::stoul(argv[2])) : 2;

    for (const auto& e : bktree.find(query, threshold)) {
      std::cout << e.first << " " << e.second << std::endl;
    }

  } catch (const std::exception& e) {
    std::cout << e.what() << std::endl;
    return EXIT_FAILURE;
  }
 
  return 0;
}
