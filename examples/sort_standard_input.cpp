#include <pforest/dump.hpp>
#include <pforest/priority_forest.hpp>

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

// Reads whitespace separated integers from standard input and writes them back
// in ascending order. With --dump the shape of the forest after the first
// extraction goes to standard error.
int main(int argc, char** argv) {
  const bool dump = argc > 1 && std::string_view{argv[1]} == "--dump";

  pforest::priority_forest<long long> forest;
  std::string token;
  while (std::cin >> token) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
      value = std::stoll(token, &consumed);
    } catch (const std::exception&) {
      consumed = 0;
    }
    if (consumed != token.size()) {
      std::cerr << "Not an integer: " << token << std::endl;
      return EXIT_FAILURE;
    }
    forest.insert(value);
  }

  bool first = true;
  while (auto entry = forest.try_extract_min()) {
    if (first && dump) {
      pforest::dump(std::cerr, forest);
    }
    std::cout << (first ? "" : " ") << entry->key;
    first = false;
  }
  std::cout << std::endl;
}
