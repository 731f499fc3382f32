#pragma once

#include <cstdlib>
#include <iostream>

namespace pforest::detail {
  [[noreturn]] inline void assert_failed(const char* expr, const char* file, int line) noexcept {
    std::cerr << file << ":" << line << ": pforest assertion failed: " << expr << std::endl;
    std::abort();
  }
} // namespace pforest::detail

#ifndef NDEBUG
#define PFOREST_ASSERT(...)                                                   \
  do {                                                                        \
    if (!static_cast<bool>(__VA_ARGS__)) {                                    \
      ::pforest::detail::assert_failed(#__VA_ARGS__, __FILE__, __LINE__);     \
    }                                                                         \
  } while (false)
#else
#define PFOREST_ASSERT(...) static_cast<void>(0)
#endif
