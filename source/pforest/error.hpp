#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace pforest {
  enum class forest_errc {
    empty_structure = 1,
    invalid_key,
    foreign_handle,
    stale_handle,
    corrupted_structure,
  };

  namespace detail {
    class forest_category_impl final : public std::error_category {
     public:
      const char* name() const noexcept override {
        return "pforest";
      }

      std::string message(int value) const override {
        switch (static_cast<forest_errc>(value)) {
        case forest_errc::empty_structure:
          return "operation requires a non-empty forest";
        case forest_errc::invalid_key:
          return "new key is greater than the current key";
        case forest_errc::foreign_handle:
          return "handle belongs to a different forest";
        case forest_errc::stale_handle:
          return "handle does not refer to a live node";
        case forest_errc::corrupted_structure:
          return "forest invariants are violated";
        }
        return "unknown pforest error";
      }
    };
  } // namespace detail

  inline const std::error_category& forest_category() noexcept {
    static const detail::forest_category_impl category{};
    return category;
  }

  inline std::error_code make_error_code(forest_errc value) noexcept {
    return {static_cast<int>(value), forest_category()};
  }

  [[noreturn]] inline void throw_error(forest_errc value) {
    throw std::system_error(make_error_code(value));
  }
} // namespace pforest

namespace std {
  template <>
  struct is_error_code_enum<pforest::forest_errc> : true_type { };
} // namespace std
