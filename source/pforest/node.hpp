#pragma once

#include "./ownership.hpp"

#include <cstddef>
#include <cstdint>
#include <new>

namespace pforest {
  // Payload type of forests that only order keys.
  struct no_value {
    friend constexpr bool operator==(const no_value&, const no_value&) noexcept = default;
  };

  template <class Key, class Value>
  struct entry {
    Key key;
    Value value;
  };

  template <class Key, class Value>
  struct forest_node {
    using entry_type = entry<Key, Value>;

    forest_node* parent = nullptr;
    forest_node* child = nullptr;
    forest_node* left = nullptr;
    forest_node* right = nullptr;
    forest_node* next_free = nullptr;
    owner_tag* owner = nullptr;
    std::size_t degree = 0;
    std::uint32_t generation = 0;
    bool marked = false;
    bool live = false;

    forest_node() noexcept {
    }

    forest_node(const forest_node&) = delete;
    forest_node& operator=(const forest_node&) = delete;

    // The payload is destroyed through destroy(), never here.
    ~forest_node() {
    }

    template <class... Args>
    void construct(Args&&... args) {
      ::new (static_cast<void*>(&entry_)) entry_type{static_cast<Args&&>(args)...};
      parent = nullptr;
      child = nullptr;
      left = this;
      right = this;
      degree = 0;
      marked = false;
      live = true;
    }

    void destroy() noexcept {
      entry_.~entry_type();
      live = false;
      ++generation;
    }

    entry_type& payload() noexcept {
      return entry_;
    }

    const entry_type& payload() const noexcept {
      return entry_;
    }

   private:
    // Only alive while live is set.
    union {
      entry_type entry_;
    };
  };

  // Refers to one node of a priority_forest. Handles are plain values: they
  // are only meaningful to the forest that returned them (or the forest that
  // forest was merged into) and stop being valid once the node has been
  // extracted or erased.
  template <class Node>
  struct basic_node_handle {
    Node* node_ = nullptr;
    std::uint32_t generation_ = 0;

    friend bool operator==(const basic_node_handle&, const basic_node_handle&) noexcept = default;
  };
} // namespace pforest
