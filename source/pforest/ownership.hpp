#pragma once

#include "./intrusive/queue.hpp"

#include <utility>

namespace pforest {
  // Identity of one forest. Merging a forest links its tag under the tag of
  // the receiving forest, so every node keeps pointing at the tag it was
  // created with and still resolves to the forest that owns it now.
  struct owner_tag {
    owner_tag* parent = nullptr;
    owner_tag* next = nullptr;
  };

  // Union-find lookup with path halving.
  inline owner_tag* find_root(owner_tag* tag) noexcept {
    while (tag->parent != nullptr) {
      if (tag->parent->parent != nullptr) {
        tag->parent = tag->parent->parent;
      }
      tag = tag->parent;
    }
    return tag;
  }

  // Owns every tag a forest has accumulated: its own and the ones absorbed
  // through merges. The own tag is created on first use so that a default
  // constructed or moved-from registry holds nothing.
  class owner_registry {
   public:
    owner_registry() noexcept = default;
    owner_registry(const owner_registry&) = delete;

    owner_registry(owner_registry&& other) noexcept
      : tags_(std::move(other.tags_))
      , current_(std::exchange(other.current_, nullptr)) {
    }

    owner_registry& operator=(owner_registry other) noexcept {
      std::swap(tags_, other.tags_);
      std::swap(current_, other.current_);
      return *this;
    }

    ~owner_registry() {
      while (owner_tag* tag = tags_.pop_front()) {
        delete tag;
      }
    }

    // The tag new nodes are stamped with.
    [[nodiscard]] owner_tag* acquire() {
      if (current_ == nullptr) {
        current_ = new owner_tag{};
        tags_.push_back(current_);
      }
      return current_;
    }

    [[nodiscard]] bool owns(owner_tag* tag) const noexcept {
      return tag != nullptr && current_ != nullptr && find_root(tag) == current_;
    }

    void absorb(owner_registry&& other) noexcept {
      owner_tag* other_current = std::exchange(other.current_, nullptr);
      if (other_current == nullptr) {
        return;
      }
      if (current_ == nullptr) {
        current_ = other_current;
      } else {
        other_current->parent = current_;
      }
      tags_.append(std::move(other.tags_));
    }

   private:
    intrusive::queue<&owner_tag::next> tags_{};
    owner_tag* current_ = nullptr;
  };
} // namespace pforest
