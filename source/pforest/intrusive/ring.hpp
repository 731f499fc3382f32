/*
 * Copyright (c) 2021-2022 Facebook, Inc. and its affiliates
 * Copyright (c) 2021-2022 NVIDIA Corporation
 * Copyright (c) 2024 Maikel Nadolski
 *
 * Licensed under the Apache License Version 2.0 with LLVM Exceptions
 * (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 *   https://llvm.org/LICENSE.txt
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <cstddef>
#include <utility>

namespace pforest::intrusive {
  template <auto Left, auto Right>
  class ring;

  // A view over a circular doubly linked ring of caller owned items. The
  // view only remembers one member (the front); every other member is
  // reached through the Right hooks. A detached item is a ring of its own:
  // both hooks point back at it.
  template <class Item, Item* Item::* Left, Item* Item::* Right>
  class ring<Left, Right> {
   public:
    struct iterator {
      using difference_type = std::ptrdiff_t;
      Item* head_ = nullptr;
      Item* item_ = nullptr;

      Item& operator*() const noexcept {
        return *item_;
      }

      Item* operator->() const noexcept {
        return item_;
      }

      iterator& operator++() noexcept {
        item_ = item_->*Right;
        if (item_ == head_) {
          item_ = nullptr;
        }
        return *this;
      }

      iterator operator++(int) noexcept {
        iterator copy{*this};
        ++*this;
        return copy;
      }

      friend bool operator==(const iterator& lhs, const iterator& rhs) noexcept {
        return lhs.item_ == rhs.item_;
      }

      friend bool operator!=(const iterator& lhs, const iterator& rhs) noexcept {
        return lhs.item_ != rhs.item_;
      }
    };

    ring() noexcept = default;

    ring(ring&& other) noexcept
      : head_(std::exchange(other.head_, nullptr)) {
    }

    ring& operator=(ring other) noexcept {
      std::swap(head_, other.head_);
      return *this;
    }

    // Views the ring that already contains item. A null item yields an
    // empty view.
    [[nodiscard]] static ring adopt(Item* item) noexcept {
      ring result{};
      result.head_ = item;
      return result;
    }

    static void make_singleton(Item* item) noexcept {
      item->*Left = item;
      item->*Right = item;
    }

    iterator begin() const noexcept {
      return iterator{head_, head_};
    }

    iterator end() const noexcept {
      return iterator{head_, nullptr};
    }

    [[nodiscard]] bool empty() const noexcept {
      return head_ == nullptr;
    }

    [[nodiscard]] Item* front() const noexcept {
      return head_;
    }

    // O(n): walks the whole ring.
    [[nodiscard]] std::size_t size() const noexcept {
      std::size_t count = 0;
      for (auto it = begin(); it != end(); ++it) {
        ++count;
      }
      return count;
    }

    // Inserts a detached item in front of the head, i.e. as the last member
    // visited by iteration.
    void push_back(Item* item) noexcept {
      if (head_ == nullptr) {
        make_singleton(item);
        head_ = item;
        return;
      }
      Item* tail = head_->*Left;
      item->*Right = head_;
      item->*Left = tail;
      tail->*Right = item;
      head_->*Left = item;
    }

    // Unlinks a member. The item is left as a singleton ring.
    void erase(Item* item) noexcept {
      if (item == nullptr) {
        return;
      }
      Item* next = item->*Right;
      if (next == item) {
        if (head_ == item) {
          head_ = nullptr;
        }
        return;
      }
      Item* prev = item->*Left;
      prev->*Right = next;
      next->*Left = prev;
      if (head_ == item) {
        head_ = next;
      }
      make_singleton(item);
    }

    // Splices every member of other behind the current tail in O(1).
    void append(ring other) noexcept {
      if (other.empty()) {
        return;
      }
      Item* other_head = std::exchange(other.head_, nullptr);
      if (head_ == nullptr) {
        head_ = other_head;
        return;
      }
      Item* tail = head_->*Left;
      Item* other_tail = other_head->*Left;
      tail->*Right = other_head;
      other_head->*Left = tail;
      other_tail->*Right = head_;
      head_->*Left = other_tail;
    }

    // Forgets the ring without touching any hook and returns the former
    // front.
    [[nodiscard]] Item* release() noexcept {
      return std::exchange(head_, nullptr);
    }

   private:
    Item* head_ = nullptr;
  };
} // namespace pforest::intrusive
