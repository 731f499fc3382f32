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

#include <utility>

namespace pforest::intrusive {
  template <auto Next>
  class queue;

  // Singly linked chain threaded through the Next member of its items. It
  // never owns the items; the pool keeps its free slots and chunks in it and
  // the owner registry its tags.
  template <class Item, Item* Item::* Next>
  class queue<Next> {
   public:
    queue() noexcept = default;

    queue(queue&& other) noexcept
      : head_(std::exchange(other.head_, nullptr))
      , tail_(std::exchange(other.tail_, nullptr)) {
    }

    queue& operator=(queue other) noexcept {
      std::swap(head_, other.head_);
      std::swap(tail_, other.tail_);
      return *this;
    }

    [[nodiscard]] bool empty() const noexcept {
      return head_ == nullptr;
    }

    [[nodiscard]] Item* back() const noexcept {
      return tail_;
    }

    // Unhooks the first item, or returns nullptr on an empty queue.
    [[nodiscard]] Item* pop_front() noexcept {
      Item* item = head_;
      if (item != nullptr) {
        head_ = std::exchange(item->*Next, nullptr);
        tail_ = head_ == nullptr ? nullptr : tail_;
      }
      return item;
    }

    void push_front(Item* item) noexcept {
      queue single{item};
      prepend(std::move(single));
    }

    void push_back(Item* item) noexcept {
      queue single{item};
      append(std::move(single));
    }

    void append(queue other) noexcept {
      *this = join(std::move(*this), std::move(other));
    }

    void prepend(queue other) noexcept {
      *this = join(std::move(other), std::move(*this));
    }

   private:
    explicit queue(Item* item) noexcept
      : head_(item)
      , tail_(item) {
      item->*Next = nullptr;
    }

    static queue join(queue first, queue second) noexcept {
      if (first.empty()) {
        return second;
      }
      if (!second.empty()) {
        first.tail_->*Next = std::exchange(second.head_, nullptr);
        first.tail_ = std::exchange(second.tail_, nullptr);
      }
      return first;
    }

    Item* head_ = nullptr;
    Item* tail_ = nullptr;
  };
} // namespace pforest::intrusive
