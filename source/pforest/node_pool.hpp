#pragma once

#include "./assert.hpp"
#include "./config.hpp"
#include "./intrusive/queue.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>

namespace pforest {
  // Slab storage for forest nodes. Nodes are carved from chunks that never
  // move, so node addresses stay valid until the pool is destroyed. A
  // released node goes on the free list with its generation bumped; a handle
  // remembering the old generation can tell the slot has been recycled.
  //
  // Node must provide `Node* next_free`, `bool live`, `construct(args...)`
  // and `destroy()`.
  template <class Node>
  class node_pool {
    struct chunk {
      chunk* next = nullptr;
      std::size_t used = 0;
      std::size_t capacity = 0;
      std::unique_ptr<Node[]> slots{};
    };

   public:
    explicit node_pool(forest_config config = {}) noexcept
      : config_(config)
      , next_capacity_(config.initial_chunk_capacity) {
    }

    node_pool(const node_pool&) = delete;

    node_pool(node_pool&& other) noexcept
      : config_(other.config_)
      , chunks_(std::move(other.chunks_))
      , free_(std::move(other.free_))
      , next_capacity_(std::exchange(other.next_capacity_, other.config_.initial_chunk_capacity))
      , live_(std::exchange(other.live_, 0))
      , capacity_(std::exchange(other.capacity_, 0))
      , chunk_count_(std::exchange(other.chunk_count_, 0)) {
    }

    node_pool& operator=(node_pool other) noexcept {
      std::swap(config_, other.config_);
      std::swap(chunks_, other.chunks_);
      std::swap(free_, other.free_);
      std::swap(next_capacity_, other.next_capacity_);
      std::swap(live_, other.live_);
      std::swap(capacity_, other.capacity_);
      std::swap(chunk_count_, other.chunk_count_);
      return *this;
    }

    ~node_pool() {
      while (chunk* current = chunks_.pop_front()) {
        for (std::size_t i = 0; i < current->used; ++i) {
          if (current->slots[i].live) {
            current->slots[i].destroy();
          }
        }
        delete current;
      }
    }

    [[nodiscard]] std::size_t live_count() const noexcept {
      return live_;
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
      return capacity_;
    }

    [[nodiscard]] std::size_t chunk_count() const noexcept {
      return chunk_count_;
    }

    [[nodiscard]] const forest_config& config() const noexcept {
      return config_;
    }

    template <class... Args>
    [[nodiscard]] Node* allocate(Args&&... args) {
      Node* node = acquire_slot();
      try {
        node->construct(static_cast<Args&&>(args)...);
      } catch (...) {
        free_.push_front(node);
        throw;
      }
      ++live_;
      return node;
    }

    void release(Node* node) noexcept {
      PFOREST_ASSERT(node != nullptr && node->live);
      node->destroy();
      --live_;
      free_.push_front(node);
    }

    // Releases every live node. Chunks are kept for reuse.
    void release_all() noexcept {
      intrusive::queue<&chunk::next> visited{};
      while (chunk* current = chunks_.pop_front()) {
        for (std::size_t i = 0; i < current->used; ++i) {
          if (current->slots[i].live) {
            release(&current->slots[i]);
          }
        }
        visited.push_back(current);
      }
      chunks_ = std::move(visited);
    }

    // Takes over every chunk and free slot of other in O(1). The absorbed
    // chunks go in front so new slots keep being bumped from our last chunk.
    // Slots other never handed out from its last chunk stay unused.
    void absorb(node_pool&& other) noexcept {
      chunks_.prepend(std::move(other.chunks_));
      free_.append(std::move(other.free_));
      live_ += std::exchange(other.live_, 0);
      capacity_ += std::exchange(other.capacity_, 0);
      chunk_count_ += std::exchange(other.chunk_count_, 0);
      other.next_capacity_ = other.config_.initial_chunk_capacity;
    }

   private:
    Node* acquire_slot() {
      if (Node* node = free_.pop_front()) {
        return node;
      }
      chunk* current = chunks_.back();
      if (current == nullptr || current->used == current->capacity) {
        current = grow();
      }
      return &current->slots[current->used++];
    }

    chunk* grow() {
      const std::size_t capacity = std::max<std::size_t>(next_capacity_, 1);
      auto fresh = std::make_unique<chunk>();
      fresh->capacity = capacity;
      fresh->slots = std::make_unique<Node[]>(capacity);
      next_capacity_ = std::min(capacity * 2, std::max(config_.max_chunk_capacity, capacity));
      chunks_.push_back(fresh.get());
      capacity_ += capacity;
      ++chunk_count_;
      return fresh.release();
    }

    forest_config config_{};
    intrusive::queue<&chunk::next> chunks_{};
    intrusive::queue<&Node::next_free> free_{};
    std::size_t next_capacity_{};
    std::size_t live_ = 0;
    std::size_t capacity_ = 0;
    std::size_t chunk_count_ = 0;
  };
} // namespace pforest
