#pragma once

#include "./assert.hpp"
#include "./config.hpp"
#include "./error.hpp"
#include "./intrusive/ring.hpp"
#include "./node.hpp"
#include "./node_pool.hpp"
#include "./ownership.hpp"

#include <bit>
#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace pforest {
  // Mergeable min-priority queue backed by a forest of heap ordered trees
  // (a Fibonacci heap). Siblings at every level, and the roots, form
  // circular doubly linked rings.
  //
  // insert, find_min, merge: O(1). decrease_key: O(1) amortized.
  // extract_min, erase: O(log n) amortized.
  //
  // Handles returned by insert stay usable until their node is extracted or
  // erased. Passing a handle of another forest, or of a node that is gone,
  // throws std::system_error (foreign_handle, stale_handle) without touching
  // the forest, provided the forest that minted the handle is still alive.
  // Compare must not throw.
  template <class Key, class Value = no_value, class Compare = std::less<Key>>
    requires std::strict_weak_order<const Compare&, const Key&, const Key&>
  class priority_forest {
   public:
    using key_type = Key;
    using value_type = Value;
    using compare_type = Compare;
    using size_type = std::size_t;
    using entry_type = entry<Key, Value>;
    using node_type = forest_node<Key, Value>;
    using node_handle = basic_node_handle<node_type>;

    // Read-only view of one node, handed to visit().
    class node_view {
     public:
      explicit node_view(node_type& node) noexcept
        : node_(&node) {
      }

      const Key& key() const noexcept {
        return node_->payload().key;
      }

      const Value& value() const noexcept {
        return node_->payload().value;
      }

      std::size_t degree() const noexcept {
        return node_->degree;
      }

      bool marked() const noexcept {
        return node_->marked;
      }

      bool is_root() const noexcept {
        return node_->parent == nullptr;
      }

      node_handle handle() const noexcept {
        return node_handle{node_, node_->generation};
      }

     private:
      node_type* node_;
    };

    priority_forest() = default;

    explicit priority_forest(Compare compare, forest_config config = {})
      : pool_(config)
      , compare_(std::move(compare)) {
    }

    explicit priority_forest(forest_config config)
      : pool_(config) {
    }

    priority_forest(const priority_forest&) = delete;
    priority_forest& operator=(const priority_forest&) = delete;

    priority_forest(priority_forest&& other) noexcept
      : pool_(std::move(other.pool_))
      , owners_(std::move(other.owners_))
      , roots_(std::move(other.roots_))
      , min_(std::exchange(other.min_, nullptr))
      , size_(std::exchange(other.size_, 0))
      , compare_(std::move(other.compare_)) {
    }

    priority_forest& operator=(priority_forest&& other) noexcept {
      if (this != &other) {
        priority_forest released{std::move(*this)};
        pool_ = std::move(other.pool_);
        owners_ = std::move(other.owners_);
        roots_ = std::move(other.roots_);
        min_ = std::exchange(other.min_, nullptr);
        size_ = std::exchange(other.size_, 0);
        compare_ = std::move(other.compare_);
      }
      return *this;
    }

    ~priority_forest() = default;

    [[nodiscard]] bool empty() const noexcept {
      return size_ == 0;
    }

    [[nodiscard]] size_type size() const noexcept {
      return size_;
    }

    // Number of trees in the root ring. O(number of roots).
    [[nodiscard]] size_type root_count() const noexcept {
      return roots_.size();
    }

    [[nodiscard]] const Compare& compare() const noexcept {
      return compare_;
    }

    node_handle insert(Key key, Value value = Value{}) {
      owner_tag* owner = owners_.acquire();
      const bool new_min = min_ == nullptr || compare_(key, min_->payload().key);
      node_type* node = pool_.allocate(std::move(key), std::move(value));
      node->owner = owner;
      roots_.push_back(node);
      if (new_min) {
        min_ = node;
      }
      ++size_;
      return node_handle{node, node->generation};
    }

    [[nodiscard]] const entry_type& find_min() const {
      if (min_ == nullptr) {
        throw_error(forest_errc::empty_structure);
      }
      return min_->payload();
    }

    [[nodiscard]] const entry_type* try_find_min() const noexcept {
      return min_ == nullptr ? nullptr : &min_->payload();
    }

    entry_type extract_min() {
      if (min_ == nullptr) {
        throw_error(forest_errc::empty_structure);
      }
      return take_min();
    }

    std::optional<entry_type> try_extract_min() {
      if (min_ == nullptr) {
        return std::nullopt;
      }
      return take_min();
    }

    // Lowers the key of the node behind handle. A key equal to the current
    // one is accepted; a greater key throws invalid_key and leaves the forest
    // untouched.
    void decrease_key(node_handle handle, Key new_key) {
      node_type* node = checked(handle);
      if (compare_(node->payload().key, new_key)) {
        throw_error(forest_errc::invalid_key);
      }
      node->payload().key = std::move(new_key);
      node_type* parent = node->parent;
      if (parent != nullptr && less(node, parent)) {
        cut(node, parent);
        cascading_cut(parent);
      }
      if (less(node, min_)) {
        min_ = node;
      }
    }

    // Removes the node behind handle whatever its key. The node is cut to
    // the root ring and extracted as if it were the minimum.
    entry_type erase(node_handle handle) {
      node_type* node = checked(handle);
      degree_table by_degree(degree_limit(size_), nullptr);
      entry_type result(std::move(node->payload()));
      if (node_type* parent = node->parent) {
        cut(node, parent);
        cascading_cut(parent);
      }
      min_ = node;
      unlink_min(by_degree);
      pool_.release(node);
      return result;
    }

    // Moves every node of other into this forest in O(1). Handles minted by
    // other keep working against this forest; other is left empty and
    // usable.
    void merge(priority_forest& other) {
      if (this == &other || other.min_ == nullptr) {
        return;
      }
      const bool other_min = min_ == nullptr || less(other.min_, min_);
      owners_.absorb(std::move(other.owners_));
      pool_.absorb(std::move(other.pool_));
      roots_.append(std::move(other.roots_));
      if (other_min) {
        min_ = other.min_;
      }
      other.min_ = nullptr;
      size_ += std::exchange(other.size_, 0);
    }

    // Drops every node. Outstanding handles become stale.
    void clear() noexcept {
      (void) roots_.release();
      pool_.release_all();
      min_ = nullptr;
      size_ = 0;
    }

    [[nodiscard]] bool contains(node_handle handle) const noexcept {
      node_type* node = handle.node_;
      return node != nullptr && owners_.owns(node->owner) && node->live
          && node->generation == handle.generation_;
    }

    [[nodiscard]] const Key& key(node_handle handle) const {
      return checked(handle)->payload().key;
    }

    [[nodiscard]] Value& value(node_handle handle) {
      return checked(handle)->payload().value;
    }

    [[nodiscard]] const Value& value(node_handle handle) const {
      return checked(handle)->payload().value;
    }

    // Calls fn(node_view, depth) for every node, depth first, starting with
    // the tree holding the minimum. Roots have depth 0.
    template <class Fn>
    void visit(Fn&& fn) const {
      if (min_ == nullptr) {
        return;
      }
      std::vector<std::pair<node_type*, std::size_t>> pending;
      push_ring(pending, min_, 0);
      while (!pending.empty()) {
        auto [node, depth] = pending.back();
        pending.pop_back();
        fn(node_view{*node}, depth);
        if (node->child != nullptr) {
          push_ring(pending, node->child, depth + 1);
        }
      }
    }

    // Checks every structural invariant in O(n): ring links, parent links,
    // degrees, heap order, unmarked roots, the minimum, node count and
    // ownership. Returns corrupted_structure on the first violation.
    [[nodiscard]] std::error_code validate() const {
      const std::error_code corrupted = make_error_code(forest_errc::corrupted_structure);
      if (min_ == nullptr || roots_.empty() || size_ == 0) {
        const bool consistent = min_ == nullptr && roots_.empty() && size_ == 0
                             && pool_.live_count() == 0;
        return consistent ? std::error_code{} : corrupted;
      }
      if (min_->parent != nullptr) {
        return corrupted;
      }

      size_type reached = 0;
      bool min_is_root = false;
      std::vector<const node_type*> parents{nullptr};
      std::vector<const node_type*> heads{roots_.front()};
      while (!heads.empty()) {
        const node_type* head = heads.back();
        const node_type* parent = parents.back();
        heads.pop_back();
        parents.pop_back();

        size_type members = 0;
        const node_type* node = head;
        do {
          if (++reached > size_ || ++members > size_) {
            return corrupted;
          }
          if (!node->live || !owners_.owns(node->owner) || node->parent != parent) {
            return corrupted;
          }
          if (node->right->left != node || node->left->right != node) {
            return corrupted;
          }
          if (parent == nullptr) {
            if (node->marked || less(node, min_)) {
              return corrupted;
            }
            min_is_root = min_is_root || node == min_;
          } else if (less(node, parent)) {
            return corrupted;
          }
          if (node->child != nullptr) {
            heads.push_back(node->child);
            parents.push_back(node);
          } else if (node->degree != 0) {
            return corrupted;
          }
          node = node->right;
        } while (node != head);

        if (parent != nullptr && members != parent->degree) {
          return corrupted;
        }
      }

      if (!min_is_root || reached != size_ || pool_.live_count() != size_) {
        return corrupted;
      }
      return {};
    }

   private:
    using ring_type = intrusive::ring<&node_type::left, &node_type::right>;
    using degree_table = std::vector<node_type*>;

    // Table size that fits every degree a forest of count nodes can reach:
    // a tree whose root has degree k holds at least phi^k nodes.
    static std::size_t degree_limit(size_type count) noexcept {
      return 2 * static_cast<std::size_t>(std::bit_width(count)) + 1;
    }

    bool less(const node_type* lhs, const node_type* rhs) const {
      return compare_(lhs->payload().key, rhs->payload().key);
    }

    node_type* checked(node_handle handle) const {
      node_type* node = handle.node_;
      if (node == nullptr) {
        throw_error(forest_errc::stale_handle);
      }
      if (!owners_.owns(node->owner)) {
        throw_error(forest_errc::foreign_handle);
      }
      if (!node->live || node->generation != handle.generation_) {
        throw_error(forest_errc::stale_handle);
      }
      return node;
    }

    // Everything that can throw happens before the first relink, so a
    // failure leaves the forest as it was.
    entry_type take_min() {
      degree_table by_degree(degree_limit(size_), nullptr);
      node_type* node = min_;
      entry_type result(std::move(node->payload()));
      unlink_min(by_degree);
      pool_.release(node);
      return result;
    }

    // Moves the children of min_ to the root ring, removes min_ from it and
    // consolidates what is left.
    void unlink_min(degree_table& by_degree) noexcept {
      node_type* z = min_;
      PFOREST_ASSERT(z != nullptr && z->parent == nullptr);
      if (z->child != nullptr) {
        ring_type children = ring_type::adopt(std::exchange(z->child, nullptr));
        for (auto& child: children) {
          child.parent = nullptr;
          child.marked = false;
        }
        z->degree = 0;
        roots_.append(std::move(children));
      }
      roots_.erase(z);
      --size_;
      if (roots_.empty()) {
        min_ = nullptr;
        return;
      }
      consolidate(by_degree);
    }

    // Links roots of equal degree until all root degrees are distinct and
    // points min_ at the smallest remaining root. by_degree must be all null
    // and at least degree_limit(size_) long.
    void consolidate(degree_table& by_degree) noexcept {
      ring_type pending{std::move(roots_)};
      while (node_type* x = pending.front()) {
        pending.erase(x);
        std::size_t degree = x->degree;
        PFOREST_ASSERT(degree < by_degree.size());
        while (by_degree[degree] != nullptr) {
          node_type* y = std::exchange(by_degree[degree], nullptr);
          if (less(y, x)) {
            std::swap(x, y);
          }
          link(y, x);
          ++degree;
          PFOREST_ASSERT(degree < by_degree.size());
        }
        by_degree[degree] = x;
      }

      min_ = nullptr;
      for (node_type* root: by_degree) {
        if (root == nullptr) {
          continue;
        }
        roots_.push_back(root);
        if (min_ == nullptr || less(root, min_)) {
          min_ = root;
        }
      }
    }

    // Makes the detached root child a child of parent.
    void link(node_type* child, node_type* parent) noexcept {
      ring_type siblings = ring_type::adopt(parent->child);
      siblings.push_back(child);
      parent->child = siblings.release();
      child->parent = parent;
      child->marked = false;
      ++parent->degree;
    }

    // Moves node from the child ring of parent to the root ring.
    void cut(node_type* node, node_type* parent) noexcept {
      ring_type siblings = ring_type::adopt(parent->child);
      siblings.erase(node);
      parent->child = siblings.release();
      --parent->degree;
      node->parent = nullptr;
      node->marked = false;
      roots_.push_back(node);
    }

    // Walks up from a node that just lost a child: marked ancestors are cut,
    // the first unmarked non-root ancestor gets marked.
    void cascading_cut(node_type* node) noexcept {
      while (node_type* parent = node->parent) {
        if (!node->marked) {
          node->marked = true;
          return;
        }
        cut(node, parent);
        node = parent;
      }
    }

    static void push_ring(
      std::vector<std::pair<node_type*, std::size_t>>& pending,
      node_type* head,
      std::size_t depth) {
      // Pushed back to front so the head is visited first.
      node_type* node = head->left;
      do {
        pending.emplace_back(node, depth);
        node = node->left;
      } while (node != head->left);
    }

    node_pool<node_type> pool_{};
    owner_registry owners_{};
    ring_type roots_{};
    node_type* min_ = nullptr;
    size_type size_ = 0;
    [[no_unique_address]] Compare compare_{};
  };
} // namespace pforest
