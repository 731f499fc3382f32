#include "pforest/priority_forest.hpp"

#include <catch2/catch_all.hpp>

#include <cstdlib>
#include <new>
#include <vector>

namespace {
  bool fail_next_allocation = false;

  using int_forest = pforest::priority_forest<int>;

  // Runs fn with the next global allocation failing. Returns whether fn
  // reported the failure as std::bad_alloc.
  template <class Fn>
  bool with_failing_allocation(Fn&& fn) {
    bool threw = false;
    fail_next_allocation = true;
    try {
      fn();
    } catch (const std::bad_alloc&) {
      threw = true;
    }
    fail_next_allocation = false;
    return threw;
  }

  std::vector<int> drain(int_forest& forest) {
    std::vector<int> keys;
    while (!forest.empty()) {
      keys.push_back(forest.extract_min().key);
    }
    return keys;
  }
} // namespace

void* operator new(std::size_t size) {
  if (fail_next_allocation) {
    fail_next_allocation = false;
    throw std::bad_alloc{};
  }
  if (void* ptr = std::malloc(size == 0 ? 1 : size)) {
    return ptr;
  }
  throw std::bad_alloc{};
}

void operator delete(void* ptr) noexcept {
  std::free(ptr);
}

void operator delete(void* ptr, std::size_t) noexcept {
  std::free(ptr);
}

TEST_CASE("priority_forest survives allocation failures", "[pforest][priority_forest]") {
  int_forest forest;
  std::vector<int_forest::node_handle> handles;
  for (int key: {5, 3, 8, 1, 9, 2}) {
    handles.push_back(forest.insert(key));
  }

  SECTION("1. extract_min") {
    CHECK(with_failing_allocation([&] { (void) forest.extract_min(); }));
    CHECK(forest.size() == 6);
    CHECK(forest.root_count() == 6);
    CHECK(forest.find_min().key == 1);
    CHECK_FALSE(forest.validate());
    CHECK(drain(forest) == std::vector<int>{1, 2, 3, 5, 8, 9});
  }

  SECTION("2. try_extract_min") {
    CHECK(with_failing_allocation([&] { (void) forest.try_extract_min(); }));
    CHECK(forest.size() == 6);
    CHECK(forest.find_min().key == 1);
    CHECK_FALSE(forest.validate());
  }

  SECTION("3. erase of a node below a root") {
    REQUIRE(forest.extract_min().key == 1);
    REQUIRE(forest.root_count() < 5);
    int_forest::node_handle nested{};
    forest.visit([&](const auto& node, std::size_t depth) {
      if (depth > 0) {
        nested = node.handle();
      }
    });
    REQUIRE(forest.contains(nested));
    const int key = forest.key(nested);
    const auto roots = forest.root_count();

    CHECK(with_failing_allocation([&] { (void) forest.erase(nested); }));
    CHECK(forest.contains(nested));
    CHECK(forest.key(nested) == key);
    CHECK(forest.size() == 5);
    CHECK(forest.root_count() == roots);
    CHECK_FALSE(forest.validate());

    CHECK(forest.erase(nested).key == key);
    CHECK_FALSE(forest.validate());
  }

  SECTION("4. the forest keeps working afterwards") {
    CHECK(with_failing_allocation([&] { (void) forest.extract_min(); }));
    CHECK(forest.extract_min().key == 1);
    forest.decrease_key(handles[4], 0);
    CHECK(drain(forest) == std::vector<int>{0, 2, 3, 5, 8});
  }
}

TEST_CASE("priority_forest insert survives a failing chunk allocation", "[pforest][priority_forest]") {
  int_forest forest{pforest::forest_config{.initial_chunk_capacity = 1, .max_chunk_capacity = 1}};
  forest.insert(4);
  REQUIRE(forest.size() == 1);

  CHECK(with_failing_allocation([&] { forest.insert(2); }));
  CHECK(forest.size() == 1);
  CHECK(forest.find_min().key == 4);
  CHECK_FALSE(forest.validate());

  forest.insert(2);
  CHECK(forest.find_min().key == 2);
  CHECK_FALSE(forest.validate());
}
