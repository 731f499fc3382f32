#include "pforest/intrusive/queue.hpp"

#include <catch2/catch_all.hpp>

#include <vector>

namespace {
  struct slot {
    int id;
    slot* next_free = nullptr;
  };

  using free_list = pforest::intrusive::queue<&slot::next_free>;

  std::vector<int> drain(free_list& list) {
    std::vector<int> ids;
    while (!list.empty()) {
      ids.push_back(list.pop_front()->id);
    }
    return ids;
  }
} // namespace

TEST_CASE("queue hands slots back in FIFO order", "[intrusive][queue]") {
  free_list list;
  slot s1{1};
  slot s2{2};
  slot s3{3};

  list.push_back(&s1);
  list.push_back(&s2);
  list.push_back(&s3);

  auto* first = list.pop_front();
  REQUIRE(first == &s1);
  REQUIRE(first->next_free == nullptr);
  REQUIRE(s2.next_free == &s3);
  list.push_front(first);
  REQUIRE(s1.next_free == &s2);
  REQUIRE(list.back() == &s3);
  CHECK(drain(list) == std::vector<int>{1, 2, 3});
  CHECK(list.back() == nullptr);
}

TEST_CASE("queue splices whole chains in constant time", "[intrusive][queue]") {
  slot s0{0};
  slot s1{1};
  slot s2{2};
  slot s3{3};
  slot s4{4};

  free_list ours;
  ours.push_back(&s1);
  ours.push_back(&s2);

  free_list theirs;
  theirs.push_back(&s3);
  theirs.push_back(&s4);
  ours.append(std::move(theirs));
  CHECK(theirs.empty());
  CHECK(ours.back() == &s4);

  free_list prefix;
  prefix.push_back(&s0);
  ours.prepend(std::move(prefix));
  CHECK(prefix.empty());
  CHECK(s0.next_free == &s1);
  CHECK(drain(ours) == std::vector<int>{0, 1, 2, 3, 4});
}

TEST_CASE("queue moves leave the source empty", "[intrusive][queue]") {
  free_list source;
  slot s1{1};
  slot s2{2};
  source.push_back(&s1);
  source.push_back(&s2);

  free_list moved{std::move(source)};
  REQUIRE(source.empty());
  REQUIRE(source.back() == nullptr);
  REQUIRE(moved.back() == &s2);
  REQUIRE(s1.next_free == &s2);
  REQUIRE(s2.next_free == nullptr);

  free_list target;
  slot s3{3};
  target.push_back(&s3);
  target = std::move(moved);
  REQUIRE(target.back() == &s2);
  REQUIRE(s3.next_free == nullptr);
  CHECK(drain(target) == std::vector<int>{1, 2});
}

TEST_CASE("queue edge cases", "[intrusive][queue]") {
  SECTION("empty queue pops nothing") {
    free_list list;
    CHECK(list.pop_front() == nullptr);
    CHECK(list.back() == nullptr);
    CHECK(list.empty());
  }

  SECTION("push_front on an empty queue sets both ends") {
    free_list list;
    slot only{7, &only};
    list.push_front(&only);
    CHECK(only.next_free == nullptr);
    CHECK(list.back() == &only);
    CHECK(list.pop_front() == &only);
    CHECK(list.empty());
    CHECK(list.back() == nullptr);
  }

  SECTION("append and prepend with empty operands") {
    free_list list;
    list.append(free_list{});
    list.prepend(free_list{});
    CHECK(list.empty());

    slot s1{1};
    free_list single;
    single.push_back(&s1);
    list.prepend(std::move(single));
    CHECK_FALSE(list.empty());
    CHECK(list.back() == &s1);

    slot s2{2};
    free_list tail;
    tail.push_back(&s2);
    list.append(std::move(tail));
    list.append(free_list{});
    CHECK(drain(list) == std::vector<int>{1, 2});
  }
}
