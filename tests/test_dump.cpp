#include "pforest/dump.hpp"
#include "pforest/priority_forest.hpp"

#include <catch2/catch_all.hpp>

#include <sstream>
#include <string>

TEST_CASE("dump lists every root of a fresh forest", "[pforest][dump]") {
  pforest::priority_forest<int> forest;
  forest.insert(3);
  forest.insert(1);
  forest.insert(2);

  std::ostringstream out;
  pforest::dump(out, forest);
  CHECK(out.str() ==
        "priority_forest size=3 roots=3 min=1\n"
        "  1 (degree 0)\n"
        "  2 (degree 0)\n"
        "  3 (degree 0)\n");
}

TEST_CASE("dump indents children below their parent", "[pforest][dump]") {
  pforest::priority_forest<int> forest;
  forest.insert(3);
  forest.insert(1);
  forest.insert(2);
  (void) forest.extract_min();

  std::ostringstream out;
  pforest::dump(out, forest);
  CHECK(out.str() ==
        "priority_forest size=2 roots=1 min=2\n"
        "  2 (degree 1)\n"
        "    3 (degree 0)\n");
}

TEST_CASE("dump flags marked nodes", "[pforest][dump]") {
  pforest::priority_forest<int> forest;
  pforest::priority_forest<int>::node_handle six{};
  for (int key = 0; key < 9; ++key) {
    auto h = forest.insert(key);
    if (key == 6) {
      six = h;
    }
  }
  (void) forest.extract_min();
  forest.decrease_key(six, -1);

  std::ostringstream out;
  pforest::dump(out, forest);
  CHECK_THAT(out.str(), Catch::Matchers::StartsWith("priority_forest size=8 roots=2 min=-1\n  -1 (degree 0)\n"));
  CHECK_THAT(out.str(), Catch::Matchers::ContainsSubstring("    5 (degree 1, marked)\n"));
  CHECK_THAT(out.str(), Catch::Matchers::ContainsSubstring("      7 (degree 1)\n"));
}

TEST_CASE("dump of an empty forest is a single line", "[pforest][dump]") {
  pforest::priority_forest<int> forest;
  std::ostringstream out;
  pforest::dump(out, forest);
  CHECK(out.str() == "priority_forest size=0 roots=0\n");
}
