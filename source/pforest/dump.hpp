#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace pforest {
  // Writes the shape of a forest, one node per line, children indented below
  // their parent:
  //
  //   priority_forest size=4 roots=2 min=1
  //     1 (degree 2)
  //       7 (degree 0, marked)
  //       4 (degree 0)
  //     3 (degree 0)
  template <class Forest>
  std::ostream& dump(std::ostream& out, const Forest& forest) {
    out << "priority_forest size=" << forest.size() << " roots=" << forest.root_count();
    if (const auto* min = forest.try_find_min()) {
      out << " min=" << min->key;
    }
    out << '\n';
    forest.visit([&out](const auto& node, std::size_t depth) {
      out << std::string(2 * (depth + 1), ' ') << node.key() << " (degree " << node.degree();
      if (node.marked()) {
        out << ", marked";
      }
      out << ")\n";
    });
    return out;
  }
} // namespace pforest
