#include <pforest/priority_forest.hpp>

#include <cstddef>
#include <deque>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
  struct edge {
    std::size_t to;
    double cost;
  };

  struct graph {
    std::vector<std::string> names;
    std::vector<std::vector<edge>> edges;

    std::size_t add_vertex(std::string name) {
      names.push_back(std::move(name));
      edges.emplace_back();
      return names.size() - 1;
    }

    void add_edge(std::size_t from, std::size_t to, double cost) {
      edges[from].push_back(edge{to, cost});
    }
  };

  struct route {
    std::vector<double> cost;
    std::vector<std::optional<std::size_t>> prev;
  };

  // Dijkstra over a forest keyed by tentative distance. Every vertex is
  // queued up front; relaxing an edge lowers the key through the vertex's
  // handle.
  route solve(const graph& g, std::size_t source) {
    using queue_type = pforest::priority_forest<double, std::size_t>;
    constexpr double unreachable = std::numeric_limits<double>::infinity();

    const std::size_t count = g.names.size();
    route result{std::vector<double>(count, unreachable), std::vector<std::optional<std::size_t>>(count)};
    std::vector<queue_type::node_handle> handles(count);
    std::vector<bool> visited(count, false);

    queue_type queue;
    result.cost[source] = 0.0;
    for (std::size_t v = 0; v < count; ++v) {
      handles[v] = queue.insert(result.cost[v], v);
    }

    while (auto next = queue.try_extract_min()) {
      if (next->key == unreachable) {
        break;
      }
      const std::size_t u = next->value;
      visited[u] = true;
      for (const edge& e: g.edges[u]) {
        const double cost = result.cost[u] + e.cost;
        if (!visited[e.to] && cost < result.cost[e.to]) {
          queue.decrease_key(handles[e.to], cost);
          result.cost[e.to] = cost;
          result.prev[e.to] = u;
        }
      }
    }
    return result;
  }

  void print_route(const graph& g, const route& r, std::size_t target) {
    std::deque<std::size_t> points;
    for (std::optional<std::size_t> v = target; v; v = r.prev[*v]) {
      points.push_front(*v);
    }
    std::cout << g.names[target] << ": " << r.cost[target] << " via";
    for (std::size_t v: points) {
      std::cout << " " << g.names[v];
    }
    std::cout << std::endl;
  }
} // namespace

int main() {
  graph g;
  const auto jita = g.add_vertex("Jita");
  const auto perimeter = g.add_vertex("Perimeter");
  const auto urlen = g.add_vertex("Urlen");
  const auto sirppala = g.add_vertex("Sirppala");
  const auto inaro = g.add_vertex("Inaro");
  const auto amarr = g.add_vertex("Amarr");
  const auto niarja = g.add_vertex("Niarja");

  g.add_edge(jita, perimeter, 14.0);
  g.add_edge(perimeter, jita, 14.0);
  g.add_edge(jita, urlen, 30.0);
  g.add_edge(perimeter, urlen, 14.0);
  g.add_edge(urlen, sirppala, 14.0);
  g.add_edge(sirppala, inaro, 14.0);
  g.add_edge(perimeter, niarja, 60.0);
  g.add_edge(inaro, niarja, 14.0);
  g.add_edge(niarja, amarr, 14.0);

  const route r = solve(g, jita);
  for (std::size_t v = 0; v < g.names.size(); ++v) {
    if (r.cost[v] == std::numeric_limits<double>::infinity()) {
      std::cerr << g.names[v] << ": unreachable" << std::endl;
      continue;
    }
    print_route(g, r, v);
  }
}
