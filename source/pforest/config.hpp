#pragma once

#include <cstddef>

namespace pforest {
  // Sizing of the chunks node storage is carved from. The first chunk holds
  // initial_chunk_capacity nodes, every following chunk twice as many as the
  // previous one until max_chunk_capacity is reached.
  struct forest_config {
    std::size_t initial_chunk_capacity = 32;
    std::size_t max_chunk_capacity = 4096;
  };
} // namespace pforest
