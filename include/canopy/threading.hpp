#pragma once

/**
 * Canopy Threading Utilities
 *
 * Fork/join over independent units: OpenMP when available, a thread pool
 * otherwise. Units never share mutable state; results are written to
 * per-unit slots and read after the join.
 */

#include <cstddef>
#include <functional>

namespace canopy {
namespace threading {

/**
 * Run body(i) for every i in [begin, end).
 *
 * Every unit runs to completion. If any unit throws, the exception of the
 * lowest failed index is rethrown after the join. Calls made from inside a
 * worker run serially.
 *
 * @param n_threads Upper bound on workers; <= 0 means all cores
 */
void parallel_for(size_t begin, size_t end,
                  const std::function<void(size_t)>& body,
                  int n_threads = -1);

int get_max_threads();

// Safe while other threads are inside parallel_for; they finish on the
// workers they started with
void set_num_threads(int n);

} // namespace threading
} // namespace canopy
