#pragma once

#include "../types.hpp"

#include <unsupported/Eigen/CXX11/ThreadPool>

namespace mrl {
namespace Threads {

auto GlobalPool() -> Eigen::ThreadPool *;
auto TensorDevice() -> Eigen::ThreadPoolDevice &;

auto GlobalThreadCount() -> Index;
void SetGlobalThreadCount(Index const n); // n < 1 means one per hardware thread

/*
 * Call f(lo, hi) on contiguous ranges covering [0, n), one per pool thread, and wait for all of them. Volume loops
 * pass the number of z slices.
 */
template <typename F> void ChunkFor(F const &f, Index const n)
{
  if (n < 1) { return; }
  Index const nC = std::min(n, GlobalThreadCount());
  if (nC == 1) {
    f(0, n);
    return;
  }
  Eigen::Barrier barrier(static_cast<unsigned>(nC));
  for (Index ic = 0; ic < nC; ic++) {
    Index const lo = ic * n / nC;
    Index const hi = (ic + 1) * n / nC;
    GlobalPool()->Schedule([&barrier, &f, lo, hi] {
      f(lo, hi);
      barrier.Notify();
    });
  }
  barrier.Wait();
}

} // namespace Threads
} // namespace mrl
