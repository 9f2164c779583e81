#pragma once

#include "sys/threads.hpp"
#include "types.hpp"

#include <cmath>

namespace mrl {

namespace internal {
template <typename Expr> auto Scalar0(Expr const &e, bool const threads = true)
{
  using Scalar = typename Eigen::internal::traits<Expr>::Scalar;
  Eigen::TensorFixedSize<Scalar, Eigen::Sizes<>> r;
  if (threads) {
    r.device(Threads::TensorDevice()) = e;
  } else {
    r = e;
  }
  return r();
}
} // namespace internal

/*
 * Full reductions, evaluated on the global thread pool
 */
template <typename T> auto Sum(T const &a) { return internal::Scalar0(a.sum()); }
template <typename T> auto Mean(T const &a) { return internal::Scalar0(a.mean()); }
template <typename T> auto Minimum(T const &a) { return internal::Scalar0(a.minimum()); }
template <typename T> auto Maximum(T const &a) { return internal::Scalar0(a.maximum()); }

// L2 norm of a real or complex tensor expression. Tests pass false to stay off the pool.
template <bool threads, typename T> auto Norm(T const &a) -> float
{
  return std::sqrt(internal::Scalar0(a.abs().square().sum(), threads));
}

} // namespace mrl
