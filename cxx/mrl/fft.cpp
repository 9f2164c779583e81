#include "fft.hpp"

#include "log/log.hpp"
#include "sys/threads.hpp"

#include "ducc0/fft/fftnd_impl.h"

#include <functional>
#include <numeric>

namespace mrl {
namespace FFT {
namespace internal {
/*
 *  Wrapper for DUCC. Adapted from https://github.com/tensorflow/tensorflow/blob/master/third_party/ducc/threading.h
 */
struct ThreadPool : ducc0::detail_threading::thread_pool
{
  ThreadPool(Eigen::ThreadPoolDevice &dev)
    : pool_{dev.getPool()}
  {
  }

  size_t nthreads() const override { return (size_t)pool_->NumThreads(); }
  size_t adjust_nthreads(size_t nthreads_in) const override
  {
    // If called by a thread in the pool, return 1
    if (pool_->CurrentThreadId() >= 0) {
      return 1;
    } else if (nthreads_in == 0) {
      return (size_t)pool_->NumThreads();
    }
    return std::min<size_t>(nthreads_in, (size_t)pool_->NumThreads());
  };
  void submit(std::function<void()> work) override { pool_->Schedule(std::move(work)); }

private:
  Eigen::ThreadPoolInterface *pool_;
};
using Guard = ducc0::detail_threading::ScopedUseThreadPool;
} // namespace internal

template <int ND> void Run(CxN<ND> &x, bool const fwd)
{
  auto const shape = x.dimensions();
  /* DUCC is row-major, reverse dims */
  std::vector<size_t> duccShape(ND), duccDims(ND);
  std::copy(shape.rbegin(), shape.rend(), duccShape.begin());
  std::iota(duccDims.begin(), duccDims.end(), 0);
  float const scale = 1.f / std::sqrt(static_cast<float>(Product(shape)));
  internal::ThreadPool pool(Threads::TensorDevice());
  internal::Guard      guard(pool);
  ducc0::cfmav         xc(x.data(), duccShape);
  ducc0::vfmav         xv(x.data(), duccShape);
  auto const           t = Log::Now();
  ducc0::c2c(xc, xv, duccDims, fwd, scale, pool.nthreads());
  Log::Debug("FFT", "{} shape {} took {}", fwd ? "Forward" : "Adjoint", shape, Log::ToNow(t));
}

template <int ND> void Forward(CxN<ND> &x) { Run(x, true); }
template <int ND> void Adjoint(CxN<ND> &x) { Run(x, false); }

template void Forward<2>(Cx2 &);
template void Forward<3>(Cx3 &);
template void Adjoint<2>(Cx2 &);
template void Adjoint<3>(Cx3 &);

} // namespace FFT
} // namespace mrl
