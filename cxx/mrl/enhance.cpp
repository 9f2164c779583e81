#include "enhance.hpp"

#include "log/debug.hpp"
#include "log/log.hpp"
#include "sys/threads.hpp"

#include <algorithm>
#include <numbers>
#include <utility>
#include <vector>

namespace mrl {
namespace Enhance {

namespace {
auto Kernel(float const σ) -> std::vector<float>
{
  if (σ <= 0.f) { return {1.f}; }
  Index const        r = static_cast<Index>(std::ceil(3.f * σ));
  std::vector<float> k(2 * r + 1);
  float              sum = 0.f;
  for (Index ii = -r; ii <= r; ii++) {
    k[ii + r] = std::exp(-0.5f * (ii * ii) / (σ * σ));
    sum += k[ii + r];
  }
  for (auto &v : k) {
    v /= sum;
  }
  return k;
}

/* Convolve along one dimension of a column-major volume */
void Blur1D(Re3 const &x, Re3 &y, std::vector<float> const &k, int const dim)
{
  Index const nX = x.dimension(0), nY = x.dimension(1), nZ = x.dimension(2);
  Index const n = x.dimension(dim);
  Index const r = (Index)k.size() / 2;
  auto        task = [&](Index const lo, Index const hi) {
    for (Index iz = lo; iz < hi; iz++) {
      for (Index iy = 0; iy < nY; iy++) {
        for (Index ix = 0; ix < nX; ix++) {
          Sz3 const c{ix, iy, iz};
          float     sum = 0.f;
          for (Index ik = -r; ik <= r; ik++) {
            Sz3 s = c;
            s[dim] = std::clamp<Index>(c[dim] + ik, 0, n - 1);
            sum += k[ik + r] * x(s[0], s[1], s[2]);
          }
          y(ix, iy, iz) = sum;
        }
      }
    }
  };
  Threads::ChunkFor(task, nZ);
}
} // namespace

auto Sigmas(float const emission, Opts const &opts) -> Eigen::Array2f
{
  float const xy = 0.22f * emission / opts.NA;
  float const z = std::sqrt(6.f) / std::numbers::pi_v<float> * opts.RI * emission / (opts.NA * opts.NA);
  return Eigen::Array2f(xy, z);
}

auto Gaussian(Re3 const &x, Eigen::Array3f const &σ) -> Re3
{
  Re3 a = x;
  Re3 b(x.dimensions());
  for (int id = 0; id < 3; id++) {
    auto const k = Kernel(σ[id]);
    if (k.size() == 1) { continue; }
    Blur1D(a, b, k, id);
    std::swap(a, b);
  }
  return a;
}

auto Run(Re3 const &x, Eigen::Array3f const &voxel, float const emission, Opts const &opts) -> Re3
{
  if ((voxel <= 0.f).any()) { throw Log::Failure("Enhance", "Invalid voxel size {}", fmt::join(voxel, ",")); }
  if (!(emission > 0.f)) { throw Log::Failure("Enhance", "Invalid emission wavelength {}", emission); }
  auto const     s = Sigmas(emission, opts);
  Eigen::Array3f σ(s[0], s[0], s[1]);
  σ /= voxel;
  Eigen::Array3f const σSmall = σ / std::sqrt(2.f);
  Eigen::Array3f const σLarge = σ * std::sqrt(2.f);
  Log::Print("Enhance", "DoG σ small {} large {} voxels", fmt::join(σSmall, ","), fmt::join(σLarge, ","));
  Re3 const g1 = Gaussian(x, σSmall);
  Re3 const g2 = Gaussian(x, σLarge);
  Re3       dog(x.dimensions());
  dog.device(Threads::TensorDevice()) = (g1 - g2).cwiseMax(0.f);
  Log::Tensor<3>("dog", dog, HD5::Dims::Image);
  return dog;
}

} // namespace Enhance
} // namespace mrl
