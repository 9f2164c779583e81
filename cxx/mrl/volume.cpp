#include "volume.hpp"

#include "log/log.hpp"
#include "sys/threads.hpp"

namespace mrl {

auto ToFloat(U16_3 const &x) -> Re3
{
  Re3 y(x.dimensions());
  y.device(Threads::TensorDevice()) = x.cast<float>();
  return y;
}

auto ToU16(Re3 const &x) -> U16_3
{
  U16_3 y(x.dimensions());
  y.device(Threads::TensorDevice()) = x.round().cwiseMax(0.f).cwiseMin(65535.f).cast<uint16_t>();
  return y;
}

auto Downsample(Re3 const &x, Index const factor) -> Re3
{
  if (factor < 1) { throw Log::Failure("Volume", "Downsample factor {} must be at least 1", factor); }
  Sz3 const ishape = x.dimensions();
  Sz3 const oshape = Div(ishape, factor);
  Re3       y(oshape);
  if (factor == 1) {
    y = x;
    return y;
  }
  Index const fx = std::min(factor, ishape[0]), fy = std::min(factor, ishape[1]), fz = std::min(factor, ishape[2]);
  float const scale = 1.f / (fx * fy * fz);
  auto        task = [&](Index const lo, Index const hi) {
    for (Index iz = lo; iz < hi; iz++) {
      for (Index iy = 0; iy < oshape[1]; iy++) {
        for (Index ix = 0; ix < oshape[0]; ix++) {
          float sum = 0.f;
          for (Index kz = 0; kz < fz; kz++) {
            for (Index ky = 0; ky < fy; ky++) {
              for (Index kx = 0; kx < fx; kx++) {
                sum += x(ix * fx + kx, iy * fy + ky, iz * fz + kz);
              }
            }
          }
          y(ix, iy, iz) = sum * scale;
        }
      }
    }
  };
  Threads::ChunkFor(task, oshape[2]);
  Log::Debug("Volume", "Downsampled {} to {}", ishape, oshape);
  return y;
}

auto MaxProjection(Re3 const &x) -> Re2
{
  Re2 p(x.dimension(0), x.dimension(1));
  p.device(Threads::TensorDevice()) = x.maximum(Sz1{2});
  return p;
}

} // namespace mrl
