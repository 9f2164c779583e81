#include "apply.hpp"

#include "../log/log.hpp"
#include "../sys/threads.hpp"
#include "../volume.hpp"

namespace mrl {

auto Translate(Re3 const &x, Shift3 const &s) -> Re3
{
  Sz3 const shape = x.dimensions();
  Re3       y(shape);
  auto      task = [&](Index const lo, Index const hi) {
    for (Index iz = lo; iz < hi; iz++) {
      for (Index iy = 0; iy < shape[1]; iy++) {
        for (Index ix = 0; ix < shape[0]; ix++) {
          y(ix, iy, iz) = Sample(x, ix + s[0], iy + s[1], iz + s[2]);
        }
      }
    }
  };
  Threads::ChunkFor(task, shape[2]);
  Log::Debug("Apply", "Translated by {}", fmt::join(s, ","));
  return y;
}

auto UpsampleField(Re4 const &field, Sz3 const target, Index const factor) -> Re4
{
  if (field.dimension(3) != 3) { throw Log::Failure("Apply", "Displacement field must have 3 channels, had {}", field.dimension(3)); }
  Sz3 const fshape = FirstN<3>(field.dimensions());
  // Axes shorter than the factor were downsampled by their own length
  Eigen::Array3f f;
  for (Index id = 0; id < 3; id++) {
    f[id] = static_cast<float>(std::max(Index(1), std::min(factor, target[id])));
  }
  Re4 up(AddBack(target, 3));
  Re3 channel(fshape);
  for (Index ic = 0; ic < 3; ic++) {
    channel = field.chip<3>(ic);
    auto task = [&](Index const lo, Index const hi) {
      for (Index iz = lo; iz < hi; iz++) {
        float const fz = (iz + 0.5f) / f[2] - 0.5f;
        for (Index iy = 0; iy < target[1]; iy++) {
          float const fy = (iy + 0.5f) / f[1] - 0.5f;
          for (Index ix = 0; ix < target[0]; ix++) {
            float const fx = (ix + 0.5f) / f[0] - 0.5f;
            if (fx < -0.5f || fy < -0.5f || fz < -0.5f || fx > fshape[0] - 0.5f || fy > fshape[1] - 0.5f ||
                fz > fshape[2] - 0.5f) {
              up(ix, iy, iz, ic) = 0.f;
            } else {
              float const cx = std::clamp(fx, 0.f, fshape[0] - 1.f);
              float const cy = std::clamp(fy, 0.f, fshape[1] - 1.f);
              float const cz = std::clamp(fz, 0.f, fshape[2] - 1.f);
              up(ix, iy, iz, ic) = Sample(channel, cx, cy, cz) * f[ic];
            }
          }
        }
      }
    };
    Threads::ChunkFor(task, target[2]);
  }
  Log::Debug("Apply", "Upsampled field {} to {} factors {}", fshape, target, fmt::join(f, ","));
  return up;
}

auto Deform(Re3 const &x, Re4 const &field) -> Re3
{
  Sz3 const shape = x.dimensions();
  if (FirstN<3>(field.dimensions()) != shape || field.dimension(3) != 3) {
    throw Log::Failure("Apply", "Field shape {} does not match volume {}", field.dimensions(), shape);
  }
  Re3  y(shape);
  auto task = [&](Index const lo, Index const hi) {
    for (Index iz = lo; iz < hi; iz++) {
      for (Index iy = 0; iy < shape[1]; iy++) {
        for (Index ix = 0; ix < shape[0]; ix++) {
          y(ix, iy, iz) =
            Sample(x, ix + field(ix, iy, iz, 0), iy + field(ix, iy, iz, 1), iz + field(ix, iy, iz, 2));
        }
      }
    }
  };
  Threads::ChunkFor(task, shape[2]);
  return y;
}

auto Apply(Re3 const &x, Transform const &t) -> Re3
{
  Re3 y = Translate(x, t.shift);
  if (t.field) {
    Re4 const up = UpsampleField(*t.field, y.dimensions(), t.factor);
    y = Deform(y, up);
  }
  return y;
}

} // namespace mrl
