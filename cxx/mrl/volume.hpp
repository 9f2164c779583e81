#pragma once

#include "types.hpp"

#include <algorithm>
#include <cmath>

namespace mrl {

auto ToFloat(U16_3 const &x) -> Re3;
auto ToU16(Re3 const &x) -> U16_3; // Rounds and clamps to [0, 65535]

/*
 * Block-mean downsampling by an integer factor in every dimension. Output dimensions are floor(n / factor), at
 * least 1. Partial blocks at the far edges are dropped.
 */
auto Downsample(Re3 const &x, Index const factor) -> Re3;

// Maximum intensity projection along z
auto MaxProjection(Re3 const &x) -> Re2;

/*
 * Trilinear sample at a fractional voxel position. Positions outside [0, n-1] on any axis return 0.
 */
inline auto Sample(Re3 const &x, float const px, float const py, float const pz) -> float
{
  Index const nX = x.dimension(0), nY = x.dimension(1), nZ = x.dimension(2);
  constexpr float eps = 1.e-4f;
  if (!(px > -eps && py > -eps && pz > -eps && px < nX - 1 + eps && py < nY - 1 + eps && pz < nZ - 1 + eps)) {
    return 0.f;
  }
  Index const ix = std::clamp<Index>(static_cast<Index>(std::floor(px)), 0, nX - 1);
  Index const iy = std::clamp<Index>(static_cast<Index>(std::floor(py)), 0, nY - 1);
  Index const iz = std::clamp<Index>(static_cast<Index>(std::floor(pz)), 0, nZ - 1);
  Index const jx = std::min(ix + 1, nX - 1), jy = std::min(iy + 1, nY - 1), jz = std::min(iz + 1, nZ - 1);
  float const fx = std::clamp(px - ix, 0.f, 1.f), fy = std::clamp(py - iy, 0.f, 1.f), fz = std::clamp(pz - iz, 0.f, 1.f);

  float const c00 = x(ix, iy, iz) * (1.f - fx) + x(jx, iy, iz) * fx;
  float const c10 = x(ix, jy, iz) * (1.f - fx) + x(jx, jy, iz) * fx;
  float const c01 = x(ix, iy, jz) * (1.f - fx) + x(jx, iy, jz) * fx;
  float const c11 = x(ix, jy, jz) * (1.f - fx) + x(jx, jy, jz) * fx;
  float const c0 = c00 * (1.f - fy) + c10 * fy;
  float const c1 = c01 * (1.f - fy) + c11 * fy;
  return c0 * (1.f - fz) + c1 * fz;
}

} // namespace mrl
