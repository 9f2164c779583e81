#pragma once

#include "../types.hpp"

namespace mrl {

constexpr Index FieldFactor = 4; // Resolution of persisted displacement fields relative to the volumes

/*
 * The effective geometric transform of a round. The shift is in full-resolution voxels (x, y, z). The field, if
 * present, is a displacement field at 1/factor resolution, channels along the last dimension in downsampled voxels.
 */
struct Transform
{
  Shift3     shift = Shift3::Zero();
  Re4 const *field = nullptr;
  Index      factor = FieldFactor;
};

// Physical shift to voxels
inline auto ToVoxels(Shift3 const &physical, Eigen::Array3f const &voxel) -> Shift3 { return physical / voxel; }

/*
 * Trilinear resampling out(x) = in(x + s), zero outside the input
 */
auto Translate(Re3 const &x, Shift3 const &s) -> Re3;

/*
 * Resample a downsampled displacement field onto the full-resolution grid. The factor on each axis is
 * min(factor, target), matching Downsample. Downsampled voxel centres sit at (i + 0.5) * f - 0.5 and displacements are
 * multiplied by f. Positions beyond the field's extent get zero displacement.
 */
auto UpsampleField(Re4 const &field, Sz3 const target, Index const factor) -> Re4;

/*
 * out(x) = in(x + d(x)), trilinear, zero outside the input. The field must match the volume's shape.
 */
auto Deform(Re3 const &x, Re4 const &field) -> Re3;

/*
 * Rigid translate, then deform with the upsampled field if there is one
 */
auto Apply(Re3 const &x, Transform const &t) -> Re3;

} // namespace mrl
