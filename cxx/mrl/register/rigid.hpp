#pragma once

#include "../types.hpp"

namespace mrl {
namespace Rigid {

struct Opts
{
  Index factor = 4; // Downsampling applied before every pass
  Index zRange = 8; // Z search half-width, in downsampled voxels
};

/*
 * Partial and cumulative shifts, in physical units and x, y, z order. registered(p) = moving(p + total).
 */
struct Result
{
  Shift3 xy = Shift3::Zero();
  Shift3 z = Shift3::Zero();
  Shift3 xyz = Shift3::Zero();
  Shift3 total = Shift3::Zero();
};

/*
 * Three-pass translation estimate of moving onto reference. An XY pass on maximum intensity projections, a Z search,
 * then a full 3D phase correlation on the coarsely aligned pair. Passes that find no usable peak contribute zero.
 */
auto Estimate(Re3 const &reference, Re3 const &moving, Eigen::Array3f const &voxel, Opts const &opts) -> Result;

} // namespace Rigid
} // namespace mrl
