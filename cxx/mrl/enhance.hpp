#pragma once

#include "types.hpp"

namespace mrl {
namespace Enhance {

struct Opts
{
  float NA = 1.35f; // Objective numerical aperture
  float RI = 1.51f; // Immersion refractive index
};

/*
 * Approximate PSF standard deviations (lateral, axial) in µm for a widefield system
 */
auto Sigmas(float const emission, Opts const &opts) -> Eigen::Array2f;

/*
 * Difference of Gaussians tuned to the diffraction-limited spot size, negative responses clipped to zero.
 * Voxel size is in µm and x, y, z order.
 */
auto Run(Re3 const &x, Eigen::Array3f const &voxel, float const emission, Opts const &opts) -> Re3;

// Separable Gaussian blur, σ in voxels per axis. Borders replicate the edge voxel.
auto Gaussian(Re3 const &x, Eigen::Array3f const &σ) -> Re3;

} // namespace Enhance
} // namespace mrl
