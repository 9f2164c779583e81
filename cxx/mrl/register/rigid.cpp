#include "rigid.hpp"

#include "../log/debug.hpp"
#include "../log/log.hpp"
#include "../volume.hpp"
#include "apply.hpp"
#include "correlate.hpp"

namespace mrl {
namespace Rigid {

auto Estimate(Re3 const &ref, Re3 const &mov, Eigen::Array3f const &voxel, Opts const &opts) -> Result
{
  Sz3 const shape = ref.dimensions();
  if (shape != mov.dimensions()) {
    throw Log::Failure("Rigid", "Reference shape {} does not match moving shape {}", shape, mov.dimensions());
  }
  if (opts.factor < 1) { throw Log::Failure("Rigid", "Invalid downsample factor {}", opts.factor); }
  /* Downsample clamps the block size to the dimension, so small axes have a smaller effective factor */
  Eigen::Array3f factors;
  for (int id = 0; id < 3; id++) {
    factors[id] = static_cast<float>(std::min(opts.factor, shape[id]));
  }
  Eigen::Array3f const scale = factors * voxel; // Downsampled voxels to physical units

  auto const t0 = Log::Now();
  Re3 const  refDs = Downsample(ref, opts.factor);
  Result     result;

  // XY
  {
    Re3 const movDs = Downsample(mov, opts.factor);
    Re2 const refP = MaxProjection(refDs);
    Re2 const movP = MaxProjection(movDs);
    Log::Tensor<2>("rigid-ref-mip", refP, HD5::Dims::Projection);
    Log::Tensor<2>("rigid-mov-mip", movP, HD5::Dims::Projection);
    if (auto const s = PhaseCorrelate<2>(refP, movP)) {
      result.xy = Shift3((*s)[0], (*s)[1], 0.f) * scale;
    } else {
      Log::Warn("Rigid", "XY pass found no correlation peak, using zero shift");
    }
  }
  Log::Print("Rigid", "XY shift {}", fmt::join(result.xy, ","));

  // Z
  Re3 aligned = Translate(mov, ToVoxels(result.xy, voxel));
  {
    Re3 const movDs = Downsample(aligned, opts.factor);
    if (auto const z = ZSearch(refDs, movDs, opts.zRange)) {
      result.z = Shift3(0.f, 0.f, *z) * scale;
    } else {
      Log::Warn("Rigid", "Z pass found no correlation peak, using zero shift");
    }
  }
  Log::Print("Rigid", "Z shift {}", fmt::join(result.z, ","));

  // XYZ
  aligned = Translate(mov, ToVoxels(result.xy + result.z, voxel));
  {
    Re3 const movDs = Downsample(aligned, opts.factor);
    Log::Tensor<3>("rigid-ref-ds", refDs, HD5::Dims::Image);
    Log::Tensor<3>("rigid-mov-ds", movDs, HD5::Dims::Image);
    if (auto const s = PhaseCorrelate<3>(refDs, movDs)) {
      result.xyz = *s * scale;
    } else {
      Log::Warn("Rigid", "3D pass found no correlation peak, using zero shift");
    }
  }
  Log::Print("Rigid", "3D shift {}", fmt::join(result.xyz, ","));

  result.total = result.xy + result.z + result.xyz;
  Log::Print("Rigid", "Total shift {} µm in {}", fmt::join(result.total, ","), Log::ToNow(t0));
  return result;
}

} // namespace Rigid
} // namespace mrl
