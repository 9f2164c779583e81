#pragma once

#include "mrl/io/file.hpp"
#include "mrl/types.hpp"

#include <string>
#include <vector>

/*
 * Smooth test volumes and small dataset files
 */
namespace synthetic {

// Sum of Gaussian blobs kept away from the borders. Same seed, same volume.
auto Blobs(mrl::Sz3 const shape, int const seed = 7, Index const nBlobs = 24, float const σ = 3.f) -> mrl::Re3;

// A single Gaussian blob centred on voxel shape / 2
auto Blob(mrl::Sz3 const shape, float const σ, float const amplitude) -> mrl::Re3;

// Uniform noise in [0, 1000)
auto Noise(mrl::Sz3 const shape, int const seed) -> mrl::Re3;

struct BitSpec
{
  Index round;
  Index psf = 0;
};

/*
 * Writes calibrations (a delta PSF) and one tile, with a raw volume per round and per bit. Voxel size is x, y, z.
 */
void WriteDataset(mrl::HD5::File const            &file,
                  Index const                      tile,
                  std::vector<mrl::U16_3> const   &rounds,
                  std::vector<mrl::U16_3> const   &bits,
                  std::vector<BitSpec> const      &bitSpecs,
                  Eigen::Array3f const            &voxel);

} // namespace synthetic
