#pragma once

#include "types.hpp"

namespace mrl {
namespace Decon {

struct Opts
{
  Index its = 40;
  float λ = 1.e-4f; // Total-variation regularisation
};

/*
 * Centre a PSF in a volume of the given shape, normalise it to unit sum, and rotate its centre to the origin.
 * PSFs larger than the volume are cropped symmetrically.
 */
auto PadPSF(Re3 const &psf, Sz3 const shape) -> Re3;

/*
 * Richardson-Lucy deconvolution with total-variation regularisation. Convolutions are done with the FFT, so the
 * volume boundaries wrap.
 */
auto Run(U16_3 const &raw, Re3 const &psf, Opts const &opts) -> U16_3;
auto Run(Re3 const &raw, Re3 const &psf, Opts const &opts) -> Re3;

} // namespace Decon
} // namespace mrl
