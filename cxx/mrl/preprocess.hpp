#pragma once

#include "decon.hpp"
#include "enhance.hpp"

namespace mrl {

struct Preprocessed
{
  U16_3 decon;
  Re3   dog;
};

/*
 * Deconvolve then enhance one readout volume
 */
auto Preprocess(U16_3 const    &raw,
                Re3 const      &psf,
                Eigen::Array3f  voxel,
                float const     emission,
                Decon::Opts const   &dOpts = Decon::Opts(),
                Enhance::Opts const &eOpts = Enhance::Opts()) -> Preprocessed;

} // namespace mrl
