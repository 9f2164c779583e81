#include "preprocess.hpp"

#include "log/log.hpp"
#include "volume.hpp"

namespace mrl {

auto Preprocess(U16_3 const         &raw,
                Re3 const           &psf,
                Eigen::Array3f       voxel,
                float const          emission,
                Decon::Opts const   &dOpts,
                Enhance::Opts const &eOpts) -> Preprocessed
{
  Preprocessed p;
  p.decon = Decon::Run(raw, psf, dOpts);
  p.dog = Enhance::Run(ToFloat(p.decon), voxel, emission, eOpts);
  return p;
}

} // namespace mrl
