#include "inputs.hpp"

using namespace mrl;

EnhanceArgs::EnhanceArgs(args::Subparser &parser)
  : NA(parser, "NA", "Objective numerical aperture (1.35)", {"na"}, 1.35f)
  , RI(parser, "RI", "Immersion refractive index (1.51)", {"ri"}, 1.51f)
{
}

auto EnhanceArgs::Get() -> Enhance::Opts { return Enhance::Opts{.NA = NA.Get(), .RI = RI.Get()}; }

RigidArgs::RigidArgs(args::Subparser &parser)
  : factor(parser, "F", "Rigid downsampling factor (4)", {"rigid-factor"}, 4)
  , zRange(parser, "Z", "Z search half-width in downsampled voxels (8)", {"z-range"}, 8)
{
}

auto RigidArgs::Get() -> Rigid::Opts { return Rigid::Opts{.factor = factor.Get(), .zRange = zRange.Get()}; }

DenseArgs::DenseArgs(args::Subparser &parser)
  : enable(parser, "D", "Refine with a dense displacement field", {"dense", 'd'})
  , its(parser, "N", "Demons iterations (50)", {"dense-its"}, 50)
  , σ(parser, "σ", "Demons field smoothing in voxels (1)", {"dense-sigma"}, 1.f)
  , noHistograms(parser, "H", "Do not match histograms before demons", {"no-histogram-match"})
{
}

auto DenseArgs::Get() -> Dense::Opts
{
  return Dense::Opts{.its = its.Get(), .σ = σ.Get(), .histograms = !noHistograms.Get()};
}
