#pragma once

#include "../types.hpp"

#include <itkImage.h>
#include <itkVector.h>

namespace mrl {
namespace Dense {

using ImageType = itk::Image<float, 3>;
using VectorType = itk::Vector<float, 3>;
using FieldType = itk::Image<VectorType, 3>;

struct Opts
{
  Index its = 50;
  float σ = 1.f;          // Smoothing of the displacement field, in voxels
  bool  histograms = true; // Match the moving histogram to the fixed one first
  Index levels = 1024;
  Index matchPoints = 7;
};

/*
 * Wrap a volume as an ITK image without copying. The volume must outlive the image.
 */
auto Import(Re3Map const data) -> ImageType::Pointer;

/*
 * Demons registration of two volumes with unit spacing. The returned field d has the volumes' shape with 3 channels
 * last, such that moving(x + d(x)) ≈ fixed(x).
 */
auto Estimate(Re3 fixed, Re3 moving, Opts const &opts) -> Re4;

} // namespace Dense
} // namespace mrl
