#pragma once

#include "../types.hpp"

#include <optional>

namespace mrl {

/*
 * Phase correlation. Returns the shift t, in voxels, such that moving(x) ≈ reference(x - t), refined to sub-voxel
 * precision with a parabola through the peak and its neighbours. Returns nothing if either input is flat or
 * non-finite, or if the correlation peak does not stand out from the background.
 */
template <int N> auto PhaseCorrelate(ReN<N> const &reference, ReN<N> const &moving) -> std::optional<Shift<N>>;

/*
 * Exhaustive search of integer z offsets within ±range, scored by normalised cross-correlation over the overlapping
 * slices, then refined with a parabola. Same sign convention as PhaseCorrelate.
 */
auto ZSearch(Re3 const &reference, Re3 const &moving, Index const range) -> std::optional<float>;

// Parabolic sub-sample offset of a peak from its two neighbours, in [-0.5, 0.5]
auto ParabolicPeak(float const minus, float const centre, float const plus) -> float;

} // namespace mrl
