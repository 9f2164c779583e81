#pragma once

#include "types.hpp"

namespace mrl {
namespace FFT {

/*
 * Unitary (1/sqrt(N) scaled) complex transforms over every dimension. The zero frequency stays at index 0, no shifts.
 */
template <int ND> void Forward(CxN<ND> &data);
template <int ND> void Adjoint(CxN<ND> &data);

} // namespace FFT
} // namespace mrl
