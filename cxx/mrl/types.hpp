#pragma once

// EIGEN_USE_THREADS must be defined before these, CMakeLists.txt does it
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>

#include <algorithm>
#include <array>
#include <cassert>
#include <complex>
#include <cstdint>
#include <numeric>

using Index = Eigen::Index;

namespace mrl {

/* Volumes are column-major x, y, z. Stacks and fields add a last dimension. */
template <int N> using ReN = Eigen::Tensor<float, N>;
using Re2 = ReN<2>;
using Re3 = ReN<3>;
using Re4 = ReN<4>;
using Re3Map = Eigen::TensorMap<Re3>;

/* Camera data and everything persisted from it is unsigned 16-bit */
template <int N> using U16N = Eigen::Tensor<uint16_t, N>;
using U16_3 = U16N<3>;
using U16_4 = U16N<4>;

using Cx = std::complex<float>;
template <int N> using CxN = Eigen::Tensor<Cx, N>;
using Cx2 = CxN<2>;
using Cx3 = CxN<3>;

template <int Rank> using Sz = typename Eigen::DSizes<Index, Rank>;
using Sz1 = Sz<1>;
using Sz2 = Sz<2>;
using Sz3 = Sz<3>;
using Sz4 = Sz<4>;

// Translations, x, y(, z)
template <int N> using Shift = Eigen::Array<float, N, 1>;
using Shift2 = Shift<2>;
using Shift3 = Shift<3>;

// DSizes uses DenseIndex, HD5 and fmt want a plain array
template <int N> auto ToArray(Sz<N> const &sz) -> std::array<Index, N>
{
  std::array<Index, N> a;
  std::copy(sz.begin(), sz.end(), a.begin());
  return a;
}

template <typename T, int N, typename... Args> auto AddBack(Eigen::DSizes<T, N> const &front, Args... toAdd)
{
  static_assert(sizeof...(Args) > 0);
  Eigen::DSizes<T, N + sizeof...(Args)> out;
  std::copy_n(front.begin(), N, out.begin());
  Index ii = N;
  ((out[ii++] = static_cast<T>(toAdd)), ...);
  return out;
}

template <size_t N, typename T> auto FirstN(T const &sz) -> Eigen::DSizes<typename T::value_type, N>
{
  assert(N <= sz.size());
  Eigen::DSizes<typename T::value_type, N> first;
  std::copy_n(sz.begin(), N, first.begin());
  return first;
}

template <int N> auto Product(Sz<N> const &sz) -> Index
{
  return std::accumulate(sz.begin(), sz.end(), Index(1), std::multiplies<Index>());
}

// Integer division of every dimension, never below 1
template <int N, typename T> auto Div(Sz<N> const &sz, T const d) -> Sz<N>
{
  Sz<N> result;
  std::transform(sz.begin(), sz.end(), result.begin(), [d](Index const i) { return std::max<Index>(1, i / d); });
  return result;
}

// Periodic index into [0, sz)
template <typename T> auto Wrap(T const index, T const sz) -> T
{
  T const w = index % sz;
  return w < 0 ? w + sz : w;
}

} // namespace mrl
