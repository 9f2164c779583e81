#include "correlate.hpp"

#include "../fft.hpp"
#include "../log/debug.hpp"
#include "../log/log.hpp"
#include "../sys/threads.hpp"
#include "../tensors.hpp"

#include <algorithm>
#include <limits>
#include <vector>

namespace mrl {

namespace {
/* How far the peak must stand above the background, in standard deviations of the correlation surface */
constexpr float PeakThreshold = 6.f;

template <int N> auto SurfaceDims() -> HD5::DNames<N>
{
  if constexpr (N == 2) {
    return HD5::Dims::Projection;
  } else {
    return HD5::Dims::Image;
  }
}

template <int N> auto IsFlat(ReN<N> const &x) -> bool
{
  float const lo = Minimum(x);
  float const hi = Maximum(x);
  return !std::isfinite(lo) || !std::isfinite(hi) || hi - lo <= 0.f;
}
} // namespace

auto ParabolicPeak(float const minus, float const centre, float const plus) -> float
{
  float const den = minus - 2.f * centre + plus;
  if (!(den < 0.f)) { return 0.f; }
  return std::clamp(0.5f * (minus - plus) / den, -0.5f, 0.5f);
}

template <int N> auto PhaseCorrelate(ReN<N> const &ref, ReN<N> const &mov) -> std::optional<Shift<N>>
{
  Sz<N> const shape = ref.dimensions();
  if (shape != mov.dimensions()) {
    throw Log::Failure("Correlate", "Reference shape {} does not match moving shape {}", shape, mov.dimensions());
  }
  if (IsFlat<N>(ref) || IsFlat<N>(mov)) {
    Log::Debug("Correlate", "Flat or non-finite input, no correlation possible");
    return std::nullopt;
  }

  CxN<N> F(shape), G(shape);
  F.device(Threads::TensorDevice()) = (ref - ref.constant(Mean(ref))).template cast<Cx>();
  G.device(Threads::TensorDevice()) = (mov - mov.constant(Mean(mov))).template cast<Cx>();
  FFT::Forward(F);
  FFT::Forward(G);
  G.device(Threads::TensorDevice()) = G * F.conjugate();
  float const floor = Maximum(ReN<N>(G.abs())) * 1.e-6f;
  G.device(Threads::TensorDevice()) = (G.abs() > floor).select(G / G.abs().template cast<Cx>(), G.constant(Cx(0.f)));
  FFT::Adjoint(G);

  ReN<N> surface(shape);
  surface.device(Threads::TensorDevice()) = G.real();
  Log::Tensor<N>("phase-correlation", surface, SurfaceDims<N>());

  Index const total = Product(shape);
  Index       peak = 0;
  for (Index ii = 1; ii < total; ii++) {
    if (surface.data()[ii] > surface.data()[peak]) { peak = ii; }
  }
  float const pv = surface.data()[peak];
  float const mean = Mean(surface);
  float const σ = std::sqrt(Mean(ReN<N>((surface - surface.constant(mean)).square())));
  if (!std::isfinite(pv) || !(σ > 0.f) || pv < mean + PeakThreshold * σ) {
    Log::Debug("Correlate", "No distinct peak, value {:4.3E} mean {:4.3E} std {:4.3E}", pv, mean, σ);
    return std::nullopt;
  }

  /* Unravel the column-major index */
  Sz<N> p;
  Index rem = peak;
  for (int id = 0; id < N; id++) {
    p[id] = rem % shape[id];
    rem /= shape[id];
  }

  Shift<N> s;
  for (int id = 0; id < N; id++) {
    Index const n = shape[id];
    Index const c = p[id] > n / 2 ? p[id] - n : p[id];
    float       sub = 0.f;
    if (n > 2) {
      Sz<N> lo = p, hi = p;
      lo[id] = Wrap(p[id] - 1, n);
      hi[id] = Wrap(p[id] + 1, n);
      sub = ParabolicPeak(surface(lo), pv, surface(hi));
    }
    s[id] = c + sub;
  }
  Log::Debug("Correlate", "Peak {:4.3E} ({:.1f} σ) shift {}", pv, (pv - mean) / σ, fmt::join(s, ","));
  return s;
}

template auto PhaseCorrelate<2>(Re2 const &, Re2 const &) -> std::optional<Shift2>;
template auto PhaseCorrelate<3>(Re3 const &, Re3 const &) -> std::optional<Shift3>;

auto ZSearch(Re3 const &ref, Re3 const &mov, Index const range) -> std::optional<float>
{
  Sz3 const shape = ref.dimensions();
  if (shape != mov.dimensions()) {
    throw Log::Failure("Correlate", "Reference shape {} does not match moving shape {}", shape, mov.dimensions());
  }
  Index const nZ = shape[2];
  Index const r = std::min(range, nZ / 2);
  if (nZ < 2 || IsFlat<3>(ref) || IsFlat<3>(mov)) { return std::nullopt; }

  Index const        plane = shape[0] * shape[1];
  std::vector<float> scores(2 * r + 1, -std::numeric_limits<float>::infinity());
  auto               score = [&](Index const lo, Index const hi) {
    for (Index io = lo; io < hi; io++) {
      Index const o = io - r;
      /* registered(z) = moving(z + o), compare over the overlap */
      Index const z0 = std::max<Index>(0, -o);
      Index const z1 = std::min<Index>(nZ, nZ - o);
      Index const n = (z1 - z0) * plane;
      if (n <= 0) { continue; }
      Eigen::Map<Eigen::ArrayXf const> a(ref.data() + z0 * plane, n);
      Eigen::Map<Eigen::ArrayXf const> b(mov.data() + (z0 + o) * plane, n);
      Eigen::ArrayXf const             da = a - a.mean();
      Eigen::ArrayXf const             db = b - b.mean();
      float const                      den = std::sqrt(da.square().sum() * db.square().sum());
      if (den > 0.f) { scores[io] = (da * db).sum() / den; }
    }
  };
  Threads::ChunkFor(score, 2 * r + 1);

  Index best = 0;
  for (Index io = 1; io < 2 * r + 1; io++) {
    if (scores[io] > scores[best]) { best = io; }
  }
  if (!std::isfinite(scores[best]) || scores[best] <= 0.f) {
    Log::Debug("Correlate", "No positive z correlation");
    return std::nullopt;
  }
  float sub = 0.f;
  if (best > 0 && best < 2 * r && std::isfinite(scores[best - 1]) && std::isfinite(scores[best + 1])) {
    sub = ParabolicPeak(scores[best - 1], scores[best], scores[best + 1]);
  }
  float const z = (best - r) + sub;
  Log::Debug("Correlate", "Z search best NCC {:4.3f} offset {:.2f}", scores[best], z);
  return z;
}

} // namespace mrl
