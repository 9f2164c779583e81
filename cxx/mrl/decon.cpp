#include "decon.hpp"

#include "fft.hpp"
#include "log/debug.hpp"
#include "log/log.hpp"
#include "sys/threads.hpp"
#include "tensors.hpp"
#include "volume.hpp"

namespace mrl {
namespace Decon {

namespace {
constexpr float ε = 1.e-6f;

/*
 * Divergence of the normalised gradient, div(∇x / |∇x|). Forward differences for the gradient, backward for the
 * divergence, Neumann boundaries.
 */
auto TVDivergence(Re3 const &x) -> Re3
{
  Index const nX = x.dimension(0), nY = x.dimension(1), nZ = x.dimension(2);
  Re4         n(nX, nY, nZ, 3);
  auto        gradTask = [&](Index const lo, Index const hi) {
    for (Index iz = lo; iz < hi; iz++) {
      for (Index iy = 0; iy < nY; iy++) {
        for (Index ix = 0; ix < nX; ix++) {
          float const v = x(ix, iy, iz);
          float const gx = ix + 1 < nX ? x(ix + 1, iy, iz) - v : 0.f;
          float const gy = iy + 1 < nY ? x(ix, iy + 1, iz) - v : 0.f;
          float const gz = iz + 1 < nZ ? x(ix, iy, iz + 1) - v : 0.f;
          float const g = std::sqrt(gx * gx + gy * gy + gz * gz + ε);
          n(ix, iy, iz, 0) = gx / g;
          n(ix, iy, iz, 1) = gy / g;
          n(ix, iy, iz, 2) = gz / g;
        }
      }
    }
  };
  Threads::ChunkFor(gradTask, nZ);

  Re3  d(nX, nY, nZ);
  auto divTask = [&](Index const lo, Index const hi) {
    for (Index iz = lo; iz < hi; iz++) {
      for (Index iy = 0; iy < nY; iy++) {
        for (Index ix = 0; ix < nX; ix++) {
          float const dx = (ix + 1 < nX ? n(ix, iy, iz, 0) : 0.f) - (ix > 0 ? n(ix - 1, iy, iz, 0) : 0.f);
          float const dy = (iy + 1 < nY ? n(ix, iy, iz, 1) : 0.f) - (iy > 0 ? n(ix, iy - 1, iz, 1) : 0.f);
          float const dz = (iz + 1 < nZ ? n(ix, iy, iz, 2) : 0.f) - (iz > 0 ? n(ix, iy, iz - 1, 2) : 0.f);
          d(ix, iy, iz) = dx + dy + dz;
        }
      }
    }
  };
  Threads::ChunkFor(divTask, nZ);
  return d;
}

struct Convolver
{
  Cx3 otf;

  Convolver(Re3 const &psf)
    : otf(psf.dimensions())
  {
    otf.device(Threads::TensorDevice()) = psf.cast<Cx>();
    FFT::Forward(otf);
    /* The FFT is unitary, so rescale to get a true convolution */
    float const scale = std::sqrt(static_cast<float>(Product(Sz3(psf.dimensions()))));
    otf.device(Threads::TensorDevice()) = otf * Cx(scale);
  }

  void apply(Re3 const &x, Re3 &y, bool const adjoint)
  {
    Cx3 ks(x.dimensions());
    ks.device(Threads::TensorDevice()) = x.cast<Cx>();
    FFT::Forward(ks);
    if (adjoint) {
      ks.device(Threads::TensorDevice()) = ks * otf.conjugate();
    } else {
      ks.device(Threads::TensorDevice()) = ks * otf;
    }
    FFT::Adjoint(ks);
    y.device(Threads::TensorDevice()) = ks.real();
  }
};
} // namespace

auto PadPSF(Re3 const &psf, Sz3 const shape) -> Re3
{
  float const total = Sum(psf);
  if (!(total > 0.f) || !std::isfinite(total)) { throw Log::Failure("Decon", "PSF has invalid sum {}", total); }
  Sz3 const pshape = psf.dimensions();
  Re3       padded(shape);
  padded.setZero();
  for (Index iz = 0; iz < pshape[2]; iz++) {
    Index const oz = iz - pshape[2] / 2;
    if (oz < -(shape[2] / 2) || oz > (shape[2] - 1) / 2) { continue; }
    for (Index iy = 0; iy < pshape[1]; iy++) {
      Index const oy = iy - pshape[1] / 2;
      if (oy < -(shape[1] / 2) || oy > (shape[1] - 1) / 2) { continue; }
      for (Index ix = 0; ix < pshape[0]; ix++) {
        Index const ox = ix - pshape[0] / 2;
        if (ox < -(shape[0] / 2) || ox > (shape[0] - 1) / 2) { continue; }
        padded(Wrap(ox, shape[0]), Wrap(oy, shape[1]), Wrap(oz, shape[2])) = psf(ix, iy, iz);
      }
    }
  }
  float const kept = Sum(padded);
  if (!(kept > 0.f)) { throw Log::Failure("Decon", "PSF {} has no support inside volume {}", pshape, shape); }
  padded.device(Threads::TensorDevice()) = padded / kept;
  return padded;
}

auto Run(Re3 const &raw, Re3 const &psf, Opts const &opts) -> Re3
{
  Sz3 const shape = raw.dimensions();
  Log::Print("Decon", "Shape {} PSF {} iterations {} λ {:4.3E}", shape, psf.dimensions(), opts.its, opts.λ);
  Convolver H(PadPSF(psf, shape));

  Re3 data(shape), x(shape), Hx(shape), r(shape);
  data.device(Threads::TensorDevice()) = raw.cwiseMax(0.f);
  x.device(Threads::TensorDevice()) = data.cwiseMax(ε);
  auto const start = Log::Now();
  for (Index ii = 0; ii < opts.its; ii++) {
    H.apply(x, Hx, false);
    r.device(Threads::TensorDevice()) = data / Hx.cwiseMax(ε);
    H.apply(r, r, true);
    if (opts.λ > 0.f) {
      Re3 const div = TVDivergence(x);
      x.device(Threads::TensorDevice()) = x * r / (div * -opts.λ + 1.f).cwiseMax(ε);
    } else {
      x.device(Threads::TensorDevice()) = x * r;
    }
    x.device(Threads::TensorDevice()) = x.cwiseMax(0.f);
    Log::Debug("Decon", "{:02d} |x| {:4.3E}", ii, Norm<true>(x));
  }
  Log::Print("Decon", "Finished {} iterations in {}", opts.its, Log::ToNow(start));
  Log::Tensor<3>("decon", x, HD5::Dims::Image);
  return x;
}

auto Run(U16_3 const &raw, Re3 const &psf, Opts const &opts) -> U16_3 { return ToU16(Run(ToFloat(raw), psf, opts)); }

} // namespace Decon
} // namespace mrl
