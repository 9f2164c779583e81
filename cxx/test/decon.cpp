#include "mrl/decon.hpp"
#include "mrl/enhance.hpp"
#include "mrl/preprocess.hpp"
#include "mrl/tensors.hpp"
#include "mrl/volume.hpp"

#include "synthetic.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace mrl;
using namespace Catch;

namespace {
auto DeltaPSF() -> Re3
{
  Re3 psf(5, 5, 5);
  psf.setZero();
  psf(2, 2, 2) = 3.f;
  return psf;
}
} // namespace

TEST_CASE("Decon", "[decon]")
{
  Sz3 const shape{16, 12, 8};

  SECTION("PSF padding")
  {
    Re3 const p = Decon::PadPSF(DeltaPSF(), shape);
    CHECK(p.dimensions() == shape);
    CHECK(Sum(p) == Approx(1.f));
    CHECK(p(0, 0, 0) == Approx(1.f));

    Re3 big(20, 20, 20);
    big.setConstant(1.f);
    Re3 const c = Decon::PadPSF(big, shape);
    CHECK(Sum(c) == Approx(1.f));

    Re3 zero(3, 3, 3);
    zero.setZero();
    CHECK_THROWS(Decon::PadPSF(zero, shape));
  }

  SECTION("Delta PSF is the identity")
  {
    U16_3 const raw = ToU16(synthetic::Noise(shape, 4) + 100.f);
    U16_3 const out = Decon::Run(raw, DeltaPSF(), Decon::Opts{.its = 40, .λ = 0.f});
    U16_3 const diff = (out.cast<int>() - raw.cast<int>()).abs().cast<uint16_t>();
    CHECK(Maximum(diff) == 0);
  }

  SECTION("Constant volume is unchanged by regularisation")
  {
    U16_3 raw(shape);
    raw.setConstant(500);
    U16_3 const out = Decon::Run(raw, DeltaPSF(), Decon::Opts());
    CHECK(Minimum(out) == 500);
    CHECK(Maximum(out) == 500);
  }

  SECTION("Sharpens a blurred point")
  {
    Re3 psf = synthetic::Blob(Sz3{7, 7, 7}, 1.f, 1.f);
    Re3 blurred(shape);
    blurred.setZero();
    for (Index iz = 0; iz < 7; iz++) {
      for (Index iy = 0; iy < 7; iy++) {
        for (Index ix = 0; ix < 7; ix++) {
          blurred(5 + ix, 3 + iy, 1 + iz) += 990.f * psf(ix, iy, iz) / Sum(psf);
        }
      }
    }
    blurred = blurred + 10.f;
    Re3 const out = Decon::Run(blurred, psf, Decon::Opts{.its = 40, .λ = 0.f});
    CHECK(out(8, 6, 4) > 1.5f * blurred(8, 6, 4));
    CHECK(Minimum(out) >= 0.f);
  }
}

TEST_CASE("Enhance", "[enhance]")
{
  Sz3 const            shape{24, 24, 12};
  Eigen::Array3f const voxel(0.1f, 0.1f, 0.3f);

  SECTION("Sigmas")
  {
    auto const s = Enhance::Sigmas(0.52f, Enhance::Opts());
    CHECK(s[0] == Approx(0.22f * 0.52f / 1.35f));
    CHECK(s[1] > s[0]);
  }

  SECTION("Non-negative")
  {
    Re3 const dog = Enhance::Run(synthetic::Noise(shape, 9), voxel, 0.52f, Enhance::Opts());
    CHECK(Minimum(dog) >= 0.f);
    CHECK(Maximum(dog) > 0.f);
  }

  SECTION("Constant volume has no response")
  {
    Re3 x(shape);
    x.setConstant(123.f);
    Re3 const dog = Enhance::Run(x, voxel, 0.52f, Enhance::Opts());
    CHECK(Maximum(dog) == Approx(0.f).margin(1.e-3f));
  }

  SECTION("Spot responds at its centre")
  {
    Re3 x(shape);
    x.setZero();
    x(12, 12, 6) = 1000.f;
    Re3 const dog = Enhance::Run(x, voxel, 0.52f, Enhance::Opts());
    CHECK(dog(12, 12, 6) == Approx(Maximum(dog)));
    CHECK(dog(12, 12, 6) > 0.f);
  }

  SECTION("Invalid parameters")
  {
    Re3 x(shape);
    x.setZero();
    CHECK_THROWS(Enhance::Run(x, Eigen::Array3f(0.f, 0.1f, 0.1f), 0.52f, Enhance::Opts()));
    CHECK_THROWS(Enhance::Run(x, voxel, 0.f, Enhance::Opts()));
  }

  SECTION("Preprocess")
  {
    U16_3 const raw = ToU16(synthetic::Blobs(shape, 2, 6, 1.5f));
    Re3         psf(3, 3, 3);
    psf.setZero();
    psf(1, 1, 1) = 1.f;
    auto const p = Preprocess(raw, psf, voxel, 0.52f, Decon::Opts{.its = 2}, Enhance::Opts());
    CHECK(p.decon.dimensions() == raw.dimensions());
    CHECK(p.dog.dimensions() == raw.dimensions());
    CHECK(Minimum(p.dog) >= 0.f);
  }
}
