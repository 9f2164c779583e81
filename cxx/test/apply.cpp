#include "mrl/register/apply.hpp"
#include "mrl/tensors.hpp"
#include "mrl/volume.hpp"

#include "synthetic.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace mrl;
using namespace Catch;

namespace {
auto MaxInteriorDiff(Re3 const &a, Re3 const &b, Index const margin) -> float
{
  float m = 0.f;
  for (Index iz = margin; iz < a.dimension(2) - margin; iz++) {
    for (Index iy = margin; iy < a.dimension(1) - margin; iy++) {
      for (Index ix = margin; ix < a.dimension(0) - margin; ix++) {
        m = std::max(m, std::abs(a(ix, iy, iz) - b(ix, iy, iz)));
      }
    }
  }
  return m;
}
} // namespace

TEST_CASE("Volume", "[volume]")
{
  SECTION("Downsample")
  {
    Re3 x(8, 8, 4);
    x.setConstant(2.f);
    x(0, 0, 0) = 6.f;
    Re3 const d = Downsample(x, 4);
    CHECK(d.dimension(0) == 2);
    CHECK(d.dimension(1) == 2);
    CHECK(d.dimension(2) == 1);
    CHECK(d(0, 0, 0) == Approx(2.f + 4.f / 64.f));
    CHECK(d(1, 1, 0) == Approx(2.f));
  }

  SECTION("Conversion")
  {
    Re3 x(2, 1, 1);
    x(0, 0, 0) = -3.f;
    x(1, 0, 0) = 70000.6f;
    U16_3 const u = ToU16(x);
    CHECK(u(0, 0, 0) == 0);
    CHECK(u(1, 0, 0) == 65535);
  }

  SECTION("Projection")
  {
    Re3 x(3, 3, 5);
    x.setZero();
    x(1, 2, 4) = 7.f;
    Re2 const p = MaxProjection(x);
    CHECK(p(1, 2) == Approx(7.f));
    CHECK(p(0, 0) == Approx(0.f));
  }
}

TEST_CASE("Apply", "[apply]")
{
  Sz3 const shape{24, 24, 24};
  Re3 const vol = synthetic::Blobs(shape);

  SECTION("Translate")
  {
    Shift3 const s(2.f, -1.f, 3.f);
    Re3 const    t = Translate(vol, s);
    CHECK(t(5, 5, 5) == Approx(vol(7, 4, 8)));
    CHECK(t(23, 0, 23) == 0.f);
    Re3 const zero = Translate(vol, Shift3::Zero());
    CHECK(Norm<false>(zero - vol) == 0.f);
  }

  SECTION("Translation is recovered")
  {
    Shift3 const t(3.f, -2.f, 1.f);
    Re3 const    moving = Translate(vol, -t); // moving(x) = vol(x - t)
    Re3 const    back = Apply(moving, Transform{.shift = t});
    CHECK(MaxInteriorDiff(back, vol, 4) == Approx(0.f).margin(1.e-2f));
  }

  SECTION("Upsample constant field")
  {
    Re4 field(6, 6, 6, 3);
    field.chip<3>(0).setConstant(0.5f);
    field.chip<3>(1).setConstant(-0.25f);
    field.chip<3>(2).setConstant(0.f);
    Re4 const up = UpsampleField(field, shape, 4);
    CHECK(up.dimension(0) == 24);
    CHECK(up(0, 0, 0, 0) == Approx(2.f));
    CHECK(up(23, 23, 23, 0) == Approx(2.f));
    CHECK(up(11, 7, 3, 1) == Approx(-1.f));
    CHECK(up(11, 7, 3, 2) == Approx(0.f));
    Re4 const beyond = UpsampleField(field, Sz3{32, 24, 24}, 4);
    CHECK(beyond(31, 0, 0, 0) == 0.f);
  }

  SECTION("Upsample field with an axis shorter than the factor")
  {
    /* An 8x8x2 volume downsamples to 2x2x1, z by a factor of 2 */
    Sz3 const target{8, 8, 2};
    Re4       field(2, 2, 1, 3);
    field.setConstant(1.f);
    Re4 const up = UpsampleField(field, target, 4);
    REQUIRE(up.dimension(2) == 2);
    for (Index iz = 0; iz < 2; iz++) {
      for (Index ix = 0; ix < 8; ix++) {
        CHECK(up(ix, 3, iz, 0) == Approx(4.f));
        CHECK(up(ix, 3, iz, 1) == Approx(4.f));
        CHECK(up(ix, 3, iz, 2) == Approx(2.f));
      }
    }
  }

  SECTION("Rigid then dense")
  {
    /* Displacement along x that varies with z, translation along z */
    Re4 field(6, 6, 6, 3);
    field.setZero();
    for (Index iz = 0; iz < 6; iz++) {
      field.chip<3>(0).chip<2>(iz).setConstant(0.15f * iz);
    }
    Shift3 const t(0.f, 0.f, 3.f);
    Re3 const    moving = synthetic::Blob(shape, 4.f, 1000.f);
    Re3 const    result = Apply(moving, Transform{.shift = t, .field = &field, .factor = 4});
    Re4 const    d = UpsampleField(field, shape, 4);

    Re3 expected(shape), reversed(shape);
    for (Index iz = 0; iz < shape[2]; iz++) {
      for (Index iy = 0; iy < shape[1]; iy++) {
        for (Index ix = 0; ix < shape[0]; ix++) {
          expected(ix, iy, iz) = Sample(moving, ix + d(ix, iy, iz, 0) + t[0], iy + d(ix, iy, iz, 1) + t[1],
                                        iz + d(ix, iy, iz, 2) + t[2]);
        }
      }
    }
    Re3 const deformedFirst = Translate(Deform(moving, d), t);
    CHECK(MaxInteriorDiff(result, expected, 5) == Approx(0.f).margin(1.e-1f));
    CHECK(MaxInteriorDiff(deformedFirst, expected, 5) > 1.f);
  }

  SECTION("Mismatched field")
  {
    Re4 field(5, 5, 5, 3);
    field.setZero();
    CHECK_THROWS(Deform(vol, field));
  }
}
