#include "mrl/log/log.hpp"
#include "mrl/register/apply.hpp"
#include "mrl/register/correlate.hpp"
#include "mrl/register/rigid.hpp"
#include "mrl/volume.hpp"

#include "synthetic.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace mrl;
using namespace Catch;

TEST_CASE("Correlate", "[rigid]")
{
  SECTION("Parabola")
  {
    CHECK(ParabolicPeak(1.f, 2.f, 1.f) == Approx(0.f));
    CHECK(ParabolicPeak(1.f, 2.f, 1.5f) > 0.f);
    CHECK(ParabolicPeak(1.f, 1.f, 1.f) == 0.f);
  }

  SECTION("Circular shift 2D")
  {
    Re3 const vol = synthetic::Blobs(Sz3{32, 32, 1}, 3, 12, 2.f);
    Re2 const ref = vol.chip<2>(0);
    Re2       mov(32, 32);
    for (Index iy = 0; iy < 32; iy++) {
      for (Index ix = 0; ix < 32; ix++) {
        mov(Wrap(ix + 3, Index(32)), Wrap(iy - 5, Index(32))) = ref(ix, iy);
      }
    }
    auto const s = PhaseCorrelate<2>(ref, mov);
    REQUIRE(s);
    CHECK((*s)[0] == Approx(3.f).margin(1.e-3f));
    CHECK((*s)[1] == Approx(-5.f).margin(1.e-3f));
  }

  SECTION("Flat input")
  {
    Re2 flat(16, 16);
    flat.setConstant(100.f);
    Re2 other(16, 16);
    other.setRandom();
    CHECK_FALSE(PhaseCorrelate<2>(flat, other));
    Re3 f3(8, 8, 8);
    f3.setConstant(5.f);
    CHECK_FALSE(ZSearch(f3, f3, 4));
  }

  SECTION("Z search")
  {
    Re3 const ref = synthetic::Blobs(Sz3{16, 16, 16}, 5, 12, 2.f);
    Re3 const mov = Translate(ref, Shift3(0.f, 0.f, -2.f));
    auto const z = ZSearch(ref, mov, 4);
    REQUIRE(z);
    CHECK(*z == Approx(2.f).margin(0.5f));
  }
}

TEST_CASE("Rigid", "[rigid]")
{
  Sz3 const            shape{64, 64, 32};
  Eigen::Array3f const voxel(0.1f, 0.1f, 0.3f);
  Re3 const            ref = synthetic::Blobs(shape);
  Rigid::Opts const    opts;

  SECTION("Identity")
  {
    auto const r = Rigid::Estimate(ref, ref, voxel, opts);
    CHECK(r.total.matrix().norm() == Approx(0.f).margin(1.e-3f));
    CHECK(r.total.isFinite().all());
  }

  SECTION("Shift recovery")
  {
    Shift3 const t(8.f, -4.f, 4.f); // voxels
    Re3 const    mov = Translate(ref, -t);
    auto const   r = Rigid::Estimate(ref, mov, voxel, opts);
    Shift3 const found = ToVoxels(r.total, voxel);
    INFO("Found " << found.transpose() << " expected " << t.transpose());
    CHECK(((found - t).abs() <= 0.5f * opts.factor).all());
    CHECK((r.total - (r.xy + r.z + r.xyz)).abs().maxCoeff() == Approx(0.f).margin(1.e-6f));
  }

  SECTION("Sub-voxel shift recovery")
  {
    Shift3 const t(5.5f, -2.25f, 3.f); // voxels
    Re3 const    mov = Translate(ref, -t);
    auto const   r = Rigid::Estimate(ref, mov, voxel, opts);
    Shift3 const found = ToVoxels(r.total, voxel);
    INFO("Found " << found.transpose() << " expected " << t.transpose());
    /* Within half a downsampled voxel on every axis */
    CHECK(((found - t).abs() <= 0.5f * opts.factor).all());
    CHECK(((r.total - t * voxel).abs() <= 0.5f * opts.factor * voxel).all());
  }

  SECTION("Degenerate")
  {
    Re3 flat(shape);
    flat.setConstant(300.f);
    auto const warned = Log::Warnings();
    auto const r = Rigid::Estimate(flat, flat, voxel, opts);
    CHECK((r.total == 0.f).all());
    CHECK(Log::Warnings() == warned + 3); // One per pass

    auto const n = Rigid::Estimate(synthetic::Noise(shape, 1), synthetic::Noise(shape, 2), voxel, opts);
    CHECK(n.total.isFinite().all());
  }

  SECTION("Shape mismatch")
  {
    Re3 small(8, 8, 8);
    small.setZero();
    CHECK_THROWS(Rigid::Estimate(ref, small, voxel, opts));
  }
}
