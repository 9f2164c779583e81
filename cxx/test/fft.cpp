#include "mrl/fft.hpp"
#include "mrl/log/log.hpp"
#include "mrl/tensors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

using namespace mrl;
using namespace Catch;

TEST_CASE("FFT", "[fft]")
{
  auto sx = GENERATE(2, 5, 8);
  auto sy = GENERATE(3, 8);
  auto sz = GENERATE(1, 4);
  SECTION("3D")
  {
    INFO("FFT shape: " << sx << "," << sy << "," << sz);
    Index const N = sx * sy * sz;
    Cx3         data(sx, sy, sz);
    Cx3         ref(sx, sy, sz);

    ref.setConstant(1.f);
    data.setZero();
    data(0, 0, 0) = std::sqrt(N); // Unitary transform, zero frequency at the origin
    FFT::Adjoint(data);
    CHECK(Norm<false>(data - ref) == Approx(0.f).margin(1.e-4f));
    FFT::Forward(data);
    ref.setZero();
    ref(0, 0, 0) = std::sqrt(N);
    CHECK(Norm<false>(data - ref) == Approx(0.f).margin(1.e-4f));
  }

  SECTION("2D")
  {
    Cx2 data(sx, sy);
    data.setRandom();
    Cx2 const orig = data;
    FFT::Forward(data);
    CHECK(Norm<false>(data) == Approx(Norm<false>(orig)).margin(1.e-4f));
    FFT::Adjoint(data);
    CHECK(Norm<false>(data - orig) == Approx(0.f).margin(1.e-4f));
  }
}
