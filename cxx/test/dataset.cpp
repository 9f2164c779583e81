#include "mrl/dataset.hpp"
#include "mrl/errors.hpp"
#include "mrl/io/hd5.hpp"
#include "mrl/volume.hpp"

#include "synthetic.hpp"

#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace mrl;
using namespace Catch;

TEST_CASE("Dataset", "[dataset]")
{
  std::filesystem::path const fname("test-dataset.h5");
  Sz3 const                   shape{8, 8, 4};
  U16_3                       vol(shape);
  vol.setConstant(10);
  Eigen::Array3f const voxel(0.1f, 0.2f, 0.3f);

  SECTION("Discovery")
  {
    HD5::File file(fname, HD5::Mode::Create);
    synthetic::WriteDataset(file, 2, {vol, vol, vol}, {vol, vol}, {{.round = 0}, {.round = 2}}, voxel);
    synthetic::WriteDataset(file, 10, {vol}, {}, {}, voxel);
    synthetic::WriteDataset(file, 0, {vol}, {}, {}, voxel);
    file.open(RoundPath(0, 11)); // Out of order names must still be sorted numerically
    {
      auto const  node = file.open(RoundPath(0, 11));
      HD5::Writer writer(node.handle());
      writer.writeAttribute(HD5::Attrs::Gain, 2.f);
      writer.writeAttribute(HD5::Attrs::PSF, Index(0));
    }
    file.open(fmt::format("{}/notatile", HD5::Keys::Reference));

    Dataset ds(file);
    CHECK(ds.tiles() == std::vector<Index>{0, 2, 10});

    auto const rounds = ds.rounds(2);
    REQUIRE(rounds.size() == 3);
    CHECK(rounds[1].index == 1);
    CHECK(rounds[2].path == "polyDT/tile0002/round002");
    CHECK(rounds[0].voxel[0] == Approx(0.1f));
    CHECK(rounds[2].voxel[2] == Approx(0.3f));
    CHECK(rounds[1].gain == Approx(1.f));

    auto const r0 = ds.rounds(0);
    REQUIRE(r0.size() == 2);
    CHECK(r0[1].index == 11);
    CHECK(r0[1].voxel[1] == Approx(0.2f)); // Shared from round 0

    auto const bits = ds.bits(2);
    REQUIRE(bits.size() == 2);
    CHECK(bits[1].round == 2);
    CHECK(bits[1].emission == Approx(0.52f));
    CHECK(bits[0].path == "readouts/tile0002/bit000");

    auto const cal = ds.calibration();
    CHECK(cal.count() == 1);
    CHECK(cal.psf(0)(1, 1, 1) == Approx(1.f));
    CHECK_THROWS_AS(cal.psf(1), ConfigError);
    CHECK_THROWS_AS(ds.rounds(5), ConfigError);
    CHECK_THROWS_AS(ds.bits(10), ConfigError);
    std::filesystem::remove(fname);
  }

  SECTION("Missing pieces")
  {
    {
      HD5::File file(fname, HD5::Mode::Create);
      CHECK_THROWS_AS(Dataset(file), ConfigError);
      file.open(RoundPath(0, 1));
      Dataset ds(file);
      CHECK_THROWS_AS(ds.rounds(0), ConfigError); // No round 0
      CHECK_THROWS_AS(ds.calibration(), ConfigError);
      auto const node = file.open(RoundPath(0, 0));
      CHECK_THROWS_AS(ds.rounds(0), ConfigError); // No attributes
    }
    std::filesystem::remove(fname);
  }

  SECTION("Unpadded names are ignored and never recreated")
  {
    auto writeRound = [&](HD5::File const &file, std::string const &path) {
      auto const  node = file.open(path);
      HD5::Writer writer(node.handle());
      writer.writeAttribute(HD5::Attrs::Gain, 1.f);
      writer.writeAttribute(HD5::Attrs::PSF, Index(0));
      writer.writeAttribute<3>(HD5::Attrs::VoxelSize, Eigen::Array3f(0.3f, 0.2f, 0.1f));
    };
    {
      HD5::File file(fname, HD5::Mode::Create);
      writeRound(file, fmt::format("{}/tile1/round0", HD5::Keys::Reference));
      writeRound(file, fmt::format("{}/{}/round0", HD5::Keys::Reference, TileName(0)));
    }
    {
      HD5::File file(fname, HD5::Mode::ReadWrite);
      Dataset   ds(file);
      CHECK(ds.tiles() == std::vector<Index>{0});
      CHECK_THROWS_AS(ds.rounds(1), ConfigError);
      CHECK_THROWS_AS(ds.rounds(0), ConfigError); // round0 is not round000
      CHECK_THROWS_AS(ds.bits(0), ConfigError);
      CHECK_THROWS_AS(ds.calibration(), ConfigError);
    }
    HD5::File file(fname, HD5::Mode::ReadOnly);
    CHECK_FALSE(file.exists(fmt::format("{}/{}", HD5::Keys::Reference, TileName(1))));
    CHECK_FALSE(file.exists(RoundPath(0, 0)));
    CHECK_FALSE(file.exists(fmt::format("{}/{}", HD5::Keys::Readouts, TileName(0))));
    CHECK_FALSE(file.exists(HD5::Keys::Calibrations));
    CHECK(file.exists(fmt::format("{}/tile1/round0", HD5::Keys::Reference)));
    std::filesystem::remove(fname);
  }

  SECTION("Names")
  {
    CHECK(TileName(3) == "tile0003");
    CHECK(RoundName(12) == "round012");
    CHECK(BitName(7) == "bit007");
    CHECK(BitPath(1, 2) == "readouts/tile0001/bit002");
  }
}
