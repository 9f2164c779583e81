#include "mrl/io/hd5.hpp"
#include "mrl/log/log.hpp"
#include "mrl/tensors.hpp"

#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace mrl;
using namespace Catch;

TEST_CASE("IO", "[io]")
{
  std::filesystem::path const fname("test-io.h5");
  Re3                         refData(4, 5, 6);
  refData.setConstant(1.f);

  SECTION("Basic")
  {
    {
      HD5::File   file(fname, HD5::Mode::Create);
      auto const  node = file.open("a/b/c");
      HD5::Writer writer(node.handle());
      CHECK_NOTHROW(writer.writeTensor(HD5::Keys::Data, refData, HD5::Dims::Image));
    }
    CHECK(std::filesystem::exists(fname));
    HD5::File file(fname, HD5::Mode::ReadOnly);
    CHECK(file.exists("a/b"));
    CHECK(file.exists("a/b/c"));
    CHECK_FALSE(file.exists("a/d"));
    CHECK_THROWS_AS(file.open("a/d"), Log::Failure);
    auto const  node = file.open("a/b/c");
    HD5::Reader reader(node.handle());
    auto const  check = reader.readTensor<Re3>(HD5::Keys::Data);
    CHECK(check.dimensions() == refData.dimensions());
    CHECK(Norm<false>(check - refData) == Approx(0.f).margin(1.e-9));
    CHECK(reader.dimensions(HD5::Keys::Data) == std::vector<Index>{4, 5, 6});
    std::filesystem::remove(fname);
  }

  SECTION("Group lookup never creates")
  {
    {
      HD5::File file(fname, HD5::Mode::Create);
      file.open("a/b");
      CHECK_NOTHROW(file.group("a/b"));
      CHECK_THROWS_AS(file.group("a/c"), Log::Failure);
      CHECK_THROWS_AS(file.group("x"), Log::Failure);
      CHECK_FALSE(file.exists("a/c"));
      CHECK_FALSE(file.exists("x"));
    }
    HD5::File file(fname, HD5::Mode::ReadWrite);
    CHECK_THROWS_AS(file.group("x/y"), Log::Failure);
    CHECK_FALSE(file.exists("x"));
    std::filesystem::remove(fname);
  }

  SECTION("Overwrite")
  {
    HD5::File   file(fname, HD5::Mode::Create);
    auto const  node = file.open("node");
    HD5::Writer writer(node.handle());
    HD5::Reader reader(node.handle());
    writer.writeTensor(HD5::Keys::Data, refData, HD5::Dims::Image);
    Re3 second(4, 5, 6);
    second.setConstant(2.f);
    writer.writeTensor(HD5::Keys::Data, second, HD5::Dims::Image);
    CHECK(reader.list() == std::vector<std::string>{HD5::Keys::Data});
    CHECK(Maximum(reader.readTensor<Re3>(HD5::Keys::Data)) == Approx(2.f));

    Re3 bigger(8, 5, 6);
    bigger.setConstant(3.f);
    writer.writeTensor(HD5::Keys::Data, bigger, HD5::Dims::Image);
    CHECK(reader.list().size() == 1);
    auto const check = reader.readTensor<Re3>(HD5::Keys::Data);
    CHECK(check.dimension(0) == 8);
    CHECK(Minimum(check) == Approx(3.f));

    U16_3 asInt(8, 5, 6);
    asInt.setConstant(4);
    writer.writeTensor(HD5::Keys::Data, asInt, HD5::Dims::Image);
    CHECK(reader.readTensor<U16_3>(HD5::Keys::Data)(0, 0, 0) == 4);
    std::filesystem::remove(fname);
  }

  SECTION("Attributes")
  {
    HD5::File   file(fname, HD5::Mode::Create);
    auto const  node = file.open("node");
    HD5::Writer writer(node.handle());
    HD5::Reader reader(node.handle());
    writer.writeAttribute("f", 1.5f);
    writer.writeAttribute("i", Index(3));
    writer.writeAttribute<3>("v", Eigen::Array3f(1.f, 2.f, 3.f));
    CHECK(reader.hasAttribute("f"));
    CHECK_FALSE(reader.hasAttribute("missing"));
    CHECK(reader.readAttributeFloat("f") == Approx(1.5f));
    CHECK(reader.readAttributeInt("i") == 3);
    CHECK(reader.readAttributeArray<3>("v")[2] == Approx(3.f));
    writer.writeAttribute("f", 2.5f);
    CHECK(reader.readAttributeFloat("f") == Approx(2.5f));
    writer.writeAttribute<3>("v", Eigen::Array3f(4.f, 5.f, 6.f));
    CHECK(reader.readAttributeArray<3>("v")[0] == Approx(4.f));
    CHECK_THROWS_AS(reader.readAttributeFloat("missing"), Log::Failure);
    std::filesystem::remove(fname);
  }
}
