#include "dataset.hpp"

#include "errors.hpp"
#include "io/reader.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>

namespace mrl {

namespace {
/*
 * Indices of child groups named exactly as name(index) would write them, sorted numerically. Anything else, including
 * unpadded numbers, is skipped so that paths rebuilt from an index always point at the group that was listed.
 */
auto Numbered(std::vector<std::string> const &names, std::string const &prefix, std::string (*name)(Index const))
  -> std::vector<Index>
{
  std::vector<Index> indices;
  for (auto const &n : names) {
    if (n.size() <= prefix.size() || n.compare(0, prefix.size(), prefix) != 0) { continue; }
    auto const suffix = n.substr(prefix.size());
    if (!std::all_of(suffix.begin(), suffix.end(), [](char const c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
      continue;
    }
    Index const index = std::stol(suffix);
    if (n != name(index)) {
      Log::Warn("Dataset", "Ignoring group {}, expected {}", n, name(index));
      continue;
    }
    indices.push_back(index);
  }
  std::sort(indices.begin(), indices.end());
  return indices;
}

auto Reverse(Eigen::Array3f const &zyx) -> Eigen::Array3f { return Eigen::Array3f(zyx[2], zyx[1], zyx[0]); }

void RequireAttrs(HD5::Reader const &reader, std::string const &path, std::vector<std::string> const &attrs)
{
  for (auto const &a : attrs) {
    if (!reader.hasAttribute(a)) { throw ConfigError("Dataset", "{} has no attribute {}", path, a); }
  }
}

} // namespace

auto TileName(Index const tile) -> std::string { return fmt::format("tile{:04d}", tile); }
auto RoundName(Index const round) -> std::string { return fmt::format("round{:03d}", round); }
auto BitName(Index const bit) -> std::string { return fmt::format("bit{:03d}", bit); }

auto RoundPath(Index const tile, Index const round) -> std::string
{
  return fmt::format("{}/{}/{}", HD5::Keys::Reference, TileName(tile), RoundName(round));
}

auto BitPath(Index const tile, Index const bit) -> std::string
{
  return fmt::format("{}/{}/{}", HD5::Keys::Readouts, TileName(tile), BitName(bit));
}

auto Calibration::count() const -> Index { return psfs.dimension(3); }

auto Calibration::psf(Index const i) const -> Re3
{
  if (i < 0 || i >= count()) { throw ConfigError("Dataset", "No PSF with index {}, have {}", i, count()); }
  Re3 p = psfs.chip<3>(i).cast<float>();
  return p;
}

Dataset::Dataset(HD5::File const &file)
  : file_{file}
{
  auto const reference = node(HD5::Keys::Reference);
  tiles_ = Numbered(HD5::Reader(reference.handle()).groups(), "tile", TileName);
  Log::Print("Dataset", "Found {} tiles", tiles_.size());
}

auto Dataset::file() const -> HD5::File const & { return file_; }
auto Dataset::tiles() const -> std::vector<Index> const & { return tiles_; }

auto Dataset::node(std::string const &path) const -> HD5::Node
{
  if (!file_.exists(path)) { throw ConfigError("Dataset", "No group {} in file", path); }
  return file_.group(path);
}

void Dataset::checkTile(Index const tile) const
{
  if (std::find(tiles_.begin(), tiles_.end(), tile) == tiles_.end()) {
    throw ConfigError("Dataset", "Tile {} does not exist, have {}", tile, fmt::join(tiles_, ","));
  }
}

auto Dataset::rounds(Index const tile) const -> std::vector<RoundInfo>
{
  checkTile(tile);
  auto const tileNode = node(fmt::format("{}/{}", HD5::Keys::Reference, TileName(tile)));
  auto const indices = Numbered(HD5::Reader(tileNode.handle()).groups(), "round", RoundName);
  if (indices.empty() || indices.front() != 0) { throw ConfigError("Dataset", "{} has no reference round 0", TileName(tile)); }

  std::vector<RoundInfo> infos;
  Eigen::Array3f         voxel;
  for (auto const ir : indices) {
    auto const  path = RoundPath(tile, ir);
    auto const  roundNode = node(path);
    HD5::Reader reader(roundNode.handle());
    RequireAttrs(reader, path, {HD5::Attrs::Gain, HD5::Attrs::PSF});
    if (ir == 0) {
      RequireAttrs(reader, path, {HD5::Attrs::VoxelSize});
      voxel = Reverse(reader.readAttributeArray<3>(HD5::Attrs::VoxelSize));
    }
    Eigen::Array3f stage = Eigen::Array3f::Zero();
    if (reader.hasAttribute(HD5::Attrs::Stage)) { stage = Reverse(reader.readAttributeArray<3>(HD5::Attrs::Stage)); }
    infos.push_back(RoundInfo{.index = ir,
                              .path = path,
                              .voxel = voxel,
                              .stage = stage,
                              .gain = reader.readAttributeFloat(HD5::Attrs::Gain),
                              .psf = reader.readAttributeInt(HD5::Attrs::PSF)});
  }
  Log::Debug("Dataset", "{} has {} rounds, voxel size {} µm", TileName(tile), infos.size(), fmt::join(voxel, ","));
  return infos;
}

auto Dataset::bits(Index const tile) const -> std::vector<BitInfo>
{
  checkTile(tile);
  auto const tilePath = fmt::format("{}/{}", HD5::Keys::Readouts, TileName(tile));
  if (!file_.exists(tilePath)) { throw ConfigError("Dataset", "No readouts for {}", TileName(tile)); }
  auto const tileNode = node(tilePath);
  auto const indices = Numbered(HD5::Reader(tileNode.handle()).groups(), "bit", BitName);

  std::vector<BitInfo> infos;
  for (auto const ib : indices) {
    auto const  path = BitPath(tile, ib);
    auto const  bitNode = node(path);
    HD5::Reader reader(bitNode.handle());
    RequireAttrs(reader, path, {HD5::Attrs::Round, HD5::Attrs::PSF, HD5::Attrs::Gain, HD5::Attrs::Emission});
    infos.push_back(BitInfo{.index = ib,
                            .path = path,
                            .round = reader.readAttributeInt(HD5::Attrs::Round),
                            .psf = reader.readAttributeInt(HD5::Attrs::PSF),
                            .gain = reader.readAttributeFloat(HD5::Attrs::Gain),
                            .emission = reader.readAttributeFloat(HD5::Attrs::Emission)});
  }
  Log::Debug("Dataset", "{} has {} bits", TileName(tile), infos.size());
  return infos;
}

auto Dataset::calibration() const -> Calibration
{
  auto const  path = HD5::Keys::Calibrations;
  auto const  calNode = node(path);
  HD5::Reader reader(calNode.handle());
  if (!reader.exists(HD5::Keys::PSFs)) { throw ConfigError("Dataset", "No {} in {}", HD5::Keys::PSFs, path); }
  return Calibration{.psfs = reader.readTensor<U16_4>(HD5::Keys::PSFs)};
}

} // namespace mrl
