#pragma once

#include "io/file.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace mrl {

auto TileName(Index const tile) -> std::string;   // tileNNNN
auto RoundName(Index const round) -> std::string; // roundNNN
auto BitName(Index const bit) -> std::string;     // bitNNN
auto RoundPath(Index const tile, Index const round) -> std::string;
auto BitPath(Index const tile, Index const bit) -> std::string;

/*
 * Axis vectors are x, y, z. Voxel size is shared by every round of a tile and taken from round 0.
 */
struct RoundInfo
{
  Index          index;
  std::string    path;
  Eigen::Array3f voxel;
  Eigen::Array3f stage;
  float          gain;
  Index          psf;
};

struct BitInfo
{
  Index       index;
  std::string path;
  Index       round;
  Index       psf;
  float       gain;
  float       emission; // µm
};

struct Calibration
{
  U16_4 psfs; // x, y, z, psf

  auto count() const -> Index;
  auto psf(Index const i) const -> Re3;
};

/*
 * Read-only view of the tiles, rounds, bits and calibrations in a dataset file. Discovery never adds groups, even when
 * the file is writable. Groups must use the zero-padded names below.
 */
struct Dataset
{
  Dataset(HD5::File const &file);

  auto file() const -> HD5::File const &;
  auto tiles() const -> std::vector<Index> const &;
  auto rounds(Index const tile) const -> std::vector<RoundInfo>;
  auto bits(Index const tile) const -> std::vector<BitInfo>;
  auto calibration() const -> Calibration;

private:
  HD5::File const   &file_;
  std::vector<Index> tiles_;

  void checkTile(Index const tile) const;
  auto node(std::string const &path) const -> HD5::Node; // ConfigError if missing, never creates
};

} // namespace mrl
