#pragma once

#include "../dataset.hpp"
#include "../decon.hpp"
#include "../enhance.hpp"
#include "cache.hpp"

namespace mrl {

struct BitOpts
{
  bool          dense = false;
  Decon::Opts   decon;
  Enhance::Opts enhance;
};

/*
 * Deconvolves and enhances every readout bit of a tile, then moves both volumes into the round 0 frame with the
 * transform persisted for the bit's round. Never estimates a transform itself.
 */
struct BitPropagation
{
  BitPropagation(Dataset const &ds, TransformCache &cache, BitOpts const &opts);

  void run();
  void runBit(BitInfo const &bit);

private:
  Dataset const       &ds_;
  TransformCache      &cache_;
  BitOpts              opts_;
  std::vector<BitInfo> bits_;
  Eigen::Array3f       voxel_;
  Calibration          calibration_;

  void checkPrerequisites(BitInfo const &bit);
};

} // namespace mrl
