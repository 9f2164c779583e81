#pragma once

#include "../dataset.hpp"
#include "../decon.hpp"
#include "../register/dense.hpp"
#include "../register/rigid.hpp"

#include <map>

namespace mrl {

enum struct RoundState
{
  Unregistered,
  RigidKnown,
  DenseKnown,
  Persisted
};

auto Name(RoundState const s) -> std::string;

struct RoundOpts
{
  bool         dense = false;
  bool         overwrite = false;
  Decon::Opts  decon;
  Rigid::Opts  rigid;
  Dense::Opts  demons;
};

/*
 * Registers every round of a tile to round 0 using the reference channel, and persists the deconvolved volumes, the
 * registered volumes and the transforms.
 */
struct RoundRegistration
{
  RoundRegistration(Dataset const &ds, Index const tile, RoundOpts const &opts);

  void run();
  auto state(Index const round) const -> RoundState;
  auto states() const -> std::map<Index, RoundState> const &;

private:
  Dataset const              &ds_;
  Index                       tile_;
  RoundOpts                   opts_;
  std::vector<RoundInfo>      rounds_;
  Calibration                 calibration_;
  std::map<Index, RoundState> states_;

  auto isComplete(RoundInfo const &r) const -> bool;
  auto reference() -> Re3;
  void registerRound(RoundInfo const &r, Re3 const &reference);
};

} // namespace mrl
