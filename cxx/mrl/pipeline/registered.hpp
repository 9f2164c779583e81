#pragma once

#include "../dataset.hpp"

namespace mrl {

enum struct Which
{
  Rounds, // Every round, round 0 first
  Bits    // Round 0, then every bit
};

/*
 * Stack the persisted registered volumes of a tile along a fourth dimension
 */
auto LoadRegistered(Dataset const &ds, Index const tile, Which const which) -> U16_4;

} // namespace mrl
