#pragma once

#include "../dataset.hpp"

#include <map>

namespace mrl {

enum struct CacheState
{
  Empty,   // Nothing read yet
  Loaded,  // Every round of the tile has the transform
  Partial, // Some rounds have not been registered yet
};

/*
 * Lazily reads the persisted rigid shifts and dense fields of one tile. Round 0 is the reference and always has the
 * identity. Changing tile drops everything held in memory.
 */
struct TransformCache
{
  TransformCache(Dataset const &ds, Index const tile);

  auto tile() const -> Index;
  void setTile(Index const tile);
  void invalidate();

  auto rigidState() const -> CacheState;
  auto denseState() const -> CacheState;

  auto hasRigid(Index const round) -> bool;
  auto hasDense(Index const round) -> bool;
  auto rigid(Index const round) -> Shift3 const &;  // Physical units, x, y, z
  auto dense(Index const round) -> Re4 const *;     // nullptr for round 0

private:
  Dataset const         &ds_;
  Index                  tile_;
  CacheState             rigidState_, denseState_;
  std::map<Index, Shift3> rigid_;
  std::map<Index, Re4>    dense_;

  void loadRigid();
  void loadDense();
  auto roundPath(Index const round) const -> std::string;
};

} // namespace mrl
