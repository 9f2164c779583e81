#include "cache.hpp"

#include "../errors.hpp"
#include "../io/reader.hpp"
#include "../log/log.hpp"

namespace mrl {

TransformCache::TransformCache(Dataset const &ds, Index const tile)
  : ds_{ds}
  , tile_{tile}
  , rigidState_{CacheState::Empty}
  , denseState_{CacheState::Empty}
{
}

auto TransformCache::tile() const -> Index { return tile_; }

void TransformCache::setTile(Index const tile)
{
  if (tile != tile_) {
    invalidate();
    tile_ = tile;
  }
}

void TransformCache::invalidate()
{
  rigid_.clear();
  dense_.clear();
  rigidState_ = CacheState::Empty;
  denseState_ = CacheState::Empty;
  Log::Debug("Cache", "Dropped transforms for {}", TileName(tile_));
}

auto TransformCache::rigidState() const -> CacheState { return rigidState_; }
auto TransformCache::denseState() const -> CacheState { return denseState_; }

auto TransformCache::roundPath(Index const round) const -> std::string { return RoundPath(tile_, round); }

void TransformCache::loadRigid()
{
  auto const rounds = ds_.rounds(tile_);
  rigidState_ = CacheState::Loaded;
  for (auto const &r : rounds) {
    auto const  node = ds_.file().group(r.path);
    HD5::Reader reader(node.handle());
    if (reader.hasAttribute(HD5::Attrs::Rigid)) {
      rigid_[r.index] = reader.readAttributeArray<3>(HD5::Attrs::Rigid);
    } else if (r.index == 0) {
      rigid_[r.index] = Shift3::Zero();
    } else {
      rigidState_ = CacheState::Partial;
    }
  }
  Log::Debug("Cache", "Read {} rigid shifts for {}", rigid_.size(), TileName(tile_));
}

void TransformCache::loadDense()
{
  auto const rounds = ds_.rounds(tile_);
  denseState_ = CacheState::Loaded;
  for (auto const &r : rounds) {
    if (r.index == 0) { continue; }
    auto const  node = ds_.file().group(r.path);
    HD5::Reader reader(node.handle());
    if (reader.exists(HD5::Keys::Field)) {
      dense_.emplace(r.index, reader.readTensor<Re4>(HD5::Keys::Field));
    } else {
      denseState_ = CacheState::Partial;
    }
  }
  Log::Debug("Cache", "Read {} dense fields for {}", dense_.size(), TileName(tile_));
}

auto TransformCache::hasRigid(Index const round) -> bool
{
  if (rigidState_ == CacheState::Empty) { loadRigid(); }
  return rigid_.contains(round);
}

auto TransformCache::hasDense(Index const round) -> bool
{
  if (round == 0) { return true; }
  if (denseState_ == CacheState::Empty) { loadDense(); }
  return dense_.contains(round);
}

auto TransformCache::rigid(Index const round) -> Shift3 const &
{
  if (!hasRigid(round)) { throw PrerequisiteError("Cache", Prerequisite::Rigid, roundPath(round)); }
  return rigid_.at(round);
}

auto TransformCache::dense(Index const round) -> Re4 const *
{
  if (round == 0) { return nullptr; }
  if (!hasDense(round)) { throw PrerequisiteError("Cache", Prerequisite::Dense, roundPath(round)); }
  return &dense_.at(round);
}

} // namespace mrl
