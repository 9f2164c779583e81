#include "bits.hpp"

#include "../errors.hpp"
#include "../io/hd5.hpp"
#include "../log/log.hpp"
#include "../preprocess.hpp"
#include "../register/apply.hpp"
#include "../volume.hpp"
#include "slot.hpp"

#include <algorithm>

namespace mrl {

BitPropagation::BitPropagation(Dataset const &ds, TransformCache &cache, BitOpts const &opts)
  : ds_{ds}
  , cache_{cache}
  , opts_{opts}
  , bits_{ds.bits(cache.tile())}
  , calibration_{ds.calibration()}
{
  if (ds_.file().mode() == HD5::Mode::ReadOnly) { throw ConfigError("Bits", "Dataset file must be writable"); }
  auto const rounds = ds.rounds(cache.tile());
  voxel_ = rounds.front().voxel;
  if (std::none_of(bits_.begin(), bits_.end(), [](BitInfo const &b) { return b.round == 0; })) {
    throw ConfigError("Bits", "{} has no bit acquired in round 0", TileName(cache.tile()));
  }
  for (auto const &b : bits_) {
    if (std::none_of(rounds.begin(), rounds.end(), [&b](RoundInfo const &r) { return r.index == b.round; })) {
      throw ConfigError("Bits", "{} refers to missing {}", b.path, RoundName(b.round));
    }
  }
}

void BitPropagation::checkPrerequisites(BitInfo const &bit)
{
  if (bit.round == 0) { return; }
  if (!cache_.hasRigid(bit.round)) {
    throw PrerequisiteError("Bits", Prerequisite::Rigid, RoundPath(cache_.tile(), bit.round));
  }
  if (opts_.dense && !cache_.hasDense(bit.round)) {
    throw PrerequisiteError("Bits", Prerequisite::Dense, RoundPath(cache_.tile(), bit.round));
  }
}

void BitPropagation::runBit(BitInfo const &bit)
{
  checkPrerequisites(bit);
  Log::Print("Bits", "Processing {} from {}", bit.path, RoundName(bit.round));
  auto const  node = ds_.file().group(bit.path);
  HD5::Writer writer(node.handle());

  VolumeSlot<U16_3> raw([&]() {
    HD5::Reader reader(node.handle());
    if (!reader.exists(HD5::Keys::Raw)) { throw ConfigError("Bits", "No {} in {}", HD5::Keys::Raw, bit.path); }
    return reader.readTensor<U16_3>(HD5::Keys::Raw);
  });
  auto p = Preprocess(*raw.get(), calibration_.psf(bit.psf), voxel_, bit.emission, opts_.decon, opts_.enhance);
  raw.release();
  writer.writeTensor(HD5::Keys::Decon, p.decon, HD5::Dims::Image);
  writer.writeTensor(HD5::Keys::Enhanced, p.dog, HD5::Dims::Image);

  if (bit.round == 0) {
    writer.writeTensor(HD5::Keys::Registered, p.decon, HD5::Dims::Image);
    writer.writeTensor(HD5::Keys::RegisteredEnhanced, p.dog, HD5::Dims::Image);
    return;
  }

  Transform const t{.shift = ToVoxels(cache_.rigid(bit.round), voxel_),
                    .field = opts_.dense ? cache_.dense(bit.round) : nullptr,
                    .factor = FieldFactor};
  writer.writeTensor(HD5::Keys::Registered, ToU16(Apply(ToFloat(p.decon), t)), HD5::Dims::Image);
  writer.writeTensor(HD5::Keys::RegisteredEnhanced, Apply(p.dog, t), HD5::Dims::Image);
}

void BitPropagation::run()
{
  auto const t0 = Log::Now();
  /* Fail before any work if a round has not been registered */
  for (auto const &b : bits_) {
    checkPrerequisites(b);
  }
  for (auto const &b : bits_) {
    runBit(b);
  }
  Log::Print("Bits", "Finished {} bits of {} in {}", bits_.size(), TileName(cache_.tile()), Log::ToNow(t0));
}

} // namespace mrl
