#include "rounds.hpp"

#include "../errors.hpp"
#include "../io/hd5.hpp"
#include "../log/log.hpp"
#include "../register/apply.hpp"
#include "../volume.hpp"
#include "slot.hpp"

namespace mrl {

auto Name(RoundState const s) -> std::string
{
  switch (s) {
  case RoundState::Unregistered: return "unregistered";
  case RoundState::RigidKnown: return "rigid";
  case RoundState::DenseKnown: return "dense";
  case RoundState::Persisted: return "persisted";
  }
  return "unknown";
}

namespace {
auto ReadRaw(HD5::File const &file, std::string const &path) -> U16_3
{
  auto const  node = file.group(path);
  HD5::Reader reader(node.handle());
  if (!reader.exists(HD5::Keys::Raw)) { throw ConfigError("Rounds", "No {} in {}", HD5::Keys::Raw, path); }
  return reader.readTensor<U16_3>(HD5::Keys::Raw);
}
} // namespace

RoundRegistration::RoundRegistration(Dataset const &ds, Index const tile, RoundOpts const &opts)
  : ds_{ds}
  , tile_{tile}
  , opts_{opts}
  , rounds_{ds.rounds(tile)}
  , calibration_{ds.calibration()}
{
  if (ds_.file().mode() == HD5::Mode::ReadOnly) { throw ConfigError("Rounds", "Dataset file must be writable"); }
  for (auto const &r : rounds_) {
    states_[r.index] = RoundState::Unregistered;
  }
}

auto RoundRegistration::state(Index const round) const -> RoundState
{
  auto const s = states_.find(round);
  if (s == states_.end()) { throw ConfigError("Rounds", "{} has no {}", TileName(tile_), RoundName(round)); }
  return s->second;
}

auto RoundRegistration::states() const -> std::map<Index, RoundState> const & { return states_; }

auto RoundRegistration::isComplete(RoundInfo const &r) const -> bool
{
  auto const  node = ds_.file().group(r.path);
  HD5::Reader reader(node.handle());
  bool const  base = reader.exists(HD5::Keys::Decon) && reader.exists(HD5::Keys::Registered);
  if (r.index == 0) { return base; }
  return base && reader.hasAttribute(HD5::Attrs::Rigid) && (!opts_.dense || reader.exists(HD5::Keys::Field));
}

/*
 * Deconvolve round 0, or read it back if it was done before. Round 0 defines the frame, so its deconvolved volume is
 * also its registered volume.
 */
auto RoundRegistration::reference() -> Re3
{
  auto const &r = rounds_.front();
  auto const  node = ds_.file().group(r.path);
  if (!opts_.overwrite && isComplete(r)) {
    Log::Print("Rounds", "Reading existing reference {}", r.path);
    states_[0] = RoundState::Persisted;
    return ToFloat(HD5::Reader(node.handle()).readTensor<U16_3>(HD5::Keys::Registered));
  }
  Re3 const   psf = calibration_.psf(r.psf);
  U16_3 const decon = Decon::Run(ReadRaw(ds_.file(), r.path), psf, opts_.decon);
  HD5::Writer writer(node.handle());
  writer.writeTensor(HD5::Keys::Decon, decon, HD5::Dims::Image);
  writer.writeTensor(HD5::Keys::Registered, decon, HD5::Dims::Image);
  writer.writeAttribute<3>(HD5::Attrs::Rigid, Shift3::Zero());
  states_[0] = RoundState::Persisted;
  return ToFloat(decon);
}

void RoundRegistration::registerRound(RoundInfo const &r, Re3 const &ref)
{
  Log::Print("Rounds", "Registering {}", r.path);
  auto const  node = ds_.file().group(r.path);
  HD5::Writer writer(node.handle());

  VolumeSlot<U16_3> raw([&]() { return ReadRaw(ds_.file(), r.path); });
  if (raw.get()->dimensions() != ref.dimensions()) {
    throw ConfigError("Rounds", "{} shape {} does not match reference {}", r.path, raw.get()->dimensions(), ref.dimensions());
  }
  Re3 const   psf = calibration_.psf(r.psf);
  U16_3 const decon = Decon::Run(*raw.get(), psf, opts_.decon);
  raw.release();
  writer.writeTensor(HD5::Keys::Decon, decon, HD5::Dims::Image);

  Re3 moving = ToFloat(decon);
  auto const rigid = Rigid::Estimate(ref, moving, r.voxel, opts_.rigid);
  writer.writeAttribute<3>(HD5::Attrs::Rigid, rigid.total);
  states_[r.index] = RoundState::RigidKnown;

  moving = Translate(moving, ToVoxels(rigid.total, r.voxel));
  if (opts_.dense) {
    Re4 const field = Dense::Estimate(Downsample(ref, FieldFactor), Downsample(moving, FieldFactor), opts_.demons);
    writer.writeTensor(HD5::Keys::Field, field, HD5::Dims::Field);
    states_[r.index] = RoundState::DenseKnown;
    moving = Deform(moving, UpsampleField(field, moving.dimensions(), FieldFactor));
  }
  writer.writeTensor(HD5::Keys::Registered, ToU16(moving), HD5::Dims::Image);
  states_[r.index] = RoundState::Persisted;
}

void RoundRegistration::run()
{
  auto const t0 = Log::Now();
  Log::Print("Rounds", "{} rounds in {}{}", rounds_.size(), TileName(tile_), opts_.dense ? " with dense refinement" : "");
  VolumeSlot<Re3> ref([&]() { return reference(); });
  for (auto const &r : rounds_) {
    if (r.index == 0) {
      ref.load();
      continue;
    }
    if (!opts_.overwrite && isComplete(r)) {
      Log::Print("Rounds", "{} already registered, skipping", r.path);
      states_[r.index] = RoundState::Persisted;
      continue;
    }
    registerRound(r, *ref.get());
  }
  ref.release();
  Log::Print("Rounds", "Finished {} in {}", TileName(tile_), Log::ToNow(t0));
}

} // namespace mrl
