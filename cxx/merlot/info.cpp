#include "args.hpp"

#include "mrl/dataset.hpp"
#include "mrl/errors.hpp"
#include "mrl/io/hd5.hpp"
#include "mrl/log/log.hpp"

using namespace mrl;

void main_info(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Dataset HD5 file");
  ParseCommand(parser, iname);

  HD5::File file(iname.Get(), HD5::Mode::ReadOnly);
  Dataset   ds(file);
  fmt::print("Tiles: {}\n", fmt::join(ds.tiles(), ","));
  if (file.exists(HD5::Keys::Calibrations)) { fmt::print("PSFs: {}\n", ds.calibration().count()); }
  for (auto const tile : ds.tiles()) {
    auto const rounds = ds.rounds(tile);
    fmt::print("{} voxel size {} µm\n", TileName(tile), fmt::join(rounds.front().voxel, ","));
    for (auto const &r : rounds) {
      auto const  node = file.group(r.path);
      HD5::Reader reader(node.handle());
      std::string shift = "-";
      if (reader.hasAttribute(HD5::Attrs::Rigid)) {
        shift = fmt::format("{:.3f}", fmt::join(reader.readAttributeArray<3>(HD5::Attrs::Rigid), ","));
      }
      fmt::print("  {} psf {} gain {} shift {} dense {} registered {}\n", RoundName(r.index), r.psf, r.gain, shift,
                 reader.exists(HD5::Keys::Field), reader.exists(HD5::Keys::Registered));
    }
    if (file.exists(fmt::format("{}/{}", HD5::Keys::Readouts, TileName(tile)))) {
      for (auto const &b : ds.bits(tile)) {
        auto const  node = file.group(b.path);
        HD5::Reader reader(node.handle());
        fmt::print("  {} {} psf {} emission {} µm registered {}\n", BitName(b.index), RoundName(b.round), b.psf, b.emission,
                   reader.exists(HD5::Keys::Registered) && reader.exists(HD5::Keys::RegisteredEnhanced));
      }
    }
  }
}
