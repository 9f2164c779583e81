#include "inputs.hpp"

#include "mrl/dataset.hpp"
#include "mrl/io/file.hpp"
#include "mrl/log/log.hpp"
#include "mrl/pipeline/bits.hpp"

#include <algorithm>

using namespace mrl;

void main_register_bits(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Dataset HD5 file");
  args::ValueFlag<Index>        tile(parser, "T", "Tile index (0)", {"tile", 't'}, 0);
  VectorFlag<Index>             only(parser, "B", "Only process these bits (comma separated)", {"bits", 'b'});
  args::Flag                    dense(parser, "D", "Apply the rounds' dense displacement fields", {"dense", 'd'});
  EnhanceArgs                   enhanceArgs(parser);
  ParseCommand(parser, iname);
  auto const cmd = parser.GetCommand().Name();

  HD5::File      file(iname.Get(), HD5::Mode::ReadWrite);
  Dataset        ds(file);
  TransformCache cache(ds, tile.Get());
  BitPropagation prop(ds, cache, BitOpts{.dense = dense.Get(), .decon = Decon::Opts{}, .enhance = enhanceArgs.Get()});
  if (only) {
    auto const bits = ds.bits(tile.Get());
    for (auto const ib : only.Get()) {
      auto const b = std::find_if(bits.begin(), bits.end(), [ib](BitInfo const &bi) { return bi.index == ib; });
      if (b == bits.end()) { throw Log::Failure(cmd, "{} has no {}", TileName(tile.Get()), BitName(ib)); }
      prop.runBit(*b);
    }
  } else {
    prop.run();
  }
  Log::Print(cmd, "Finished");
}
