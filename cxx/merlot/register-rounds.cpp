#include "inputs.hpp"

#include "mrl/dataset.hpp"
#include "mrl/io/file.hpp"
#include "mrl/log/log.hpp"
#include "mrl/pipeline/rounds.hpp"

using namespace mrl;

void main_register_rounds(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Dataset HD5 file");
  args::ValueFlag<Index>        tile(parser, "T", "Tile index (0)", {"tile", 't'}, 0);
  args::Flag                    overwrite(parser, "O", "Recompute rounds that are already registered", {"overwrite"});
  RigidArgs                     rigidArgs(parser);
  DenseArgs                     denseArgs(parser);
  ParseCommand(parser, iname);
  auto const cmd = parser.GetCommand().Name();

  HD5::File         file(iname.Get(), HD5::Mode::ReadWrite);
  Dataset           ds(file);
  RoundRegistration reg(ds, tile.Get(),
                        RoundOpts{.dense = denseArgs.enable.Get(),
                                  .overwrite = overwrite.Get(),
                                  .decon = Decon::Opts{},
                                  .rigid = rigidArgs.Get(),
                                  .demons = denseArgs.Get()});
  reg.run();
  for (auto const &[round, state] : reg.states()) {
    Log::Print(cmd, "{} {}", RoundName(round), Name(state));
  }
  Log::Print(cmd, "Finished");
}
