#include "args.hpp"

#include "mrl/dataset.hpp"
#include "mrl/io/hd5.hpp"
#include "mrl/log/log.hpp"
#include "mrl/pipeline/registered.hpp"

using namespace mrl;

void main_stack(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Dataset HD5 file");
  args::Positional<std::string> oname(parser, "OUTPUT", "Output HD5 file");
  args::ValueFlag<Index>        tile(parser, "T", "Tile index (0)", {"tile", 't'}, 0);
  args::Flag                    bits(parser, "B", "Stack readout bits instead of rounds", {"bits", 'b'});
  ParseCommand(parser, iname, oname);
  auto const cmd = parser.GetCommand().Name();

  HD5::File   ifile(iname.Get(), HD5::Mode::ReadOnly);
  Dataset     ds(ifile);
  U16_4 const stack = LoadRegistered(ds, tile.Get(), bits ? Which::Bits : Which::Rounds);
  auto const  voxel = ds.rounds(tile.Get()).front().voxel;

  HD5::File   ofile(oname.Get(), HD5::Mode::Create);
  HD5::Writer writer(ofile.handle());
  writer.writeTensor(HD5::Keys::Data, stack, HD5::Dims::Stack);
  writer.writeAttribute<3>(HD5::Attrs::VoxelSize, Eigen::Array3f(voxel[2], voxel[1], voxel[0]));
  Log::Print(cmd, "Wrote {} volumes to {}", stack.dimension(3), oname.Get());
}
