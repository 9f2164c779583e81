#include "debug.hpp"

#include "../io/file.hpp"
#include "../io/writer.hpp"
#include "log.hpp"

#include <map>
#include <memory>

namespace mrl {
namespace Log {

namespace {
std::unique_ptr<HD5::File> debugFile;
std::map<std::string, Index> written; // Dumps per name, repeats get -1, -2...
} // namespace

void SetDebugFile(std::string const &fname)
{
  debugFile = std::make_unique<HD5::File>(fname, HD5::Mode::Create);
  written.clear();
}

auto IsDebugging() -> bool { return debugFile != nullptr; }

void EndDebugging()
{
  if (debugFile) { Log::Debug("Debug", "Closing debug file after {} dumps", written.size()); }
  debugFile.reset();
}

template <int N> void Tensor(std::string const &name, ReN<N> const &x, HD5::DNames<N> const &dims)
{
  if (!debugFile) { return; }
  Index const      n = written[name]++;
  std::string const label = n == 0 ? name : fmt::format("{}-{}", name, n);
  HD5::Writer(debugFile->handle()).writeTensor(label, x, dims);
}

template void Tensor<2>(std::string const &, Re2 const &, HD5::DNames<2> const &);
template void Tensor<3>(std::string const &, Re3 const &, HD5::DNames<3> const &);
template void Tensor<4>(std::string const &, Re4 const &, HD5::DNames<4> const &);

} // namespace Log
} // namespace mrl
