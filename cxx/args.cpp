#include "args.hpp"

#include "mrl/io/writer.hpp"
#include "mrl/log/debug.hpp"
#include "mrl/sys/threads.hpp"

#include <cstdlib>
#include <fmt/format.h>
#include <optional>
#include <scn/scan.h>
#include <unordered_map>

using namespace mrl;

namespace {
std::unordered_map<int, Log::Display> levelMap{
  {0, Log::Display::None}, {1, Log::Display::Ephemeral}, {2, Log::Display::Low}, {3, Log::Display::High}};

/*
 * Settings not given on the command line can come from MRL_ environment variables
 */
template <typename T> auto FromEnv(char const *var) -> std::optional<T>
{
  char const *const value = std::getenv(var);
  if (!value) { return std::nullopt; }
  auto const result = scn::scan<T>(std::string_view(value), "{}");
  if (!result) { throw args::Error(fmt::format("Could not read {} from '{}'", var, value)); }
  return result->value();
}
} // namespace

args::Group                      global_group("GLOBAL OPTIONS");
args::HelpFlag                   help(global_group, "H", "Show this help message", {'h', "help"});
args::MapFlag<int, Log::Display> verbosity(global_group, "V", "Log level 0-3 (MRL_VERBOSITY)", {'v', "verbosity"}, levelMap,
                                           Log::Display::Low);
args::ValueFlag<std::string>     debug(global_group, "F", "Write intermediate volumes to file", {"debug"});
args::ValueFlag<Index>           nthreads(global_group, "N", "Limit number of threads (MRL_THREADS)", {"nthreads"});
args::ValueFlag<Index>           deflate(global_group, "D", "Deflate level, 0 for none (MRL_DEFLATE)", {"deflate"}, 2);

void SetLogging(std::string const &name)
{
  if (verbosity) {
    Log::SetDisplayLevel(verbosity.Get());
  } else if (auto const v = FromEnv<int>("MRL_VERBOSITY")) {
    auto const level = levelMap.find(*v);
    if (level == levelMap.end()) { throw args::Error(fmt::format("MRL_VERBOSITY must be 0-3, was {}", *v)); }
    Log::SetDisplayLevel(level->second);
  }
  Log::Print(name, "Welcome to MERLOT");
  if (debug) {
    Log::SetDebugFile(debug.Get());
    Log::Print(name, "Writing intermediate volumes to {}", debug.Get());
  }
}

void SetResources()
{
  if (nthreads) {
    Threads::SetGlobalThreadCount(nthreads.Get());
  } else if (auto const n = FromEnv<Index>("MRL_THREADS")) {
    Threads::SetGlobalThreadCount(*n);
  }
  if (deflate) {
    HD5::SetDeflate(deflate.Get());
  } else if (auto const d = FromEnv<Index>("MRL_DEFLATE")) {
    HD5::SetDeflate(*d);
  }
}

void ParseCommand(args::Subparser &parser)
{
  args::GlobalOptions globals(parser, global_group);
  parser.Parse();
  SetLogging(parser.GetCommand().Name());
  SetResources();
}

void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname)
{
  ParseCommand(parser);
  if (!iname) { throw args::Error("No input file specified"); }
}

void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname, args::Positional<std::string> &oname)
{
  ParseCommand(parser, iname);
  if (!oname) { throw args::Error("No output file specified"); }
}

template <typename T>
void VectorReader<T>::operator()(std::string const &name, std::string const &input, std::vector<T> &values)
{
  values.clear();
  auto result = scn::scan<T>(input, "{}");
  if (!result) { throw args::Error(fmt::format("Could not read a list for {} from '{}'", name, input)); }
  values.push_back(result->value());
  while ((result = scn::scan<T>(result->range(), ",{}"))) {
    values.push_back(result->value());
  }
}

template struct VectorReader<Index>;
