#include "args.hpp"
#include "mrl/errors.hpp"
#include "mrl/log/log.hpp"

using namespace mrl;

#define COMMAND(PARSER, NM, CMD, DESC)                                                                                         \
  void          main_##NM(args::Subparser &parser);                                                                            \
  args::Command NM(PARSER, CMD, DESC, &main_##NM);

namespace {
// Exit codes
constexpr int Failed = 1;
constexpr int BadConfig = 2;
constexpr int MissingPrerequisite = 3;

auto Report(Log::Failure const &f, int const code) -> int
{
  Log::Fail(f);
  Log::End();
  return code;
}
} // namespace

int main(int const argc, char const *const argv[])
{
  args::ArgumentParser parser("MERLOT: registration of multi-round volumetric imaging");
  args::GlobalOptions  globals(parser, global_group);

  args::Group reg(parser, "REGISTER");
  COMMAND(reg, register_rounds, "register-rounds", "Register every round of a tile to round 0");
  COMMAND(reg, register_bits, "register-bits", "Deconvolve, enhance and register readout bits");

  args::Group data(parser, "DATA");
  COMMAND(data, info, "info", "List tiles, rounds, bits and registration state");
  COMMAND(data, stack, "stack", "Stack registered volumes into a new file");

  args::Group util(parser, "UTIL");
  COMMAND(util, version, "version", "Print version number");

  try {
    parser.ParseCLI(argc, argv);
    Log::End();
  } catch (args::Help &) {
    fmt::print(stderr, "{}\n", parser.Help());
  } catch (args::Error &e) {
    fmt::print(stderr, "{}\n", parser.Help());
    fmt::print(stderr, fmt::fg(fmt::terminal_color::bright_red), "{}\n", e.what());
    return BadConfig;
  } catch (PrerequisiteError const &e) {
    return Report(e, MissingPrerequisite);
  } catch (ConfigError const &e) {
    return Report(e, BadConfig);
  } catch (Log::Failure const &f) {
    return Report(f, Failed);
  } catch (std::exception const &e) {
    return Report(Log::Failure("merlot", "{}", e.what()), Failed);
  }
  return EXIT_SUCCESS;
}
