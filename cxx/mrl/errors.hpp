#pragma once

#include "log/log.hpp"
#include "types.hpp"

namespace mrl {

/*
 * Dataset layout or settings are wrong (no tile, missing round/bit group, missing calibration entry)
 */
struct ConfigError : Log::Failure
{
  using Log::Failure::Failure;
};

enum struct Prerequisite
{
  Rigid,
  Dense,
  Registered
};

/*
 * A stage was asked to run before the stage it depends on
 */
struct PrerequisiteError : Log::Failure
{
  PrerequisiteError(std::string const &category, Prerequisite const p, std::string const &node);

  Prerequisite missing;
};

auto Name(Prerequisite const p) -> std::string;

} // namespace mrl
