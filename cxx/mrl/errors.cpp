#include "errors.hpp"

namespace mrl {

auto Name(Prerequisite const p) -> std::string
{
  switch (p) {
  case Prerequisite::Rigid: return "rigid transform";
  case Prerequisite::Dense: return "dense displacement field";
  case Prerequisite::Registered: return "registered data";
  }
  return "unknown prerequisite";
}

namespace {
auto Remedy(Prerequisite const p) -> std::string
{
  switch (p) {
  case Prerequisite::Rigid: return "run round registration first";
  case Prerequisite::Dense: return "run round registration with dense refinement first";
  case Prerequisite::Registered: return "generate registered data first";
  }
  return "";
}
} // namespace

PrerequisiteError::PrerequisiteError(std::string const &category, Prerequisite const p, std::string const &node)
  : Log::Failure(category, "No {} for {}, {}", Name(p), node, Remedy(p))
  , missing{p}
{
}

} // namespace mrl
