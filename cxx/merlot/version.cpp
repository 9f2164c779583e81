#include "version.h"

#include "args.hpp"

#include <fmt/format.h>

void main_version(args::Subparser &parser)
{
  parser.Parse();
  fmt::print("merlot {} built {}\n", VERSION, DATETIME);
}
