#pragma once

#include "mrl/types.hpp"

#include <args.hxx>
#include <string>
#include <vector>

/*
 * Options shared by every merlot command: verbosity, debug file, threads and deflate level
 */
extern args::Group    global_group;
extern args::HelpFlag help;

void SetLogging(std::string const &name);

// Parse a subcommand's arguments, then apply the global options
void ParseCommand(args::Subparser &parser);
void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname);
void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname, args::Positional<std::string> &oname);

// Comma separated list, e.g. --bits=0,3,4
template <typename T> struct VectorReader
{
  void operator()(std::string const &name, std::string const &value, std::vector<T> &x);
};

template <typename T> using VectorFlag = args::ValueFlag<std::vector<T>, VectorReader<T>>;
