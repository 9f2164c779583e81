#pragma once

#include "args.hpp"

#include "mrl/enhance.hpp"
#include "mrl/register/dense.hpp"
#include "mrl/register/rigid.hpp"

struct EnhanceArgs
{
  args::ValueFlag<float> NA, RI;

  EnhanceArgs(args::Subparser &parser);
  auto Get() -> mrl::Enhance::Opts;
};

struct RigidArgs
{
  args::ValueFlag<Index> factor, zRange;

  RigidArgs(args::Subparser &parser);
  auto Get() -> mrl::Rigid::Opts;
};

struct DenseArgs
{
  args::Flag             enable;
  args::ValueFlag<Index> its;
  args::ValueFlag<float> σ;
  args::Flag             noHistograms;

  DenseArgs(args::Subparser &parser);
  auto Get() -> mrl::Dense::Opts;
};
