#pragma once

#include "../io/hd5-core.hpp"
#include "../types.hpp"

#include <string>

namespace mrl {
namespace Log {

/*
 * Intermediate volumes (projections, downsampled pairs, correlation surfaces, fields) can be dumped to an HD5 file
 * for inspection. Nothing is written unless a debug file has been set.
 */
void SetDebugFile(std::string const &fname);
auto IsDebugging() -> bool;
void EndDebugging();

template <int N> void Tensor(std::string const &name, ReN<N> const &x, HD5::DNames<N> const &dims);

} // namespace Log
} // namespace mrl
