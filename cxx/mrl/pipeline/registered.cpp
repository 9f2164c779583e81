#include "registered.hpp"

#include "../errors.hpp"
#include "../io/reader.hpp"
#include "../log/log.hpp"

namespace mrl {

auto LoadRegistered(Dataset const &ds, Index const tile, Which const which) -> U16_4
{
  std::vector<std::string> paths;
  auto const               rounds = ds.rounds(tile);
  if (which == Which::Rounds) {
    for (auto const &r : rounds) {
      paths.push_back(r.path);
    }
  } else {
    paths.push_back(rounds.front().path);
    for (auto const &b : ds.bits(tile)) {
      paths.push_back(b.path);
    }
  }

  for (auto const &p : paths) {
    if (!ds.file().exists(p) || !HD5::Reader(ds.file().group(p).handle()).exists(HD5::Keys::Registered)) {
      throw PrerequisiteError("Stack", Prerequisite::Registered, p);
    }
  }

  U16_4 stack;
  for (size_t ii = 0; ii < paths.size(); ii++) {
    auto const  node = ds.file().group(paths[ii]);
    U16_3 const v = HD5::Reader(node.handle()).readTensor<U16_3>(HD5::Keys::Registered);
    if (ii == 0) {
      stack.resize(AddBack(v.dimensions(), (Index)paths.size()));
    } else if (v.dimensions() != FirstN<3>(stack.dimensions())) {
      throw Log::Failure("Stack", "{} shape {} does not match {}", paths[ii], v.dimensions(), FirstN<3>(stack.dimensions()));
    }
    stack.chip<3>(ii) = v;
  }
  Log::Print("Stack", "Stacked {} volumes from {}", paths.size(), TileName(tile));
  return stack;
}

} // namespace mrl
