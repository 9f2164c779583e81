#include "file.hpp"

#include "../log/log.hpp"

#include <filesystem>
#include <hdf5.h>

namespace mrl {
namespace HD5 {

Node::Node(Handle const h, std::string const &p)
  : handle_{h}
  , path_{p}
{
}

Node::Node(Node &&other)
  : handle_{other.handle_}
  , path_{std::move(other.path_)}
{
  other.handle_ = -1;
}

Node::~Node()
{
  if (handle_ >= 0) {
    H5Gclose(handle_);
    Log::Debug("HD5", "Closed group {}", path_);
  }
}

auto Node::handle() const -> Handle { return handle_; }
auto Node::path() const -> std::string const & { return path_; }

File::File(std::string const &fname, Mode const m)
  : mode_{m}
{
  Init();
  switch (mode_) {
  case Mode::ReadOnly:
  case Mode::ReadWrite:
    if (!std::filesystem::exists(fname)) { throw Log::Failure("HD5", "File does not exist: {}", fname); }
    handle_ = H5Fopen(fname.c_str(), mode_ == Mode::ReadOnly ? H5F_ACC_RDONLY : H5F_ACC_RDWR, H5P_DEFAULT);
    break;
  case Mode::Create: handle_ = H5Fcreate(fname.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT); break;
  }
  if (handle_ < 0) { throw Log::Failure("HD5", "Could not open {} because: {}", fname, GetError()); }
  Log::Print("HD5", "Opened {} {} id {}", fname, mode_ == Mode::ReadOnly ? "for reading" : "for writing", handle_);
}

File::~File()
{
  H5Fclose(handle_);
  Log::Debug("HD5", "Closed id {}", handle_);
}

auto File::handle() const -> Handle { return handle_; }
auto File::mode() const -> Mode { return mode_; }

auto File::exists(std::string const &path) const -> bool
{
  // H5Lexists only checks the final link, so walk the path
  std::filesystem::path const p(path);
  std::string                 partial;
  for (auto const &part : p) {
    if (part.empty() || part == "/") { continue; }
    partial = partial.empty() ? part.string() : partial + "/" + part.string();
    if (!Exists(handle_, partial)) { return false; }
  }
  return true;
}

auto File::open(std::string const &path) const -> Node
{
  if (!exists(path)) {
    if (mode_ == Mode::ReadOnly) { throw Log::Failure("HD5", "Group {} does not exist", path); }
    auto const lcpl = H5Pcreate(H5P_LINK_CREATE);
    CheckedCall(H5Pset_create_intermediate_group(lcpl, 1), "setting intermediate group creation");
    auto const g = H5Gcreate(handle_, path.c_str(), lcpl, H5P_DEFAULT, H5P_DEFAULT);
    CheckedCall(H5Pclose(lcpl), "closing link plist");
    if (g < 0) { throw Log::Failure("HD5", "Could not create group {}: {}", path, GetError()); }
    Log::Debug("HD5", "Created group {}", path);
    return Node(g, path);
  }
  return group(path);
}

auto File::group(std::string const &path) const -> Node
{
  if (!exists(path)) { throw Log::Failure("HD5", "Group {} does not exist", path); }
  auto const g = H5Gopen(handle_, path.c_str(), H5P_DEFAULT);
  if (g < 0) { throw Log::Failure("HD5", "Could not open group {}: {}", path, GetError()); }
  return Node(g, path);
}

} // namespace HD5
} // namespace mrl
