#pragma once

#include "hd5-core.hpp"

#include <string>

namespace mrl {
namespace HD5 {

enum struct Mode
{
  ReadOnly,
  ReadWrite,
  Create
};

/*
 * An open group inside a file. Closes the group when destroyed.
 */
struct Node
{
  Node(Handle const h, std::string const &path);
  Node(Node const &) = delete;
  Node(Node &&other);
  ~Node();

  auto handle() const -> Handle;
  auto path() const -> std::string const &;

private:
  Handle      handle_;
  std::string path_;
};

struct File
{
  File(std::string const &fname, Mode const mode);
  File(File const &) = delete;
  ~File();

  auto handle() const -> Handle;
  auto mode() const -> Mode;
  auto exists(std::string const &path) const -> bool;
  auto open(std::string const &path) const -> Node;  // Creates the group (and parents) if the file is writable
  auto group(std::string const &path) const -> Node; // Never creates, throws if the group is missing

private:
  Handle handle_;
  Mode   mode_;
};

} // namespace HD5
} // namespace mrl
