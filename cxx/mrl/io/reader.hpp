#pragma once

#include "hd5-core.hpp"

#include <Eigen/Core>
#include <string>

namespace mrl {
namespace HD5 {

/*
 * Reads tensors and attributes from an open file or group. Does not own the handle.
 */
struct Reader
{
  Reader(Reader const &) = delete;
  Reader(Handle const h);

  auto list() const -> std::vector<std::string>;                                      // List all datasets
  auto groups() const -> std::vector<std::string>;                                    // List child groups
  auto exists(std::string const &label) const -> bool;                                // Does a data-set exist?
  auto hasAttribute(std::string const &attr) const -> bool;                           // Does the node have an attribute?
  auto order(std::string const &label) const -> Index;                                // Determine order of tensor dataset
  auto dimensions(std::string const &label) const -> std::vector<Index>;              // Get Tensor dimensions

  auto readAttributeFloat(std::string const &attribute) const -> float;
  auto readAttributeInt(std::string const &attribute) const -> Index;
  template <int N> auto readAttributeArray(std::string const &attribute) const -> Eigen::Array<float, N, 1>;

  template <typename T> auto readTensor(std::string const &label) const -> T;

protected:
  Handle handle_;
};

} // namespace HD5
} // namespace mrl
