#pragma once

#include "hd5-core.hpp"

#include <Eigen/Core>
#include <algorithm>
#include <string>

namespace mrl {
namespace HD5 {

void SetDeflate(Index const d); //! Set the global compression (deflate) level

/*
 * Writes tensors and attributes into an open file or group. Does not own the handle.
 *
 * Writing a name that already exists replaces its contents. If the existing dataset has the same shape and type it is
 * overwritten in place, otherwise it is unlinked and recreated.
 */
struct Writer
{
  Writer(Writer const &) = delete;
  Writer(Handle const h);

  template <typename Scalar, size_t N>
  void writeTensor(std::string const &label, Shape<N> const &shape, Scalar const *data, DNames<N> const &dims);

  // Convenience for whole tensors
  template <typename T> void writeTensor(std::string const &label, T const &x, DNames<T::NumDimensions> const &dims)
  {
    Shape<T::NumDimensions> shape;
    std::copy_n(x.dimensions().begin(), T::NumDimensions, shape.begin());
    writeTensor(label, shape, x.data(), dims);
  }

  void                     writeAttribute(std::string const &attribute, float const val);
  void                     writeAttribute(std::string const &attribute, Index const val);
  template <int N> void    writeAttribute(std::string const &attribute, Eigen::Array<float, N, 1> const &val);

  bool exists(std::string const &name) const;

private:
  Handle handle_;
};

} // namespace HD5
} // namespace mrl
