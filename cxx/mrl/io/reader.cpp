#include "reader.hpp"

#include "../log/log.hpp"
#include "../types.hpp"

#include <hdf5.h>

namespace mrl {
namespace HD5 {

Reader::Reader(Handle const h)
  : handle_{h}
{
  Init();
}

auto Reader::list() const -> std::vector<std::string> { return List(handle_); }
auto Reader::groups() const -> std::vector<std::string> { return Groups(handle_); }

auto Reader::order(std::string const &name) const -> Index
{
  hid_t dset = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open tensor {}", name); }
  hid_t     ds = H5Dget_space(dset);
  int const ndims = H5Sget_simple_extent_ndims(ds);
  CheckedCall(H5Sclose(ds), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close dataset");
  return ndims;
}

auto Reader::dimensions(std::string const &label) const -> std::vector<Index>
{
  hid_t dset = H5Dopen(handle_, label.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open tensor {}", label); }

  hid_t                ds = H5Dget_space(dset);
  int const            ND = H5Sget_simple_extent_ndims(ds);
  std::vector<hsize_t> hdims(ND);
  H5Sget_simple_extent_dims(ds, hdims.data(), NULL);
  std::vector<Index> dims(ND);
  for (int ii = 0; ii < ND; ii++) {
    dims[ii] = hdims[ii];
  }
  std::reverse(dims.begin(), dims.end()); // HD5=row-major, Eigen=col-major
  CheckedCall(H5Sclose(ds), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close dataset");
  return dims;
}

template <typename T> auto Reader::readTensor(std::string const &name) const -> T
{
  constexpr auto ND = T::NumDimensions;
  using Scalar = typename T::Scalar;
  hid_t dset = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open tensor '{}'", name); }
  hid_t      ds = H5Dget_space(dset);
  auto const rank = H5Sget_simple_extent_ndims(ds);
  if (rank != ND) { throw Log::Failure("HD5", "Tensor {} has rank {} expected {}", name, rank, ND); }

  std::array<hsize_t, ND> dims;
  H5Sget_simple_extent_dims(ds, dims.data(), NULL);
  typename Eigen::Tensor<Scalar, ND>::Dimensions tDims;
  std::copy_n(dims.begin(), ND, tDims.begin());
  std::reverse(tDims.begin(), tDims.end()); // HD5=row-major, Eigen=col-major
  Eigen::Tensor<Scalar, ND> tensor(tDims);
  herr_t                    ret_value = H5Dread(dset, type<Scalar>(), ds, H5S_ALL, H5P_DATASET_XFER_DEFAULT, tensor.data());
  CheckedCall(H5Sclose(ds), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close dataset");
  if (ret_value < 0) {
    throw Log::Failure("HD5", "Error reading tensor {} code {}", name, ret_value);
  } else {
    Log::Debug("HD5", "Read tensor {} shape {}", name, tDims);
  }
  return tensor;
}

template auto Reader::readTensor<Re3>(std::string const &) const -> Re3;
template auto Reader::readTensor<Re4>(std::string const &) const -> Re4;
template auto Reader::readTensor<U16_3>(std::string const &) const -> U16_3;
template auto Reader::readTensor<U16_4>(std::string const &) const -> U16_4;

auto Reader::exists(std::string const &label) const -> bool { return Exists(handle_, label); }

auto Reader::hasAttribute(std::string const &attr) const -> bool { return H5Aexists(handle_, attr.c_str()) > 0; }

auto Reader::readAttributeFloat(std::string const &attr) const -> float
{
  if (!hasAttribute(attr)) { throw Log::Failure("HD5", "Attribute {} does not exist", attr); }
  float      val;
  auto const attrH = H5Aopen(handle_, attr.c_str(), H5P_DEFAULT);
  CheckedCall(H5Aread(attrH, H5T_NATIVE_FLOAT, &val), fmt::format("reading attribute {}", attr));
  CheckedCall(H5Aclose(attrH), "closing attribute");
  return val;
}

auto Reader::readAttributeInt(std::string const &attr) const -> Index
{
  if (!hasAttribute(attr)) { throw Log::Failure("HD5", "Attribute {} does not exist", attr); }
  Index      val;
  auto const attrH = H5Aopen(handle_, attr.c_str(), H5P_DEFAULT);
  CheckedCall(H5Aread(attrH, H5T_NATIVE_LONG, &val), fmt::format("reading attribute {}", attr));
  CheckedCall(H5Aclose(attrH), "closing attribute");
  return val;
}

template <int N> auto Reader::readAttributeArray(std::string const &attr) const -> Eigen::Array<float, N, 1>
{
  if (!hasAttribute(attr)) { throw Log::Failure("HD5", "Attribute {} does not exist", attr); }
  auto const     attrH = H5Aopen(handle_, attr.c_str(), H5P_DEFAULT);
  auto const     space = H5Aget_space(attrH);
  hssize_t const n = H5Sget_simple_extent_npoints(space);
  CheckedCall(H5Sclose(space), "closing attribute space");
  if (n != N) {
    H5Aclose(attrH);
    throw Log::Failure("HD5", "Attribute {} has {} elements, expected {}", attr, n, N);
  }
  Eigen::Array<float, N, 1> val;
  CheckedCall(H5Aread(attrH, H5T_NATIVE_FLOAT, val.data()), fmt::format("reading attribute {}", attr));
  CheckedCall(H5Aclose(attrH), "closing attribute");
  return val;
}

template auto Reader::readAttributeArray<3>(std::string const &) const -> Eigen::Array<float, 3, 1>;

} // namespace HD5
} // namespace mrl
