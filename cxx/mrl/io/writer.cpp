#include "writer.hpp"

#include "../log/log.hpp"
#include "../types.hpp"

#include <hdf5.h>
#include <hdf5_hl.h>

namespace mrl {
namespace HD5 {

namespace {
Index deflate = 2;

/*
 * One chunk per plane of the two fastest (Eigen) dimensions, halved until it fits under 4 GiB
 */
template <size_t N> auto ChunkShape(hsize_t const (&ds_dims)[N], Index const scalarSize) -> std::array<hsize_t, N>
{
  std::array<hsize_t, N> chunk;
  for (size_t ii = 0; ii < N; ii++) {
    chunk[ii] = (N < 3 || ii >= N - 2) ? ds_dims[ii] : 1;
  }
  Index sizeInBytes = scalarSize;
  for (auto const c : chunk) {
    sizeInBytes *= c;
  }
  Index dimToShrink = N - 1;
  while (sizeInBytes >= (1L << 32L)) {
    if (chunk[dimToShrink] > 1) {
      chunk[dimToShrink] /= 2;
      sizeInBytes /= 2;
    }
    dimToShrink = (dimToShrink + N - 1) % N;
  }
  return chunk;
}

/*
 * Does an existing dataset have the requested type and (HDF5 ordered) shape?
 */
auto Matches(hid_t const dset, hid_t const tid, hsize_t const *ds_dims, int const N) -> bool
{
  hid_t const ftype = H5Dget_type(dset);
  bool const  sameType = H5Tequal(ftype, tid) > 0;
  H5Tclose(ftype);
  hid_t const          space = H5Dget_space(dset);
  int const            rank = H5Sget_simple_extent_ndims(space);
  std::vector<hsize_t> dims(std::max(rank, 0));
  H5Sget_simple_extent_dims(space, dims.data(), NULL);
  H5Sclose(space);
  if (!sameType || rank != N) { return false; }
  return std::equal(dims.begin(), dims.end(), ds_dims);
}
} // namespace

void SetDeflate(Index d) { deflate = d; }

Writer::Writer(Handle const h)
  : handle_{h}
{
  Init();
}

bool Writer::exists(std::string const &name) const { return HD5::Exists(handle_, name); }

template <typename Scalar, size_t N>
void Writer::writeTensor(std::string const &name, Shape<N> const &shape, Scalar const *data, DNames<N> const &labels)
{
  for (size_t ii = 0; ii < N; ii++) {
    if (shape[ii] == 0) { throw Log::Failure("HD5", "Tensor {} had a zero dimension. Dims: {}", name, shape); }
  }

  hsize_t ds_dims[N];
  // HD5=row-major, Eigen=col-major, so need to reverse the dimensions
  std::copy_n(shape.rbegin(), N, ds_dims);
  hid_t const tid = type<Scalar>();

  hid_t dset = -1;
  if (exists(name)) {
    dset = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
    if (dset < 0) { throw Log::Failure("HD5", "Could not open existing dataset {}: {}", name, GetError()); }
    if (Matches(dset, tid, ds_dims, N)) {
      Log::Debug("HD5", "Overwriting tensor {}", name);
    } else {
      Log::Debug("HD5", "Tensor {} changed shape or type, recreating", name);
      CheckedCall(H5Dclose(dset), "closing dataset");
      CheckedCall(H5Ldelete(handle_, name.c_str(), H5P_DEFAULT), fmt::format("unlinking {}", name));
      dset = -1;
    }
  }

  if (dset < 0) {
    auto const chunk_dims = ChunkShape(ds_dims, sizeof(Scalar));
    auto const space = H5Screate_simple(N, ds_dims, NULL);
    auto const plist = H5Pcreate(H5P_DATASET_CREATE);
    CheckedCall(H5Pset_chunk(plist, N, chunk_dims.data()), "setting chunk");
    if (deflate > 0) { CheckedCall(H5Pset_deflate(plist, deflate), "setting deflate"); }
    dset = H5Dcreate(handle_, name.c_str(), tid, space, H5P_DEFAULT, plist, H5P_DEFAULT);
    CheckedCall(H5Pclose(plist), "closing plist");
    CheckedCall(H5Sclose(space), "closing space");
    if (dset < 0) { throw Log::Failure("HD5", "Could not create dataset {} dimensions {} error {}", name, shape, GetError()); }
    auto l = labels.rbegin();
    for (size_t ii = 0; ii < N; ii++) {
      CheckedCall(H5DSset_label(dset, ii, l->c_str()), fmt::format("dataset {} dimension {} label {}", name, ii, *l));
      l++;
    }
  }

  CheckedCall(H5Dwrite(dset, tid, H5S_ALL, H5S_ALL, H5P_DEFAULT, data), fmt::format("writing {}", name));
  CheckedCall(H5Dclose(dset), "closing dataset");
  Log::Debug("HD5", "Wrote tensor {}", name);
}

template void Writer::writeTensor<float, 2>(std::string const &, Shape<2> const &, float const *, DNames<2> const &);
template void Writer::writeTensor<float, 3>(std::string const &, Shape<3> const &, float const *, DNames<3> const &);
template void Writer::writeTensor<float, 4>(std::string const &, Shape<4> const &, float const *, DNames<4> const &);
template void Writer::writeTensor<uint16_t, 3>(std::string const &, Shape<3> const &, uint16_t const *, DNames<3> const &);
template void Writer::writeTensor<uint16_t, 4>(std::string const &, Shape<4> const &, uint16_t const *, DNames<4> const &);

namespace {
/*
 * Attributes cannot be resized, so remove any previous value first
 */
auto CreateAttribute(hid_t const h, std::string const &attr, hid_t const tid, hsize_t const n) -> hid_t
{
  if (H5Aexists(h, attr.c_str()) > 0) { CheckedCall(H5Adelete(h, attr.c_str()), fmt::format("replacing attribute {}", attr)); }
  hsize_t const sz[1] = {n};
  auto const    space = H5Screate_simple(1, sz, NULL);
  auto const    attrH = H5Acreate(h, attr.c_str(), tid, space, H5P_DEFAULT, H5P_DEFAULT);
  CheckedCall(H5Sclose(space), "closing attribute space");
  if (attrH < 0) { throw Log::Failure("HD5", "Could not create attribute {}: {}", attr, GetError()); }
  return attrH;
}
} // namespace

void Writer::writeAttribute(std::string const &attr, float const val)
{
  auto const attrH = CreateAttribute(handle_, attr, H5T_NATIVE_FLOAT, 1);
  CheckedCall(H5Awrite(attrH, H5T_NATIVE_FLOAT, &val), fmt::format("writing attribute {}", attr));
  CheckedCall(H5Aclose(attrH), "closing attribute");
}

void Writer::writeAttribute(std::string const &attr, Index const val)
{
  auto const attrH = CreateAttribute(handle_, attr, H5T_NATIVE_LONG, 1);
  CheckedCall(H5Awrite(attrH, H5T_NATIVE_LONG, &val), fmt::format("writing attribute {}", attr));
  CheckedCall(H5Aclose(attrH), "closing attribute");
}

template <int N> void Writer::writeAttribute(std::string const &attr, Eigen::Array<float, N, 1> const &val)
{
  auto const attrH = CreateAttribute(handle_, attr, H5T_NATIVE_FLOAT, N);
  CheckedCall(H5Awrite(attrH, H5T_NATIVE_FLOAT, val.data()), fmt::format("writing attribute {}", attr));
  CheckedCall(H5Aclose(attrH), "closing attribute");
}

template void Writer::writeAttribute<3>(std::string const &, Eigen::Array<float, 3, 1> const &);

} // namespace HD5
} // namespace mrl
