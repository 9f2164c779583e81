#include "hd5-core.hpp"

#include "../log/log.hpp"
#include "../types.hpp"

#include <hdf5.h>

namespace mrl {
namespace HD5 {

template <> hid_t type_impl(type_tag<uint16_t>) { return H5T_NATIVE_USHORT; }

template <> hid_t type_impl(type_tag<Index>) { return H5T_NATIVE_LONG; }

template <> hid_t type_impl(type_tag<float>) { return H5T_NATIVE_FLOAT; }

template <> hid_t type_impl(type_tag<double>) { return H5T_NATIVE_DOUBLE; }

void Init()
{
  static bool NeedsInit = true;

  if (NeedsInit) {
    auto err = H5open();
    err = H5Eset_auto(H5E_DEFAULT, nullptr, nullptr);
    if (err < 0) { throw Log::Failure("HD5", "Could not initialise HDF5, code: {}", err); }
    NeedsInit = false;
    Log::Debug("HD5", "Initialised HDF5");
  }
}

// Saves the error at the top (bottom) of the stack in the supplied string
herr_t ErrorWalker(unsigned n, const H5E_error2_t *err_desc, void *data)
{
  std::string *str = (std::string *)data;
  if (n == 0) { *str = fmt::format("{}\n", err_desc->desc); }
  return 0;
}

std::string GetError()
{
  std::string error_string;
  H5Ewalk(H5Eget_current_stack(), H5E_WALK_UPWARD, &ErrorWalker, (void *)&error_string);
  return error_string;
}

void CheckedCall(herr_t status, std::string const &msg)
{
  if (status < 0) { throw Log::Failure("HD5", "Error {}. Status {}. Error: {}", msg, status, GetError()); }
}

auto Exists(hid_t const parent, std::string const &name) -> bool { return (H5Lexists(parent, name.c_str(), H5P_DEFAULT) > 0); }

herr_t AddName(hid_t, const char *name, const H5L_info_t *, void *opdata)
{
  auto names = reinterpret_cast<std::vector<std::string> *>(opdata);
  names->push_back(name);
  return 0;
}

namespace {
auto ListType(Handle h, H5I_type_t const type) -> std::vector<std::string>
{
  std::vector<std::string> names;
  H5Literate(h, H5_INDEX_NAME, H5_ITER_INC, NULL, AddName, &names);

  std::erase_if(names, [h, type](std::string const &name) {
    hid_t const obj = H5Oopen(h, name.c_str(), H5P_DEFAULT);
    if (obj < 0) { return true; }
    auto const t = H5Iget_type(obj);
    H5Oclose(obj);
    return t != type;
  });

  return names;
}
} // namespace

std::vector<std::string> List(Handle h) { return ListType(h, H5I_DATASET); }

std::vector<std::string> Groups(Handle h) { return ListType(h, H5I_GROUP); }

} // namespace HD5
} // namespace mrl
