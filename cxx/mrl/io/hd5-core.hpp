#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace mrl {
namespace HD5 {

using Handle = int64_t;
using Index = long int;

template <typename T> struct type_tag
{
};

template <size_t N> using Shape = std::array<Index, N>;

template <typename T> Handle type_impl(type_tag<T>);

template <typename T> Handle type() { return type_impl(type_tag<T>{}); }

void                     Init();
auto                     Exists(Handle const h, std::string const &name) -> bool;
void                     CheckedCall(int status, std::string const &msg);
std::string              GetError();
std::vector<std::string> List(Handle h);   // Datasets only
std::vector<std::string> Groups(Handle h); // Child groups only

/*
 * Names of groups and datasets within a MERFISH dataset file
 */
namespace Keys {
std::string const Calibrations = "calibrations";
std::string const PSFs = "psf_data";
std::string const Reference = "polyDT";
std::string const Readouts = "readouts";
std::string const Raw = "raw_data";
std::string const Decon = "decon_data";
std::string const Registered = "registered_decon_data";
std::string const Enhanced = "dog_data";
std::string const RegisteredEnhanced = "registered_dog_data";
std::string const Field = "of_xform_4x";
std::string const Data = "data";
std::string const VoxelSize = "voxel_size";
} // namespace Keys

/*
 * Attribute names. Axis vectors are stored in the order given in their name
 */
namespace Attrs {
std::string const VoxelSize = "voxel_zyx_um";
std::string const Stage = "stage_zyx_um";
std::string const Gain = "gain";
std::string const PSF = "psf_idx";
std::string const Round = "round";
std::string const Emission = "emission_um";
std::string const Rigid = "rigid_xform_xyz_um";
} // namespace Attrs

// Horrible hack due to DSizes shenanigans
template <size_t N> struct DNames : std::array<std::string, N>
{
};

namespace Dims {
DNames<2> const Projection = {"i", "j"};
DNames<3> const Image = {"i", "j", "k"};
DNames<4> const Field = {"i", "j", "k", "v"};
DNames<4> const PSFs = {"i", "j", "k", "psf"};
DNames<4> const Stack = {"i", "j", "k", "volume"};
} // namespace Dims

} // namespace HD5
} // namespace mrl
