#pragma once

#include <functional>
#include <memory>

namespace mrl {

/*
 * Holds one large volume that is loaded on demand and dropped as soon as it is released
 */
template <typename T> struct VolumeSlot
{
  using Loader = std::function<T()>;

  VolumeSlot(Loader l)
    : loader_{std::move(l)}
  {
  }
  VolumeSlot(VolumeSlot const &) = delete;

  void load()
  {
    if (!data_) { data_ = std::make_unique<T>(loader_()); }
  }

  // Loads on first use
  auto get() -> T const *
  {
    load();
    return data_.get();
  }

  auto loaded() const -> bool { return data_ != nullptr; }
  void release() { data_.reset(); }

private:
  Loader             loader_;
  std::unique_ptr<T> data_;
};

} // namespace mrl
