#include "threads.hpp"

#include "../log/log.hpp"

#include <memory>
#include <thread>

namespace mrl {
namespace Threads {

namespace {
struct Pool
{
  std::unique_ptr<Eigen::ThreadPool>       pool;
  std::unique_ptr<Eigen::ThreadPoolDevice> device;

  void create(Index n)
  {
    if (n < 1) { n = std::max<Index>(1, std::thread::hardware_concurrency()); }
    device.reset();
    pool = std::make_unique<Eigen::ThreadPool>(n);
    device = std::make_unique<Eigen::ThreadPoolDevice>(pool.get(), n);
    Log::Debug("Threads", "Pool of {} threads", n);
  }
};

auto Global() -> Pool &
{
  static Pool p;
  if (!p.pool) { p.create(0); }
  return p;
}
} // namespace

auto GlobalPool() -> Eigen::ThreadPool * { return Global().pool.get(); }
auto TensorDevice() -> Eigen::ThreadPoolDevice & { return *Global().device; }
auto GlobalThreadCount() -> Index { return Global().pool->NumThreads(); }
void SetGlobalThreadCount(Index const n) { Global().create(n); }

} // namespace Threads
} // namespace mrl
