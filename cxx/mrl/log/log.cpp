#include "log.hpp"

#include "debug.hpp"

#include <fmt/chrono.h>

#include <atomic>
#include <ctime>
#include <mutex>

namespace mrl {
namespace Log {

namespace {
Display                  level = Display::None;
std::mutex               entryMutex;
std::vector<std::string> entries;
std::atomic<int>         warnings = 0;

constexpr char const *ClearLine = "\033[A\33[2K\r";
} // namespace

void SetDisplayLevel(Display const l)
{
  level = l;
  // Ephemeral entries erase the line above, so keep the command line on screen
  if (level == Display::Ephemeral) { fmt::print(stderr, "\n"); }
}

auto IsHigh() -> bool { return level == Display::High; }

auto FormatEntry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string
{
  return fmt::format("[{:%H:%M:%S}] [{:<7}] {}", fmt::localtime(std::time(nullptr)), category, fmt::vformat(fmt, args));
}

void SaveEntry(std::string const &entry, fmt::text_style const style, Display const l)
{
  std::scoped_lock lock(entryMutex);
  entries.push_back(entry);
  if (level < l) { return; }
  if (level == Display::Ephemeral && l == Display::Ephemeral) { fmt::print(stderr, "{}", ClearLine); }
  fmt::print(stderr, style, "{}\n", entry);
}

auto Saved() -> std::vector<std::string> const & { return entries; }

void CountWarning() { warnings++; }
auto Warnings() -> int { return warnings; }

void End()
{
  if (warnings > 0) { SaveEntry(fmt::format("{} warnings, see log above", warnings.load()), fmt::text_style(), Display::Low); }
  EndDebugging();
  level = Display::None;
}

auto Now() -> Time { return std::chrono::steady_clock::now(); }

auto ToNow(Time const t) -> std::string
{
  auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(Now() - t).count();
  if (ms < 1000) { return fmt::format("{} ms", ms); }
  auto const s = ms / 1000;
  if (s < 60) { return fmt::format("{}.{:03d} s", s, ms % 1000); }
  if (s < 3600) { return fmt::format("{}m {:02d}s", s / 60, s % 60); }
  return fmt::format("{}h {:02d}m {:02d}s", s / 3600, (s / 60) % 60, s % 60);
}

} // namespace Log
} // namespace mrl
