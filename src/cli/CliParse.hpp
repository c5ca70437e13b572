#pragma once

// Strict option parsing shared by the footprint command-line tools.
//
// Numbers must parse completely and be finite; "12x" or "nan" are rejected rather than
// silently truncated.

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace footprint::cli {

// Creates the directories above `file`; false when `file` is empty or creation fails.
inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path dir = file.parent_path();
  if (dir.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;

  // from_chars rejects a leading '+' on some standard libraries.
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseF64(std::string_view s, double* out)
{
  if (!out || s.empty()) return false;

  const std::string text(s);
  char* stop = nullptr;
  errno = 0;
  const double v = std::strtod(text.c_str(), &stop);
  const bool whole = stop == text.c_str() + text.size();
  if (errno != 0 || !whole || !std::isfinite(v)) return false;
  *out = v;
  return true;
}

// "12000x8000" (either separator case). Both values must be > 0.
inline bool ParseExtent(std::string_view s, double* outW, double* outH)
{
  if (!outW || !outH) return false;
  const std::size_t pos = s.find_first_of("xX");
  if (pos == std::string_view::npos) return false;
  double w = 0.0;
  double h = 0.0;
  if (!ParseF64(s.substr(0, pos), &w)) return false;
  if (!ParseF64(s.substr(pos + 1), &h)) return false;
  if (!(w > 0.0) || !(h > 0.0)) return false;
  *outW = w;
  *outH = h;
  return true;
}

// Output path for input `in` inside `dir`: <dir>/<stem><suffix>.
inline std::filesystem::path OutputPathFor(const std::filesystem::path& dir, const std::filesystem::path& in,
                                           const std::string& suffix)
{
  std::filesystem::path name = in.stem();
  name += suffix;
  return dir / name;
}

} // namespace footprint::cli
