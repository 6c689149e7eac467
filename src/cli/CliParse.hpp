#pragma once

// Strict argument parsers and small filesystem helpers shared by the urbanres tools.
//
// All numeric parsers reject trailing garbage; float parsers reject inf/nan so that
// coordinates and time budgets entering the core are always finite.

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace urbanres::cli {

inline bool EnsureDir(const std::filesystem::path& p)
{
  if (p.empty()) return false;
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  if (ec) return false;
  return std::filesystem::exists(p, ec);
}

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path parent = file.parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out || s.empty()) return false;

  // from_chars does not accept a leading '+'.
  if (s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

// Decimal or 0x-prefixed hex (seeds are printed in hex).
inline bool ParseU64(std::string_view s, std::uint64_t* out)
{
  if (!out || s.empty()) return false;

  if (s.front() == '+') s.remove_prefix(1);
  int base = 10;
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    base = 16;
    s.remove_prefix(2);
  }
  if (s.empty()) return false;

  std::uint64_t v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, base);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseF64(std::string_view s, double* out)
{
  if (!out || s.empty()) return false;

  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0 || !end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool ParseBool01(std::string_view s, bool* out)
{
  if (!out) return false;
  std::string k(s);
  for (char& c : k) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  if (k == "0" || k == "false" || k == "off" || k == "no") {
    *out = false;
    return true;
  }
  if (k == "1" || k == "true" || k == "on" || k == "yes") {
    *out = true;
    return true;
  }
  return false;
}

// "2000x1500" -> positive width and height.
inline bool ParseWxH(std::string_view s, double* outW, double* outH)
{
  if (!outW || !outH) return false;
  const std::size_t pos = s.find_first_of("xX");
  if (pos == std::string_view::npos) return false;
  double w = 0.0;
  double h = 0.0;
  if (!ParseF64(s.substr(0, pos), &w) || !ParseF64(s.substr(pos + 1), &h)) return false;
  if (!(w > 0.0) || !(h > 0.0)) return false;
  *outW = w;
  *outH = h;
  return true;
}

// "x,y" in meters.
inline bool ParseVec2(std::string_view s, double* outX, double* outY)
{
  if (!outX || !outY) return false;
  const std::size_t pos = s.find(',');
  if (pos == std::string_view::npos) return false;
  double x = 0.0;
  double y = 0.0;
  if (!ParseF64(s.substr(0, pos), &x) || !ParseF64(s.substr(pos + 1), &y)) return false;
  *outX = x;
  *outY = y;
  return true;
}

inline std::vector<std::string> SplitCommaList(std::string_view s)
{
  std::vector<std::string> out;
  std::string cur;
  for (const char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

// "300,600,900" -> {300, 600, 900}. Empty lists are rejected.
inline bool ParseF64List(std::string_view s, std::vector<double>* out)
{
  if (!out) return false;
  std::vector<double> vals;
  for (const std::string& item : SplitCommaList(s)) {
    double v = 0.0;
    if (!ParseF64(item, &v)) return false;
    vals.push_back(v);
  }
  if (vals.empty()) return false;
  *out = std::move(vals);
  return true;
}

inline std::string HexU64(std::uint64_t v)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(16) << std::setfill('0') << v;
  return oss.str();
}

} // namespace urbanres::cli
