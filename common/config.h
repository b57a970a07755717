// common/config.h
#pragma once
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

// Environment overrides for the plain config structs. Unset or malformed
// values leave the default in place.

inline uint32_t env_u32(const char *n, uint32_t d)
{
  if (const char *e = std::getenv(n))
  {
    char *end = nullptr;
    long v = std::strtol(e, &end, 10);
    if (end != e && v > 0 && v < 100000000)
      return static_cast<uint32_t>(v);
  }
  return d;
}

inline bool env_bool(const char *n, bool d)
{
  if (const char *e = std::getenv(n))
  {
    if (std::strcmp(e, "1") == 0 || std::strcmp(e, "true") == 0 || std::strcmp(e, "on") == 0)
      return true;
    if (std::strcmp(e, "0") == 0 || std::strcmp(e, "false") == 0 || std::strcmp(e, "off") == 0)
      return false;
  }
  return d;
}

inline std::string env_str(const char *n, const std::string &d)
{
  if (const char *e = std::getenv(n))
  {
    if (e[0] != '\0')
      return e;
  }
  return d;
}

// Comma separated positive integers, e.g. "1,3,6,12,24".
inline std::vector<int> env_int_list(const char *n, const std::vector<int> &d)
{
  const char *e = std::getenv(n);
  if (!e)
    return d;
  std::vector<int> out;
  const char *p = e;
  while (*p)
  {
    char *end = nullptr;
    long v = std::strtol(p, &end, 10);
    if (end == p)
      return d;
    if (v > 0 && v < 100000)
      out.push_back(static_cast<int>(v));
    p = end;
    if (*p == ',')
      ++p;
  }
  return out.empty() ? d : out;
}
