#include <devsup/timefmt.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace devsup {

namespace {
struct Fields {
  int y, mo, d, h, mi, s;
};
} // namespace

static bool in_range(const Fields& f) {
  return f.mo >= 1 && f.mo <= 12 && f.d >= 1 && f.d <= 31 && f.h >= 0 &&
         f.h <= 23 && f.mi >= 0 && f.mi <= 59 && f.s >= 0 && f.s <= 60;
}

static SystemTime to_time_point(const Fields& f) {
  std::tm tm{};
  tm.tm_year = f.y - 1900;
  tm.tm_mon = f.mo - 1;
  tm.tm_mday = f.d;
  tm.tm_hour = f.h;
  tm.tm_min = f.mi;
  tm.tm_sec = f.s;
  return std::chrono::system_clock::from_time_t(::timegm(&tm));
}

// Parses the 19-char "YYYY-MM-DD?HH:MM:SS" prefix; `sep` is ' ', 'T' or 't'.
static std::optional<Fields> parse_base(std::string_view s, bool allow_space) {
  if (s.size() < 19)
    return std::nullopt;
  for (size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u, 11u, 12u, 14u, 15u, 17u, 18u})
    if (!std::isdigit(static_cast<unsigned char>(s[i])))
      return std::nullopt;
  if (s[4] != '-' || s[7] != '-' || s[13] != ':' || s[16] != ':')
    return std::nullopt;
  char sep = s[10];
  if (!(sep == 'T' || sep == 't' || (allow_space && sep == ' ')))
    return std::nullopt;

  auto num = [&](size_t at, size_t len) {
    int v = 0;
    for (size_t i = at; i < at + len; ++i)
      v = v * 10 + (s[i] - '0');
    return v;
  };
  Fields f{num(0, 4), num(5, 2), num(8, 2), num(11, 2), num(14, 2), num(17, 2)};
  if (!in_range(f))
    return std::nullopt;
  return f;
}

std::optional<SystemTime> parse_rfc3339(std::string_view s) {
  auto f = parse_base(s, true);
  if (!f)
    return std::nullopt;

  size_t i = 19;
  std::chrono::nanoseconds frac{0};
  if (i < s.size() && s[i] == '.') {
    ++i;
    long long ns = 0;
    int digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
      if (digits < 9) {
        ns = ns * 10 + (s[i] - '0');
        ++digits;
      }
      ++i;
    }
    if (digits == 0)
      return std::nullopt;
    for (int k = digits; k < 9; ++k)
      ns *= 10;
    frac = std::chrono::nanoseconds(ns);
  }

  if (i >= s.size())
    return std::nullopt; // offset is mandatory
  std::chrono::minutes offset{0};
  if (s[i] == 'Z' || s[i] == 'z') {
    ++i;
  } else if (s[i] == '+' || s[i] == '-') {
    if (s.size() < i + 6 || s[i + 3] != ':')
      return std::nullopt;
    for (size_t k : {i + 1, i + 2, i + 4, i + 5})
      if (!std::isdigit(static_cast<unsigned char>(s[k])))
        return std::nullopt;
    int oh = (s[i + 1] - '0') * 10 + (s[i + 2] - '0');
    int om = (s[i + 4] - '0') * 10 + (s[i + 5] - '0');
    offset = std::chrono::minutes(oh * 60 + om);
    if (s[i] == '-')
      offset = -offset;
    i += 6;
  } else {
    return std::nullopt;
  }
  if (i != s.size())
    return std::nullopt;

  auto tp = to_time_point(*f) - offset;
  return tp + std::chrono::duration_cast<SystemTime::duration>(frac);
}

std::optional<SystemTime> parse_datetime(std::string_view s) {
  auto f = parse_base(s, true);
  if (!f)
    return std::nullopt;
  return to_time_point(*f);
}

std::string format_utc(SystemTime t, const char *fmt) {
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  ::gmtime_r(&tt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, fmt);
  return ss.str();
}

std::string format_rfc3339(SystemTime t) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                t.time_since_epoch()) %
            1000;
  if (ms.count() < 0)
    ms += std::chrono::milliseconds(1000);
  std::ostringstream ss;
  ss << format_utc(t, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
     << std::setw(3) << ms.count() << 'Z';
  return ss.str();
}

std::string format_local_clock(SystemTime t) {
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  ::localtime_r(&tt, &tm);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                t.time_since_epoch()) %
            1000;
  std::ostringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0')
     << std::setw(3) << ms.count();
  return ss.str();
}

} // namespace devsup
