#include "log_scan/date_parse.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <string_view>
#include <system_error>
#include <fast_float/fast_float.h>

namespace lscan {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

// ".5" / ".123456" -> whole milliseconds, truncated.
static bool parse_fraction_ms(std::string_view digits, int& ms) {
  char buf[32] = {'0', '.'};
  if (digits.empty() || digits.size() > sizeof(buf) - 2) return false;
  for (size_t i = 0; i < digits.size(); ++i) {
    if (!is_digit(digits[i])) return false;
    buf[i + 2] = digits[i];
  }
  double frac = 0.0;
  auto r = fast_float::from_chars(buf, buf + digits.size() + 2, frac);
  if (r.ec != std::errc()) return false;
  ms = static_cast<int>(std::floor(frac * 1000.0 + 1e-9));
  if (ms > 999) ms = 999;
  return true;
}

// Z, +HH:MM, -HH:MM, +HHMM, -HHMM -> offset minutes east of UTC.
static bool parse_offset(std::string_view s, int& minutes) {
  if (s == "Z" || s == "z") { minutes = 0; return true; }
  if (s.size() != 6 && s.size() != 5) return false;
  if (s[0] != '+' && s[0] != '-') return false;
  int hh = 0, mm = 0;
  if (!parse_int(s.substr(1, 2), hh)) return false;
  std::string_view rest = s.substr(3);
  if (rest.size() == 3) {
    if (rest[0] != ':') return false;
    rest.remove_prefix(1);
  }
  if (!parse_int(rest, mm)) return false;
  if (hh > 23 || mm > 59) return false;
  minutes = (hh * 60 + mm) * (s[0] == '-' ? -1 : 1);
  return true;
}

std::optional<std::int64_t> parse_iso8601_ms(std::string_view s) {
  if (s.size() < 10) return std::nullopt;
  int Y,M,D,h=0,m=0,sec=0,ms=0,off_min=0;

  if (!(parse_int(s.substr(0,4), Y) && s[4]=='-' && parse_int(s.substr(5,2), M) && s[7]=='-' && parse_int(s.substr(8,2), D)))
    return std::nullopt;
  if (M < 1 || M > 12 || D < 1 || D > 31) return std::nullopt;

  size_t i = 10;
  if (i < s.size() && (s[i]=='T' || s[i]==' ')) {
    ++i;
    if (i+5 > s.size()) return std::nullopt;
    if (!(parse_int(s.substr(i,2), h) && s[i+2]==':' && parse_int(s.substr(i+3,2), m)))
      return std::nullopt;
    i += 5;
    if (i < s.size() && s[i]==':') {
      if (i+3 > s.size() || !parse_int(s.substr(i+1,2), sec)) return std::nullopt;
      i += 3;
      if (i < s.size() && s[i]=='.') {
        size_t j=i+1, k=j;
        while (k < s.size() && is_digit(s[k])) ++k;
        if (!parse_fraction_ms(s.substr(j, k-j), ms)) return std::nullopt;
        i = k;
      }
    }
    if (h > 24 || m > 59 || sec > 59) return std::nullopt;
    if (h == 24 && (m || sec || ms)) return std::nullopt;  // only 24:00 (end of day)

    if (i < s.size()) {
      if (!parse_offset(s.substr(i), off_min)) return std::nullopt;
      i = s.size();
    }
  }
  if (i != s.size()) return std::nullopt;

  std::tm tm{}; tm.tm_year = Y - 1900; tm.tm_mon = M - 1; tm.tm_mday = D;
  tm.tm_hour = h; tm.tm_min = m; tm.tm_sec = sec;

#if defined(_WIN32)
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif
  if (t == (std::time_t)-1) return std::nullopt;

  using namespace std::chrono;
  auto ms_epoch = duration_cast<milliseconds>(system_clock::from_time_t(t).time_since_epoch()).count();
  return static_cast<std::int64_t>(ms_epoch + ms) - static_cast<std::int64_t>(off_min) * 60 * 1000;
}

}
