#include "core/types.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace chatstore {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::Corrupt:
      return "corrupt";
    case ErrorCode::IOFailure:
      return "io_failure";
  }
  return "unknown";
}

std::string format_timestamp(const Timestamp &ts) {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
  int64_t seconds = micros / 1000000;
  int64_t fraction = micros % 1000000;
  if (fraction < 0) {
    fraction += 1000000;
    seconds -= 1;
  }

  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                tm.tm_sec, static_cast<long long>(fraction));
  return buf;
}

Timestamp parse_timestamp(const json &j) {
  if (j.is_number_integer()) {
    return Timestamp(std::chrono::seconds(j.get<int64_t>()));
  }
  if (!j.is_string()) {
    return Timestamp{};
  }

  const auto str = j.get<std::string>();
  std::tm tm{};
  int consumed = 0;
  if (std::sscanf(str.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec,
                  &consumed) != 6) {
    return Timestamp{};
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;

  int64_t micros = 0;
  size_t pos = static_cast<size_t>(consumed);
  if (pos < str.size() && str[pos] == '.') {
    int digits = 0;
    ++pos;
    while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos])) && digits < 6) {
      micros = micros * 10 + (str[pos] - '0');
      ++digits;
      ++pos;
    }
    while (digits++ < 6) {
      micros *= 10;
    }
  }

  auto seconds = static_cast<int64_t>(timegm(&tm));
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds(seconds * 1000000 + micros)));
}

std::string to_lower_ascii(const std::string &input) {
  std::string output = input;
  for (auto &c : output) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return output;
}

}  // namespace chatstore
