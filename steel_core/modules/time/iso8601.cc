// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/time/iso8601.h"

#include <cstdio>

namespace steel::time {
namespace {

// Parses exactly `count` ASCII digits starting at `pos`.
bool ParseDigits(std::string_view text, size_t pos, size_t count, int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    char c = text[i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

bool Expect(std::string_view text, size_t pos, char c) {
  return pos < text.size() && text[pos] == c;
}

}  // namespace

Iso8601String FormatIso8601(std::time_t utc) {
  std::tm t{};
  gmtime_r(&utc, &t);

  char buffer[kIso8601Size + 1];
  std::snprintf(buffer,
                sizeof(buffer),
                "%04d-%02d-%02dT%02d:%02d:%02dZ",
                t.tm_year + 1900,
                t.tm_mon + 1,
                t.tm_mday,
                t.tm_hour,
                t.tm_min,
                t.tm_sec);
  return Iso8601String(buffer);
}

pw::Result<std::time_t> ParseIso8601(std::string_view text) {
  int year, month, day, hour, minute, second;
  if (!ParseDigits(text, 0, 4, year) || !Expect(text, 4, '-') ||
      !ParseDigits(text, 5, 2, month) || !Expect(text, 7, '-') ||
      !ParseDigits(text, 8, 2, day) || !Expect(text, 10, 'T') ||
      !ParseDigits(text, 11, 2, hour) || !Expect(text, 13, ':') ||
      !ParseDigits(text, 14, 2, minute) || !Expect(text, 16, ':') ||
      !ParseDigits(text, 17, 2, second)) {
    return pw::Status::InvalidArgument();
  }

  size_t pos = 19;
  if (Expect(text, pos, '.')) {
    ++pos;
    size_t fraction_start = pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      ++pos;
    }
    if (pos == fraction_start) {
      return pw::Status::InvalidArgument();
    }
  }
  if (!Expect(text, pos, 'Z') || pos + 1 != text.size()) {
    return pw::Status::InvalidArgument();
  }

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 59) {
    return pw::Status::InvalidArgument();
  }

  std::tm t{};
  t.tm_year = year - 1900;
  t.tm_mon = month - 1;
  t.tm_mday = day;
  t.tm_hour = hour;
  t.tm_min = minute;
  t.tm_sec = second;
  std::time_t utc = timegm(&t);

  // timegm normalizes out-of-range days (Feb 30 -> Mar 2); reject those.
  std::tm check{};
  gmtime_r(&utc, &check);
  if (check.tm_mday != day || check.tm_mon != month - 1) {
    return pw::Status::InvalidArgument();
  }
  return utc;
}

}  // namespace steel::time
