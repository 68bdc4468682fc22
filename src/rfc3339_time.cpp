// Copyright 2024 Andrew Karasyov
//
// Copyright 2018 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "resumableupload/internal/rfc3339_time.h"
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace rup {
namespace internal {
namespace {

using std::chrono::duration_cast;

Status ReportError(std::string const& timestamp, char const* msg)
{
    return Status(StatusCode::InvalidArgument,
                  std::string("Error parsing RFC 3339 timestamp: ") + msg +
                      " Valid format is YYYY-MM-DD[Tt]HH:MM:SS[.s+](Z|[+-]HH:MM), got=" + timestamp);
}

bool IsLeapYear(int year) { return (year % 4 == 0 && (year % 100 != 0 || year % 400 == 0)); }

int DaysInMonth(int year, int month)
{
    static std::array<int, 12> constexpr Days{{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31}};
    if (month == 2 && IsLeapYear(year))
        return 29;
    return Days[month - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian civil date.
std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2;
    std::int64_t const era = (y >= 0 ? y : y - 399) / 400;
    auto const yoe = static_cast<unsigned>(y - era * 400);
    unsigned const doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    unsigned const doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

StatusOrVal<std::chrono::seconds> ParseDateTime(char const*& buffer, std::string const& timestamp)
{
    int year, month, day, hours, minutes, seconds, pos;
    char separator;
    auto count = std::sscanf(buffer, "%4d-%2d-%2d%c%2d:%2d:%2d%n", &year, &month, &day, &separator, &hours, &minutes,
                             &seconds, &pos);
    // All fields up to this point have a fixed width.
    if (count != 7 || pos != 19)
        return ReportError(timestamp, "Invalid format detected while parsing the base date and time portion.");
    if (separator != 'T' && separator != 't')
        return ReportError(timestamp, "Invalid date-time separator, expected 'T' or 't'.");
    if (month < 1 || month > 12)
        return ReportError(timestamp, "Out of range month.");
    if (day < 1 || day > DaysInMonth(year, month))
        return ReportError(timestamp, "Out of range day for given month.");
    if (hours < 0 || hours >= 24)
        return ReportError(timestamp, "Out of range hour.");
    if (minutes < 0 || minutes >= 60)
        return ReportError(timestamp, "Out of range minute.");
    // 60 is valid for leap seconds.
    if (seconds < 0 || seconds > 60)
        return ReportError(timestamp, "Out of range second.");
    buffer += pos;

    auto const days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return std::chrono::seconds(days * 86400 + hours * 3600 + minutes * 60 + seconds);
}

StatusOrVal<std::chrono::nanoseconds> ParseFractionalSeconds(char const*& buffer, std::string const& timestamp)
{
    if (buffer[0] != '.')
        return std::chrono::nanoseconds(0);
    ++buffer;

    long fractional = 0;
    int pos = 0;
    if (std::sscanf(buffer, "%9ld%n", &fractional, &pos) != 1)
        return ReportError(timestamp, "Invalid fractional seconds component.");
    for (int digits = pos; digits < 9; ++digits)
        fractional *= 10;
    buffer += pos;
    // Sub-nanosecond digits are ignored.
    while (std::isdigit(static_cast<unsigned char>(buffer[0])) != 0)
        ++buffer;
    return std::chrono::nanoseconds(fractional);
}

StatusOrVal<std::chrono::seconds> ParseOffset(char const*& buffer, std::string const& timestamp)
{
    if (buffer[0] == 'Z' || buffer[0] == 'z')
    {
        ++buffer;
        return std::chrono::seconds(0);
    }
    if (buffer[0] != '+' && buffer[0] != '-')
        return ReportError(timestamp, "Invalid timezone offset, expected 'Z' or 'z'.");

    bool const positive = buffer[0] == '+';
    ++buffer;
    int hours, minutes, pos;
    auto count = std::sscanf(buffer, "%2d:%2d%n", &hours, &minutes, &pos);
    if (count != 2 || pos != 5)
        return ReportError(timestamp, "Invalid timezone offset, expected [+-]HH:MM.");
    if (hours < 0 || hours >= 24)
        return ReportError(timestamp, "Out of range offset hour.");
    if (minutes < 0 || minutes >= 60)
        return ReportError(timestamp, "Out of range offset minute.");
    buffer += pos;
    auto offset = duration_cast<std::chrono::seconds>(std::chrono::hours(hours) + std::chrono::minutes(minutes));
    return positive ? offset : -offset;
}

std::string FormatFractional(std::chrono::nanoseconds ns)
{
    if (ns.count() == 0)
        return "";

    std::array<char, 16> buffer{};
    auto const count = static_cast<long long>(ns.count());
    if (count % 1000000 == 0)
        std::snprintf(buffer.data(), buffer.size(), ".%03lld", count / 1000000);
    else if (count % 1000 == 0)
        std::snprintf(buffer.data(), buffer.size(), ".%06lld", count / 1000);
    else
        std::snprintf(buffer.data(), buffer.size(), ".%09lld", count);
    return buffer.data();
}

}  // namespace

StatusOrVal<std::chrono::system_clock::time_point> ParseRfc3339(std::string const& timestamp)
{
    char const* buffer = timestamp.c_str();
    auto sinceEpoch = ParseDateTime(buffer, timestamp);
    if (!sinceEpoch)
        return std::move(sinceEpoch).GetStatus();
    auto fractional = ParseFractionalSeconds(buffer, timestamp);
    if (!fractional)
        return std::move(fractional).GetStatus();
    auto offset = ParseOffset(buffer, timestamp);
    if (!offset)
        return std::move(offset).GetStatus();
    if (buffer[0] != '\0')
        return ReportError(timestamp, "Additional text after RFC 3339 date.");

    std::chrono::system_clock::time_point tp{};
    tp += duration_cast<std::chrono::system_clock::duration>(*sinceEpoch - *offset);
    tp += duration_cast<std::chrono::system_clock::duration>(*fractional);
    return tp;
}

std::string FormatRfc3339(std::chrono::system_clock::time_point tp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if _WIN32
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif  // _WIN32
    std::array<char, 64> buffer{};
    std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%S", &tm);

    auto const sinceEpoch = tp.time_since_epoch();
    auto const fractional =
        duration_cast<std::chrono::nanoseconds>(sinceEpoch - duration_cast<std::chrono::seconds>(sinceEpoch));
    std::string result(buffer.data());
    result += FormatFractional(fractional);
    result += "Z";
    return result;
}

}  // namespace internal
}  // namespace rup
