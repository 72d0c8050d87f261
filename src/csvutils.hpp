#pragma once

#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace execmetrics::csv {

// Minimal delimited-text helpers: no quoting, no escaped separators

inline std::string trim(const std::string& text)
{
    auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

inline std::string toUpper(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

inline std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

inline std::vector<std::string> splitLine(const std::string& line, char delimiter = ',')
{
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        auto end = line.find(delimiter, start);
        if (end == std::string::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, end - start)));
        start = end + 1;
    }
    return fields;
}

// Column name (lower-cased) -> position
class Header {
public:
    explicit Header(const std::string& line)
    {
        auto names = splitLine(line);
        for (size_t i = 0; i < names.size(); ++i) {
            m_columns.emplace(toLower(names[i]), i);
        }
    }

    [[nodiscard]] std::optional<size_t> find(const std::string& name) const
    {
        auto iterator = m_columns.find(name);
        if (iterator == m_columns.end()) {
            return std::nullopt;
        }
        return iterator->second;
    }

    // Throws std::runtime_error naming the file when the column is missing
    [[nodiscard]] size_t require(const std::string& name, const std::string& source) const
    {
        auto position = find(name);
        if (!position) {
            throw std::runtime_error("Missing column '" + name + "' in " + source);
        }
        return *position;
    }

private:
    std::unordered_map<std::string, size_t> m_columns;
};

// Field at position, empty when the row is short
inline const std::string& field(const std::vector<std::string>& fields, std::optional<size_t> position)
{
    static const std::string empty;
    if (!position || *position >= fields.size()) {
        return empty;
    }
    return fields[*position];
}

// Empty -> nullopt; throws std::invalid_argument when not a number
inline std::optional<double> parseOptionalDouble(const std::string& text)
{
    if (text.empty()) {
        return std::nullopt;
    }
    size_t consumed = 0;
    double value = std::stod(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("not a number: '" + text + "'");
    }
    return value;
}

inline double parseDouble(const std::string& text, const char* name)
{
    auto value = parseOptionalDouble(text);
    if (!value) {
        throw std::invalid_argument(std::string("missing ") + name);
    }
    return *value;
}

// Days since 1970-01-01 for a proleptic Gregorian date
inline int64_t daysFromCivil(int64_t year, unsigned month, unsigned day)
{
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yearOfEra = static_cast<unsigned>(year - era * 400);
    const unsigned dayOfYear = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned dayOfEra = yearOfEra * 365 + yearOfEra / 4 - yearOfEra / 100 + dayOfYear;
    return era * 146097 + static_cast<int64_t>(dayOfEra) - 719468;
}

inline bool isLeapYear(int64_t year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

inline unsigned daysInMonth(int64_t year, unsigned month)
{
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return month == 2 && isLeapYear(year) ? 29 : kDays[month - 1];
}

inline void civilFromDays(int64_t days, int64_t& year, unsigned& month, unsigned& day)
{
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned dayOfEra = static_cast<unsigned>(days - era * 146097);
    const unsigned yearOfEra = (dayOfEra - dayOfEra / 1460 + dayOfEra / 36524 - dayOfEra / 146096) / 365;
    const unsigned dayOfYear = dayOfEra - (365 * yearOfEra + yearOfEra / 4 - yearOfEra / 100);
    const unsigned mp = (5 * dayOfYear + 2) / 153;
    day = dayOfYear - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int64_t>(yearOfEra) + era * 400 + (month <= 2 ? 1 : 0);
}

namespace detail {

inline int64_t parseDigits(const std::string& text, size_t pos, size_t count)
{
    if (pos + count > text.size()) {
        throw std::invalid_argument("truncated timestamp: '" + text + "'");
    }
    if (count > 18) {
        throw std::invalid_argument("timestamp out of range: '" + text + "'");
    }
    int64_t value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("invalid timestamp: '" + text + "'");
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

// ".123" -> 123000000 ns
inline int64_t parseFraction(const std::string& digits, const std::string& text)
{
    if (digits.empty() || digits.size() > 9) {
        throw std::invalid_argument("invalid fractional seconds: '" + text + "'");
    }
    std::string padded = digits + std::string(9 - digits.size(), '0');
    return parseDigits(padded, 0, 9);
}

// Throws when the instant does not fit in int64 nanoseconds (1677-09-21 to 2262-04-11)
inline Timestamp toNanos(int64_t seconds, int64_t nanos, const std::string& text)
{
    constexpr int64_t kMaxSeconds = std::numeric_limits<Timestamp>::max() / kNanosPerSecond;
    constexpr int64_t kMinSeconds = std::numeric_limits<Timestamp>::min() / kNanosPerSecond;
    if (seconds > kMaxSeconds - 1 || seconds < kMinSeconds) {
        throw std::invalid_argument("timestamp out of range: '" + text + "'");
    }
    return seconds * kNanosPerSecond + nanos;
}

} // namespace detail

// "2023-01-01 12:00:00.123456", "2023-01-01T12:00:00Z", "2023-01-01", or epoch seconds "1672574400.5"
inline Timestamp parseTimestamp(const std::string& raw)
{
    std::string text = trim(raw);
    if (text.empty()) {
        throw std::invalid_argument("missing timestamp");
    }

    if (text.size() >= 10 && text[4] == '-' && text[7] == '-') {
        int64_t year = detail::parseDigits(text, 0, 4);
        auto month = static_cast<unsigned>(detail::parseDigits(text, 5, 2));
        auto day = static_cast<unsigned>(detail::parseDigits(text, 8, 2));
        if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
            throw std::invalid_argument("invalid date: '" + text + "'");
        }

        int64_t seconds = 0;
        int64_t nanos = 0;
        if (text.size() > 10) {
            if (text[10] != 'T' && text[10] != ' ') {
                throw std::invalid_argument("invalid timestamp: '" + text + "'");
            }
            if (text.size() < 19 || text[13] != ':' || text[16] != ':') {
                throw std::invalid_argument("invalid time of day: '" + text + "'");
            }
            int64_t hour = detail::parseDigits(text, 11, 2);
            int64_t minute = detail::parseDigits(text, 14, 2);
            int64_t second = detail::parseDigits(text, 17, 2);
            if (hour > 23 || minute > 59 || second > 60) {
                throw std::invalid_argument("invalid time of day: '" + text + "'");
            }
            seconds = hour * 3600 + minute * 60 + second;

            std::string rest = text.substr(19);
            if (!rest.empty() && (rest.back() == 'Z' || rest.back() == 'z')) {
                rest.pop_back();
            }
            if (!rest.empty()) {
                if (rest.front() != '.') {
                    throw std::invalid_argument("unsupported timestamp suffix: '" + text + "'");
                }
                nanos = detail::parseFraction(rest.substr(1), text);
            }
        }

        int64_t days = daysFromCivil(year, month, day);
        return detail::toNanos(days * 86400 + seconds, nanos, text);
    }

    // Epoch seconds, optionally fractional
    auto dot = text.find('.');
    std::string whole = text.substr(0, dot);
    if (whole.empty()) {
        throw std::invalid_argument("invalid timestamp: '" + text + "'");
    }
    int64_t seconds = detail::parseDigits(whole, 0, whole.size());
    int64_t nanos = dot == std::string::npos ? 0 : detail::parseFraction(text.substr(dot + 1), text);
    return detail::toNanos(seconds, nanos, text);
}

// "YYYY-MM-DD HH:MM:SS.nnnnnnnnn" (UTC)
inline std::string formatTimestamp(Timestamp timestamp)
{
    int64_t seconds = timestamp / kNanosPerSecond;
    int64_t nanos = timestamp % kNanosPerSecond;
    if (nanos < 0) {
        nanos += kNanosPerSecond;
        --seconds;
    }
    int64_t days = seconds / 86400;
    int64_t secondOfDay = seconds % 86400;
    if (secondOfDay < 0) {
        secondOfDay += 86400;
        --days;
    }

    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civilFromDays(days, year, month, day);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u %02lld:%02lld:%02lld.%09lld", static_cast<long long>(year),
                  month, day, static_cast<long long>(secondOfDay / 3600), static_cast<long long>(secondOfDay / 60 % 60),
                  static_cast<long long>(secondOfDay % 60), static_cast<long long>(nanos));
    return buffer;
}

// Whole days since epoch (UTC date of the timestamp)
inline int64_t dayOf(Timestamp timestamp)
{
    int64_t seconds = timestamp / kNanosPerSecond;
    if (timestamp % kNanosPerSecond < 0) {
        --seconds;
    }
    int64_t days = seconds / 86400;
    if (seconds % 86400 < 0) {
        --days;
    }
    return days;
}

} // namespace execmetrics::csv
