#include "utils.h"

#include <cctype>
#include <cstdio>

namespace {
// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}
}

std::optional<std::int64_t> parseTimestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3)
        return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > 31)
        return std::nullopt;

    std::size_t pos = static_cast<std::size_t>(consumed);
    int hour = 0, minute = 0, second = 0;
    std::int64_t offset = 0;

    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != ' ')
            return std::nullopt;
        ++pos;

        consumed = 0;
        if (std::sscanf(text.c_str() + pos, "%2d:%2d:%2d%n", &hour, &minute, &second, &consumed) != 3)
            return std::nullopt;
        pos += static_cast<std::size_t>(consumed);
        if (hour > 23 || minute > 59 || second > 60)
            return std::nullopt;

        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
                ++pos;
        }

        if (pos < text.size()) {
            const char sign = text[pos];
            if (sign == 'Z') {
                ++pos;
            }
            else if (sign == '+' || sign == '-') {
                ++pos;
                int offHour = 0, offMinute = 0;
                consumed = 0;
                if (std::sscanf(text.c_str() + pos, "%2d:%2d%n", &offHour, &offMinute, &consumed) != 2) {
                    consumed = 0;
                    if (std::sscanf(text.c_str() + pos, "%2d%2d%n", &offHour, &offMinute, &consumed) != 2)
                        return std::nullopt;
                }
                pos += static_cast<std::size_t>(consumed);
                offset = (offHour * 3600 + offMinute * 60) * (sign == '+' ? 1 : -1);
            }
            else {
                return std::nullopt;
            }
        }

        if (pos != text.size())
            return std::nullopt;
    }

    const std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return days * 86400 + hour * 3600 + minute * 60 + second - offset;
}

std::optional<int> yearOf(const std::string& text) {
    if (!parseTimestamp(text).has_value())
        return std::nullopt;

    int year = 0;
    if (std::sscanf(text.c_str(), "%4d", &year) != 1)
        return std::nullopt;
    return year;
}

const char* toString(EntityState state) {
    switch (state) {
    case EntityState::PendingCheck:    return "pending-check";
    case EntityState::ExportRequested: return "export-requested";
    case EntityState::ExportReady:     return "export-ready";
    case EntityState::ArtifactPresent: return "artifact-present";
    case EntityState::TerminalFailure: return "terminal-failure";
    }
    return "unknown";
}

const char* toString(TransferErrorKind kind) {
    switch (kind) {
    case TransferErrorKind::None:                 return "none";
    case TransferErrorKind::Transport:            return "transport error";
    case TransferErrorKind::UnexpectedStatus:     return "unexpected status";
    case TransferErrorKind::Write:                return "write error";
    case TransferErrorKind::RetryBudgetExhausted: return "retry budget exhausted";
    }
    return "unknown";
}
