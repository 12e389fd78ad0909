#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tasksync {

// Proleptic Gregorian calendar date. Always holds a valid day once built
// through from_ymd or one of the parsers.
struct Date {
    int year  = 1970;
    int month = 1;
    int day   = 1;

    static std::optional<Date> from_ymd(int year, int month, int day);

    // Strict "YYYY-MM-DD", the form used by the structured store.
    static std::optional<Date> parse_iso(std::string_view text);

    static Date today();

    std::string to_string() const;
};

bool operator==(const Date& a, const Date& b);
bool operator!=(const Date& a, const Date& b);

int days_in_month(int year, int month);

}
