/**
 * @file ExpiryParser.cpp
 * @brief Implementation of the ExpiryParser class
 */

#include "../market/ExpiryParser.hpp"
#include <regex>

namespace OptionsScalper {

namespace {

const std::regex& monthlyPattern() {
    static const std::regex pattern(
        "^[A-Z&\\-]+(\\d{2})(JAN|FEB|MAR|APR|MAY|JUN|JUL|AUG|SEP|OCT|NOV|DEC)");
    return pattern;
}

const std::regex& weeklyPattern() {
    static const std::regex pattern("^[A-Z&\\-]+(\\d{2})([1-9OND])(\\d{2})");
    return pattern;
}

}  // namespace

std::optional<Date> ExpiryParser::parse(const std::string& tradingSymbol) {
    std::smatch match;

    if (std::regex_search(tradingSymbol, match, monthlyPattern())) {
        Date date;
        date.year = 2000 + std::stoi(match[1].str());
        date.month = monthFromAbbreviation(match[2].str());
        date.day = Date::daysInMonth(date.year, date.month);
        if (date.isValid()) {
            return date;
        }
        return std::nullopt;
    }

    if (std::regex_search(tradingSymbol, match, weeklyPattern())) {
        Date date;
        date.year = 2000 + std::stoi(match[1].str());
        date.month = monthFromWeeklyCode(match[2].str()[0]);
        date.day = std::stoi(match[3].str());
        if (date.isValid()) {
            return date;
        }
    }

    return std::nullopt;
}

int ExpiryParser::monthFromAbbreviation(const std::string& abbreviation) {
    static const char* const months[] = {
        "JAN", "FEB", "MAR", "APR", "MAY", "JUN",
        "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"
    };
    for (int i = 0; i < 12; ++i) {
        if (abbreviation == months[i]) {
            return i + 1;
        }
    }
    return 0;
}

int ExpiryParser::monthFromWeeklyCode(char code) {
    if (code >= '1' && code <= '9') {
        return code - '0';
    }
    switch (code) {
        case 'O': return 10;
        case 'N': return 11;
        case 'D': return 12;
        default:  return 0;
    }
}

}  // namespace OptionsScalper
