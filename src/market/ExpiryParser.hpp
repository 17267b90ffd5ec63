/**
 * @file ExpiryParser.hpp
 * @brief Derives a contract's expiry date from its NFO trading symbol
 */

#pragma once

#include <optional>
#include <string>
#include "../utils/Clock.hpp"

namespace OptionsScalper {

/**
 * @class ExpiryParser
 * @brief Parses monthly and weekly Kite option symbols
 *
 * Monthly: <UNDERLYING><YY><MMM>... expires on the last calendar day of the
 * month (e.g. NIFTY24DEC24000CE). Weekly: <UNDERLYING><YY><M><DD>... where M is
 * 1-9 or O/N/D for Oct/Nov/Dec (e.g. NIFTY2410324000CE, NIFTY24O1724000CE).
 */
class ExpiryParser {
public:
    /**
     * @brief Parse the expiry encoded in a trading symbol
     * @param tradingSymbol Broker trading symbol
     * @return Expiry date, empty if the symbol matches neither form or the
     *         encoded date does not exist
     */
    static std::optional<Date> parse(const std::string& tradingSymbol);

    /**
     * @brief Map a three-letter month abbreviation to 1..12
     * @return Month number, 0 if unknown
     */
    static int monthFromAbbreviation(const std::string& abbreviation);

    /**
     * @brief Map a weekly month code (1-9, O, N, D) to 1..12
     * @return Month number, 0 if unknown
     */
    static int monthFromWeeklyCode(char code);
};

}  // namespace OptionsScalper
