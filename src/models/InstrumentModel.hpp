/**
 * @file InstrumentModel.hpp
 * @brief Option contracts and the token-keyed instrument registry
 */

#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "../utils/Clock.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @enum OptionType
 * @brief Types of options
 */
enum class OptionType {
    NONE,
    CALL,
    PUT
};

/**
 * @struct Contract
 * @brief Immutable description of one tradable instrument
 */
struct Contract {
    std::string underlying;              ///< Underlying name, e.g. NIFTY
    double strike = 0.0;                 ///< Strike price, 0 for futures
    OptionType optionType = OptionType::NONE;
    Date expiry;                         ///< Expiry date
    std::string tradingSymbol;           ///< Broker trading symbol
    uint32_t instrumentToken = 0;        ///< Ticker token, 0 for a placeholder
    int lotSize = 1;                     ///< Contract lot size
    double tickSize = 0.05;              ///< Minimum price increment
    std::string exchange = "NFO";        ///< Exchange segment

    /**
     * @brief Convert option type to string
     * @param type Option type
     * @return "CE", "PE" or "" for NONE
     */
    static std::string optionTypeToString(OptionType type);

    /**
     * @brief Convert string to option type
     * @param typeStr "CE"/"CALL" or "PE"/"PUT"
     * @return Option type, NONE for anything else
     */
    static OptionType stringToOptionType(const std::string& typeStr);
};

/**
 * @struct SymbolInfo
 * @brief Per-underlying metadata derived from the loaded contracts
 */
struct SymbolInfo {
    std::string underlying;
    int lotSize = 1;
    double tickSize = 0.05;
    std::vector<Date> expiries;          ///< Sorted, unique
    std::vector<double> strikes;         ///< Sorted, unique
    std::vector<uint32_t> tokens;        ///< Tokens of the underlying's contracts
};

/**
 * @class InstrumentRegistry
 * @brief Arena of contracts keyed by instrument token
 *
 * Positions refer to contracts by token and resolve them here. The registry
 * is filled once at start-up and only read afterwards.
 */
class InstrumentRegistry {
public:
    explicit InstrumentRegistry(std::shared_ptr<Logger> logger);

    /**
     * @brief Load metadata of the form
     *        {UNDERLYING: {lot_size, tick_size, instruments: [...]}}
     * @param metadata Parsed metadata document
     * @return Number of contracts added
     */
    std::size_t load(const nlohmann::json& metadata);

    /**
     * @brief Load metadata from a JSON snapshot file
     * @param path File path
     * @return True if the file was read and parsed
     */
    bool loadFromFile(const std::string& path);

    /**
     * @brief Add or replace one contract
     */
    void add(const Contract& contract);

    const Contract* findByToken(uint32_t token) const;
    const Contract* findBySymbol(const std::string& tradingSymbol) const;
    const SymbolInfo* getSymbolInfo(const std::string& underlying) const;

    std::vector<std::string> getUnderlyings() const;
    std::size_t size() const { return m_contracts.size(); }

private:
    std::shared_ptr<Logger> m_logger;
    std::unordered_map<uint32_t, Contract> m_contracts;       ///< Arena keyed by token
    std::unordered_map<std::string, uint32_t> m_symbolIndex;  ///< Trading symbol to token
    std::map<std::string, SymbolInfo> m_symbols;              ///< Underlying to metadata
};

}  // namespace OptionsScalper
