/**
 * @file InstrumentModel.cpp
 * @brief Implementation of the Contract helpers and InstrumentRegistry
 */

#include "../models/InstrumentModel.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>

namespace OptionsScalper {

namespace {

Date parseIsoDate(const std::string& text) {
    Date date;
    if (std::sscanf(text.c_str(), "%d-%d-%d", &date.year, &date.month, &date.day) != 3) {
        return Date{};
    }
    return date;
}

template <typename T>
void insertSorted(std::vector<T>& values, const T& value) {
    auto it = std::lower_bound(values.begin(), values.end(), value);
    if (it == values.end() || value < *it || *it < value) {
        values.insert(it, value);
    }
}

}  // namespace

std::string Contract::optionTypeToString(OptionType type) {
    switch (type) {
        case OptionType::CALL: return "CE";
        case OptionType::PUT:  return "PE";
        default:               return "";
    }
}

OptionType Contract::stringToOptionType(const std::string& typeStr) {
    if (typeStr == "CE" || typeStr == "CALL") return OptionType::CALL;
    if (typeStr == "PE" || typeStr == "PUT")  return OptionType::PUT;
    return OptionType::NONE;
}

InstrumentRegistry::InstrumentRegistry(std::shared_ptr<Logger> logger)
    : m_logger(logger) {
}

std::size_t InstrumentRegistry::load(const nlohmann::json& metadata) {
    std::size_t added = 0;
    if (!metadata.is_object()) {
        m_logger->error("Instrument metadata must be an object keyed by underlying");
        return 0;
    }

    for (auto it = metadata.begin(); it != metadata.end(); ++it) {
        const std::string& underlying = it.key();
        const auto& data = it.value();

        int lotSize = data.value("lot_size", 1);
        double tickSize = data.value("tick_size", 0.05);

        if (!data.contains("instruments") || !data["instruments"].is_array()) {
            m_logger->warn("No instruments listed for {}", underlying);
            continue;
        }

        for (const auto& inst : data["instruments"]) {
            try {
                Contract contract;
                contract.underlying = underlying;
                contract.instrumentToken = inst.at("instrument_token").get<uint32_t>();
                contract.tradingSymbol = inst.at("tradingsymbol").get<std::string>();
                contract.strike = inst.value("strike", 0.0);
                contract.optionType = Contract::stringToOptionType(inst.value("instrument_type", std::string()));
                contract.expiry = parseIsoDate(inst.value("expiry", std::string()));
                contract.lotSize = inst.value("lot_size", lotSize);
                contract.tickSize = inst.value("tick_size", tickSize);
                contract.exchange = inst.value("exchange", std::string("NFO"));

                add(contract);
                ++added;
            } catch (const std::exception& e) {
                m_logger->warn("Skipping malformed instrument under {}: {}", underlying, e.what());
            }
        }

        auto symIt = m_symbols.find(underlying);
        if (symIt != m_symbols.end()) {
            symIt->second.lotSize = lotSize;
            symIt->second.tickSize = tickSize;
        }
    }

    m_logger->info("Loaded {} contracts across {} underlyings", added, m_symbols.size());
    return added;
}

bool InstrumentRegistry::loadFromFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            m_logger->error("Failed to open instrument snapshot: {}", path);
            return false;
        }

        nlohmann::json metadata;
        file >> metadata;
        load(metadata);
        return true;
    } catch (const std::exception& e) {
        m_logger->error("Exception while loading instrument snapshot {}: {}", path, e.what());
        return false;
    }
}

void InstrumentRegistry::add(const Contract& contract) {
    m_contracts[contract.instrumentToken] = contract;
    m_symbolIndex[contract.tradingSymbol] = contract.instrumentToken;

    SymbolInfo& info = m_symbols[contract.underlying];
    if (info.underlying.empty()) {
        info.underlying = contract.underlying;
        info.lotSize = contract.lotSize;
        info.tickSize = contract.tickSize;
    }
    if (contract.expiry.isValid()) {
        insertSorted(info.expiries, contract.expiry);
    }
    if (contract.optionType != OptionType::NONE) {
        insertSorted(info.strikes, contract.strike);
    }
    insertSorted(info.tokens, contract.instrumentToken);
}

const Contract* InstrumentRegistry::findByToken(uint32_t token) const {
    auto it = m_contracts.find(token);
    return it == m_contracts.end() ? nullptr : &it->second;
}

const Contract* InstrumentRegistry::findBySymbol(const std::string& tradingSymbol) const {
    auto it = m_symbolIndex.find(tradingSymbol);
    if (it == m_symbolIndex.end()) {
        return nullptr;
    }
    return findByToken(it->second);
}

const SymbolInfo* InstrumentRegistry::getSymbolInfo(const std::string& underlying) const {
    auto it = m_symbols.find(underlying);
    return it == m_symbols.end() ? nullptr : &it->second;
}

std::vector<std::string> InstrumentRegistry::getUnderlyings() const {
    std::vector<std::string> result;
    result.reserve(m_symbols.size());
    for (const auto& entry : m_symbols) {
        result.push_back(entry.first);
    }
    return result;
}

}  // namespace OptionsScalper
