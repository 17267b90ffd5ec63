/**
 * @file PnlJournal.cpp
 * @brief Implementation of the PnlJournal class
 */

#include "../storage/PnlJournal.hpp"
#include "../storage/CorruptFile.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace OptionsScalper {

using json = nlohmann::json;

PnlJournal::PnlJournal(const std::string& dataDir, const std::string& mode, std::shared_ptr<Logger> logger)
    : m_path((std::filesystem::path(dataDir) / ("pnl_history_" + mode + ".json")).string()),
      m_logger(logger) {

    m_logger->info("P&L history for '{}' mode at {}", mode, m_path);
    load();
}

bool PnlJournal::logPnl(const Date& date, double pnl) {
    std::string key = date.toString();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_daily[key] += pnl;

    if (!save()) {
        return false;
    }
    m_logger->info("Logged P&L of {:.2f} for {}, day total {:.2f}", pnl, key, m_daily[key]);
    return true;
}

double PnlJournal::getPnlForDate(const Date& date) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_daily.find(date.toString());
    return it != m_daily.end() ? it->second : 0.0;
}

std::map<std::string, double> PnlJournal::getAllPnl() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_daily;
}

bool PnlJournal::load() {
    json document;
    bool readable = true;
    {
        std::ifstream file(m_path);
        if (!file.is_open()) {
            return false;
        }
        try {
            file >> document;
        } catch (const std::exception& e) {
            m_logger->error("Failed to read P&L history {}: {}", m_path, e.what());
            readable = false;
        }
    }

    if (readable && !document.is_object()) {
        m_logger->error("P&L history {} is not an object", m_path);
        readable = false;
    }
    if (!readable) {
        m_daily.clear();
        m_writable = moveAsideCorruptFile(m_path, *m_logger);
        return false;
    }

    for (auto it = document.begin(); it != document.end(); ++it) {
        if (it.value().is_number()) {
            m_daily[it.key()] = it.value().get<double>();
        }
    }
    return true;
}

bool PnlJournal::save() const {
    if (!m_writable) {
        m_logger->error("P&L history {} could not be moved aside, not overwriting it", m_path);
        return false;
    }
    try {
        std::filesystem::path path(m_path);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        json document = json::object();
        for (const auto& entry : m_daily) {
            document[entry.first] = entry.second;
        }

        std::ofstream file(m_path, std::ios::trunc);
        if (!file.is_open()) {
            m_logger->error("Failed to open P&L history for writing: {}", m_path);
            return false;
        }
        file << document.dump(4);
        return true;
    } catch (const std::exception& e) {
        m_logger->error("Failed to write P&L history {}: {}", m_path, e.what());
        return false;
    }
}

}  // namespace OptionsScalper
