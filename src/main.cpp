/**
 * @file main.cpp
 * @brief Main entry point for the options scalper trading terminal
 */

#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <atomic>

#include "utils/Clock.hpp"
#include "utils/Logger.hpp"
#include "utils/HttpClient.hpp"
#include "config/ConfigManager.hpp"
#include "auth/AuthManager.hpp"
#include "models/InstrumentModel.hpp"
#include "market/KiteTicker.hpp"
#include "trading/ExecutionClient.hpp"
#include "trading/KiteClient.hpp"
#include "trading/PaperTrader.hpp"
#include "app/TradingSession.hpp"

using namespace OptionsScalper;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

// Signal handler for graceful shutdown
void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);  // Ctrl+C
    std::signal(SIGTERM, signalHandler); // Termination request

    try {
        std::string configPath = "config.json";
        if (argc > 1) {
            configPath = argv[1];
        }

        // Console-only logger until the configuration names the real sink
        auto bootstrapLogger = std::make_shared<Logger>("", true, LogLevel::INFO);
        auto configManager = std::make_shared<ConfigManager>(configPath, bootstrapLogger);
        if (!configManager->loadConfig()) {
            bootstrapLogger->fatal("Failed to load configuration from {}", configPath);
            return 1;
        }
        TerminalSettings settings = configManager->getSettings();

        auto logger = std::make_shared<Logger>(settings.logFile, settings.logToConsole,
                                               LogSink::levelFromString(settings.logLevel));
        logger->info("Starting options scalper in {} mode", settings.paperTrading ? "paper" : "live");

        auto clock = std::make_shared<SystemClock>();

        auto instruments = std::make_shared<InstrumentRegistry>(logger->forComponent("Instruments"));
        if (!settings.instrumentSnapshot.empty() && !instruments->loadFromFile(settings.instrumentSnapshot)) {
            logger->warn("Instrument snapshot {} could not be loaded, positions will not get live prices",
                         settings.instrumentSnapshot);
        }

        auto httpClient = std::make_shared<HttpClient>(logger->forComponent("HttpClient"));
        auto authManager = std::make_shared<AuthManager>(settings, httpClient, clock,
                                                         logger->forComponent("AuthManager"));

        if (!authManager->isAccessTokenValid()) {
            if (settings.apiKey.empty()) {
                if (!settings.paperTrading) {
                    logger->fatal("Live trading needs api/key and api/secret in {}", configPath);
                    return 1;
                }
                logger->warn("No API key configured, paper trading without market data");
            } else {
                logger->info("Access token is not valid. Please authenticate.");
                std::cout << "Please open the following URL in your browser and complete the login process:" << std::endl;
                std::cout << authManager->generateLoginUrl() << std::endl;

                std::string requestToken;
                std::cout << "Enter the request token: ";
                std::cin >> requestToken;

                if (!authManager->generateAccessToken(requestToken)) {
                    logger->fatal("Failed to generate access token");
                    return 1;
                }
                logger->info("Authentication successful");
            }
        } else {
            logger->info("Using access token from configuration");
        }

        std::shared_ptr<ExecutionClient> client;
        if (settings.paperTrading) {
            client = std::make_shared<PaperTrader>(settings, instruments, clock, logger->forComponent("PaperTrader"));
        } else {
            client = std::make_shared<KiteClient>(settings, authManager, httpClient, logger->forComponent("KiteClient"));
        }

        auto ticker = std::make_shared<KiteTicker>(settings, authManager, logger->forComponent("KiteTicker"));

        TradingSession session(settings, client, ticker, instruments, clock, logger->forComponent("Session"));
        session.run(g_running);

        logger->info("Options scalper shut down");
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
