/**
 * @license
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.

 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.

 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 * @author Volker Böhm
 * @copyright Copyright (c) 2025 Volker Böhm
 */

#include <string>
#include <vector>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "app-error.h"
#include "chess-rules.h"
#include "cli-settings-manager.h"
#include "engine-config.h"
#include "engine-errors.h"
#include "engine-service.h"
#include "logger.h"
#include "request-console.h"
#include "signal-watcher.h"
#include "string-helper.h"
#include "timer.h"

namespace {

    int getPositive(const std::string& name) {
        int value = CliSettings::Manager::get<int>(name);
        if (value <= 0) {
            throw AppError::makeInvalidParameters("--" + name + " must be positive, got " + std::to_string(value));
        }
        return value;
    }

    TraceLevel getTraceLevel(const std::string& name) {
        auto value = CliSettings::Manager::get<std::string>(name);
        auto level = parseTraceLevel(to_lowercase(value));
        if (!level) {
            throw AppError::makeInvalidParameters("--" + name + "=" + value
                + " is invalid: expected error, warning, command, handshake, info or none");
        }
        return *level;
    }

    void configureLogging() {
        Logger::serviceLogger().setOutputStream(std::cerr);
        Logger::engineLogger().setOutputStream(std::cerr);
        Logger::serviceLogger().setTraceLevel(getTraceLevel("tracelevel"));
        Logger::engineLogger().setTraceLevel(getTraceLevel("enginetrace"));

        std::filesystem::path logPath = CliSettings::Manager::get<std::string>("logpath");
        if (!logPath.empty()) {
            Logger::serviceLogger().setLogFile((logPath / "engine-broker").string());
            if (CliSettings::Manager::get<bool>("enginelog")) {
                Logger::engineLogger().setLogFile((logPath / "engine-traffic").string());
            }
        }
    }

    EngineManagerConfig buildManagerConfig() {
        EngineManagerConfig config;
        config.executablePath = CliSettings::Manager::get<std::string>("engine");
        if (config.executablePath.empty()) {
            if (const char* fromEnvironment = std::getenv("ENGINE_PATH")) {
                config.executablePath = fromEnvironment;
            }
        }
        if (config.executablePath.empty()) {
            throw AppError::makeInvalidParameters("No engine given, use --engine=<path> or set ENGINE_PATH");
        }
        auto dir = CliSettings::Manager::get<std::string>("dir");
        if (!dir.empty()) {
            config.workingDirectory = dir;
        }
        config.arguments = splitWords(CliSettings::Manager::get<std::string>("engineargs"));
        config.identifier = CliSettings::Manager::get<std::string>("id");
        config.startupTimeout = std::chrono::milliseconds(getPositive("startuptimeout"));
        config.quitGrace = std::chrono::milliseconds(getPositive("quitgrace"));
        config.stopGrace = std::chrono::milliseconds(getPositive("stopgrace"));
        return config;
    }

    EngineServiceConfig buildServiceConfig() {
        EngineServiceConfig config;
        config.analysisDepth = getPositive("depth");
        config.analysisTimeout = std::chrono::milliseconds(getPositive("analysistimeout"));
        int maxQueue = CliSettings::Manager::get<int>("maxqueue");
        if (maxQueue < 0) {
            throw AppError::makeInvalidParameters("--maxqueue must not be negative");
        }
        config.maxQueueDepth = static_cast<size_t>(maxQueue);
        return config;
    }

    void registerSettings() {
        using CliSettings::ValueType;
        CliSettings::Manager::registerSetting("engine", "Path to the UCI engine executable (default: $ENGINE_PATH)",
            false, std::string(""), ValueType::PathExists);
        CliSettings::Manager::registerSetting("dir", "Working directory of the engine", false, std::string(""),
            ValueType::PathExists);
        CliSettings::Manager::registerSetting("engineargs", "Blank separated arguments passed to the engine", false,
            std::string(""), ValueType::String);
        CliSettings::Manager::registerSetting("id", "Name of the engine in log output", false, std::string("engine"),
            ValueType::String);
        CliSettings::Manager::registerSetting("startuptimeout", "Milliseconds for the uci/isready handshake", false,
            15000, ValueType::Int);
        CliSettings::Manager::registerSetting("quitgrace", "Milliseconds the engine gets to exit after quit", false,
            2000, ValueType::Int);
        CliSettings::Manager::registerSetting("stopgrace", "Milliseconds a stopped search gets to send bestmove", false,
            2000, ValueType::Int);
        CliSettings::Manager::registerSetting("depth", "Default search depth of analyze", false, 5, ValueType::Int);
        CliSettings::Manager::registerSetting("analysistimeout", "Milliseconds until analyze gives up", false, 30000,
            ValueType::Int);
        CliSettings::Manager::registerSetting("maxqueue", "Reject requests when this many are waiting (0 = unlimited)",
            false, 0, ValueType::Int);
        CliSettings::Manager::registerSetting("tracelevel", "Console log level: error, warning, command, info, none",
            false, std::string("warning"), ValueType::String);
        CliSettings::Manager::registerSetting("enginetrace", "Console log level of the engine communication", false,
            std::string("none"), ValueType::String);
        CliSettings::Manager::registerSetting("logpath", "Directory for log files", false, std::string(""),
            ValueType::PathExists);
        CliSettings::Manager::registerSetting("enginelog", "Write the engine communication to a log file in logpath",
            false, false, ValueType::Bool);
    }
}

int main(int argc, char** argv) {
    // example: ./engine-broker --engine=/usr/games/stockfish --depth=12 --tracelevel=info
    Timer timer;
    timer.start();
    AppReturnCode returnCode = AppReturnCode::NoError;
    try {
        registerSettings();
        std::vector<std::string> args(argv, argv + argc);
        args = CliSettings::Manager::mergeWithSettingsFile(args);
        if (!CliSettings::Manager::parseCommandLine(args)) {
            return static_cast<int>(AppReturnCode::NoError);
        }
        configureLogging();

        ChessRules rules;
        EngineService service(buildManagerConfig(), buildServiceConfig(), rules);
        // before initialize, no other thread may exist when the signals are blocked
        SignalWatcher signalWatcher([&service](int signal) {
            service.shutdown();
            std::cout << std::flush;
            std::_Exit(128 + signal);
        });
        try {
            service.initialize();
        }
        catch (const EngineStartupError& e) {
            throw AppError::make(AppReturnCode::EngineError, e.what());
        }
        Logger::serviceLogger().log("Engine ready after " + std::to_string(timer.elapsedMs()) + " ms, enter help for commands",
            TraceLevel::info);

        RequestConsole console(service, std::cout);
        console.run(std::cin);
        if (service.getState() == EngineState::Crashed) {
            returnCode = AppReturnCode::EngineCrashed;
        }
    }
    catch (const AppError& ex) {
		Logger::serviceLogger().log("Application error: " + std::string(ex.what()), TraceLevel::error);
        returnCode = ex.getReturnCode();
    }
	catch (const std::exception& e) {
		Logger::serviceLogger().log(std::string(e.what()), TraceLevel::error);
        returnCode = AppReturnCode::GeneralError;
	}

    Logger::serviceLogger().log("Total runtime: " + std::to_string(timer.elapsedMs()) + " ms", TraceLevel::info);
    return static_cast<int>(returnCode);
}
