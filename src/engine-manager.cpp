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

#include "engine-manager.h"

#include "engine-errors.h"
#include "engine-process.h"
#include "logger.h"
#include "string-helper.h"

EngineManager::EngineManager(EngineManagerConfig config, EngineConnectionFactory factory)
    : config_(std::move(config)), factory_(std::move(factory))
{
}

EngineManager::EngineManager(EngineManagerConfig config)
    : EngineManager(config, createProcessFactory(config))
{
}

EngineManager::~EngineManager() {
    try {
        shutdown();
    }
    catch (const std::exception& e) {
        Logger::serviceLogger().log("Shutdown of " + config_.identifier + " failed: " + e.what(), TraceLevel::error);
    }
}

EngineConnectionFactory EngineManager::createProcessFactory(const EngineManagerConfig& config) {
    return [config]() -> std::unique_ptr<EngineConnection> {
        std::optional<std::filesystem::path> workingDirectory;
        if (config.workingDirectory) {
            workingDirectory = *config.workingDirectory;
        }
        return std::make_unique<EngineProcess>(config.executablePath, workingDirectory,
            config.arguments, config.identifier);
    };
}

void EngineManager::initialize() {
    std::shared_future<void> startup;
    std::shared_ptr<std::promise<void>> promise;
    {
        std::scoped_lock lock(stateMutex_);
        switch (state_) {
        case EngineState::Ready:
        case EngineState::Busy:
            return;
        case EngineState::Terminating:
            throw EngineStartupError("engine " + config_.identifier + " is shutting down");
        case EngineState::Handshaking:
            startup = startupFuture_;
            break;
        case EngineState::NotStarted:
        case EngineState::Crashed:
            promise = std::make_shared<std::promise<void>>();
            startupFuture_ = promise->get_future().share();
            startup = startupFuture_;
            setState(EngineState::Handshaking);
            break;
        }
    }
    if (promise) {
        try {
            startEngine();
            promise->set_value();
        }
        catch (...) {
            promise->set_exception(std::current_exception());
        }
    }
    startup.get();
}

void EngineManager::startEngine() {
    std::scoped_lock lifecycle(lifecycleMutex_);
    releaseConnection();
    lineBuffer_.clear();

    std::unique_ptr<EngineConnection> connection;
    try {
        connection = factory_();
    }
    catch (const std::exception& e) {
        Logger::serviceLogger().log("Failed to start engine " + config_.identifier + ": " + e.what(), TraceLevel::error);
        {
            std::scoped_lock lock(stateMutex_);
            if (state_ == EngineState::Handshaking) {
                setState(EngineState::NotStarted);
            }
            stateCv_.notify_all();
        }
        throw EngineStartupError(e.what());
    }
    EngineConnection* reader = connection.get();
    {
        std::scoped_lock lock(commandMutex_);
        connection_ = std::move(connection);
    }
    readThread_ = std::thread(&EngineManager::readLoop, this, reader);

    const auto deadline = std::chrono::steady_clock::now() + config_.startupTimeout;
    try {
        // The expected answer is registered before the command is written, so the
        // reader cannot miss it.
        expectHandshake("uciok");
        writeCommand("uci");
        if (!waitForHandshake(deadline)) {
            throw EngineStartupError("no uciok within " + std::to_string(config_.startupTimeout.count()) + " ms");
        }
        expectHandshake("readyok");
        writeCommand("isready");
        if (!waitForHandshake(deadline)) {
            throw EngineStartupError("no readyok within " + std::to_string(config_.startupTimeout.count()) + " ms");
        }
        std::scoped_lock lock(stateMutex_);
        if (state_ != EngineState::Handshaking) {
            throw EngineStartupError("engine left the handshake as " + to_string(state_));
        }
        setState(EngineState::Ready);
        broker_.open();
    }
    catch (const EngineStartupError& e) {
        Logger::serviceLogger().log(e.what(), TraceLevel::error);
        abortStartup();
        throw;
    }
    catch (const std::exception& e) {
        Logger::serviceLogger().log(std::string("Engine startup failed: ") + e.what(), TraceLevel::error);
        abortStartup();
        throw EngineStartupError(e.what());
    }
}

void EngineManager::abortStartup() {
    {
        std::scoped_lock lock(stateMutex_);
        if (state_ != EngineState::Terminating) {
            setState(EngineState::Crashed);
        }
        stateCv_.notify_all();
    }
    releaseConnection();
}

void EngineManager::expectHandshake(const std::string& token) {
    std::scoped_lock lock(stateMutex_);
    expectedHandshake_ = token;
    handshakeReceived_ = false;
}

bool EngineManager::waitForHandshake(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock lock(stateMutex_);
    stateCv_.wait_until(lock, deadline, [this] {
        return handshakeReceived_ || state_ != EngineState::Handshaking;
        });
    if (state_ == EngineState::Crashed) {
        throw EngineStartupError("engine " + config_.identifier + " exited during the handshake");
    }
    if (state_ == EngineState::Terminating) {
        throw EngineStartupError("shutdown requested during the handshake");
    }
    return handshakeReceived_;
}

void EngineManager::readLoop(EngineConnection* connection) {
    try {
        while (auto chunk = connection->readChunk()) {
            for (const auto& line : lineBuffer_.append(*chunk)) {
                routeLine(line);
            }
        }
    }
    catch (const std::exception& e) {
        Logger::serviceLogger().log("Exception in readLoop of " + config_.identifier + ": " + e.what(), TraceLevel::error);
    }
    onEngineExit();
}

void EngineManager::routeLine(const std::string& line) {
    {
        std::scoped_lock lock(stateMutex_);
        if (state_ == EngineState::Handshaking) {
            if (!handshakeReceived_ && trim(line) == expectedHandshake_) {
                Logger::engineLogger().log(config_.identifier, line, true, TraceLevel::command);
                handshakeReceived_ = true;
                stateCv_.notify_all();
            }
            else {
                // id and option lines
                Logger::engineLogger().log(config_.identifier, line, true, TraceLevel::handshake);
            }
            return;
        }
    }
    Logger::engineLogger().log(config_.identifier, line, true,
        line.starts_with("info") ? TraceLevel::info : TraceLevel::command);
    if (!broker_.dispatchLine(line)) {
        Logger::serviceLogger().log("Discarded engine line without active request: " + line, TraceLevel::info);
    }
}

void EngineManager::onEngineExit() {
    std::scoped_lock lock(stateMutex_);
    if (state_ == EngineState::Terminating || state_ == EngineState::NotStarted || state_ == EngineState::Crashed) {
        return;
    }
    Logger::serviceLogger().log("Engine " + config_.identifier + " terminated unexpectedly in state "
        + to_string(state_), TraceLevel::error);
    setState(EngineState::Crashed);
    stateCv_.notify_all();
    broker_.close(std::make_exception_ptr(EngineCrashError("engine " + config_.identifier + " exited")));
}

void EngineManager::shutdown() {
    bool running = false;
    {
        std::unique_lock lock(stateMutex_);
        if (state_ == EngineState::Terminating) {
            stateCv_.wait(lock, [this] { return state_ != EngineState::Terminating; });
            return;
        }
        running = state_ != EngineState::NotStarted && state_ != EngineState::Crashed;
        if (running) {
            setState(EngineState::Terminating);
            stateCv_.notify_all();
            broker_.close(std::make_exception_ptr(EngineShutdownError()));
        }
    }

    std::scoped_lock lifecycle(lifecycleMutex_);
    if (!running) {
        releaseConnection();
        return;
    }
    if (connection_) {
        try {
            writeCommand("quit");
        }
        catch (const EngineError& e) {
            Logger::serviceLogger().log(std::string("Could not send quit: ") + e.what(), TraceLevel::warning);
        }
        if (!connection_->waitForExit(config_.quitGrace)) {
            Logger::serviceLogger().log("Engine " + config_.identifier + " did not exit within "
                + std::to_string(config_.quitGrace.count()) + " ms after quit, killing it", TraceLevel::warning);
        }
    }
    releaseConnection();

    std::scoped_lock lock(stateMutex_);
    setState(EngineState::NotStarted);
    broker_.close(std::make_exception_ptr(EngineNotReadyError()));
    stateCv_.notify_all();
}

bool EngineManager::isReady() const {
    std::scoped_lock lock(stateMutex_);
    return state_ == EngineState::Ready;
}

EngineState EngineManager::getState() const {
    std::scoped_lock lock(stateMutex_);
    if (state_ == EngineState::Ready && broker_.hasActiveTicket()) {
        return EngineState::Busy;
    }
    return state_;
}

void EngineManager::writeCommand(const std::string& command) {
    std::scoped_lock lock(commandMutex_);
    if (!connection_) {
        throw EngineCrashError("no engine process to receive \"" + command + "\"");
    }
    Logger::engineLogger().log(config_.identifier, command, false, TraceLevel::command);
    try {
        connection_->writeLine(command);
    }
    catch (const std::exception& e) {
        throw EngineCrashError(e.what());
    }
}

void EngineManager::stopConversation(const std::shared_ptr<Ticket>& ticket) {
    try {
        writeCommand("stop");
        auto deadline = std::chrono::steady_clock::now() + config_.stopGrace;
        if (!broker_.awaitCompletion(ticket, deadline)) {
            Logger::serviceLogger().log("Engine " + config_.identifier + " did not answer stop within "
                + std::to_string(config_.stopGrace.count()) + " ms", TraceLevel::warning);
        }
    }
    catch (const EngineError& e) {
        Logger::serviceLogger().log(std::string("Stopping the search failed: ") + e.what(), TraceLevel::warning);
    }
}

void EngineManager::releaseConnection() {
    std::unique_ptr<EngineConnection> connection;
    {
        std::scoped_lock lock(commandMutex_);
        connection = std::move(connection_);
    }
    if (connection) {
        try {
            connection->terminate();
        }
        catch (const std::exception& e) {
            Logger::serviceLogger().log("Failed to terminate engine " + config_.identifier + ": " + e.what(),
                TraceLevel::error);
        }
    }
    if (readThread_.joinable()) {
        readThread_.join();
    }
}

void EngineManager::setState(EngineState state) {
    // requires stateMutex_
    if (state_ == state) return;
    Logger::serviceLogger().log("Engine " + config_.identifier + ": " + to_string(state_) + " -> "
        + to_string(state), TraceLevel::info);
    state_ = state;
}
