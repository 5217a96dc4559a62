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
#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "engine-config.h"
#include "engine-connection.h"
#include "engine-state.h"
#include "line-buffer.h"
#include "session-broker.h"

/**
 * @brief Owns the engine subprocess and its single reader thread.
 *
 * The manager spawns the engine, runs the uci/isready handshake, routes every line
 * the engine writes to the active ticket of its SessionBroker, detects crashes and
 * performs the quit/kill shutdown. A crashed engine is never restarted implicitly,
 * only by an explicit initialize().
 */
class EngineManager {
public:
    /**
     * @param config Path, arguments and timeouts of the engine.
     * @param factory Creates the connection on every initialize; defaults to spawning an EngineProcess.
     */
    EngineManager(EngineManagerConfig config, EngineConnectionFactory factory);
    explicit EngineManager(EngineManagerConfig config);
    ~EngineManager();

    EngineManager(const EngineManager&) = delete;
    EngineManager& operator=(const EngineManager&) = delete;

    /**
     * @brief Starts the engine and waits for uciok and readyok.
     *
     * Returns immediately if the engine is ready. Concurrent calls during the handshake
     * share its outcome.
     * @throws EngineStartupError if spawning fails, the engine exits or the handshake
     *         does not complete within the startup timeout.
     */
    void initialize();

    /**
     * @brief Sends quit, waits for the grace period and kills the engine if it is still running.
     *
     * The active and all queued requests are failed with EngineShutdownError.
     * Calling it on a stopped or crashed engine has no effect.
     */
    void shutdown();

    bool isReady() const;

    /**
     * @brief Current state, Busy while a ticket is active on a ready engine.
     */
    EngineState getState() const;

    SessionBroker& getBroker() {
        return broker_;
    }

    const SessionBroker& getBroker() const {
        return broker_;
    }

    /**
     * @brief Writes a command line to the engine and logs it.
     * @throws EngineCrashError if there is no engine or the pipe is broken.
     */
    void writeCommand(const std::string& command);

    /**
     * @brief Ends a conversation that ran out of time.
     *
     * Sends "stop" and gives the engine the stop grace period to deliver its terminal line,
     * so that it is not attributed to the next ticket.
     */
    void stopConversation(const std::shared_ptr<Ticket>& ticket);

    /**
     * @brief Creates the factory spawning the configured executable as EngineProcess.
     */
    static EngineConnectionFactory createProcessFactory(const EngineManagerConfig& config);

private:
    void startEngine();
    void abortStartup();
    void expectHandshake(const std::string& token);
    bool waitForHandshake(std::chrono::steady_clock::time_point deadline);
    void readLoop(EngineConnection* connection);
    void routeLine(const std::string& line);
    void onEngineExit();
    void releaseConnection();
    void setState(EngineState state);

    EngineManagerConfig config_;
    EngineConnectionFactory factory_;
    SessionBroker broker_;

    // used by the reader thread only
    LineBuffer lineBuffer_;

    std::mutex commandMutex_;
    std::unique_ptr<EngineConnection> connection_;
    std::thread readThread_;

    // serializes startup and shutdown
    std::mutex lifecycleMutex_;

    mutable std::mutex stateMutex_;
    std::condition_variable stateCv_;
    EngineState state_ = EngineState::NotStarted;
    std::string expectedHandshake_;
    bool handshakeReceived_ = false;
    std::shared_future<void> startupFuture_;
};
