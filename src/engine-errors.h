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

#include <stdexcept>
#include <string>

/**
 * @brief Base class of all failures reported by the engine broker.
 *
 * A failure of one request never affects other requests, except a crash or a
 * shutdown, which fail every waiting and running request.
 */
class EngineError : public std::runtime_error {
public:
    enum class Kind {
        Startup,
        Crash,
        Timeout,
        InvalidPosition,
        Shutdown,
        BusyRejection,
        NotReady
    };

    EngineError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {
    }

    Kind getKind() const noexcept { return kind_; }

private:
    Kind kind_;
};

/**
 * The engine could not be spawned or did not finish the uci/isready handshake in time.
 */
class EngineStartupError : public EngineError {
public:
    explicit EngineStartupError(const std::string& message)
        : EngineError(Kind::Startup, "Engine startup failed: " + message) {
    }
};

/**
 * The engine process exited or its pipe broke.
 */
class EngineCrashError : public EngineError {
public:
    explicit EngineCrashError(const std::string& message)
        : EngineError(Kind::Crash, "Engine crashed: " + message) {
    }
};

class EngineTimeoutError : public EngineError {
public:
    explicit EngineTimeoutError(const std::string& message)
        : EngineError(Kind::Timeout, "Engine timeout: " + message) {
    }
};

class InvalidPositionError : public EngineError {
public:
    explicit InvalidPositionError(const std::string& message)
        : EngineError(Kind::InvalidPosition, "Invalid position: " + message) {
    }
};

class EngineShutdownError : public EngineError {
public:
    EngineShutdownError()
        : EngineError(Kind::Shutdown, "Engine is shutting down") {
    }
};

/**
 * Rejects a request because too many requests are already waiting for the engine.
 */
class EngineBusyRejection : public EngineError {
public:
    explicit EngineBusyRejection(size_t queueDepth)
        : EngineError(Kind::BusyRejection,
            "Engine busy: " + std::to_string(queueDepth) + " requests waiting") {
    }
};

class EngineNotReadyError : public EngineError {
public:
    EngineNotReadyError()
        : EngineError(Kind::NotReady, "Engine not ready, call initialize first") {
    }
};
