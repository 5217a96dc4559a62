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
#include <functional>
#include <memory>
#include <optional>
#include <string>

/**
 * @brief Bidirectional line channel to a running engine.
 *
 * Implemented by EngineProcess for a real subprocess. Only the reader thread of
 * the EngineManager calls readChunk; all other calls are serialized by the manager.
 */
class EngineConnection {
public:
    virtual ~EngineConnection() = default;

    /**
     * @brief Sends a single line to the engine.
     * @param line Line to send (without newline).
     * @throws std::runtime_error if the line cannot be written.
     */
    virtual void writeLine(const std::string& line) = 0;

    /**
     * @brief Blocks until output of the engine is available.
     * @return The raw bytes read, std::nullopt once the engine closed its output.
     */
    virtual std::optional<std::string> readChunk() = 0;

    /**
     * @brief Waits for the engine to exit by itself.
     * @return true if the engine exited within the timeout.
     */
    virtual bool waitForExit(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Forcefully ends the engine. readChunk returns std::nullopt afterwards.
     */
    virtual void terminate() = 0;

    virtual bool isRunning() const = 0;
};

using EngineConnectionFactory = std::function<std::unique_ptr<EngineConnection>()>;
