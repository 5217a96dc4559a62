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

#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include <chrono>
#include <thread>

#ifndef _WIN32
#include <unistd.h>
#endif

#include "engine-connection.h"

 /**
  * @brief Manages the lifecycle and communication of an external engine process.
  *
  * Responsible for starting the process, providing communication via stdin/stdout,
  * and ensuring proper termination across platforms. Lines the engine writes to stderr
  * are logged by a background thread.
  */
class EngineProcess : public EngineConnection {
public:
    /**
     * @brief Constructs and starts the engine process.
     * @param executablePath Path to the engine executable.
     * @param workingDirectory Optional working directory for the process.
     * @param arguments Command line arguments passed to the engine.
     * @throws std::runtime_error if the process cannot be started.
     */
    EngineProcess(const std::filesystem::path& executablePath,
        const std::optional<std::filesystem::path>& workingDirectory,
        const std::vector<std::string>& arguments,
        std::string identifier);

    /**
     * @brief Destructor ensures the process is safely terminated.
     */
    ~EngineProcess() override;

    EngineProcess(const EngineProcess&) = delete;
    EngineProcess& operator=(const EngineProcess&) = delete;

    void writeLine(const std::string& line) override;

    /**
     * @brief Blocks until data is available on the engine's stdout.
     * @return The bytes read or std::nullopt if the pipe is closed (engine terminated).
     */
    std::optional<std::string> readChunk() override;

    bool waitForExit(std::chrono::milliseconds timeout) override;

    /**
     * @brief Forcefully terminates the engine process and reaps it.
     *        The pipe handles stay open until destruction, so a concurrent reader sees EOF.
     */
    void terminate() override;

    bool isRunning() const override;

private:

    /**
     * @brief Starts the engine process.
     * @throws std::runtime_error if the process cannot be started.
     */
    void start();

    /**
	 * @brief Closes the engine process handles and releases resources.
     */
    void closeAllHandles();

    /**
     * @brief Logs the stderr output of the engine until the pipe is closed.
     */
    void logStdErr();

    std::filesystem::path executablePath_;
    std::optional<std::filesystem::path> workingDirectory_;
    std::vector<std::string> arguments_;
    std::string identifier_;

#ifdef _WIN32
    void* childProcess_ = nullptr;
    void* stdinWrite_ = nullptr;
    void* stdoutRead_ = nullptr;
    void* stderrRead_ = nullptr;
#else
    pid_t childPid_ = -1;
    int stdinWrite_ = -1;
    int stdoutRead_ = -1;
    int stderrRead_ = -1;
    // set once the child has been reaped, its pid must not be used afterwards
    mutable bool exited_ = false;
#endif
    std::thread stderrThread_;
};
