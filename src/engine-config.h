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
#include <optional>
#include <string>
#include <vector>

/**
 * Configuration of the engine subprocess and its lifecycle timeouts.
 */
struct EngineManagerConfig {
    std::string executablePath;
    std::optional<std::string> workingDirectory;
    std::vector<std::string> arguments;
    // prefix of the protocol log lines
    std::string identifier = "engine";
    // whole uci/uciok and isready/readyok sequence
    std::chrono::milliseconds startupTimeout{ 15000 };
    // time the engine gets to exit after "quit" before it is killed
    std::chrono::milliseconds quitGrace{ 2000 };
    // time a timed out conversation gets to deliver its bestmove after "stop"
    std::chrono::milliseconds stopGrace{ 2000 };
};

/**
 * Defaults of the requests offered by the EngineService.
 */
struct EngineServiceConfig {
    int analysisDepth = 5;
    std::chrono::milliseconds analysisTimeout{ 30000 };
    // 0 means no limit on waiting requests
    size_t maxQueueDepth = 0;
};
