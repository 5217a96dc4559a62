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

#include "analysis-handler.h"

class EngineManager;
class RulesEngine;

/**
 * @brief One move of an analysis, tagged with whether it mates immediately.
 */
struct AnalysisMove {
    std::string move;
    bool isCheckmate = false;
    std::optional<int> scoreCp;
    std::optional<int> scoreMate;
};

using AnalysisResult = std::vector<AnalysisMove>;

/**
 * @brief Multi-pv analysis of a position: the up to three best moves of a fixed depth search.
 *
 * Sends ucinewgame, position fen, setoption name MultiPV value 3 and go depth <depth>.
 * A search that runs out of time is stopped and reported as EngineTimeoutError.
 */
class AnalysisRequest {
public:
    static constexpr int DEFAULT_DEPTH = 5;
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{ 30000 };
    static constexpr int MULTI_PV = static_cast<int>(AnalysisHandler::MAX_CANDIDATES);

    AnalysisRequest(EngineManager& engine, const RulesEngine& rules, std::string fen,
        int depth = DEFAULT_DEPTH, std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    /**
     * @brief Runs the analysis, blocking until the engine answered.
     * @throws InvalidPositionError if the rules reject the position.
     * @throws EngineTimeoutError if the engine did not finish within the timeout.
     * @throws EngineCrashError, EngineShutdownError, EngineNotReadyError
     */
    AnalysisResult run();

private:
    AnalysisResult tagCheckmates(const std::vector<AnalysisCandidate>& candidates) const;

    EngineManager& engine_;
    const RulesEngine& rules_;
    std::string fen_;
    int depth_;
    std::chrono::milliseconds timeout_;
};
