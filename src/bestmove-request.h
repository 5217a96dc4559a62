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

class EngineManager;

/**
 * @brief Move chosen by the engine at a given skill level.
 */
struct BestMoveResult {
    // std::nullopt if the engine has no move, e.g. in a mate or stalemate position
    std::optional<std::string> move;
    int skillLevel = 0;
};

/**
 * @brief Asks the engine for one move with a thinking time derived from the skill level.
 *
 * Sends position fen, setoption name Skill Level value <skill> and go movetime <ms>.
 */
class BestMoveRequest {
public:
    static constexpr int MIN_SKILL_LEVEL = 0;
    static constexpr int MAX_SKILL_LEVEL = 20;
    static constexpr std::chrono::milliseconds BASE_MOVE_TIME{ 100 };
    static constexpr std::chrono::milliseconds ADDITIONAL_MOVE_TIME{ 1000 };
    static constexpr std::chrono::milliseconds TIMEOUT_BUFFER{ 7000 };

    BestMoveRequest(EngineManager& engine, std::string fen, int skillLevel);

    /**
     * @brief Thinking time for a skill level: 100 ms plus up to 1000 ms, proportional to the skill.
     * The skill level is clamped to [0, 20].
     */
    static std::chrono::milliseconds computeMoveTime(int skillLevel);

    /**
     * @brief Runs the request, blocking until the engine answered or the move time plus 7 s passed.
     * @throws EngineTimeoutError, EngineCrashError, EngineShutdownError, EngineNotReadyError
     */
    BestMoveResult run();

private:
    EngineManager& engine_;
    std::string fen_;
    int skillLevel_;
};
