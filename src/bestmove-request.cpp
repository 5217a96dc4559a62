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

#include "bestmove-request.h"

#include <algorithm>
#include <cmath>

#include "bestmove-handler.h"
#include "engine-errors.h"
#include "engine-manager.h"
#include "logger.h"
#include "timer.h"

BestMoveRequest::BestMoveRequest(EngineManager& engine, std::string fen, int skillLevel)
    : engine_(engine), fen_(std::move(fen)), skillLevel_(skillLevel)
{
}

std::chrono::milliseconds BestMoveRequest::computeMoveTime(int skillLevel) {
    int skill = std::clamp(skillLevel, MIN_SKILL_LEVEL, MAX_SKILL_LEVEL);
    double share = static_cast<double>(skill) / MAX_SKILL_LEVEL;
    auto additional = std::lround(share * static_cast<double>(ADDITIONAL_MOVE_TIME.count()));
    return BASE_MOVE_TIME + std::chrono::milliseconds(additional);
}

BestMoveResult BestMoveRequest::run() {
    if (fen_.find_first_of("\r\n") != std::string::npos) {
        throw InvalidPositionError("line break in position");
    }
    const int skill = std::clamp(skillLevel_, MIN_SKILL_LEVEL, MAX_SKILL_LEVEL);
    const auto moveTime = computeMoveTime(skill);
    const auto timeout = moveTime + TIMEOUT_BUFFER;

    Timer timer;
    timer.start();
    const auto deadline = Timer::deadlineIn(timeout);
    BestMoveHandler handler;
    SessionBroker& broker = engine_.getBroker();
    auto ticket = broker.acquire(handler, deadline);
    TicketGuard guard(broker, ticket);

    engine_.writeCommand("position fen " + fen_);
    engine_.writeCommand("setoption name Skill Level value " + std::to_string(skill));
    engine_.writeCommand("go movetime " + std::to_string(moveTime.count()));

    if (!broker.awaitCompletion(ticket, deadline)) {
        Logger::serviceLogger().log("Move search in " + fen_ + " timed out after "
            + std::to_string(timer.elapsedMs()) + " ms, stopping the search", TraceLevel::warning);
        engine_.stopConversation(ticket);
        throw EngineTimeoutError("no bestmove within " + std::to_string(timeout.count()) + " ms");
    }
    guard.release();

    BestMoveResult result{ .move = handler.getMove(), .skillLevel = skillLevel_ };
    if (!result.move) {
        Logger::serviceLogger().log("Engine has no move in " + fen_, TraceLevel::warning);
    }
    return result;
}
