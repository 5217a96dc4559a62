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

#include "analysis-request.h"

#include <stdexcept>

#include "engine-errors.h"
#include "engine-manager.h"
#include "logger.h"
#include "rules-engine.h"
#include "timer.h"

AnalysisRequest::AnalysisRequest(EngineManager& engine, const RulesEngine& rules, std::string fen,
    int depth, std::chrono::milliseconds timeout)
    : engine_(engine), rules_(rules), fen_(std::move(fen)), depth_(depth), timeout_(timeout)
{
}

AnalysisResult AnalysisRequest::run() {
    if (depth_ < 1) {
        throw std::invalid_argument("Analysis depth must be positive, got " + std::to_string(depth_));
    }
    if (fen_.find_first_of("\r\n") != std::string::npos) {
        throw InvalidPositionError("line break in position");
    }
    if (auto error = rules_.validatePosition(fen_)) {
        throw InvalidPositionError(*error);
    }

    Timer timer;
    timer.start();
    const auto deadline = Timer::deadlineIn(timeout_);
    AnalysisHandler handler;
    SessionBroker& broker = engine_.getBroker();
    auto ticket = broker.acquire(handler, deadline);
    TicketGuard guard(broker, ticket);

    engine_.writeCommand("ucinewgame");
    engine_.writeCommand("position fen " + fen_);
    engine_.writeCommand("setoption name MultiPV value " + std::to_string(MULTI_PV));
    engine_.writeCommand("go depth " + std::to_string(depth_));

    if (!broker.awaitCompletion(ticket, deadline)) {
        Logger::serviceLogger().log("Analysis of " + fen_ + " timed out after "
            + std::to_string(timer.elapsedMs()) + " ms, stopping the search", TraceLevel::warning);
        engine_.stopConversation(ticket);
        throw EngineTimeoutError("analysis did not finish within " + std::to_string(timeout_.count()) + " ms");
    }
    guard.release();

    Logger::serviceLogger().log("Analysis of " + fen_ + " finished in "
        + std::to_string(timer.elapsedMs()) + " ms", TraceLevel::info);
    return tagCheckmates(handler.getResult());
}

AnalysisResult AnalysisRequest::tagCheckmates(const std::vector<AnalysisCandidate>& candidates) const {
    AnalysisResult result;
    for (const auto& candidate : candidates) {
        AnalysisMove move{
            .move = candidate.move,
            .isCheckmate = false,
            .scoreCp = candidate.scoreCp,
            .scoreMate = candidate.scoreMate
        };
        try {
            auto newFen = rules_.applyMove(fen_, candidate.move);
            if (newFen) {
                move.isCheckmate = rules_.isCheckmate(*newFen);
            }
            else {
                Logger::serviceLogger().log("Engine suggested illegal move " + candidate.move
                    + " in " + fen_, TraceLevel::warning);
            }
        }
        catch (const std::exception& e) {
            Logger::serviceLogger().log("Checkmate test of " + candidate.move + " failed: " + e.what(),
                TraceLevel::warning);
        }
        result.push_back(std::move(move));
    }
    return result;
}
