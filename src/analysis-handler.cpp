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

#include "analysis-handler.h"
#include "uci-parser.h"

#include <algorithm>

bool AnalysisHandler::onLine(const std::string& line) {
    if (finished_) {
        return true;
    }
    if (line.starts_with("info")) {
        auto info = parseSearchInfo(line);
        if (!info || !info->depth || !info->multipv || info->pv.empty()) {
            return false;
        }
        candidates_[*info->multipv] = AnalysisCandidate{
            .move = info->pv.front(),
            .scoreCp = info->scoreCp,
            .scoreMate = info->scoreMate
        };
        return false;
    }
    auto bestMove = parseBestMove(line);
    if (!bestMove) {
        return false;
    }
    rank(bestMove->move);
    finished_ = true;
    return true;
}

void AnalysisHandler::rank(const std::optional<std::string>& bestMove) {
    // std::map iterates in ascending pv index
    for (const auto& [index, candidate] : candidates_) {
        if (result_.size() >= MAX_CANDIDATES) {
            break;
        }
        bool known = std::any_of(result_.begin(), result_.end(),
            [&](const AnalysisCandidate& c) { return c.move == candidate.move; });
        if (!known) {
            result_.push_back(candidate);
        }
    }
    if (!bestMove || result_.size() >= MAX_CANDIDATES) {
        return;
    }
    bool known = std::any_of(result_.begin(), result_.end(),
        [&](const AnalysisCandidate& c) { return c.move == *bestMove; });
    if (!known) {
        result_.push_back(AnalysisCandidate{ .move = *bestMove });
    }
}
