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

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "line-handler.h"

/**
 * @brief One ranked move of a multi-pv analysis.
 */
struct AnalysisCandidate {
    std::string move;
    std::optional<int> scoreCp;
    std::optional<int> scoreMate;
};

/**
 * @brief Collects the multi-pv lines of a "go depth" search.
 *
 * Every info line with depth, multipv and pv replaces the candidate of its pv index.
 * The bestmove line ends the conversation and ranks the candidates.
 */
class AnalysisHandler : public LineHandler {
public:
    static constexpr size_t MAX_CANDIDATES = 3;

    bool onLine(const std::string& line) override;

    /**
     * @brief Returns the candidates ranked by pv index, unique by move and at most MAX_CANDIDATES.
     *
     * The reported best move is appended if it is missing and there is room left.
     * Only valid after onLine returned true.
     */
    const std::vector<AnalysisCandidate>& getResult() const {
        return result_;
    }

    bool isFinished() const {
        return finished_;
    }

private:
    void rank(const std::optional<std::string>& bestMove);

    std::map<int, AnalysisCandidate> candidates_;
    std::vector<AnalysisCandidate> result_;
    bool finished_ = false;
};
