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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Search information of one "info" line.
 */
struct SearchInfo {
    std::optional<int> depth;
    std::optional<int> selDepth;
    std::optional<int> multipv;
    std::optional<int> scoreCp;
    std::optional<int> scoreMate;
    std::optional<int64_t> timeMs;
    std::optional<int64_t> nodes;
    std::optional<int64_t> nps;
    std::vector<std::string> pv;
    std::vector<std::string> errors;
};

/**
 * @brief Content of a "bestmove" line. An empty move means the engine has no move.
 */
struct BestMoveInfo {
    std::optional<std::string> move;
    std::optional<std::string> ponder;
};

/**
 * @brief Checks whether a token is a move in long algebraic notation, e.g. "e2e4" or "e7e8q".
 */
bool isLanMoveToken(const std::string& token);

/**
 * @brief Parses an "info ..." line.
 *
 * Never throws. Unknown or malformed fields are reported in SearchInfo::errors and
 * skipped, the remaining fields are still read.
 * @return The search info or std::nullopt if the line is not an info line.
 */
std::optional<SearchInfo> parseSearchInfo(const std::string& line);

/**
 * @brief Parses a "bestmove <move|none|(none)> [ponder <move>]" line.
 * @return The best move info or std::nullopt if the line is not a bestmove line.
 */
std::optional<BestMoveInfo> parseBestMove(const std::string& line);
