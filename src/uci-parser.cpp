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

#include "uci-parser.h"

#include <limits>
#include <sstream>

namespace {

    /**
     * Reads an integer following a keyword and stores it if it lies within range.
     * Errors are collected, the stream stays usable for the next token.
     */
    template <typename T>
    void readBoundedInt(std::istringstream& iss,
        const std::string& fieldName,
        T min,
        T max,
        std::optional<T>& target,
        std::vector<std::string>& errors)
    {
        T value;
        if (!(iss >> value)) {
            errors.push_back("Expected an integer after '" + fieldName + "'");
            iss.clear();
            return;
        }
        if (value < min || value > max) {
            errors.push_back("Value " + std::to_string(value) + " of '" + fieldName +
                "' is outside the expected range [" + std::to_string(min) + ", " + std::to_string(max) + "]");
            return;
        }
        if (target.has_value()) {
            errors.push_back("Field '" + fieldName + "' specified more than once");
            return;
        }
        target = value;
    }

    bool isNoMove(const std::string& token) {
        return token == "none" || token == "(none)" || token == "0000";
    }
}

bool isLanMoveToken(const std::string& token) {
    if (token.size() < 4 || token.size() > 5) return false;
    if (token[0] < 'a' || token[0] > 'h') return false;
    if (token[1] < '1' || token[1] > '8') return false;
    if (token[2] < 'a' || token[2] > 'h') return false;
    if (token[3] < '1' || token[3] > '8') return false;
    if (token.size() == 5) {
        char promotion = token[4];
        return promotion == 'q' || promotion == 'r' || promotion == 'b' || promotion == 'n';
    }
    return true;
}

std::optional<SearchInfo> parseSearchInfo(const std::string& line) {
    std::istringstream iss(line);
    std::string token;
    if (!(iss >> token) || token != "info") {
        return std::nullopt;
    }

    SearchInfo info;
    std::string parent;
    constexpr int64_t maxInt64 = std::numeric_limits<int64_t>::max();

    // score accepts cp|mate [lowerbound|upperbound]; pv collects move tokens until
    // the next keyword; "string" swallows the rest of the line
    while (iss >> token) {
        if (parent == "score") {
            if (token == "cp") readBoundedInt(iss, "score cp", -100000, 100000, info.scoreCp, info.errors);
            else if (token == "mate") readBoundedInt(iss, "score mate", -500, 500, info.scoreMate, info.errors);
            else if (token == "lowerbound" || token == "upperbound") {}
            else parent = "";
            if (parent == "score") continue;
        }
        if (isLanMoveToken(token)) {
            if (parent == "pv") info.pv.push_back(token);
            else if (parent != "currmove" && parent != "refutation" && parent != "currline") {
                info.errors.push_back("Unexpected move token '" + token + "' without context");
            }
            continue;
        }
        if (token == "string") {
            break;
        }
        if (token == "depth") readBoundedInt(iss, token, 0, 1000, info.depth, info.errors);
        else if (token == "seldepth") readBoundedInt(iss, token, 0, 1000, info.selDepth, info.errors);
        else if (token == "multipv") readBoundedInt(iss, token, 1, 220, info.multipv, info.errors);
        else if (token == "time") readBoundedInt<int64_t>(iss, token, 0, maxInt64, info.timeMs, info.errors);
        else if (token == "nodes") readBoundedInt<int64_t>(iss, token, 0, maxInt64, info.nodes, info.errors);
        else if (token == "nps") readBoundedInt<int64_t>(iss, token, 0, maxInt64, info.nps, info.errors);
        else if (token == "hashfull" || token == "tbhits" || token == "sbhits" || token == "cpuload"
            || token == "currmovenumber") {
            std::string skipped;
            iss >> skipped;
        }
        else if (token == "pv" && !info.pv.empty()) {
            info.errors.push_back("Field 'pv' specified more than once");
            parent = "";
            continue;
        }
        else if (token != "score" && token != "pv" && token != "currmove"
            && token != "refutation" && token != "currline") {
            info.errors.push_back("Unrecognized or misplaced token: '" + token + "'");
        }
        parent = token;
    }
    return info;
}

std::optional<BestMoveInfo> parseBestMove(const std::string& line) {
    std::istringstream iss(line);
    std::string token;
    if (!(iss >> token) || token != "bestmove") {
        return std::nullopt;
    }
    BestMoveInfo result;
    std::string move;
    if (!(iss >> move) || isNoMove(move)) {
        return result;
    }
    result.move = move;
    std::string ponder;
    if (iss >> token && token == "ponder" && iss >> ponder && !isNoMove(ponder)) {
        result.ponder = ponder;
    }
    return result;
}
