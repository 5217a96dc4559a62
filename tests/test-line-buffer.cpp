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
#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "analysis-handler.h"
#include "line-buffer.h"

TEST_CASE("LineBuffer reassembles lines split across chunks") {
    LineBuffer buffer;
    CHECK(buffer.append("info dep").empty());
    CHECK(buffer.getPending() == "info dep");

    auto lines = buffer.append("th 3\nbestmove e2");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "info depth 3");
    CHECK(buffer.getPending() == "bestmove e2");

    lines = buffer.append("e4\n");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "bestmove e2e4");
    CHECK(buffer.getPending().empty());
}

TEST_CASE("LineBuffer returns several lines of one chunk in order") {
    LineBuffer buffer;
    auto lines = buffer.append("id name X\nid author Y\nuciok\n");
    REQUIRE(lines.size() == 3);
    CHECK(lines[0] == "id name X");
    CHECK(lines[1] == "id author Y");
    CHECK(lines[2] == "uciok");
}

TEST_CASE("LineBuffer strips carriage returns and skips blank lines") {
    LineBuffer buffer;
    auto lines = buffer.append("readyok\r\n\r\n   \n\nbestmove a2a3\r\n");
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "readyok");
    CHECK(lines[1] == "bestmove a2a3");
}

TEST_CASE("LineBuffer handles a carriage return and line feed in separate chunks") {
    LineBuffer buffer;
    CHECK(buffer.append("uciok\r").empty());
    auto lines = buffer.append("\n");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "uciok");
}

TEST_CASE("LineBuffer clear drops the pending fragment") {
    LineBuffer buffer;
    buffer.append("bestmo");
    buffer.clear();
    auto lines = buffer.append("readyok\n");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "readyok");
}

namespace {
    struct FramedAnalysis {
        std::vector<std::string> lines;
        std::vector<std::string> moves;
        bool finished = false;
    };

    FramedAnalysis frameAnalysis(const std::string& transcript, size_t chunkSize) {
        LineBuffer buffer;
        AnalysisHandler handler;
        FramedAnalysis result;
        for (size_t pos = 0; pos < transcript.size(); pos += chunkSize) {
            for (auto& line : buffer.append(std::string_view(transcript).substr(pos, chunkSize))) {
                result.finished = handler.onLine(line) || result.finished;
                result.lines.push_back(std::move(line));
            }
        }
        for (const auto& candidate : handler.getResult()) {
            result.moves.push_back(candidate.move);
        }
        return result;
    }
}

TEST_CASE("LineBuffer result does not depend on the chunk size") {
    const std::string transcript =
        "info depth 1 multipv 1 score cp 20 pv e2e4\r\n"
        "info depth 1 multipv 2 score cp 15 pv d2d4\r\n"
        "\r\n"
        "info string NNUE enabled\r\n"
        "info depth 2 multipv 1 score cp 25 pv e2e4 e7e5\r\n"
        "info depth 2 multipv 2 score cp 25 pv e2e4 c7c5\r\n"
        "info depth 2 multipv 3 score mate 4 pv g1f3\r\n"
        "bestmove e2e4 ponder e7e5\r\n";

    const auto reference = frameAnalysis(transcript, transcript.size());
    REQUIRE(reference.finished);
    REQUIRE(reference.lines.size() == 7);
    REQUIRE(reference.moves == std::vector<std::string>{ "e2e4", "g1f3" });

    for (size_t chunkSize = 1; chunkSize <= transcript.size(); ++chunkSize) {
        CAPTURE(chunkSize);
        const auto framed = frameAnalysis(transcript, chunkSize);
        CHECK(framed.lines == reference.lines);
        CHECK(framed.moves == reference.moves);
        CHECK(framed.finished);
    }
}
