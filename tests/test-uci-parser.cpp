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

#include "uci-parser.h"

TEST_CASE("isLanMoveToken") {
    CHECK(isLanMoveToken("e2e4"));
    CHECK(isLanMoveToken("a7a8q"));
    CHECK(isLanMoveToken("h2h1n"));
    CHECK_FALSE(isLanMoveToken("e2e9"));
    CHECK_FALSE(isLanMoveToken("i2e4"));
    CHECK_FALSE(isLanMoveToken("e7e8k"));
    CHECK_FALSE(isLanMoveToken("e2"));
    CHECK_FALSE(isLanMoveToken("depth"));
}

TEST_CASE("parseSearchInfo reads the fields of a multipv line") {
    auto info = parseSearchInfo("info depth 12 seldepth 18 multipv 2 score cp -35 nodes 123456 nps 900000 "
        "hashfull 12 tbhits 0 time 137 pv d2d4 d7d5 c2c4");
    REQUIRE(info);
    CHECK(info->depth == 12);
    CHECK(info->selDepth == 18);
    CHECK(info->multipv == 2);
    CHECK(info->scoreCp == -35);
    CHECK_FALSE(info->scoreMate);
    CHECK(info->nodes == 123456);
    CHECK(info->nps == 900000);
    CHECK(info->timeMs == 137);
    REQUIRE(info->pv.size() == 3);
    CHECK(info->pv[0] == "d2d4");
    CHECK(info->pv[2] == "c2c4");
    CHECK(info->errors.empty());
}

TEST_CASE("parseSearchInfo reads mate scores and bounds") {
    auto info = parseSearchInfo("info depth 5 multipv 1 score mate -3 upperbound pv e1e2");
    REQUIRE(info);
    CHECK(info->scoreMate == -3);
    CHECK_FALSE(info->scoreCp);
    REQUIRE(info->pv.size() == 1);
    CHECK(info->errors.empty());
}

TEST_CASE("parseSearchInfo ignores the rest of a string line") {
    auto info = parseSearchInfo("info depth 1 string e2e4 is a nice move");
    REQUIRE(info);
    CHECK(info->depth == 1);
    CHECK(info->pv.empty());
    CHECK(info->errors.empty());
}

TEST_CASE("parseSearchInfo collects errors instead of throwing") {
    auto info = parseSearchInfo("info depth x multipv 0 foo pv e2e4");
    REQUIRE(info);
    CHECK_FALSE(info->depth);
    CHECK_FALSE(info->multipv);
    CHECK(info->errors.size() >= 3);
    REQUIRE(info->pv.size() == 1);
    CHECK(info->pv[0] == "e2e4");
}

TEST_CASE("parseSearchInfo rejects lines that are no info lines") {
    CHECK_FALSE(parseSearchInfo("bestmove e2e4"));
    CHECK_FALSE(parseSearchInfo(""));
    CHECK_FALSE(parseSearchInfo("information depth 3"));
}

TEST_CASE("parseBestMove") {
    SUBCASE("move and ponder") {
        auto best = parseBestMove("bestmove e2e4 ponder e7e5");
        REQUIRE(best);
        CHECK(best->move == "e2e4");
        CHECK(best->ponder == "e7e5");
    }
    SUBCASE("move only") {
        auto best = parseBestMove("bestmove g7g8q");
        REQUIRE(best);
        CHECK(best->move == "g7g8q");
        CHECK_FALSE(best->ponder);
    }
    SUBCASE("no move") {
        for (const char* line : { "bestmove (none)", "bestmove none", "bestmove 0000", "bestmove" }) {
            auto best = parseBestMove(line);
            REQUIRE(best);
            CHECK_FALSE(best->move);
        }
    }
    SUBCASE("other lines") {
        CHECK_FALSE(parseBestMove("info depth 1"));
        CHECK_FALSE(parseBestMove("readyok"));
    }
}
