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

#include <sstream>
#include <thread>

#include "engine-service.h"
#include "request-console.h"
#include "scripted-engine.h"
#include "stub-rules.h"

using namespace std::chrono_literals;

namespace {
    const std::string START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

    EngineManagerConfig fastConfig() {
        EngineManagerConfig config;
        config.executablePath = "scripted";
        config.identifier = "scripted";
        config.startupTimeout = 300ms;
        config.quitGrace = 100ms;
        config.stopGrace = 100ms;
        return config;
    }

    bool contains(const std::string& text, const std::string& part) {
        return text.find(part) != std::string::npos;
    }
}

TEST_CASE("RequestConsole answers requests and shuts the engine down") {
    ScriptedEngine engine;
    StubRules rules;
    rules.matingMoves = { "e2e4" };
    EngineService service(fastConfig(), EngineServiceConfig{}, rules, engine.factory());
    service.initialize();

    std::istringstream in(
        "analyze " + START_FEN + " 3\n"
        "\n"
        "move 10 " + START_FEN + "\n"
        "status\n"
        "bogus\n"
        "quit\n"
        "move 10 " + START_FEN + "\n");
    std::ostringstream out;
    RequestConsole console(service, out);
    console.run(in);

    const std::string text = out.str();
    CHECK(contains(text, "bestmoves: e2e4+mate"));
    CHECK(contains(text, "move: e2e4"));
    CHECK(contains(text, "status: "));
    CHECK(contains(text, "Unknown command: bogus"));
    CHECK(contains(text, "#1 "));
    CHECK(contains(text, "#2 "));
    // the line after quit is not processed
    CHECK_FALSE(contains(text, "#3 "));
    CHECK(engine.hasCommand("go depth 3"));
    CHECK(engine.hasCommand("quit"));
    CHECK(service.getState() == EngineState::NotStarted);
}

TEST_CASE("RequestConsole reports failing requests") {
    ScriptedEngine engine;
    StubRules rules;
    EngineService service(fastConfig(), EngineServiceConfig{}, rules, engine.factory());
    std::ostringstream out;
    RequestConsole console(service, out);

    SUBCASE("engine not started") {
        CHECK(console.handleLine("analyze " + START_FEN));
        console.waitForRequests();
        CHECK(contains(out.str(), "#1 error: "));
    }
    SUBCASE("bad arguments") {
        service.initialize();
        CHECK(console.handleLine("analyze e2e4"));
        CHECK(console.handleLine("move high " + START_FEN));
        CHECK(console.handleLine("move 30 " + START_FEN));
        console.waitForRequests();
        CHECK(contains(out.str(), "Usage: analyze"));
        CHECK(contains(out.str(), "Skill level must be an integer"));
        CHECK(contains(out.str(), "Invalid skill level 30"));
        CHECK(engine.requestCommands().empty());
    }
    SUBCASE("position without moves") {
        service.initialize();
        engine.configure([](ScriptedEngine& e) { e.goReply = "bestmove (none)\n"; });
        CHECK(console.handleLine("a 7k/5Q2/6K1/8/8/8/8/8 b - - 0 1"));
        console.waitForRequests();
        CHECK(contains(out.str(), "bestmoves: (none)"));
    }
    CHECK_FALSE(console.handleLine("q"));
}

TEST_CASE("RequestConsole restarts the engine on init") {
    ScriptedEngine engine;
    StubRules rules;
    EngineService service(fastConfig(), EngineServiceConfig{}, rules, engine.factory());
    std::ostringstream out;
    RequestConsole console(service, out);

    CHECK(console.handleLine("init"));
    console.waitForRequests();
    CHECK(contains(out.str(), "#1 status: ready"));
    CHECK(service.isReady());

    CHECK(console.handleLine("?"));
    CHECK(contains(out.str(), "status: ready, waiting: 0"));
    CHECK(console.handleLine("help"));
    CHECK(contains(out.str(), "Available commands:"));
}

TEST_CASE("RequestConsole joins finished request threads while it runs") {
    ScriptedEngine engine;
    StubRules rules;
    EngineService service(fastConfig(), EngineServiceConfig{}, rules, engine.factory());
    service.initialize();
    std::ostringstream out;
    RequestConsole console(service, out);

    for (int i = 0; i < 50; ++i) {
        REQUIRE(console.handleLine("move 0 " + START_FEN));
    }
    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (console.getTrackedRequests() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    CHECK(console.getTrackedRequests() == 0);

    REQUIRE(console.handleLine("move 0 " + START_FEN));
    console.waitForRequests();
    CHECK(console.getTrackedRequests() == 0);
    CHECK(contains(out.str(), "#51 move: e2e4"));
}
