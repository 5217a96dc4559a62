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

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include "engine-errors.h"
#include "engine-service.h"
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

    void waitForQueueDepth(const EngineService& service, size_t depth) {
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (service.getQueueDepth() != depth && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        REQUIRE(service.getQueueDepth() == depth);
    }
}

TEST_CASE("EngineService rejects requests before initialize") {
    ScriptedEngine engine;
    StubRules rules;
    EngineService service(fastConfig(), EngineServiceConfig{}, rules, engine.factory());
    CHECK_FALSE(service.isReady());
    CHECK_THROWS_AS(service.requestAnalysis(START_FEN), EngineNotReadyError);
    CHECK_THROWS_AS(service.requestBestMove(START_FEN, 10), EngineNotReadyError);
    CHECK(engine.getSpawnCount() == 0);
}

TEST_CASE("EngineService validates the skill level") {
    ScriptedEngine engine;
    StubRules rules;
    EngineService service(fastConfig(), EngineServiceConfig{}, rules, engine.factory());
    service.initialize();
    CHECK_THROWS_AS(service.requestBestMove(START_FEN, -1), std::invalid_argument);
    CHECK_THROWS_AS(service.requestBestMove(START_FEN, 21), std::invalid_argument);
    CHECK(engine.requestCommands().empty());

    auto result = service.requestBestMove(START_FEN, 20);
    CHECK(result.skillLevel == 20);
    CHECK(engine.hasCommand("go movetime 1100"));
}

TEST_CASE("EngineService applies the configured analysis depth") {
    ScriptedEngine engine;
    StubRules rules;
    EngineServiceConfig serviceConfig;
    serviceConfig.analysisDepth = 9;
    EngineService service(fastConfig(), serviceConfig, rules, engine.factory());
    service.initialize();

    service.requestAnalysis(START_FEN);
    CHECK(engine.hasCommand("go depth 9"));
    service.requestAnalysis(START_FEN, 3);
    CHECK(engine.hasCommand("go depth 3"));
}

TEST_CASE("EngineService rejects requests beyond the queue limit") {
    ScriptedEngine engine;
    engine.hangOnGo = true;
    StubRules rules;
    EngineServiceConfig serviceConfig;
    serviceConfig.maxQueueDepth = 1;
    EngineService service(fastConfig(), serviceConfig, rules, engine.factory());
    service.initialize();

    std::atomic<int> completed{ 0 };
    std::thread running([&] {
        service.requestAnalysis(START_FEN);
        ++completed;
        });
    REQUIRE(engine.waitForSearch());
    std::thread waiting([&] {
        service.requestBestMove(START_FEN, 0);
        ++completed;
        });
    waitForQueueDepth(service, 1);
    CHECK(service.getState() == EngineState::Busy);

    try {
        service.requestAnalysis(START_FEN);
        FAIL("request accepted beyond the queue limit");
    }
    catch (const EngineError& e) {
        CHECK(e.getKind() == EngineError::Kind::BusyRejection);
    }
    CHECK_THROWS_AS(service.requestBestMove(START_FEN, 5), EngineBusyRejection);

    engine.configure([](ScriptedEngine& e) { e.hangOnGo = false; });
    engine.finishSearch("bestmove e2e4\n");
    running.join();
    waiting.join();
    CHECK(completed == 2);
    CHECK(service.getState() == EngineState::Ready);
}

TEST_CASE("EngineService never runs two searches at once") {
    ScriptedEngine engine;
    engine.hangOnGo = true;
    StubRules rules;
    EngineService service(fastConfig(), EngineServiceConfig{}, rules, engine.factory());
    service.initialize();

    constexpr int requests = 6;
    std::atomic<int> succeeded{ 0 };
    std::vector<std::thread> clients;
    for (int i = 0; i < requests; ++i) {
        clients.emplace_back([&, i] {
            if (i % 2 == 0) {
                auto result = service.requestAnalysis(START_FEN, 4);
                if (result.size() == 1 && result[0].move == "c2c4") ++succeeded;
            }
            else {
                auto result = service.requestBestMove(START_FEN, i);
                if (result.move == "c2c4") ++succeeded;
            }
            });
    }
    for (int i = 0; i < requests; ++i) {
        REQUIRE(engine.waitForSearch());
        std::this_thread::sleep_for(2ms);
        engine.finishSearch("info depth 4 multipv 1 score cp 25 pv c2c4\nbestmove c2c4\n");
    }
    for (auto& client : clients) {
        client.join();
    }
    CHECK(succeeded == requests);
    CHECK_FALSE(engine.hadOverlappingSearch());
}

TEST_CASE("EngineService recovers from a crash by initialize") {
    ScriptedEngine engine;
    StubRules rules;
    EngineService service(fastConfig(), EngineServiceConfig{}, rules, engine.factory());
    service.initialize();

    engine.crash();
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (service.getState() != EngineState::Crashed && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    REQUIRE(service.getState() == EngineState::Crashed);
    CHECK_THROWS_AS(service.requestAnalysis(START_FEN), EngineNotReadyError);

    service.initialize();
    auto result = service.requestAnalysis(START_FEN);
    CHECK_FALSE(result.empty());
    service.shutdown();
    CHECK(service.getState() == EngineState::NotStarted);
}
