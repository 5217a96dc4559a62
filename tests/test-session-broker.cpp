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
#include <chrono>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

#include "engine-errors.h"
#include "session-broker.h"

using namespace std::chrono_literals;

namespace {
    class RecordingHandler : public LineHandler {
    public:
        bool onLine(const std::string& line) override {
            lines.push_back(line);
            return line == "done";
        }
        std::vector<std::string> lines;
    };

    Ticket::Clock::time_point in(std::chrono::milliseconds duration) {
        return Ticket::Clock::now() + duration;
    }

    void waitForQueueDepth(const SessionBroker& broker, size_t depth) {
        auto deadline = in(5s);
        while (broker.getQueueDepth() != depth && Ticket::Clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        REQUIRE(broker.getQueueDepth() == depth);
    }
}

TEST_CASE("SessionBroker refuses tickets before it is opened") {
    SessionBroker broker;
    RecordingHandler handler;
    CHECK_THROWS_AS(broker.acquire(handler, in(1s)), EngineNotReadyError);
}

TEST_CASE("SessionBroker grants the engine immediately when idle") {
    SessionBroker broker;
    broker.open();
    RecordingHandler handler;
    auto ticket = broker.acquire(handler, in(1s));
    CHECK(broker.getTicketState(ticket) == Ticket::State::Active);
    CHECK(broker.hasActiveTicket());
    broker.release(ticket);
    CHECK(broker.getTicketState(ticket) == Ticket::State::Resolved);
    CHECK_FALSE(broker.hasActiveTicket());
}

TEST_CASE("SessionBroker delivers lines to the active ticket only") {
    SessionBroker broker;
    broker.open();
    CHECK_FALSE(broker.dispatchLine("info depth 1"));

    RecordingHandler handler;
    auto ticket = broker.acquire(handler, in(1s));
    CHECK(broker.dispatchLine("info depth 1"));
    CHECK_FALSE(broker.awaitCompletion(ticket, in(10ms)));
    CHECK(broker.dispatchLine("done"));
    CHECK(broker.awaitCompletion(ticket, in(1s)));
    // completed tickets do not receive more output
    CHECK_FALSE(broker.dispatchLine("late"));
    CHECK(handler.lines == std::vector<std::string>{ "info depth 1", "done" });
    broker.release(ticket);
}

TEST_CASE("SessionBroker grants waiting tickets in arrival order") {
    SessionBroker broker;
    broker.open();
    RecordingHandler first;
    auto firstTicket = broker.acquire(first, in(5s));

    std::mutex orderMutex;
    std::vector<int> order;
    std::atomic<int> concurrent{ 0 };
    std::atomic<bool> overlap{ false };
    std::vector<std::thread> threads;
    std::vector<RecordingHandler> handlers(3);
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&, i] {
            auto ticket = broker.acquire(handlers[i], in(5s));
            if (++concurrent > 1) overlap = true;
            {
                std::scoped_lock lock(orderMutex);
                order.push_back(i);
            }
            std::this_thread::sleep_for(5ms);
            --concurrent;
            broker.release(ticket);
            });
        // the queue position is taken when acquire is entered
        waitForQueueDepth(broker, static_cast<size_t>(i + 1));
    }
    broker.release(firstTicket);
    for (auto& thread : threads) {
        thread.join();
    }
    CHECK(order == std::vector<int>{ 0, 1, 2 });
    CHECK_FALSE(overlap);
    CHECK(broker.getQueueDepth() == 0);
}

TEST_CASE("SessionBroker removes a ticket that times out in the queue") {
    SessionBroker broker;
    broker.open();
    RecordingHandler first;
    RecordingHandler second;
    auto active = broker.acquire(first, in(5s));
    CHECK_THROWS_AS(broker.acquire(second, in(20ms)), EngineTimeoutError);
    CHECK(broker.getQueueDepth() == 0);
    CHECK(broker.getTicketState(active) == Ticket::State::Active);
    broker.release(active);
}

TEST_CASE("SessionBroker close fails the active and the queued tickets") {
    SessionBroker broker;
    broker.open();
    RecordingHandler first;
    RecordingHandler second;
    auto active = broker.acquire(first, in(5s));

    std::atomic<bool> queuedFailed{ false };
    std::thread waiting([&] {
        try {
            broker.acquire(second, in(5s));
        }
        catch (const EngineCrashError&) {
            queuedFailed = true;
        }
        });
    waitForQueueDepth(broker, 1);

    broker.close(std::make_exception_ptr(EngineCrashError("engine exited")));
    waiting.join();
    CHECK(queuedFailed);
    CHECK_THROWS_AS(broker.awaitCompletion(active, in(1s)), EngineCrashError);
    CHECK(broker.getTicketState(active) == Ticket::State::Resolved);
    CHECK_FALSE(broker.hasActiveTicket());
    CHECK_FALSE(broker.dispatchLine("bestmove e2e4"));

    // releasing after the failure has no effect
    broker.release(active);
    RecordingHandler third;
    CHECK_THROWS_AS(broker.acquire(third, in(1s)), EngineCrashError);
}

TEST_CASE("SessionBroker accepts tickets again after reopening") {
    SessionBroker broker;
    broker.open();
    broker.close(std::make_exception_ptr(EngineShutdownError()));
    RecordingHandler handler;
    CHECK_THROWS_AS(broker.acquire(handler, in(1s)), EngineShutdownError);
    broker.open();
    auto ticket = broker.acquire(handler, in(1s));
    TicketGuard guard(broker, ticket);
    CHECK(broker.hasActiveTicket());
    guard.release();
    guard.release();
    CHECK_FALSE(broker.hasActiveTicket());
}

TEST_CASE("SessionBroker numbers tickets in arrival order") {
    SessionBroker broker;
    broker.open();
    RecordingHandler handler;
    auto first = broker.acquire(handler, in(1s));
    broker.release(first);
    auto second = broker.acquire(handler, in(1s));
    broker.release(second);
    CHECK(second->getId() > first->getId());
    CHECK(broker.getTicketState(first) == Ticket::State::Resolved);
}

TEST_CASE("SessionBroker keeps the arrival order under varying hold times") {
    constexpr int waiters = 8;
    std::mt19937 random(4711);
    std::uniform_int_distribution<int> holdMs(0, 3);

    for (int round = 0; round < 10; ++round) {
        CAPTURE(round);
        SessionBroker broker;
        broker.open();
        RecordingHandler first;
        auto firstTicket = broker.acquire(first, in(5s));

        std::vector<int> holds;
        for (int i = 0; i < waiters; ++i) {
            holds.push_back(holdMs(random));
        }

        std::mutex orderMutex;
        std::vector<int> order;
        std::atomic<int> concurrent{ 0 };
        std::atomic<bool> overlap{ false };
        std::vector<RecordingHandler> handlers(waiters);
        std::vector<std::thread> threads;
        for (int i = 0; i < waiters; ++i) {
            threads.emplace_back([&, i] {
                auto ticket = broker.acquire(handlers[i], in(10s));
                if (++concurrent > 1) overlap = true;
                {
                    std::scoped_lock lock(orderMutex);
                    order.push_back(i);
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(holds[i]));
                --concurrent;
                broker.release(ticket);
                });
            waitForQueueDepth(broker, static_cast<size_t>(i + 1));
        }
        broker.release(firstTicket);
        for (auto& thread : threads) {
            thread.join();
        }

        std::vector<int> expected(waiters);
        for (int i = 0; i < waiters; ++i) {
            expected[i] = i;
        }
        CHECK(order == expected);
        CHECK_FALSE(overlap);
    }
}
