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

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <string>

#include "line-handler.h"

class SessionBroker;

/**
 * @brief One exclusive occupation of the engine, granted to one request.
 *
 * A ticket is Queued until the broker grants it, Active while it owns the engine
 * and Resolved once it is released, timed out or failed.
 */
class Ticket {
public:
    using Clock = std::chrono::steady_clock;

    enum class State {
        Queued,
        Active,
        Resolved
    };

    /**
     * @brief Restricts the creation of tickets to the SessionBroker.
     */
    class Key {
        friend class SessionBroker;
        Key() = default;
    };

    Ticket(Key, uint64_t id, LineHandler& handler)
        : id_(id), handler_(&handler) {
    }

    uint64_t getId() const { return id_; }

private:
    friend class SessionBroker;

    uint64_t id_;
    LineHandler* handler_;
    State state_ = State::Queued;
    bool completed_ = false;
    std::exception_ptr failure_;
};

/**
 * @brief Serializes the conversations with the engine.
 *
 * Requests are granted strictly in arrival order and only while the broker is open,
 * i.e. while the engine is ready. At most one ticket is active at any time. Engine
 * output is delivered to the handler of the active ticket and to nobody else.
 * All waiting is done on one condition variable, nothing polls.
 */
class SessionBroker {
public:
    SessionBroker();

    SessionBroker(const SessionBroker&) = delete;
    SessionBroker& operator=(const SessionBroker&) = delete;

    /**
     * @brief Waits until the engine is granted to the caller.
     *
     * @param handler Receives the engine lines while the ticket is active. Must outlive the ticket.
     * @param deadline A ticket still queued at the deadline is removed from the queue.
     * @return The active ticket.
     * @throws EngineTimeoutError if the deadline passes while queued.
     * @throws the close reason (e.g. EngineShutdownError, EngineCrashError) if the broker
     *         is closed or gets closed while the ticket is queued.
     */
    std::shared_ptr<Ticket> acquire(LineHandler& handler, Ticket::Clock::time_point deadline);

    /**
     * @brief Ends the ticket and grants the engine to the next queued ticket.
     * Releasing a ticket that is no longer active has no effect.
     */
    void release(const std::shared_ptr<Ticket>& ticket);

    /**
     * @brief Waits until the handler of the ticket reported the terminating line.
     * @return true if the conversation completed, false if the deadline passed first.
     * @throws the failure the ticket was resolved with (crash or shutdown).
     */
    bool awaitCompletion(const std::shared_ptr<Ticket>& ticket, Ticket::Clock::time_point deadline);

    /**
     * @brief Delivers an engine line to the handler of the active ticket.
     * @return false if no ticket is listening and the line was discarded.
     */
    bool dispatchLine(const std::string& line);

    /**
     * @brief Starts granting tickets. Called when the engine became ready.
     */
    void open();

    /**
     * @brief Stops granting tickets and fails the active and all queued tickets.
     * @param reason Exception delivered to every affected request and to later acquire calls.
     */
    void close(std::exception_ptr reason);

    bool hasActiveTicket() const;
    size_t getQueueDepth() const;
    Ticket::State getTicketState(const std::shared_ptr<Ticket>& ticket) const;

private:
    void grantNext();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<Ticket>> queue_;
    std::shared_ptr<Ticket> active_;
    bool open_ = false;
    std::exception_ptr closeReason_;
    uint64_t nextId_ = 1;
};

/**
 * @brief Releases a ticket exactly once when leaving scope.
 */
class TicketGuard {
public:
    TicketGuard(SessionBroker& broker, std::shared_ptr<Ticket> ticket)
        : broker_(broker), ticket_(std::move(ticket)) {
    }

    ~TicketGuard() {
        release();
    }

    TicketGuard(const TicketGuard&) = delete;
    TicketGuard& operator=(const TicketGuard&) = delete;

    void release() {
        if (ticket_) {
            broker_.release(ticket_);
            ticket_.reset();
        }
    }

private:
    SessionBroker& broker_;
    std::shared_ptr<Ticket> ticket_;
};
