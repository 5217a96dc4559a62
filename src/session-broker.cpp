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

#include "session-broker.h"

#include <algorithm>

#include "engine-errors.h"
#include "logger.h"

SessionBroker::SessionBroker()
    : closeReason_(std::make_exception_ptr(EngineNotReadyError()))
{
}

std::shared_ptr<Ticket> SessionBroker::acquire(LineHandler& handler, Ticket::Clock::time_point deadline)
{
    std::unique_lock lock(mutex_);
    if (!open_)
    {
        std::rethrow_exception(closeReason_);
    }
    auto ticket = std::make_shared<Ticket>(Ticket::Key{}, nextId_++, handler);
    queue_.push_back(ticket);
    grantNext();

    while (ticket->state_ == Ticket::State::Queued)
    {
        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout && ticket->state_ == Ticket::State::Queued)
        {
            std::erase(queue_, ticket);
            ticket->state_ = Ticket::State::Resolved;
            throw EngineTimeoutError("request " + std::to_string(ticket->id_) + " timed out waiting for the engine");
        }
    }
    if (ticket->failure_)
    {
        std::rethrow_exception(ticket->failure_);
    }
    return ticket;
}

void SessionBroker::release(const std::shared_ptr<Ticket>& ticket)
{
    std::scoped_lock lock(mutex_);
    if (active_ == ticket)
    {
        active_.reset();
    }
    ticket->state_ = Ticket::State::Resolved;
    grantNext();
    cv_.notify_all();
}

bool SessionBroker::awaitCompletion(const std::shared_ptr<Ticket>& ticket, Ticket::Clock::time_point deadline)
{
    std::unique_lock lock(mutex_);
    cv_.wait_until(lock, deadline, [&] { return ticket->completed_ || ticket->failure_; });
    if (ticket->failure_)
    {
        std::rethrow_exception(ticket->failure_);
    }
    return ticket->completed_;
}

bool SessionBroker::dispatchLine(const std::string& line)
{
    std::scoped_lock lock(mutex_);
    if (!active_ || active_->completed_)
    {
        return false;
    }
    try
    {
        if (active_->handler_->onLine(line))
        {
            active_->completed_ = true;
            cv_.notify_all();
        }
    }
    catch (const std::exception& e)
    {
        Logger::serviceLogger().log("Request " + std::to_string(active_->id_) +
            " failed to process engine line \"" + line + "\": " + e.what(), TraceLevel::warning);
    }
    return true;
}

void SessionBroker::open()
{
    std::scoped_lock lock(mutex_);
    open_ = true;
    closeReason_ = nullptr;
    grantNext();
    cv_.notify_all();
}

void SessionBroker::close(std::exception_ptr reason)
{
    std::scoped_lock lock(mutex_);
    open_ = false;
    closeReason_ = reason;
    if (active_)
    {
        active_->failure_ = reason;
        active_->state_ = Ticket::State::Resolved;
        active_.reset();
    }
    for (auto& ticket : queue_)
    {
        ticket->failure_ = reason;
        ticket->state_ = Ticket::State::Resolved;
    }
    queue_.clear();
    cv_.notify_all();
}

bool SessionBroker::hasActiveTicket() const
{
    std::scoped_lock lock(mutex_);
    return active_ != nullptr;
}

size_t SessionBroker::getQueueDepth() const
{
    std::scoped_lock lock(mutex_);
    return queue_.size();
}

Ticket::State SessionBroker::getTicketState(const std::shared_ptr<Ticket>& ticket) const
{
    std::scoped_lock lock(mutex_);
    return ticket->state_;
}

void SessionBroker::grantNext()
{
    if (!open_ || active_ || queue_.empty())
    {
        return;
    }
    active_ = queue_.front();
    queue_.pop_front();
    active_->state_ = Ticket::State::Active;
    cv_.notify_all();
}
