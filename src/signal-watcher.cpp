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

#include "signal-watcher.h"

#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>
#include <cstring>

#include "logger.h"

namespace {
    constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);
#ifdef _WIN32
    std::atomic<int> pendingSignal{ 0 };

    void onSignal(int signal) {
        pendingSignal = signal;
    }
#endif
}

SignalWatcher::SignalWatcher(Handler handler)
    : handler_(std::move(handler))
{
#ifdef _WIN32
    pendingSignal = 0;
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
#else
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    int error = pthread_sigmask(SIG_BLOCK, &signals_, &previousMask_);
    if (error != 0) {
        throw std::runtime_error(std::string("Failed to block signals: ") + strerror(error));
    }
#endif
    thread_ = std::thread(&SignalWatcher::watch, this);
}

SignalWatcher::~SignalWatcher() {
    stop();
#ifdef _WIN32
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#else
    pthread_sigmask(SIG_SETMASK, &previousMask_, nullptr);
#endif
}

void SignalWatcher::stop() {
    stopped_ = true;
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void SignalWatcher::watch() {
    while (!stopped_) {
#ifdef _WIN32
        std::this_thread::sleep_for(POLL_INTERVAL);
        int signal = pendingSignal.exchange(0);
        if (signal == 0) continue;
#else
        timespec timeout{ 0, static_cast<long>(std::chrono::nanoseconds(POLL_INTERVAL).count()) };
        int signal = sigtimedwait(&signals_, nullptr, &timeout);
        if (signal < 0) continue;
#endif
        if (stopped_) return;
        Logger::serviceLogger().log("Received signal " + std::to_string(signal) + ", shutting down",
            TraceLevel::warning);
        stopped_ = true;
        try {
            handler_(signal);
        }
        catch (const std::exception& e) {
            Logger::serviceLogger().log(std::string("Signal handler failed: ") + e.what(), TraceLevel::error);
        }
    }
}
