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

#include <atomic>
#include <functional>
#include <thread>

#ifndef _WIN32
#include <signal.h>
#endif

 /**
  * @brief Calls a handler on its own thread when SIGINT or SIGTERM arrives.
  *
  * On POSIX systems the signals are blocked for the calling thread and for all threads
  * started afterwards, and a watcher thread collects them with sigtimedwait. Construct the
  * watcher before any other thread is started. On Windows a signal handler sets a flag
  * that the watcher thread polls.
  * The handler runs at most once. The signal mask is restored on destruction.
  */
class SignalWatcher {
public:
    using Handler = std::function<void(int signal)>;

    explicit SignalWatcher(Handler handler);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /**
     * @brief Ends the watcher thread without calling the handler.
     */
    void stop();

private:
    void watch();

    Handler handler_;
    std::atomic<bool> stopped_{ false };
#ifndef _WIN32
    sigset_t signals_;
    sigset_t previousMask_;
#endif
    std::thread thread_;
};
