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
#include <cstdint>

/**
 * Measures elapsed wall time of a request in milliseconds on the steady clock.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    static int64_t getCurrentTimeMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now().time_since_epoch()).count();
    }

    /**
     * @brief Returns the point in time the given duration from now.
     */
    static Clock::time_point deadlineIn(std::chrono::milliseconds duration) {
        return Clock::now() + duration;
    }

    void start() {
        start_ = getCurrentTimeMs();
    }

    int64_t elapsedMs() const {
        return getCurrentTimeMs() - start_;
    }

private:

    int64_t start_{};
};
