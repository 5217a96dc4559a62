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

#include <string>

/**
 * @brief Receives the engine output lines of one conversation.
 *
 * Exactly one handler receives lines at a time: the one of the active ticket.
 * Handlers are called from the reader thread and must not throw on malformed input.
 */
class LineHandler {
public:
    virtual ~LineHandler() = default;

    /**
     * @brief Processes one complete line from the engine.
     * @param line Line without line terminator.
     * @return true if the line terminated the conversation.
     */
    virtual bool onLine(const std::string& line) = 0;
};
