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

#include <optional>
#include <string>

#include "line-handler.h"

/**
 * @brief Waits for the first bestmove line of a "go movetime" search.
 */
class BestMoveHandler : public LineHandler {
public:
    bool onLine(const std::string& line) override;

    /**
     * @brief The move reported by the engine, std::nullopt if it reported none.
     */
    const std::optional<std::string>& getMove() const {
        return move_;
    }

    const std::optional<std::string>& getPonder() const {
        return ponder_;
    }

    bool isFinished() const {
        return finished_;
    }

private:
    std::optional<std::string> move_;
    std::optional<std::string> ponder_;
    bool finished_ = false;
};
