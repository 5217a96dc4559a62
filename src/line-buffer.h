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
#include <string_view>
#include <vector>

/**
 * @brief Splits the raw byte stream of the engine's stdout into complete lines.
 *
 * The buffer always holds exactly the trailing incomplete line fragment. The lines
 * produced are identical no matter how the stream is cut into chunks.
 */
class LineBuffer {
public:
    /**
     * @brief Appends a chunk and returns every line completed by it.
     *
     * A trailing '\r' is removed from each line, whitespace-only lines are skipped.
     * @param chunk Raw bytes as read from the pipe.
     * @return Complete lines in the order the engine emitted them.
     */
    std::vector<std::string> append(std::string_view chunk);

    /**
     * @brief Returns the incomplete fragment held since the last line break.
     */
    const std::string& getPending() const {
        return pending_;
    }

    void clear() {
        pending_.clear();
    }

private:
    std::string pending_;
};
