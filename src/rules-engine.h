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

/**
 * @brief Chess rules used to validate positions and to tag checkmating moves.
 */
class RulesEngine {
public:
    virtual ~RulesEngine() = default;

    /**
     * @brief Checks a position in FEN notation.
     * @return std::nullopt if the position is valid, otherwise a description of the problem.
     */
    virtual std::optional<std::string> validatePosition(const std::string& fen) const = 0;

    /**
     * @brief Plays a move in long algebraic notation.
     * @return The FEN of the resulting position or std::nullopt if the move is illegal.
     */
    virtual std::optional<std::string> applyMove(const std::string& fen, const std::string& move) const = 0;

    /**
     * @brief Checks whether the side to move is checkmated.
     */
    virtual bool isCheckmate(const std::string& fen) const = 0;
};
