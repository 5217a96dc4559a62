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

#include "rules-engine.h"

/**
 * @brief Rules collaborator based on the chess-library (chess.hpp).
 *
 * Positions are checked structurally by the FenScanner before a board is set up,
 * moves are matched against the generated legal move list.
 */
class ChessRules : public RulesEngine {
public:
    std::optional<std::string> validatePosition(const std::string& fen) const override;
    std::optional<std::string> applyMove(const std::string& fen, const std::string& move) const override;
    bool isCheckmate(const std::string& fen) const override;
};
