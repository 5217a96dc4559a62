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

#include "chess-rules.h"

#include <chess.hpp>

#include "fen-scanner.h"
#include "uci-parser.h"

namespace {

    /**
     * Sets up a board for a fen that passed the FenScanner.
     * @return std::nullopt if the chess-library rejects the position.
     */
    std::optional<chess::Board> loadBoard(const std::string& fen) {
        FenScanner scanner;
        if (scanner.check(fen)) {
            return std::nullopt;
        }
        try {
            return chess::Board(fen);
        }
        catch (const std::exception&) {
            return std::nullopt;
        }
    }

    std::optional<chess::Move> findLegalMove(const chess::Board& board, const std::string& move) {
        chess::Movelist moves;
        chess::movegen::legalmoves(moves, board);
        for (const auto& candidate : moves) {
            if (chess::uci::moveToUci(candidate, board.chess960()) == move) {
                return candidate;
            }
        }
        return std::nullopt;
    }
}

std::optional<std::string> ChessRules::validatePosition(const std::string& fen) const {
    FenScanner scanner;
    if (auto error = scanner.check(fen)) {
        return error;
    }
    try {
        chess::Board board(fen);
    }
    catch (const std::exception& e) {
        return std::string("position rejected: ") + e.what();
    }
    return std::nullopt;
}

std::optional<std::string> ChessRules::applyMove(const std::string& fen, const std::string& move) const {
    if (!isLanMoveToken(move)) {
        return std::nullopt;
    }
    auto board = loadBoard(fen);
    if (!board) {
        return std::nullopt;
    }
    auto legalMove = findLegalMove(*board, move);
    if (!legalMove) {
        return std::nullopt;
    }
    board->makeMove(*legalMove);
    return board->getFen();
}

bool ChessRules::isCheckmate(const std::string& fen) const {
    auto board = loadBoard(fen);
    if (!board || !board->inCheck()) {
        return false;
    }
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, *board);
    return moves.empty();
}
