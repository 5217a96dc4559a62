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

#include "bestmove-handler.h"
#include "uci-parser.h"

bool BestMoveHandler::onLine(const std::string& line) {
    if (finished_) {
        return true;
    }
    auto bestMove = parseBestMove(line);
    if (!bestMove) {
        return false;
    }
    move_ = bestMove->move;
    ponder_ = bestMove->ponder;
    finished_ = true;
    return true;
}
