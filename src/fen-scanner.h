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
/**
 * Scans a fen string
 */

#pragma once

#include <string>
#include <optional>
#include <cstdint>

	/**
	 * Checks the structure of a fen string without setting up a board.
	 * Accepts the piece sector followed by side to move, castling rights, en passant
	 * field and the two move counters.
	 */
	class FenScanner {
	public:

		/**
		 * @returns std::nullopt if the fen is well formed, otherwise the first error found
		 */
		std::optional<std::string> check(const std::string& fen) {
			std::string::const_iterator fenIterator = fen.begin();
			error.reset();
			whiteKings = 0;
			blackKings = 0;
			whiteToMove = true;

			scanPieceSector(fen, fenIterator);
			if (!error && !skipBlank(fen, fenIterator)) fail("missing side to move");
			if (!error) scanSideToMove(fen, fenIterator);
			if (!error && !skipBlank(fen, fenIterator)) fail("missing castling rights");
			if (!error) scanCastlingRights(fen, fenIterator);
			if (!error && !skipBlank(fen, fenIterator)) fail("missing en passant field");
			if (!error) scanEPField(fen, fenIterator);
			if (!error && !skipBlank(fen, fenIterator)) fail("missing halfmove clock");
			if (!error && !scanInteger(fen, fenIterator, 0)) fail("halfmove clock is not a number");
			if (!error && !skipBlank(fen, fenIterator)) fail("missing move number");
			if (!error && !scanInteger(fen, fenIterator, 1)) fail("move number must be a positive number");
			if (!error && fenIterator != fen.end()) fail("unexpected characters after move number");

			if (!error && whiteKings != 1) fail("white must have exactly one king");
			if (!error && blackKings != 1) fail("black must have exactly one king");
			return error;
		}

	private:

		std::optional<std::string> error;
		int whiteKings = 0;
		int blackKings = 0;
		bool whiteToMove = true;

		void fail(const std::string& message) {
			if (!error) error = message;
		}

		/**
		 * Scans the piece sector of a fen std::string
		 */
		void scanPieceSector(const std::string& fen, std::string::const_iterator& fenIterator) {

			int file = 0;
			int rank = 7;

			for (; fenIterator != fen.end() && !error; ++fenIterator) {
				char curChar = *fenIterator;
				if (curChar == ' ') {
					break;
				}
				else if (curChar == '/') {
					if (file != 8) fail("rank " + std::to_string(rank + 1) + " does not have 8 squares");
					file = 0;
					rank--;
					if (rank < 0) fail("too many ranks");
				}
				else if (isPieceChar(curChar)) {
					if ((curChar == 'P' || curChar == 'p') && (rank == 0 || rank == 7)) {
						fail("pawn on the first or last rank");
					}
					if (curChar == 'K') whiteKings++;
					if (curChar == 'k') blackKings++;
					file++;
				}
				else if (isColChar(curChar)) {
					file += (curChar - '0');
				}
				else {
					fail(std::string("invalid character '") + curChar + "' in piece placement");
				}
				if (file > 8) fail("rank " + std::to_string(rank + 1) + " has more than 8 squares");
			}

			if (!error && (file != 8 || rank != 0)) {
				fail("piece placement must describe 8 ranks of 8 squares");
			}
		}

		/**
		 * Skips a mandatory blank
		 */
		bool skipBlank(const std::string& fen, std::string::const_iterator& fenIterator) {
			if (fenIterator != fen.end() && *fenIterator == ' ') {
				++fenIterator;
				return true;
			}
			return false;
		}

		/**
		 * Scans the side to move, either "w" or "b"
		 */
		void scanSideToMove(const std::string& fen, std::string::const_iterator& fenIterator) {
			if (fenIterator == fen.end() || (*fenIterator != 'w' && *fenIterator != 'b')) {
				fail("side to move must be 'w' or 'b'");
				return;
			}
			whiteToMove = *fenIterator == 'w';
			++fenIterator;
		}

		/**
		 * Scans the castling rights section 'K', 'Q' for white rights and 'k', 'q' for black rights
		 * Or '-' for no castling rights
		 */
		void scanCastlingRights(const std::string& fen, std::string::const_iterator& fenIterator) {
			if (fenIterator != fen.end() && *fenIterator == '-') {
				++fenIterator;
				return;
			}
			bool castlingRightsFound = false;
			for (char right : std::string("KQkq")) {
				if (fenIterator != fen.end() && *fenIterator == right) {
					castlingRightsFound = true;
					++fenIterator;
				}
			}
			if (!castlingRightsFound || (fenIterator != fen.end() && *fenIterator != ' ')) {
				fail("invalid castling rights");
			}
		}

		/**
		 * Scans an EN-Passant-Field, rank 6 with white to move, rank 3 with black to move
		 */
		void scanEPField(const std::string& fen, std::string::const_iterator& fenIterator) {
			if (fenIterator != fen.end() && *fenIterator == '-') {
				++fenIterator;
				return;
			}
			if (fenIterator == fen.end() || *fenIterator < 'a' || *fenIterator > 'h') {
				fail("invalid en passant field");
				return;
			}
			++fenIterator;
			char expectedRank = whiteToMove ? '6' : '3';
			if (fenIterator == fen.end() || *fenIterator != expectedRank) {
				fail("invalid en passant field");
				return;
			}
			++fenIterator;
		}

		/**
		 * Scans a non negative integer in the fen
		 */
		bool scanInteger(const std::string& fen, std::string::const_iterator& fenIterator, uint32_t minValue) {
			uint32_t result = 0;
			bool found = false;
			while (fenIterator != fen.end() && *fenIterator >= '0' && *fenIterator <= '9') {
				if (result > 100000) return false;
				result *= 10;
				result += *fenIterator - '0';
				found = true;
				++fenIterator;
			}
			return found && result >= minValue;
		}

		bool isPieceChar(char pieceChar) {
			std::string supportedChars = "PpNnBbRrQqKk";
			return supportedChars.find(pieceChar) != std::string::npos;
		}

		bool isColChar(char colChar) {
			std::string supportedChars = "12345678";
			return supportedChars.find(colChar) != std::string::npos;
		}

	};
