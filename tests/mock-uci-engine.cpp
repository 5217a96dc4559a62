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
 * Minimal UCI engine for the process tests. Answers are written in fragments to
 * exercise the line reassembly of the broker. A start notice goes to stderr.
 *
 * Options:
 *   --crash-on-go   exit with code 3 on "go"
 *   --hang          do not answer "go" before "stop"
 *   --ignore-quit   keep running after "quit"
 *   --no-uciok      never finish the handshake
 */

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "string-helper.h"

namespace {
    struct Behaviour {
        bool crashOnGo = false;
        bool hang = false;
        bool ignoreQuit = false;
        bool noUciOk = false;
    };

    void sendFragmented(const std::string& text) {
        const size_t half = text.size() / 2;
        std::cout << text.substr(0, half) << std::flush;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        std::cout << text.substr(half) << std::flush;
    }

    void sendSearchResult() {
        sendFragmented("info depth 1 multipv 1 score cp 12 pv e2e4 e7e5\r\n"
            "info depth 1 multipv 2 score cp 8 pv d2d4\r\nbestmove e2e4 ponder e7e5\r\n");
    }

    void idleForever() {
        while (true) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
}

int main(int argc, char* argv[]) {
    Behaviour behaviour;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--crash-on-go") behaviour.crashOnGo = true;
        else if (arg == "--hang") behaviour.hang = true;
        else if (arg == "--ignore-quit") behaviour.ignoreQuit = true;
        else if (arg == "--no-uciok") behaviour.noUciOk = true;
        else {
            std::cerr << "Unknown option " << arg << std::endl;
            return 2;
        }
    }

    std::cerr << "mock engine started" << std::endl;

    bool searching = false;
    std::string line;
    while (std::getline(std::cin, line)) {
        auto words = splitWords(line);
        if (words.empty()) continue;
        const std::string& command = words[0];
        if (command == "uci") {
            sendFragmented("id name Mock UCI Engine\nid author engine-broker\n"
                "option name Skill Level type spin default 20 min 0 max 20\n"
                "option name MultiPV type spin default 1 min 1 max 4\n");
            if (!behaviour.noUciOk) sendFragmented("uciok\n");
        }
        else if (command == "isready") {
            sendFragmented("readyok\n");
        }
        else if (command == "go") {
            if (behaviour.crashOnGo) {
                std::_Exit(3);
            }
            if (behaviour.hang) {
                searching = true;
            }
            else {
                sendSearchResult();
            }
        }
        else if (command == "stop") {
            if (searching) {
                searching = false;
                sendFragmented("bestmove d2d4\n");
            }
        }
        else if (command == "quit") {
            if (!behaviour.ignoreQuit) return 0;
        }
    }
    if (behaviour.ignoreQuit) {
        idleForever();
    }
    return 0;
}
