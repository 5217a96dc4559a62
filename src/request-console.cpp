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

#include "request-console.h"

#include <optional>
#include <stdexcept>

#include "engine-errors.h"
#include "engine-service.h"
#include "logger.h"
#include "string-helper.h"

RequestConsole::RequestConsole(EngineService& service, std::ostream& out)
    : service_(service), out_(out) {
}

RequestConsole::~RequestConsole() {
    waitForRequests();
}

void RequestConsole::run(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (!handleLine(line)) {
            break;
        }
    }
    waitForRequests();
    service_.shutdown();
}

bool RequestConsole::handleLine(const std::string& line) {
    auto words = splitWords(line);
    if (words.empty()) {
        return true;
    }
    const std::string command = to_lowercase(words[0]);
    std::vector<std::string> args(words.begin() + 1, words.end());

    if (command == "quit" || command == "q") {
        return false;
    }
    else if (command == "analyze" || command == "a") {
        launch([this, args] { return analyze(args); });
    }
    else if (command == "move" || command == "m") {
        launch([this, args] { return move(args); });
    }
    else if (command == "init") {
        launch([this] { return initialize(); });
    }
    else if (command == "status" || command == "?") {
        print("status: " + to_string(service_.getState()) + ", waiting: " + std::to_string(service_.getQueueDepth()));
    }
    else if (command == "help" || command == "h") {
        std::scoped_lock lock(outMutex_);
        showHelp(out_);
    }
    else {
        print("Unknown command: " + command);
    }
    return true;
}

void RequestConsole::showHelp(std::ostream& out) {
    out
        << "Available commands:\n"
        << "  analyze | a <fen> [depth]  - Up to three best moves, mating moves marked with +mate\n"
        << "  move | m <skill> <fen>     - Engine move at skill level 0..20\n"
        << "  init                       - Start the engine again after a crash\n"
        << "  status | ?                 - Show the engine state\n"
        << "  quit | q                   - Wait for running requests and exit\n"
        << "  help | h                   - Show this help message\n";
}

void RequestConsole::launch(std::function<std::string()> request) {
    std::scoped_lock lock(requestsMutex_);
    joinFinished();
    int id = nextRequestId_++;
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([this, id, done, request = std::move(request)] {
        std::string result;
        try {
            result = request();
        }
        catch (const EngineError& e) {
            result = std::string("error: ") + e.what();
        }
        catch (const std::exception& e) {
            result = std::string("error: ") + e.what();
            Logger::serviceLogger().log("Request " + std::to_string(id) + " failed: " + e.what(), TraceLevel::error);
        }
        print("#" + std::to_string(id) + " " + result);
        *done = true;
    });
    requests_.push_back(RunningRequest{ std::move(thread), std::move(done) });
}

void RequestConsole::joinFinished() {
    // requires requestsMutex_
    std::erase_if(requests_, [](RunningRequest& request) {
        if (!*request.done) {
            return false;
        }
        request.thread.join();
        return true;
    });
}

size_t RequestConsole::getTrackedRequests() {
    std::scoped_lock lock(requestsMutex_);
    joinFinished();
    return requests_.size();
}

void RequestConsole::print(const std::string& line) {
    std::scoped_lock lock(outMutex_);
    out_ << line << std::endl;
}

void RequestConsole::waitForRequests() {
    std::vector<RunningRequest> running;
    {
        std::scoped_lock lock(requestsMutex_);
        running.swap(requests_);
    }
    for (auto& request : running) {
        if (request.thread.joinable()) {
            request.thread.join();
        }
    }
}

std::string RequestConsole::analyze(const std::vector<std::string>& args) {
    // a fen has six fields, a seventh word is the depth
    if (args.size() < 6 || args.size() > 7) {
        throw std::invalid_argument("Usage: analyze <fen> [depth]");
    }
    std::optional<int> depth;
    if (args.size() == 7) {
        depth = parseInteger(args[6]);
        if (!depth) {
            throw std::invalid_argument("Depth must be an integer: " + args[6]);
        }
    }
    std::vector<std::string> fenWords(args.begin(), args.begin() + 6);
    auto result = service_.requestAnalysis(joinWords(fenWords), depth);
    std::string text = "bestmoves:";
    for (const auto& move : result) {
        text += " " + move.move + (move.isCheckmate ? "+mate" : "");
    }
    if (result.empty()) {
        text += " (none)";
    }
    return text;
}

std::string RequestConsole::move(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        throw std::invalid_argument("Usage: move <skill> <fen>");
    }
    auto skill = parseInteger(args[0]);
    if (!skill) {
        throw std::invalid_argument("Skill level must be an integer: " + args[0]);
    }
    auto result = service_.requestBestMove(joinWords(args, 1), *skill);
    return "move: " + result.move.value_or("none");
}

std::string RequestConsole::initialize() {
    service_.initialize();
    return "status: " + to_string(service_.getState());
}
