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

#include <atomic>
#include <functional>
#include <memory>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class EngineService;

 /**
  * @brief Reads request lines and runs each request on its own thread.
  *
  * Requests submitted while others are running are queued by the session broker
  * of the service. Results are printed as one line each, prefixed with the request number.
  */
class RequestConsole {
public:
    RequestConsole(EngineService& service, std::ostream& out);

    /**
     * @brief Waits for running requests.
     */
    ~RequestConsole();

    RequestConsole(const RequestConsole&) = delete;
    RequestConsole& operator=(const RequestConsole&) = delete;

    /**
     * @brief Processes lines until "quit" or end of input, then waits for the running requests
     *        and shuts the engine down.
     */
    void run(std::istream& in);

    /**
     * @brief Processes one command line.
     * @return false if the line requested to quit.
     */
    bool handleLine(const std::string& line);

    /**
     * @brief Blocks until every request started so far has printed its result.
     */
    void waitForRequests();

    /**
     * @brief Number of request threads not yet joined, running or finished.
     */
    size_t getTrackedRequests();

    static void showHelp(std::ostream& out);

private:
    struct RunningRequest {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void launch(std::function<std::string()> request);
    void joinFinished();
    void print(const std::string& line);

    std::string analyze(const std::vector<std::string>& args);
    std::string move(const std::vector<std::string>& args);
    std::string initialize();

    EngineService& service_;
    std::ostream& out_;
    std::mutex outMutex_;
    std::mutex requestsMutex_;
    std::vector<RunningRequest> requests_;
    int nextRequestId_ = 1;
};
