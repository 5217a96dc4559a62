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
#include <mutex>
#include <string>
#include <string_view>
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <optional>

enum class TraceLevel : int {
    error,
    warning,
    command,
    handshake,
    info,
    none
};

/**
 * @brief Parses a trace level name as used on the command line.
 * @return The trace level or std::nullopt for an unknown name.
 */
inline std::optional<TraceLevel> parseTraceLevel(std::string_view name) {
    if (name == "error") return TraceLevel::error;
    if (name == "warning") return TraceLevel::warning;
    if (name == "command") return TraceLevel::command;
    if (name == "handshake") return TraceLevel::handshake;
    if (name == "info") return TraceLevel::info;
    if (name == "none") return TraceLevel::none;
    return std::nullopt;
}

/**
 * @brief Thread-safe logger with optional file output and trace filtering.
 *
 * Every message is written to the log file, if one is set. Messages with a trace
 * level at or below the threshold are echoed to the console output stream.
 */
class Logger {
public:
    Logger() : traceLevelThreshold_(TraceLevel::error), out_(&std::cout) {
    }

    ~Logger() {
        if (fileStream_.is_open()) {
            fileStream_.close();
        }
    }

    /**
     * @brief Logs a line of engine communication.
     * @param prefix Engine identifier.
     * @param message Line content (no newline required).
     * @param isOutput true if the engine sent the line, false if it was sent to the engine.
     * @param level Trace level of this message.
     */
    void log(std::string_view prefix, std::string_view message, bool isOutput, TraceLevel level = TraceLevel::info) {
        std::scoped_lock lock(mutex_);
        if (fileStream_.is_open()) {
            fileStream_ << timestamp() << ' ' << prefix << (isOutput ? " -> " : " <- ") << message << std::endl;
        }
        if (!isEchoed(level)) return;
        *out_ << prefix << (isOutput ? " -> " : " <- ") << message << std::endl;
    }

    /**
     * @brief Logs a message
     * @param message Log content (no newline required).
     * @param level Trace level of this message.
     */
    void log(std::string_view message, TraceLevel level = TraceLevel::command) {
        std::scoped_lock lock(mutex_);
        if (fileStream_.is_open()) {
            fileStream_ << timestamp() << ' ' << message << std::endl;
        }
        if (!isEchoed(level)) return;
        *out_ << message << std::endl;
    }

    /**
     * @brief Sets the output log file.
     * @param basename Path and base name; a timestamp and ".log" are appended.
     */
    void setLogFile(const std::string& basename) {
        std::scoped_lock lock(mutex_);
        filename_ = generateTimestampedFilename(basename);
        fileStream_.close();
        fileStream_.open(filename_, std::ios::app);
    }

    void setTraceLevel(TraceLevel level) {
        std::scoped_lock lock(mutex_);
        traceLevelThreshold_ = level;
    }

    /**
     * @brief Redirects the console echo, e.g. to std::cerr to keep stdout for results.
     */
    void setOutputStream(std::ostream& out) {
        std::scoped_lock lock(mutex_);
        out_ = &out;
    }

    /**
     * @brief Logger for the raw protocol traffic with the engine.
     */
    static Logger& engineLogger() {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Logger for lifecycle, request and error reports.
     */
    static Logger& serviceLogger() {
        static Logger instance;
        return instance;
    }

private:

    bool isEchoed(TraceLevel level) const {
        return traceLevelThreshold_ != TraceLevel::none && level <= traceLevelThreshold_;
    }

    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto nowTime = system_clock::to_time_t(now);
        auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
        std::tm localTm;
#ifdef _WIN32
        localtime_s(&localTm, &nowTime);
#else
        localtime_r(&nowTime, &localTm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&localTm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count();
        return oss.str();
    }

    std::string generateTimestampedFilename(const std::string& baseName) {
        using namespace std::chrono;

        auto now = system_clock::now();
        auto now_time_t = system_clock::to_time_t(now);
        auto now_ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

        std::tm local_tm;
#ifdef _WIN32
        localtime_s(&local_tm, &now_time_t);
#else
        localtime_r(&now_time_t, &local_tm);
#endif

        std::ostringstream oss;
        oss << baseName << '-'
            << std::put_time(&local_tm, "%Y-%m-%d_%H-%M-%S")
            << '.' << std::setw(3) << std::setfill('0') << now_ms.count()
            << ".log";
        return oss.str();
    }

    std::mutex mutex_;
    std::ofstream fileStream_;
    TraceLevel traceLevelThreshold_;
    std::ostream* out_;
    std::string filename_;
};
