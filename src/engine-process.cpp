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

#include "engine-process.h"
#include "line-buffer.h"
#include "logger.h"

#include <stdexcept>
#include <vector>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <thread>
#include <string>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <signal.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif
#endif

EngineProcess::EngineProcess(const std::filesystem::path &path,
                             const std::optional<std::filesystem::path> &workingDir,
                             const std::vector<std::string> &arguments,
                             std::string identifier)
    : executablePath_(path), workingDirectory_(workingDir), arguments_(arguments), identifier_(std::move(identifier))
{
    if (!std::filesystem::exists(path))
    {
        throw std::runtime_error("Engine executable not found: " + path.string());
    }
    if (!std::filesystem::is_regular_file(path))
    {
        throw std::runtime_error("Engine path is not a regular file: " + path.string());
    }
    if (workingDir && !std::filesystem::exists(*workingDir))
    {
        throw std::runtime_error("Working directory does not exist: " + workingDir->string());
    }
    start();
}

void EngineProcess::start()
{
#ifdef _WIN32
    constexpr DWORD READ_PUFFER_SIZE = 64 * 1024;

    SECURITY_ATTRIBUTES saAttr{};
    saAttr.nLength = sizeof(SECURITY_ATTRIBUTES);
    saAttr.bInheritHandle = TRUE;
    saAttr.lpSecurityDescriptor = nullptr;

    HANDLE stdinReadTmp, stdoutWriteTmp;

    if (!CreatePipe(&stdinReadTmp, &stdinWrite_, &saAttr, 0) ||
        !SetHandleInformation(stdinWrite_, HANDLE_FLAG_INHERIT, 0))
    {
        throw std::runtime_error("Failed to create stdin pipe");
    }

    if (!CreatePipe(&stdoutRead_, &stdoutWriteTmp, &saAttr, READ_PUFFER_SIZE) ||
        !SetHandleInformation(stdoutRead_, HANDLE_FLAG_INHERIT, 0))
    {
        CloseHandle(stdinReadTmp);
        closeAllHandles();
        throw std::runtime_error("Failed to create stdout pipe");
    }

    HANDLE stderrWriteTmp;
    if (!CreatePipe(&stderrRead_, &stderrWriteTmp, &saAttr, 0) ||
        !SetHandleInformation(stderrRead_, HANDLE_FLAG_INHERIT, 0))
    {
        CloseHandle(stdinReadTmp);
        CloseHandle(stdoutWriteTmp);
        closeAllHandles();
        throw std::runtime_error("Failed to create stderr pipe");
    }

    PROCESS_INFORMATION piProcInfo{};
    STARTUPINFOA siStartInfo{};
    siStartInfo.cb = sizeof(STARTUPINFOA);
    siStartInfo.hStdInput = stdinReadTmp;
    siStartInfo.hStdOutput = stdoutWriteTmp;
    siStartInfo.hStdError = stderrWriteTmp;
    siStartInfo.dwFlags |= STARTF_USESTDHANDLES;

    std::string cmd = "\"" + executablePath_.string() + "\"";
    for (const auto &argument : arguments_)
    {
        cmd += " \"" + argument + "\"";
    }

    BOOL success = CreateProcessA(
        nullptr,
        cmd.data(),
        nullptr,
        nullptr,
        TRUE,
        0,
        nullptr,
        workingDirectory_ ? workingDirectory_->string().c_str() : nullptr,
        &siStartInfo,
        &piProcInfo);
	CloseHandle(stdinReadTmp);
    CloseHandle(stdoutWriteTmp);
    CloseHandle(stderrWriteTmp);

    if (!success)
    {
        closeAllHandles();
        throw std::runtime_error("Failed to create process");
    }

    childProcess_ = piProcInfo.hProcess;
    CloseHandle(piProcInfo.hThread);
    stderrThread_ = std::thread(&EngineProcess::logStdErr, this);
#else
    // a dead engine must surface as a failed write, not terminate the broker
    signal(SIGPIPE, SIG_IGN);

    int inPipe[2], outPipe[2], errPipe[2], execStatusPipe[2];
    if (pipe(inPipe))
    {
        throw std::runtime_error("Failed to create pipes");
    }
    if (pipe(outPipe))
    {
        close(inPipe[0]);
        close(inPipe[1]);
        throw std::runtime_error("Failed to create pipes");
    }
    if (pipe(errPipe))
    {
        close(inPipe[0]);
        close(inPipe[1]);
        close(outPipe[0]);
        close(outPipe[1]);
        throw std::runtime_error("Failed to create stderr pipe");
    }
    if (pipe(execStatusPipe))
    {
        close(inPipe[0]);
        close(inPipe[1]);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        throw std::runtime_error("Failed to create pipes");
    }
    fcntl(execStatusPipe[1], F_SETFD, FD_CLOEXEC);
    fcntl(inPipe[1], F_SETFD, FD_CLOEXEC);
    fcntl(outPipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(errPipe[0], F_SETFD, FD_CLOEXEC);

    std::vector<std::string> argStorage;
    argStorage.push_back(executablePath_.string());
    argStorage.insert(argStorage.end(), arguments_.begin(), arguments_.end());
    std::vector<char *> argv;
    for (auto &arg : argStorage)
    {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    childPid_ = fork();
    if (childPid_ == -1)
    {
        close(inPipe[0]);
        close(inPipe[1]);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        close(execStatusPipe[0]);
        close(execStatusPipe[1]);
        throw std::runtime_error("Failed to fork process");
    }

    if (childPid_ == 0)
    {
        #ifdef __linux__
        // the engine must not survive the broker
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        #endif
        signal(SIGPIPE, SIG_DFL);
        // Ctrl+C reaches the whole process group, the broker ends the engine with quit
        signal(SIGINT, SIG_IGN);
        sigset_t noSignals;
        sigemptyset(&noSignals);
        sigprocmask(SIG_SETMASK, &noSignals, nullptr);
        if (workingDirectory_ && chdir(workingDirectory_->c_str()) == -1) {
            perror("chdir failed");
        }

        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);

        close(inPipe[0]);
        close(inPipe[1]);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        close(execStatusPipe[0]);

        execv(argv[0], argv.data());

        // only on failure:
        int err = errno;
        ssize_t w = write(execStatusPipe[1], &err, sizeof(err));
        if (w != sizeof(err)) {
            // write failed, we can't do much about it
        }
        _exit(1);
    }

    // Parent
    close(inPipe[0]);
    close(outPipe[1]);
    close(errPipe[1]);
    stdinWrite_ = inPipe[1];
    stdoutRead_ = outPipe[0];
    stderrRead_ = errPipe[0];
    close(execStatusPipe[1]);

    int execError = 0;
    ssize_t n = read(execStatusPipe[0], &execError, sizeof(execError));
    close(execStatusPipe[0]);

    if (n > 0)
    {
        waitForExit(std::chrono::seconds(1));
        closeAllHandles();
        std::string msg = "Failed to exec engine process: ";
        msg += strerror(execError);
        throw std::runtime_error(msg);
    }
    stderrThread_ = std::thread(&EngineProcess::logStdErr, this);
#endif
}

EngineProcess::~EngineProcess()
{
    try
    {
        terminate();
    }
    catch (const std::exception &e)
    {
        Logger::serviceLogger().log("Failed to terminate " + identifier_ + ": " + e.what(), TraceLevel::error);
    }
    // the stderr pipe is closed by the exit of the engine
    if (stderrThread_.joinable())
    {
        stderrThread_.join();
    }
    closeAllHandles();
}

void EngineProcess::closeAllHandles()
{
#ifdef _WIN32
    if (stdinWrite_)
        CloseHandle(stdinWrite_);
    if (stdoutRead_)
        CloseHandle(stdoutRead_);
    if (stderrRead_)
        CloseHandle(stderrRead_);
    if (childProcess_)
        CloseHandle(childProcess_);

    stdinWrite_ = 0;
    stdoutRead_ = 0;
    stderrRead_ = 0;
    childProcess_ = 0;
#else
    if (stdinWrite_ >= 0)
        close(stdinWrite_);
    if (stdoutRead_ >= 0)
        close(stdoutRead_);
    if (stderrRead_ >= 0)
        close(stderrRead_);

    stdinWrite_ = -1;
    stdoutRead_ = -1;
    stderrRead_ = -1;
#endif
}

void EngineProcess::logStdErr()
{
    LineBuffer buffer;
    char temp[1024];
    while (true)
    {
#ifdef _WIN32
        DWORD bytesRead = 0;
        if (!ReadFile(stderrRead_, temp, sizeof(temp), &bytesRead, nullptr) || bytesRead == 0)
        {
            break;
        }
        size_t count = bytesRead;
#else
        ssize_t bytesRead = read(stderrRead_, temp, sizeof(temp));
        if (bytesRead < 0 && errno == EINTR)
        {
            continue;
        }
        if (bytesRead <= 0)
        {
            break;
        }
        size_t count = static_cast<size_t>(bytesRead);
#endif
        for (const auto &line : buffer.append(std::string_view(temp, count)))
        {
            Logger::engineLogger().log(identifier_, "stderr: " + line, true, TraceLevel::warning);
        }
    }
}

void EngineProcess::writeLine(const std::string &line)
{
    std::string withNewline = line + '\n';
#ifdef _WIN32
    DWORD written;
    if (!stdinWrite_ || !WriteFile(stdinWrite_, withNewline.c_str(), static_cast<DWORD>(withNewline.size()), &written, nullptr))
    {
        throw std::runtime_error("Failed to write to stdin of " + identifier_);
    }
#else
    size_t offset = 0;
    while (offset < withNewline.size())
    {
        ssize_t written = write(stdinWrite_, withNewline.data() + offset, withNewline.size() - offset);
        if (written == -1 && errno == EINTR)
        {
            continue;
        }
        if (written == -1)
        {
            throw std::runtime_error("Failed to write to stdin of " + identifier_ + ": " + strerror(errno));
        }
        offset += static_cast<size_t>(written);
    }
#endif
}

std::optional<std::string> EngineProcess::readChunk()
{
    char temp[4096];
#ifdef _WIN32
    DWORD bytesRead = 0;
    if (!stdoutRead_ || !ReadFile(stdoutRead_, temp, sizeof(temp), &bytesRead, nullptr) || bytesRead == 0)
    {
        // ERROR_BROKEN_PIPE: engine terminated or closed its stdout
        return std::nullopt;
    }
    return std::string(temp, bytesRead);
#else
    if (stdoutRead_ < 0)
    {
        return std::nullopt;
    }
    while (true)
    {
        ssize_t bytesRead = read(stdoutRead_, temp, sizeof(temp));
        if (bytesRead > 0)
        {
            return std::string(temp, static_cast<size_t>(bytesRead));
        }
        if (bytesRead < 0 && errno == EINTR)
        {
            continue;
        }
        // EOF or read error, both mean the engine is gone
        return std::nullopt;
    }
#endif
}

bool EngineProcess::waitForExit(std::chrono::milliseconds timeout)
{
#ifdef _WIN32
    if (!childProcess_)
        return true;
    DWORD waitResult = WaitForSingleObject(childProcess_, static_cast<DWORD>(timeout.count()));
    if (waitResult == WAIT_OBJECT_0)
    {
        return true;
    }
    else if (waitResult == WAIT_TIMEOUT)
    {
        return false;
    }
    else
    {
        throw std::runtime_error("WaitForSingleObject failed");
    }
#else
    if (childPid_ <= 0 || exited_)
        return true;
    int status = 0;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        pid_t result = waitpid(childPid_, &status, WNOHANG);
        if (result > 0)
        {
            exited_ = true;
            return true;
        }
        else if (result == 0)
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        else
        {
            if (errno == EINTR)
                continue;
            if (errno == ECHILD)
            {
                exited_ = true;
                return true;
            }
            throw std::runtime_error("waitpid() failed " + std::string(std::strerror(errno)));
        }
    }
#endif
}

/**
 * Terminates the engine process if it is still running.
 * If the process is already terminated, this is considered a successful outcome.
 * If termination fails, an exception is thrown.
 */
void EngineProcess::terminate()
{
#ifdef _WIN32
    if (!childProcess_)
    {
        return;
    }
    DWORD exitCode;
    if (!GetExitCodeProcess(childProcess_, &exitCode))
    {
        DWORD error = GetLastError();
        throw std::runtime_error("GetExitCodeProcess failed with error code: " + std::to_string(error));
    }
    if (exitCode != STILL_ACTIVE)
    {
        return;
    }
    if (!TerminateProcess(childProcess_, 1))
    {
        DWORD error = GetLastError();
        throw std::runtime_error("TerminateProcess failed with error code: " + std::to_string(error));
    }
    if (!waitForExit(std::chrono::seconds(5)))
    {
        throw std::runtime_error("Engine did not end after TerminateProcess");
    }
#else
    if (childPid_ <= 0 || exited_)
    {
        return;
    }
    if (kill(childPid_, SIGKILL) == -1 && errno != ESRCH)
    {
        throw std::runtime_error("kill(SIGKILL) failed: " + std::string(std::strerror(errno)));
    }
    if (!waitForExit(std::chrono::seconds(5)))
    {
        throw std::runtime_error("Engine did not end after SIGKILL");
    }
#endif
}

bool EngineProcess::isRunning() const
{
#ifdef _WIN32
    DWORD status;
    if (!childProcess_ || !GetExitCodeProcess(childProcess_, &status))
        return false;
    return status == STILL_ACTIVE;
#else
    if (childPid_ <= 0 || exited_)
        return false;
    int status;
    pid_t result = waitpid(childPid_, &status, WNOHANG);
    if (result != 0)
    {
        exited_ = true;
        return false;
    }
    return true;
#endif
}
