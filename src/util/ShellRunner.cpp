#include "util/ShellRunner.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace hookgate {

Expected<ProcessResult> ShellRunner::run(const std::string& command, const fs::path& workDir) {
    Logger::instance().debug("run: " + command);

    int fds[2];
    if (pipe(fds) != 0) {
        return Error{ErrorCode::CommandFailed, std::string("pipe failed: ") + std::strerror(errno)};
    }

    std::cout.flush();
    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        return Error{ErrorCode::CommandFailed, std::string("fork failed: ") + std::strerror(err)};
    }

    if (pid == 0) {
        close(fds[0]);
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[1]);
        if (!workDir.empty() && chdir(workDir.c_str()) != 0) {
            _exit(126);
        }
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    close(fds[1]);
    ProcessResult result;
    char buf[4096];
    while (true) {
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
            if (echoOutput) {
                std::cout.write(buf, n);
                std::cout.flush();
            }
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        break;
    }
    close(fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return Error{ErrorCode::CommandFailed, std::string("waitpid failed: ") + std::strerror(errno)};
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    return result;
}

bool ShellRunner::commandAvailable(const std::string& tool) const {
    if (tool.empty()) return false;
    if (tool.find('/') != std::string::npos) {
        return access(tool.c_str(), X_OK) == 0;
    }
    const char* env = std::getenv("PATH");
    if (!env) return false;

    std::istringstream dirs(env);
    std::string dir;
    std::error_code ec;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / tool;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

std::unique_ptr<IProcessRunner> ProcessRunnerFactory::createDefault() {
    return std::make_unique<ShellRunner>(true);
}

IProcessRunner& ProcessRunnerFactory::shared() {
    static std::unique_ptr<IProcessRunner> runner = createDefault();
    return *runner;
}

}
