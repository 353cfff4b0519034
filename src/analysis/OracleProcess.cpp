#include "analysis/OracleProcess.hpp"
#include "core/StrikeError.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace strikebox;

OracleProcess::OracleProcess(std::string command, std::string script, int timeout_ms)
    : command_(std::move(command)), script_(std::move(script)), timeout_ms_(timeout_ms) {}

AnalysisResult OracleProcess::evaluate(const std::string& symbol, const std::string& label) {
    return parse_analysis(run(symbol, label));
}

std::string OracleProcess::run(const std::string& symbol, const std::string& label) {
    // argv and the descriptor bound are prepared before fork(); the child of a
    // threaded process may only make async-signal-safe calls.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command_.c_str()));
    if (!script_.empty()) argv.push_back(const_cast<char*>(script_.c_str()));
    argv.push_back(const_cast<char*>(symbol.c_str()));
    argv.push_back(const_cast<char*>(label.c_str()));
    argv.push_back(nullptr);

    long open_max = sysconf(_SC_OPEN_MAX);
    if (open_max < 0 || open_max > 65536) open_max = 65536;
    const int max_fd = static_cast<int>(open_max);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw StrikeError(ErrorCode::AnalysisUnavailable,
                          std::string("oracle pipe: ") + std::strerror(errno));

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        throw StrikeError(ErrorCode::AnalysisUnavailable,
                          std::string("oracle fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: stdout -> pipe, drop every inherited descriptor, then exec.
        dup2(fds[1], STDOUT_FILENO);
        for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) close(fd);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    close(fds[1]);

    using namespace std::chrono;
    const auto deadline = steady_clock::now() + milliseconds(timeout_ms_);

    std::string out;
    bool timed_out = false;
    char buf[4096];
    for (;;) {
        auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
        if (left <= 0) { timed_out = true; break; }

        pollfd p{fds[0], POLLIN, 0};
        int rc = poll(&p, 1, static_cast<int>(left));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) { timed_out = true; break; }

        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;   // EOF
        out.append(buf, static_cast<size_t>(n));
    }
    close(fds[0]);

    if (timed_out) kill(pid, SIGKILL);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (timed_out)
        throw StrikeError(ErrorCode::AnalysisUnavailable,
                          "oracle timed out after " + std::to_string(timeout_ms_) + "ms");
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
        throw StrikeError(ErrorCode::AnalysisUnavailable,
                          "oracle exited abnormally (status " + std::to_string(status) + ")");
    return out;
}
