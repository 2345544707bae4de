#include "util/subprocess.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace panelpress {

namespace {

constexpr size_t MAX_CAPTURED_OUTPUT = 8192;
constexpr int POLL_INTERVAL_MS = 100;
constexpr int TERM_GRACE_MS = 2000;

void append_capped(std::string& out, const char* data, size_t n) {
    out.append(data, n);
    if (out.size() > MAX_CAPTURED_OUTPUT) {
        out.erase(0, out.size() - MAX_CAPTURED_OUTPUT);
    }
}

void terminate_child(pid_t pid) {
    kill(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(TERM_GRACE_MS);
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        if (waitpid(pid, &status, WNOHANG) == pid) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
}

}

ProcessResult run_process(const std::vector<std::string>& argv, const std::atomic<bool>* cancel) {
    ProcessResult result;
    if (argv.empty() || argv[0].empty()) {
        result.output = "empty command";
        return result;
    }

    // Both pipes are close-on-exec so children forked by other workers never inherit them.
    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.output = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    // Closed on successful exec, so a read of the error code means exec failed.
    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        result.output = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        result.output = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        close(out_pipe[0]);
        close(exec_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        execvp(cargv[0], cargv.data());
        int err = errno;
        ssize_t written = write(exec_pipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    close(out_pipe[1]);
    close(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    close(exec_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        close(out_pipe[0]);
        int status = 0;
        waitpid(pid, &status, 0);
        result.output = argv[0] + ": " + std::strerror(exec_errno);
        return result;
    }
    result.launched = true;

    char buffer[4096];
    bool open_stream = true;
    while (open_stream) {
        if (cancel && cancel->load()) {
            close(out_pipe[0]);
            terminate_child(pid);
            result.cancelled = true;
            return result;
        }
        struct pollfd pfd{out_pipe[0], POLLIN, 0};
        int pr = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) continue;
        ssize_t got = read(out_pipe[0], buffer, sizeof(buffer));
        if (got > 0) {
            append_capped(result.output, buffer, static_cast<size_t>(got));
        } else if (got == 0 || errno != EINTR) {
            open_stream = false;
        }
    }
    close(out_pipe[0]);

    int status = 0;
    while (true) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
        if (cancel && cancel->load()) {
            terminate_child(pid);
            result.cancelled = true;
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

bool command_available(const std::string& command) {
    if (command.empty()) return false;
    std::error_code ec;
    if (command.find('/') != std::string::npos) {
        return std::filesystem::exists(command, ec) && access(command.c_str(), X_OK) == 0;
    }
    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;
    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        std::filesystem::path candidate = std::filesystem::path(dir) / command;
        if (std::filesystem::exists(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

}
