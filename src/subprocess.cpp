#include "subprocess.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolbelt {

static void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

CommandResult run_command(const std::vector<std::string>& argv, const std::string& cwd) {
    CommandResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // close-on-exec: carries errno if exec fails
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_pipe);
        result.error = std::string("failed to create pipes: ") + std::strerror(errno);
        return result;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        cargv.push_back(const_cast<char*>(a.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_pipe);
        result.error = std::string("failed to fork process: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close(exec_pipe[0]);
        int stage = 0;
        if (cwd.empty() || chdir(cwd.c_str()) == 0) {
            stage = 1;
            execvp(cargv[0], cargv.data());
        }
        int failure[2] = {stage, errno};
        ssize_t ignored = write(exec_pipe[1], failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(exec_pipe[1]);

    // EOF here means exec succeeded
    int failure[2] = {0, 0};
    ssize_t got;
    do {
        got = read(exec_pipe[0], failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    close(exec_pipe[0]);
    if (got == static_cast<ssize_t>(sizeof(failure))) {
        result.error = failure[0] == 0
            ? "failed to enter directory " + cwd + ": " + std::strerror(failure[1])
            : "failed to start " + argv[0] + ": " + std::strerror(failure[1]);
    }

    struct pollfd fds[2];
    fds[0] = {stdout_pipe[0], POLLIN, 0};
    fds[1] = {stderr_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    std::array<char, 4096> buffer;
    int open_fds = 2;

    while (open_fds > 0) {
        int ret = poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                // EOF or hard error
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& f : fds) {
        if (f.fd >= 0) close(f.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.error = std::string("failed to wait for process: ") + std::strerror(errno);
            return result;
        }
    }

    if (!result.error.empty()) return result;

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code != 0) {
            result.error = "exit status " + std::to_string(result.exit_code);
        }
    } else if (WIFSIGNALED(status)) {
        result.error = "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return result;
}

} // namespace toolbelt
