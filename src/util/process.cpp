#include <grg/process.hpp>

#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace grg {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

static void close_pipes(int out_fd, int err_fd) {
    close(out_fd);
    close(err_fd);
}

static void drain(int fd, std::string& into) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        into.append(buf, static_cast<size_t>(n));
    }
}

Result<CommandResult> run_command(const CommandSpec& spec) {
    if (spec.args.empty()) {
        return GrgError{GrgError::InvalidArg, "run_command: empty args"};
    }

    // Build argv for execvp
    std::vector<const char*> argv;
    argv.reserve(spec.args.size() + 1);
    for (const auto& a : spec.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return GrgError{GrgError::Process,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        int saved = errno;
        close_pipes(stdout_pipe[0], stdout_pipe[1]);
        return GrgError{GrgError::Process,
            std::string("pipe() failed: ") + strerror(saved)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_pipes(stdout_pipe[0], stdout_pipe[1]);
        close_pipes(stderr_pipe[0], stderr_pipe[1]);
        return GrgError{GrgError::Process,
            std::string("fork() failed: ") + strerror(saved)};
    }

    if (pid == 0) {
        // Child process. Own process group so a timeout reaches grandchildren.
        setpgid(0, 0);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!spec.working_dir.empty()) {
            if (chdir(spec.working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        for (const auto& [key, val] : spec.env) {
            setenv(key.c_str(), val.c_str(), 1);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    // Parent process
    setpgid(pid, pid);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    // Set non-blocking on read ends
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    for (;;) {
        if (spec.timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                    >= spec.timeout_seconds) {
                kill(-pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close_pipes(stdout_pipe[0], stderr_pipe[0]);
                return GrgError{GrgError::Process,
                    "command timed out after " + std::to_string(spec.timeout_seconds) + "s"};
            }
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close_pipes(stdout_pipe[0], stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0) {
            int saved = errno;
            close_pipes(stdout_pipe[0], stderr_pipe[0]);
            return GrgError{GrgError::Process,
                std::string("waitpid failed: ") + strerror(saved)};
        }

        // Brief sleep to avoid busy-wait
        usleep(1000);  // 1ms
    }
}

Result<CommandResult> SystemProcessRunner::run(const CommandSpec& spec) {
    return run_command(spec);
}

// ---------------------------------------------------------------------------
// PATH lookup
// ---------------------------------------------------------------------------

static bool is_executable_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return access(path.c_str(), X_OK) == 0;
}

Result<std::string> find_executable(const std::string& name,
                                    const std::string& path_env) {
    if (name.empty()) {
        return GrgError{GrgError::InvalidArg, "empty executable name"};
    }

    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) {
            return Result<std::string>::ok(name);
        }
        return GrgError{GrgError::NotFound,
            "'" + name + "' is not an executable file"};
    }

    size_t start = 0;
    while (start <= path_env.size()) {
        size_t end = path_env.find(':', start);
        if (end == std::string::npos) end = path_env.size();

        // An empty PATH entry means the current directory
        std::string dir = path_env.substr(start, end - start);
        if (dir.empty()) dir = ".";

        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) {
            return Result<std::string>::ok(std::move(candidate));
        }
        start = end + 1;
    }

    return GrgError{GrgError::NotFound,
        "could not find " + name + " in your PATH"};
}

Result<std::string> find_executable(const std::string& name) {
    const char* path = std::getenv("PATH");
    return find_executable(name, path ? path : "");
}

std::string join_command(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

} // namespace grg
