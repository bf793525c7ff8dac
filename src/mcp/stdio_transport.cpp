#include <mcp_agent/mcp/stdio_transport.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_agent {

namespace {

Error MakeTransportError(const std::string& operation,
                         const std::string& command,
                         const std::string& message,
                         ErrorCategory category = ErrorCategory::Connection) {
    return Error{operation, command, std::nullopt, message, std::nullopt, category};
}

void SetNonblocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void SetCloexec(int fd) {
    const int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

void CloseFd(int& fd) noexcept {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

// Current environment with `overrides` applied, as KEY=VALUE strings.
std::vector<std::string> BuildEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string Truncate(const std::string& line) {
    constexpr std::size_t kMaxLineLength = 240;
    if (line.size() <= kMaxLineLength) {
        return line;
    }
    return line.substr(0, kMaxLineLength) + "...";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Launch
// ---------------------------------------------------------------------------
Result<std::unique_ptr<StdioTransport>, Error> StdioTransport::Launch(
    const ToolProviderSpec& spec, Logger& logger,
    std::chrono::milliseconds grace_period) {
    using R = Result<std::unique_ptr<StdioTransport>, Error>;

    if (spec.command.empty()) {
        return R::Err(MakeTransportError("Launch", "", "Empty provider command"));
    }

    // A provider that exits early must surface as EPIPE on write, not kill us.
    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));

    // Everything the child needs is built before fork().
    std::vector<std::string> argv_storage;
    argv_storage.push_back(spec.command);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> child_argv;
    for (auto& a : argv_storage) child_argv.push_back(a.data());
    child_argv.push_back(nullptr);

    auto env_storage = BuildEnvironment(spec.env);
    std::vector<char*> child_env;
    for (auto& e : env_storage) child_env.push_back(e.data());
    child_env.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(error_pipe) != 0) {
        const std::string reason = std::strerror(errno);
        for (int* fd : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0],
                        &stdout_pipe[1], &error_pipe[0], &error_pipe[1]}) {
            CloseFd(*fd);
        }
        return R::Err(MakeTransportError("Launch", spec.command,
                                         "Failed to create process pipes: " + reason));
    }
    // Keeps sibling providers from inheriting each other's pipe ends;
    // dup2() onto 0/1 clears the flag in the child.
    for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1],
                   error_pipe[0], error_pipe[1]}) {
        SetCloexec(fd);
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        for (int* fd : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0],
                        &stdout_pipe[1], &error_pipe[0], &error_pipe[1]}) {
            CloseFd(*fd);
        }
        return R::Err(MakeTransportError("Launch", spec.command,
                                         "Failed to fork process: " + reason));
    }

    if (pid == 0) {
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        environ = child_env.data();
        execvp(child_argv[0], child_argv.data());
        const int err = errno;
        static_cast<void>(write(error_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    CloseFd(stdin_pipe[0]);
    CloseFd(stdout_pipe[1]);
    CloseFd(error_pipe[1]);

    // exec() success closes the error pipe; failure writes errno into it.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(error_pipe[0]);

    if (n > 0) {
        CloseFd(stdin_pipe[1]);
        CloseFd(stdout_pipe[0]);
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        return R::Err(MakeTransportError(
            "Launch", spec.command,
            "Failed to start '" + spec.command + "': " + std::strerror(child_errno)));
    }

    SetNonblocking(stdin_pipe[1]);
    SetNonblocking(stdout_pipe[0]);
    logger.Debug("stdio", "Started '" + spec.command + "' (pid " +
                              std::to_string(pid) + ")");

    return R::Ok(std::unique_ptr<StdioTransport>(new StdioTransport(
        pid, stdin_pipe[1], stdout_pipe[0], spec.command, logger, grace_period)));
}

StdioTransport::StdioTransport(pid_t pid, int stdin_fd, int stdout_fd,
                               std::string command, Logger& logger,
                               std::chrono::milliseconds grace_period)
    : pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      command_(std::move(command)),
      logger_(logger),
      grace_period_(grace_period) {}

StdioTransport::~StdioTransport() {
    Close();
}

// ---------------------------------------------------------------------------
// Send
// ---------------------------------------------------------------------------
Result<void, Error> StdioTransport::Send(const nlohmann::json& message,
                                         std::chrono::milliseconds timeout) {
    if (closed_ || stdin_fd_ < 0) {
        return Result<void, Error>::Err(
            MakeTransportError("Send", command_, "Transport is closed"));
    }

    std::string line = message.dump(-1, ' ', false,
                                     nlohmann::json::error_handler_t::replace);
    line.push_back('\n');
    logger_.Debug("stdio", "-> " + Truncate(line.substr(0, line.size() - 1)));

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::size_t written = 0;
    while (written < line.size()) {
        const ssize_t n = write(stdin_fd_, line.data() + written, line.size() - written);
        if (n >= 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            return Result<void, Error>::Err(MakeTransportError(
                "Send", command_,
                "Write to provider failed: " + std::string(std::strerror(errno))));
        }

        // Pipe full: wait for the child to drain it.
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return Result<void, Error>::Err(MakeTransportError(
                "Send", command_,
                "Provider stopped reading input for " + std::to_string(timeout.count()) +
                    " ms",
                ErrorCategory::Timeout));
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        pollfd pfd{};
        pfd.fd = stdin_fd_;
        pfd.events = POLLOUT;
        const int ready = poll(&pfd, 1, static_cast<int>(remaining.count()) + 1);
        if (ready < 0 && errno != EINTR) {
            return Result<void, Error>::Err(MakeTransportError(
                "Send", command_, "poll failed: " + std::string(std::strerror(errno))));
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Receive
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> StdioTransport::Receive(std::chrono::milliseconds timeout) {
    using R = Result<nlohmann::json, Error>;
    if (closed_ || stdout_fd_ < 0) {
        return R::Err(MakeTransportError("Receive", command_, "Transport is closed"));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto nl = buffer_.find('\n');
        while (nl != std::string::npos) {
            auto line = Trim(buffer_.substr(0, nl));
            buffer_.erase(0, nl + 1);
            if (!line.empty()) {
                auto message = nlohmann::json::parse(line, nullptr, false);
                if (!message.is_discarded()) {
                    logger_.Debug("stdio", "<- " + Truncate(line));
                    return R::Ok(std::move(message));
                }
                logger_.Debug("stdio", "Skipping non-JSON line from '" + command_ +
                                           "': " + Truncate(line));
            }
            nl = buffer_.find('\n');
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return R::Err(MakeTransportError(
                "Receive", command_,
                "No response within " + std::to_string(timeout.count()) + " ms",
                ErrorCategory::Timeout));
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        pollfd pfd{};
        pfd.fd = stdout_fd_;
        pfd.events = POLLIN;
        const int ready = poll(&pfd, 1, static_cast<int>(remaining.count()) + 1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return R::Err(MakeTransportError(
                "Receive", command_, "poll failed: " + std::string(std::strerror(errno))));
        }
        if (ready == 0) {
            continue;
        }

        char chunk[4096];
        const ssize_t n = read(stdout_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return R::Err(MakeTransportError("Receive", command_,
                                             "Provider closed its output"));
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            continue;
        }
        return R::Err(MakeTransportError(
            "Receive", command_, "Read failed: " + std::string(std::strerror(errno))));
    }
}

// ---------------------------------------------------------------------------
// Close
// ---------------------------------------------------------------------------
bool StdioTransport::WaitForExit(std::chrono::milliseconds timeout) noexcept {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int status = 0;
        const pid_t waited = waitpid(pid_, &status, WNOHANG);
        if (waited == pid_ || (waited < 0 && errno == ECHILD)) {
            if (waited == pid_) {
                exit_status_ = WIFEXITED(status) ? WEXITSTATUS(status)
                                                 : 128 + WTERMSIG(status);
            }
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void StdioTransport::Close() noexcept {
    if (closed_) {
        return;
    }
    closed_ = true;

    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);

    if (pid_ <= 0) {
        return;
    }
    if (WaitForExit(grace_period_)) {
        return;
    }

    logger_.Debug("stdio", "'" + command_ + "' still running, sending SIGTERM");
    static_cast<void>(kill(pid_, SIGTERM));
    if (WaitForExit(grace_period_)) {
        return;
    }

    logger_.Warn("stdio", "'" + command_ + "' ignored SIGTERM, sending SIGKILL");
    static_cast<void>(kill(pid_, SIGKILL));
    int status = 0;
    if (waitpid(pid_, &status, 0) == pid_) {
        exit_status_ = 128 + SIGKILL;
    }
}

} // namespace mcp_agent
