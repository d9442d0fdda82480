#include "process/process_supervisor.hpp"

#include <chrono>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

extern char** environ;

namespace costbridge::process {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

constexpr std::size_t kStderrTailBytes = 8192;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void set_cloexec(const int fd) {
    const int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

void close_pair(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            static_cast<void>(close(fd));
            fd = -1;
        }
    }
}

// Reads everything currently available. Returns false once the writer side
// has closed the pipe.
bool drain_pipe(const int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        return false;
    }
}

std::string variable_name(const std::string& entry) {
    const auto pos = entry.find('=');
    return pos == std::string::npos ? entry : entry.substr(0, pos);
}

std::string variable_value(const std::string& entry) {
    const auto pos = entry.find('=');
    return pos == std::string::npos ? std::string() : entry.substr(pos + 1);
}

bool has_prefix(const std::string& value, const std::string& prefix) {
    return !prefix.empty() && value.rfind(prefix, 0) == 0;
}

std::string join_command(const std::vector<std::string>& command) {
    std::string joined;
    for (const auto& part : command) {
        if (!joined.empty()) {
            joined += " ";
        }
        joined += part;
    }
    return joined;
}

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { static_cast<void>(signal(SIGPIPE, SIG_IGN)); });
}

}  // namespace

std::vector<std::string> current_environment() {
    std::vector<std::string> entries;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        entries.emplace_back(*entry);
    }
    return entries;
}

std::vector<std::string> build_child_environment(
    const core::config::ServerConfig& config,
    const std::vector<std::string>& inherited) {
    std::vector<std::string> env;
    std::string home;
    std::string path;
    std::string inherited_region;

    for (const auto& entry : inherited) {
        const std::string name = variable_name(entry);
        bool stripped = false;
        for (const auto& prefix : config.stripped_variable_prefixes) {
            if (has_prefix(name, prefix)) {
                stripped = true;
                break;
            }
        }
        if (stripped) {
            continue;
        }
        if (name == "HOME") {
            home = variable_value(entry);
        }
        if (name == "PATH") {
            path = variable_value(entry);
            continue;
        }
        if (name == config.region_variable) {
            inherited_region = variable_value(entry);
            continue;
        }
        env.push_back(entry);
    }

    std::string local_bin = config.local_bin_dir;
    if (local_bin.empty() && !home.empty()) {
        local_bin = home + "/.local/bin";
    }
    if (!local_bin.empty()) {
        path = path.empty() ? local_bin : local_bin + ":" + path;
    }
    env.push_back("PATH=" + path);

    std::string region = config.default_region;
    if (config.forced_region.has_value()) {
        region = config.forced_region.value();
    } else if (!inherited_region.empty()) {
        region = inherited_region;
    }
    if (!config.region_variable.empty()) {
        env.push_back(config.region_variable + "=" + region);
    }
    return env;
}

std::optional<std::string> resolve_executable(const std::string& name,
                                              const std::string& search_path) {
    if (name.empty()) {
        return std::nullopt;
    }

    const auto is_executable_file = [](const std::string& candidate) {
        struct stat info {};
        return stat(candidate.c_str(), &info) == 0 && S_ISREG(info.st_mode) &&
               access(candidate.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) {
            return name;
        }
        return std::nullopt;
    }

    std::size_t begin = 0;
    while (begin <= search_path.size()) {
        auto end = search_path.find(':', begin);
        if (end == std::string::npos) {
            end = search_path.size();
        }
        std::string dir = search_path.substr(begin, end - begin);
        if (dir.empty()) {
            dir = ".";
        }
        const std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) {
            return candidate;
        }
        begin = end + 1;
    }
    return std::nullopt;
}

ProcessSupervisor::ProcessSupervisor(core::config::ServerConfig config)
    : config_(std::move(config)) {}

ProcessSupervisor::~ProcessSupervisor() {
    terminate();
}

core::errors::Status ProcessSupervisor::start() {
    if (started_) {
        return BridgeError{ErrorCategory::ProcessStart,
                           "This supervisor already started a tool server.",
                           "already_started",
                           "Create a new supervisor to restart the server."};
    }
    if (config_.command.empty() || config_.command.front().empty()) {
        return BridgeError{ErrorCategory::ProcessStart,
                           "Tool server command is empty.", "empty_command"};
    }

    const std::vector<std::string> env =
        build_child_environment(config_, current_environment());
    std::string search_path;
    for (const auto& entry : env) {
        if (variable_name(entry) == "PATH") {
            search_path = variable_value(entry);
        }
    }

    const auto resolved = resolve_executable(config_.command.front(), search_path);
    if (!resolved.has_value()) {
        return BridgeError{ErrorCategory::ProcessStart,
                           "Tool server executable not found: " +
                               config_.command.front(),
                           "executable_not_found",
                           "Install it or pass another command with --server."};
    }

    ignore_sigpipe_once();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 ||
        pipe(status_pipe) != 0) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return BridgeError{ErrorCategory::ProcessStart,
                           "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }
    set_cloexec(stdin_pipe[1]);
    set_cloexec(stdout_pipe[0]);
    set_cloexec(stderr_pipe[0]);
    set_cloexec(status_pipe[0]);
    set_cloexec(status_pipe[1]);

    // Everything the child touches is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(config_.command.size() + 1);
    for (const auto& arg : config_.command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (const auto& entry : env) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return BridgeError{ErrorCategory::ProcessStart, "Failed to fork process.",
                           "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdin_pipe[0]));
        static_cast<void>(close(stdin_pipe[1]));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(status_pipe[0]));
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        execve(resolved->c_str(), argv.data(), envp.data());
        const int exec_errno = errno;
        static_cast<void>(write(status_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    static_cast<void>(close(stdin_pipe[0]));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(status_pipe[1]));

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int exec_errno = 0;
    ssize_t status_bytes = 0;
    do {
        status_bytes = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (status_bytes < 0 && errno == EINTR);
    static_cast<void>(close(status_pipe[0]));

    pid_ = pid;
    started_ = true;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];

    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        static_cast<void>(waitpid(pid_, &status, 0));
        exited_ = true;
        close_fd(stdin_fd_);
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);
        return BridgeError{ErrorCategory::ProcessStart,
                           "Failed to execute " + resolved.value() + ": " +
                               std::strerror(exec_errno),
                           "exec_failed"};
    }

    set_nonblocking(stdout_fd_);
    set_nonblocking(stderr_fd_);
    CB_LOG_INFO("ProcessSupervisor: started '" + join_command(config_.command) +
                "' (pid " + std::to_string(pid_) + ")");

    if (config_.startup_grace_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.startup_grace_ms));
        if (!is_running()) {
            std::string captured;
            if (stderr_fd_ >= 0) {
                static_cast<void>(drain_pipe(stderr_fd_, captured));
                append_stderr(captured);
            }
            return BridgeError{ErrorCategory::ProcessStart,
                               "Tool server exited during startup.", "server_exited",
                               stderr_tail_};
        }
    }
    return core::errors::ok();
}

bool ProcessSupervisor::is_running() {
    if (pid_ <= 0 || exited_) {
        return false;
    }
    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        exited_ = true;
        return false;
    }
    return true;
}

void ProcessSupervisor::terminate() {
    close_fd(stdin_fd_);
    if (pid_ > 0 && !exited_) {
        static_cast<void>(kill(pid_, SIGTERM));

        constexpr int kGraceSteps = 50;
        for (int step = 0; step < kGraceSteps && is_running(); ++step) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (is_running()) {
            static_cast<void>(kill(pid_, SIGKILL));
            int status = 0;
            static_cast<void>(waitpid(pid_, &status, 0));
            exited_ = true;
        }
        CB_LOG_INFO("ProcessSupervisor: terminated pid " + std::to_string(pid_));
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    pid_ = -1;
}

core::errors::Status ProcessSupervisor::write_line(const std::string& line) {
    if (stdin_fd_ < 0) {
        return BridgeError{ErrorCategory::BrokenPipe,
                           "Tool server input stream is closed.", "stream_closed"};
    }

    const std::string payload = line + "\n";
    std::size_t written = 0;
    while (written < payload.size()) {
        const ssize_t n =
            write(stdin_fd_, payload.data() + written, payload.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        const int write_errno = (n < 0) ? errno : EIO;
        close_fd(stdin_fd_);
        const bool broken = (write_errno == EPIPE);
        if (broken) {
            return BridgeError{ErrorCategory::BrokenPipe,
                               "Tool server closed its input stream.", "broken_pipe",
                               stderr_tail_};
        }
        return BridgeError{ErrorCategory::BrokenPipe,
                           std::string("Write to tool server failed: ") +
                               std::strerror(write_errno),
                           "write_failed"};
    }
    return core::errors::ok();
}

core::errors::Result<std::string> ProcessSupervisor::read_line(
    const std::uint32_t timeout_ms) {
    std::string line;
    if (take_buffered_line(line)) {
        return line;
    }
    if (stdout_fd_ < 0) {
        return BridgeError{ErrorCategory::BrokenPipe,
                           "Tool server output stream is closed.",
                           "server_closed_stream", stderr_tail_};
    }

    const auto started = std::chrono::steady_clock::now();
    while (true) {
        int wait_ms = -1;
        if (timeout_ms > 0) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - started)
                                     .count();
            if (elapsed >= static_cast<std::int64_t>(timeout_ms)) {
                return BridgeError{ErrorCategory::Protocol,
                                   "Timed out after " + std::to_string(timeout_ms) +
                                       " ms waiting for the tool server.",
                                   "read_timeout"};
            }
            wait_ms = static_cast<int>(timeout_ms - elapsed);
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds].fd = stdout_fd_;
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        ++nfds;
        if (stderr_fd_ >= 0) {
            fds[nfds].fd = stderr_fd_;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }

        const int rc = poll(fds, nfds, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return BridgeError{ErrorCategory::BrokenPipe,
                               std::string("poll on tool server failed: ") +
                                   std::strerror(errno),
                               "poll_failed"};
        }
        if (rc == 0) {
            continue;
        }

        if (stderr_fd_ >= 0) {
            std::string chunk;
            const bool stderr_open = drain_pipe(stderr_fd_, chunk);
            append_stderr(chunk);
            if (!stderr_open) {
                close_fd(stderr_fd_);
            }
        }

        const bool stdout_open = drain_pipe(stdout_fd_, stdout_buffer_);
        if (take_buffered_line(line)) {
            return line;
        }
        if (!stdout_open) {
            close_fd(stdout_fd_);
            if (!stdout_buffer_.empty()) {
                line.swap(stdout_buffer_);
                return line;
            }
            return BridgeError{ErrorCategory::BrokenPipe,
                               "Tool server closed its output stream.",
                               "server_closed_stream", stderr_tail_};
        }
    }
}

bool ProcessSupervisor::is_open() const {
    return stdin_fd_ >= 0 && (stdout_fd_ >= 0 || !stdout_buffer_.empty());
}

bool ProcessSupervisor::take_buffered_line(std::string& line) {
    const auto newline = stdout_buffer_.find('\n');
    if (newline == std::string::npos) {
        return false;
    }
    line = stdout_buffer_.substr(0, newline);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    stdout_buffer_.erase(0, newline + 1);
    return true;
}

void ProcessSupervisor::append_stderr(const std::string& chunk) {
    if (chunk.empty()) {
        return;
    }
    stderr_partial_ += chunk;
    std::size_t newline = 0;
    while ((newline = stderr_partial_.find('\n')) != std::string::npos) {
        CB_LOG_DEBUG("tool server stderr: " + stderr_partial_.substr(0, newline));
        stderr_partial_.erase(0, newline + 1);
    }
    if (stderr_partial_.size() >= kStderrTailBytes) {
        CB_LOG_DEBUG("tool server stderr: " + stderr_partial_);
        stderr_partial_.clear();
    }

    stderr_tail_ += chunk;
    if (stderr_tail_.size() > kStderrTailBytes) {
        stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
    }
}

void ProcessSupervisor::close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

}  // namespace costbridge::process
