#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "process/line_channel.hpp"

namespace costbridge::process {

// Snapshot of the current process environment as NAME=VALUE entries.
std::vector<std::string> current_environment();

// Inherited variables minus the stripped prefixes, with the region variable
// resolved and the local binary directory prepended to PATH.
std::vector<std::string> build_child_environment(
    const core::config::ServerConfig& config,
    const std::vector<std::string>& inherited);

// Looks up `name` in the colon-separated `search_path` unless it already
// contains a slash.
std::optional<std::string> resolve_executable(const std::string& name,
                                              const std::string& search_path);

// Owns exactly one tool-server child process and its three pipes.
class ProcessSupervisor : public LineChannel {
public:
    explicit ProcessSupervisor(core::config::ServerConfig config);
    ~ProcessSupervisor() override;

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    core::errors::Status start();
    void terminate();
    bool is_running();

    core::errors::Status write_line(const std::string& line) override;
    core::errors::Result<std::string> read_line(std::uint32_t timeout_ms) override;
    bool is_open() const override;

    pid_t pid() const { return pid_; }
    const std::string& stderr_tail() const { return stderr_tail_; }
    // Bytes of an unterminated stderr line not yet logged.
    std::size_t pending_stderr_bytes() const { return stderr_partial_.size(); }

private:
    bool take_buffered_line(std::string& line);
    void append_stderr(const std::string& chunk);
    void close_fd(int& fd);

    core::config::ServerConfig config_;
    pid_t pid_ = -1;
    bool started_ = false;
    bool exited_ = false;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::string stdout_buffer_;
    std::string stderr_partial_;
    std::string stderr_tail_;
};

}  // namespace costbridge::process
