/**
 * @file ProcessRunner.cpp
 * @brief GLib-based process runner implementation
 */

#include "services/ProcessRunner.hpp"

#include "util/Logger.hpp"

#include <glib.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr auto COMPONENT = "ProcessRunner";
constexpr size_t READ_CHUNK_SIZE = 4'096;

auto join_argv(const std::vector<std::string>& argv) -> std::string {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined.append(arg);
    }
    return joined;
}

/**
 * @brief Read with retry on EINTR
 */
auto read_with_retry(int fd, void* buf, size_t count) -> ssize_t {
    while (true) {
        ssize_t result = ::read(fd, buf, count);
        if (result >= 0 || errno != EINTR) {
            return result;
        }
    }
}

// Reads until EOF. Embedded NUL bytes are kept.
auto read_all(int fd, std::string& out) -> bool {
    std::array<char, READ_CHUNK_SIZE> buf{};
    while (true) {
        ssize_t n = read_with_retry(fd, buf.data(), buf.size());
        if (n == 0) {
            return true;
        }
        if (n < 0) {
            return false;
        }
        out.append(buf.data(), static_cast<size_t>(n));
    }
}

auto wait_with_retry(GPid pid, int& wait_status) -> bool {
    while (waitpid(pid, &wait_status, 0) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

}  // namespace

auto ProcessRunner::run(const std::vector<std::string>& argv) -> CommandResult {
    CommandResult result;

    if (argv.empty() || argv.front().empty()) {
        result.error_message = "Empty command";
        return result;
    }

    std::vector<gchar*> argv_vec;
    argv_vec.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        argv_vec.push_back(const_cast<gchar*>(arg.c_str()));
    }
    argv_vec.push_back(nullptr);

    const auto command_line = join_argv(argv);
    LOG_DEBUG(COMPONENT, std::format("Running: {}", command_line));

    gint stdout_fd = -1;
    GPid child_pid = 0;
    GError* error = nullptr;

    gboolean spawned = g_spawn_async_with_pipes(
        nullptr,           // working directory
        argv_vec.data(),   // arguments
        nullptr,           // environment (inherit)
        static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH | G_SPAWN_DO_NOT_REAP_CHILD |
                                 G_SPAWN_STDERR_TO_DEV_NULL),
        nullptr,           // child setup
        nullptr,           // user data
        &child_pid,        // child PID
        nullptr,           // stdin
        &stdout_fd,        // stdout
        nullptr,           // stderr (discarded)
        &error
    );

    if (!spawned) {
        result.error_message = error ? error->message : "Unknown error";
        LOG_WARNING(COMPONENT,
                    std::format("Failed to spawn '{}': {}", command_line, result.error_message));
        if (error) g_error_free(error);
        return result;
    }

    result.launched = true;

    if (!read_all(stdout_fd, result.output)) {
        LOG_WARNING(COMPONENT, std::format("Failed to read output of '{}': {}", command_line,
                                           std::strerror(errno)));
    }
    close(stdout_fd);

    int wait_status = 0;
    const bool reaped = wait_with_retry(child_pid, wait_status);
    const int wait_errno = errno;
    g_spawn_close_pid(child_pid);

    if (!reaped) {
        LOG_WARNING(COMPONENT, std::format("Failed to wait for '{}': {}", command_line,
                                           std::strerror(wait_errno)));
        return result;
    }

    if (WIFEXITED(wait_status)) {
        result.exit_status = WEXITSTATUS(wait_status);
    }

    if (result.exit_status != 0) {
        LOG_DEBUG(COMPONENT,
                  std::format("'{}' exited with status {}", command_line, result.exit_status));
    }

    return result;
}
