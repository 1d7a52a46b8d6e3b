#include "esh_filesystem.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string_view>
#include <system_error>

#include "error_out.h"

namespace esh_filesystem {

namespace {
std::string describe_errno(int err) {
    return std::system_category().message(err);
}

std::atomic<unsigned> g_temp_file_counter{0};
}  // namespace

Result<int> safe_open(const std::string& path, int flags, mode_t mode) {
    int fd = ::open(path.c_str(), flags, mode);
    if (fd == -1) {
        return Result<int>::error("Failed to open file '" + path + "': " + describe_errno(errno));
    }
    return Result<int>::ok(fd);
}

void safe_close(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

Result<FILE*> safe_fopen(const std::string& path, const std::string& mode) {
    FILE* file = std::fopen(path.c_str(), mode.c_str());
    if (file == nullptr) {
        return Result<FILE*>::error("Failed to open file '" + path + "' with mode '" + mode +
                                    "': " + describe_errno(errno));
    }
    return Result<FILE*>::ok(file);
}

void safe_fclose(FILE* file) {
    if (file != nullptr) {
        (void)std::fclose(file);
    }
}

Result<void> create_pipe_cloexec(int pipe_fds[2]) {
    if (::pipe(pipe_fds) == -1) {
        return Result<void>::error("Failed to create pipe: " + describe_errno(errno));
    }
    for (int i = 0; i < 2; ++i) {
        if (::fcntl(pipe_fds[i], F_SETFD, FD_CLOEXEC) == -1) {
            std::string message = "Failed to set close-on-exec on pipe: " + describe_errno(errno);
            close_pipe(pipe_fds);
            return Result<void>::error(message);
        }
    }
    return Result<void>::ok();
}

void close_pipe(int pipe_fds[2]) {
    safe_close(pipe_fds[0]);
    safe_close(pipe_fds[1]);
    pipe_fds[0] = -1;
    pipe_fds[1] = -1;
}

bool error_indicates_broken_pipe(std::string_view message) {
    return message.find(std::strerror(EPIPE)) != std::string_view::npos;
}

Result<std::string> create_temp_file(const std::string& prefix) {
    std::string temp_path = "/tmp/" + prefix + "_" + std::to_string(getpid()) + "_" +
                            std::to_string(time(nullptr)) + "_" +
                            std::to_string(g_temp_file_counter.fetch_add(1));
    auto open_result = safe_open(temp_path, O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (open_result.is_error()) {
        return Result<std::string>::error(open_result.error());
    }
    safe_close(open_result.value());
    return Result<std::string>::ok(temp_path);
}

void cleanup_temp_file(const std::string& path) {
    (void)std::remove(path.c_str());
}

Result<void> write_all(int fd, std::string_view data) {
    size_t total_written = 0;
    while (total_written < data.size()) {
        size_t remaining = data.size() - total_written;
#ifdef SSIZE_MAX
        remaining = std::min(remaining, static_cast<size_t>(SSIZE_MAX));
#endif
        ssize_t written = ::write(fd, data.data() + total_written, remaining);
        if (written == -1) {
            if (errno == EINTR
#ifdef EAGAIN
                || errno == EAGAIN
#endif
#ifdef EWOULDBLOCK
                || errno == EWOULDBLOCK
#endif
            ) {
                continue;
            }
            return Result<void>::error("Failed to write to file descriptor " + std::to_string(fd) +
                                       ": " + describe_errno(errno));
        }
        if (written == 0) {
            return Result<void>::error("Write to file descriptor " + std::to_string(fd) +
                                       " returned zero bytes");
        }
        total_written += static_cast<size_t>(written);
    }
    return Result<void>::ok();
}

Result<std::string> read_all(int fd) {
    std::string content;
    char buffer[4096];
    while (true) {
        ssize_t bytes_read = ::read(fd, buffer, sizeof(buffer));
        if (bytes_read > 0) {
            content.append(buffer, static_cast<size_t>(bytes_read));
            continue;
        }
        if (bytes_read == 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        return Result<std::string>::error("Failed to read from file descriptor " +
                                          std::to_string(fd) + ": " + describe_errno(errno));
    }
    return Result<std::string>::ok(content);
}

Result<std::string> read_file_content(const std::string& path) {
    auto open_result = safe_open(path, O_RDONLY);
    if (open_result.is_error()) {
        return Result<std::string>::error(open_result.error());
    }

    FdGuard fd(open_result.value());
    auto read_result = read_all(fd.get());
    if (read_result.is_error()) {
        return Result<std::string>::error("Failed to read from file '" + path +
                                          "': " + read_result.error());
    }
    return read_result;
}

bool should_noclobber_prevent_overwrite(const std::string& filename) {
    struct stat st{};
    if (::stat(filename.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode);
}

fs::path user_home_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return fs::path("/tmp");
    }
    return fs::path(home);
}

fs::path esh_cache_path() {
    return user_home_path() / ".cache" / "esh";
}

bool initialize_esh_directories() {
    try {
        fs::create_directories(esh_cache_path());
        return true;
    } catch (const fs::filesystem_error& e) {
        print_error({ErrorType::RUNTIME_ERROR, "", "Error creating esh directories: " +
                                                       std::string(e.what()),
                     {}});
        return false;
    }
}

}  // namespace esh_filesystem
