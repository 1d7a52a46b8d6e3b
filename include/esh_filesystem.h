/*
  esh_filesystem.h

  This file is part of esh, an embeddable shell

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#pragma once

#include <limits.h>
#include <unistd.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace esh_filesystem {
namespace fs = std::filesystem;

struct Error {
    std::string message;
    explicit Error(const std::string& msg) : message(msg) {
    }
};

template <typename T>
class Result {
   public:
    explicit Result(T value) : value_(std::move(value)), has_value_(true) {
    }
    explicit Result(const Error& error) : error_(error.message), has_value_(false) {
    }

    static Result<T> ok(T value) {
        return Result<T>(std::move(value));
    }
    static Result<T> error(const std::string& message) {
        return Result<T>(Error(message));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const T& value() const {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error Result");
        return value_;
    }

    T& value() {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error Result");
        return value_;
    }

    const std::string& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

   private:
    T value_{};
    std::string error_;
    bool has_value_;
};

template <>
class Result<void> {
   public:
    Result() : has_value_(true) {
    }
    explicit Result(const Error& error) : error_(error.message), has_value_(false) {
    }

    static Result<void> ok() {
        return Result<void>();
    }
    static Result<void> error(const std::string& message) {
        return Result<void>(Error(message));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const std::string& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

   private:
    std::string error_;
    bool has_value_;
};

Result<int> safe_open(const std::string& path, int flags, mode_t mode = 0644);
void safe_close(int fd);

Result<FILE*> safe_fopen(const std::string& path, const std::string& mode);
void safe_fclose(FILE* file);

Result<void> create_pipe_cloexec(int pipe_fds[2]);
void close_pipe(int pipe_fds[2]);
bool error_indicates_broken_pipe(std::string_view message);

Result<std::string> create_temp_file(const std::string& prefix = "esh_temp");
void cleanup_temp_file(const std::string& path);

Result<std::string> read_file_content(const std::string& path);
Result<std::string> read_all(int fd);
Result<void> write_all(int fd, std::string_view data);

bool should_noclobber_prevent_overwrite(const std::string& filename);

fs::path user_home_path();
fs::path esh_cache_path();
bool initialize_esh_directories();

// Owns one descriptor and closes it on destruction.
class FdGuard {
   public:
    FdGuard() = default;
    explicit FdGuard(int fd) : fd_(fd) {
    }
    ~FdGuard() {
        reset();
    }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    FdGuard(FdGuard&& other) noexcept : fd_(other.release()) {
    }
    FdGuard& operator=(FdGuard&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const {
        return fd_;
    }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1) {
        safe_close(fd_);
        fd_ = fd;
    }

   private:
    int fd_ = -1;
};

}  // namespace esh_filesystem
