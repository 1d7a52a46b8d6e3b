#pragma once

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

#include <filesystem>
#include <string>
#include <system_error>

#include "esh_filesystem.h"
#include "io_context.h"
#include "shell_script_interpreter.h"

namespace esh_test {

struct ScriptOutput {
    int status = 0;
    std::string out;
    std::string err;
};

// Runs text in shell with stdin from /dev/null and both output streams captured.
inline ScriptOutput run_script(ShellScriptInterpreter& shell, const std::string& text) {
    ScriptOutput output;
    auto out_path = esh_filesystem::create_temp_file("esh_test_out");
    auto err_path = esh_filesystem::create_temp_file("esh_test_err");
    if (out_path.is_error() || err_path.is_error()) {
        output.status = -1;
        return output;
    }

    {
        esh_filesystem::FdGuard in(::open("/dev/null", O_RDONLY | O_CLOEXEC));
        esh_filesystem::FdGuard out(::open(out_path.value().c_str(), O_WRONLY | O_CLOEXEC));
        esh_filesystem::FdGuard err(::open(err_path.value().c_str(), O_WRONLY | O_CLOEXEC));

        IoContext io;
        io.in = in.get();
        io.out = out.get();
        io.err = err.get();
        output.status = shell.execute_script(text, io);
    }

    auto out_text = esh_filesystem::read_file_content(out_path.value());
    auto err_text = esh_filesystem::read_file_content(err_path.value());
    output.out = out_text.is_ok() ? out_text.value() : std::string();
    output.err = err_text.is_ok() ? err_text.value() : std::string();
    esh_filesystem::cleanup_temp_file(out_path.value());
    esh_filesystem::cleanup_temp_file(err_path.value());
    return output;
}

// Fresh directory under /tmp, removed on destruction.
class TempDir {
   public:
    TempDir() {
        char templ[] = "/tmp/esh_test_dir_XXXXXX";
        if (mkdtemp(templ) != nullptr) {
            path_ = templ;
        }
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const {
        return path_;
    }

   private:
    std::string path_;
};

}  // namespace esh_test
