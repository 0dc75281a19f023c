#pragma once
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../core/errors.hpp"
#include "../util/log.hpp"
#include "file_stats.hpp"

namespace dsprof {

inline std::string find_executable_in_path(const std::string& command) {
    if (command.empty()) return "";
    if (command.find('/') != std::string::npos)
        return ::access(command.c_str(), X_OK) == 0 ? command : "";
    const char* path_env = std::getenv("PATH");
    if (!path_env) return "";

    std::stringstream ss{std::string(path_env)};
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        const std::filesystem::path candidate = std::filesystem::path(dir) / command;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && !ec && ::access(candidate.c_str(), X_OK) == 0)
            return candidate.string();
    }
    return "";
}

// Runs `executable args...` with stdout redirected into `output_path`; returns the exit code or -1.
inline int spawn_to_file(const std::string& executable,
                         const std::vector<std::string>& args,
                         const std::string& output_path)
{
    const int out_fd = ::open(output_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0600);
    if (out_fd < 0) return -1;

    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(out_fd);
        return -1;
    }
    if (pid == 0) {
        const int dev_null = ::open("/dev/null", O_WRONLY);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDERR_FILENO);
            ::close(dev_null);
        }
        if (::dup2(out_fd, STDOUT_FILENO) < 0) _exit(127);
        ::close(out_fd);

        std::vector<char*> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);
        ::execv(executable.c_str(), argv.data());
        _exit(127);
    }

    ::close(out_fd);
    int status = 0;
    if (::waitpid(pid, &status, 0) < 0) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// Temporary file removed on scope exit.
class scoped_temp_file {
public:
    explicit scoped_temp_file(const std::string& suffix) {
        std::string tmpl = (std::filesystem::temp_directory_path() / "dsprof_XXXXXX").string() + suffix;
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
        if (fd < 0) throw LoadError("cannot create temporary file in " +
                                    std::filesystem::temp_directory_path().string());
        ::close(fd);
        path_ = buf.data();
    }
    ~scoped_temp_file() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    scoped_temp_file(const scoped_temp_file&) = delete;
    scoped_temp_file& operator=(const scoped_temp_file&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Converts spreadsheet bytes (first sheet) to CSV text with an external converter.
inline std::string convert_spreadsheet_to_csv(std::string_view bytes,
                                              const std::string& extension,
                                              const std::string& converter)
{
    const std::string exe = find_executable_in_path(converter);
    if (exe.empty())
        throw LoadError(extension + " import requires '" + converter + "' on PATH");

    scoped_temp_file input(extension);
    scoped_temp_file output(".csv");
    write_file_bytes(input.path(), bytes);

    log_debug("converting {} with {}", extension, exe);
    const int rc = spawn_to_file(exe, {input.path()}, output.path());
    if (rc != 0)
        throw LoadError(fmt::format("{} exited with status {} while converting {} input", converter, rc, extension));
    return read_file_bytes(output.path());
}

}
