#include "unflake/analysis/pyflakes_runner.hpp"
#include "unflake/core/text_utils.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/wait.h>
#include <unistd.h>

namespace unflake {

namespace {

constexpr int launch_failure_status = 127;

auto system_error_message(const std::string& what) -> std::string {
    return what + ": " + std::strerror(errno);
}

// Temporary file holding the text under analysis; removed on destruction
class TemporarySource {
public:
    explicit TemporarySource(const std::string& content) {
        auto pattern = (std::filesystem::temp_directory_path() / "unflake-XXXXXX").string();
        fd_ = mkstemp(pattern.data());
        if (fd_ == -1) {
            throw AnalyzerError(system_error_message("cannot create temporary file"));
        }
        path_ = pattern;

        size_t written = 0;
        while (written < content.size()) {
            auto rc = ::write(fd_, content.data() + written, content.size() - written);
            if (rc < 0 && errno == EINTR) {
                continue;
            }
            if (rc < 0) {
                auto message = system_error_message("cannot write temporary file");
                cleanup();
                throw AnalyzerError(message);
            }
            written += static_cast<size_t>(rc);
        }
        ::close(fd_);
        fd_ = -1;
    }

    ~TemporarySource() { cleanup(); }

    TemporarySource(const TemporarySource&) = delete;
    auto operator=(const TemporarySource&) -> TemporarySource& = delete;

    auto path() const -> const std::string& { return path_; }

private:
    int fd_ = -1;
    std::string path_;

    auto cleanup() -> void {
        if (fd_ != -1) {
            ::close(fd_);
            fd_ = -1;
        }
        if (!path_.empty()) {
            ::unlink(path_.c_str());
            path_.clear();
        }
    }
};

} // namespace

PyflakesRunner::PyflakesRunner(std::vector<std::string> command) : command_(std::move(command)) {
    if (command_.empty()) {
        command_.emplace_back("pyflakes");
    }
}

auto PyflakesRunner::analyze(const std::string& source) -> std::vector<Diagnostic> {
    TemporarySource file(source);
    return parser_.parse_report(run_command(file.path()));
}

auto PyflakesRunner::split_command(const std::string& command_line) -> std::vector<std::string> {
    return split_by_whitespace(command_line);
}

auto PyflakesRunner::run_command(const std::string& path) -> std::string {
    int pipe_fds[2];
    if (::pipe(pipe_fds) == -1) {
        throw AnalyzerError(system_error_message("pipe failed"));
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        auto message = system_error_message("fork failed");
        ::close(pipe_fds[0]);
        ::close(pipe_fds[1]);
        throw AnalyzerError(message);
    }

    if (pid == 0) {  // we are inside child
        ::dup2(pipe_fds[1], STDOUT_FILENO);
        ::close(pipe_fds[0]);
        ::close(pipe_fds[1]);

        // Syntax errors are reported on stderr; they mean "no diagnostics"
        int null_fd = ::open("/dev/null", O_WRONLY);
        if (null_fd != -1) {
            ::dup2(null_fd, STDERR_FILENO);
            ::close(null_fd);
        }

        std::vector<std::string> args = command_;
        args.push_back(path);
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        ::execvp(argv[0], argv.data());
        ::_exit(launch_failure_status);
    }

    // we are in parent
    ::close(pipe_fds[1]);
    std::string output;
    char buffer[4096];
    while (true) {
        auto count = ::read(pipe_fds[0], buffer, sizeof(buffer));
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count <= 0) {
            break;
        }
        output.append(buffer, static_cast<size_t>(count));
    }
    ::close(pipe_fds[0]);

    int wstatus = 0;
    while (::waitpid(pid, &wstatus, 0) == -1) {
        if (errno != EINTR) {
            throw AnalyzerError(system_error_message("waitpid failed"));
        }
    }

    if (!WIFEXITED(wstatus)) {
        throw AnalyzerError("'" + command_.front() + "' terminated by a signal");
    }

    // pyflakes exits with 1 whenever it reports something
    int status = WEXITSTATUS(wstatus);
    if (status == launch_failure_status) {
        throw AnalyzerError("failed to launch '" + command_.front() + "'");
    }
    if (status > 1) {
        throw AnalyzerError("'" + command_.front() + "' exited with status "
                            + std::to_string(status));
    }

    return output;
}

} // namespace unflake
