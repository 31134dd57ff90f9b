#include <acb/process.hpp>
#include <acb/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace acb {

// Exit status the child uses when chdir/exec fails
static constexpr int EXEC_FAILED = 127;

std::string command_line(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        if (a.find_first_of(" \t\"'") != std::string::npos) {
            out += '\'' + a + '\'';
        } else {
            out += a;
        }
    }
    return out;
}

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return AcbError{AcbError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe(stdout_pipe) != 0) {
        return AcbError{AcbError::Process,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return AcbError{AcbError::Process,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    log::trace("running `%s` in %s", command_line(args).c_str(),
               working_dir.empty() ? "." : working_dir.c_str());

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return AcbError{AcbError::Process,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(EXEC_FAILED);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(EXEC_FAILED);
    }

    // Parent
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    auto close_pipes = [&] {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
    };

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    for (;;) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close_pipes();
            return AcbError{AcbError::Process,
                "`" + command_line(args) + "` timed out after "
                    + std::to_string(timeout_seconds) + "s"};
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close_pipes();

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        }
        if (w < 0 && errno != EINTR) {
            close_pipes();
            return AcbError{AcbError::Process,
                std::string("waitpid() failed: ") + strerror(errno)};
        }

        usleep(1000);
    }
}

} // namespace acb
