#include "synthflat/core/process.hpp"
#include "synthflat/core/errors.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace synthflat::core {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

// The child leads its own process group, so helpers it spawned die with it
void kill_and_reap(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0) ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

ProcessResult run_process(const fs::path& executable,
                          const std::vector<std::string>& args,
                          std::chrono::seconds timeout,
                          const std::atomic<bool>* stop_flag) {
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(executable.string());
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    // Exec failure is reported through a close-on-exec pipe
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        throw ExternalToolError("pipe2() failed: " + std::string(std::strerror(errno)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        throw ExternalToolError("fork() failed: " + std::string(std::strerror(e)));
    }

    if (pid == 0) {
        ::close(err_pipe[0]);
        ::setpgid(0, 0);
        ::dup2(STDERR_FILENO, STDOUT_FILENO);
        ::execv(argv[0], argv.data());
        int e = errno;
        ssize_t ignored = ::write(err_pipe[1], &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    ::close(err_pipe[1]);
    int exec_errno = 0;
    ssize_t n = ::read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    ::close(err_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw ExternalToolError("cannot execute " + executable.string() + ": " +
                                std::strerror(exec_errno));
    }

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
            return result;
        }
        if (r < 0 && errno != EINTR) {
            throw ExternalToolError("waitpid() failed: " + std::string(std::strerror(errno)));
        }

        if (stop_flag && stop_flag->load()) {
            kill_and_reap(pid);
            result.cancelled = true;
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill_and_reap(pid);
            result.timed_out = true;
            return result;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

ScopedTempDir::ScopedTempDir(const std::string& prefix) {
    std::string templ = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
    if (::mkdtemp(templ.data()) == nullptr) {
        throw IOError("Cannot create temporary directory: " + templ);
    }
    path_ = templ;
}

ScopedTempDir::~ScopedTempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

} // namespace synthflat::core
