#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace synthflat::core {

namespace fs = std::filesystem;

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
};

/**
 * Run an executable as a blocking child process.
 *
 * The child is killed (SIGKILL) and reaped if the timeout expires or
 * stop_flag becomes true; its stdout is redirected to our stderr so the
 * JSON event stream on stdout stays clean. Throws ExternalToolError if
 * the process cannot be started.
 */
ProcessResult run_process(const fs::path& executable,
                          const std::vector<std::string>& args,
                          std::chrono::seconds timeout,
                          const std::atomic<bool>* stop_flag = nullptr);

// Temporary directory removed on destruction
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix);
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

} // namespace synthflat::core
