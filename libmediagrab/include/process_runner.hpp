/**
 * @file process_runner.hpp
 * @brief Runs external programs with an argument vector, a deadline and cancellation.
 */

#ifndef MEDIAGRAB_PROCESS_RUNNER_HPP
#define MEDIAGRAB_PROCESS_RUNNER_HPP

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

namespace mediagrab {

struct ProcessOptions {
    std::chrono::milliseconds timeout{std::chrono::minutes(10)};
    std::stop_token stop;
    std::size_t max_output = 16 * 1024 * 1024; ///< Per stream; extra output is discarded
};

struct ProcessResult {
    int exit_code = -1;     ///< -1 when the process did not exit normally
    bool timed_out = false;
    bool cancelled = false;
    std::string out;
    std::string err;
};

/**
 * @brief The program could not be started at all.
 */
class SpawnError : public std::runtime_error {
public:
    SpawnError(const std::string& message, const bool not_found)
        : std::runtime_error(message), not_found_(not_found) {}

    /// @return true when the executable was not found on PATH.
    [[nodiscard]] bool not_found() const noexcept { return not_found_; }

private:
    bool not_found_;
};

class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Run argv[0] (looked up on PATH) and wait for it.
     *
     * A timed-out or cancelled process is killed together with its children;
     * the result then has timed_out or cancelled set.
     * @throws SpawnError when the program cannot be started.
     */
    virtual ProcessResult run(const std::vector<std::string>& argv, const ProcessOptions& options) = 0;
};

/**
 * @brief IProcessRunner on posix_spawnp, with pipes for stdout and stderr.
 */
class PosixProcessRunner final : public IProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv, const ProcessOptions& options) override;
};

} // namespace mediagrab

#endif // MEDIAGRAB_PROCESS_RUNNER_HPP
