#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace netsentry::infra {

/**
 * @brief Outcome of running an external command.
 */
struct ProcessResult {
    bool started{false};       ///< The executable was found and launched
    bool timedOut{false};      ///< The wall-clock limit expired and the child was killed
    int exitCode{-1};          ///< Exit status, or -1 if the child did not exit normally
    std::string output;        ///< Captured standard output
    std::string errorMessage;  ///< Launch or wait failure description

    [[nodiscard]] bool succeeded() const { return started && !timedOut && exitCode == 0; }
};

/**
 * @brief Runs external commands without a shell.
 *
 * Arguments are passed to execv() verbatim. Standard output is captured;
 * standard error is discarded.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Runs a command and waits for it.
     * @param executable Absolute path, or a name looked up on PATH.
     * @param args Arguments, excluding argv[0].
     * @param timeout Wall-clock limit; the child is killed when it expires.
     * @return Process outcome. Never throws for child failures.
     */
    virtual ProcessResult run(const std::string& executable, const std::vector<std::string>& args,
                              std::chrono::milliseconds timeout);

    /**
     * @brief Resolves an executable name against PATH.
     * @param name Name or path.
     * @return Absolute path of an executable file, or std::nullopt.
     */
    virtual std::optional<std::string> findExecutable(const std::string& name);
};

} // namespace netsentry::infra
