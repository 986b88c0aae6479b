#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include "AppException.hpp"
#include "CommandLine.hpp"
#include "FileScanner.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

/**
 * @brief Dispatches a parsed command and maps its outcome to an exit code.
 *
 * Results go to @c out; errors are printed to @c err as `Error: <message>`
 * and yield exit code 1. Finding nothing (no matches, nothing to clean)
 * is a successful run.
 */
class CommandRunner {
public:
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1;

    CommandRunner(std::ostream& out, std::ostream& err,
                  std::filesystem::path proc_root = "/proc");

    int run(const std::vector<std::string>& args);

    int execute(const ParsedCommand& command);

private:
    void run_inspect(const InspectOptions& options);
    void run_backup(const BackupOptions& options);
    void run_cleanup(const CleanupOptions& options);
    void run_process(const ProcessOptions& options);
    void run_monitor();
    int report_failure(const ErrorCodes::AppException& ex);

    std::ostream& out;
    std::ostream& err;
    std::filesystem::path proc_root_;
    FileScanner scanner;
};

#endif
