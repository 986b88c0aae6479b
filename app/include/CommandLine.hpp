#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "TokenFrequencyCounter.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

enum class CommandKind {
    Help,
    Version,
    Inspect,
    Backup,
    Cleanup,
    Process,
    Monitor
};

struct InspectOptions {
    std::filesystem::path root;
    std::optional<std::string> extension;
    std::optional<std::string> pattern;
};

struct BackupOptions {
    std::filesystem::path root;
    std::filesystem::path output;
    std::optional<std::string> extension;
};

struct CleanupOptions {
    std::filesystem::path root;
    bool dry_run{false};
};

struct ProcessOptions {
    std::filesystem::path file;
    int top{TokenFrequencyCounter::kDefaultTop};
};

struct MonitorOptions {};

/**
 * @brief Result of parsing argv. Exactly the options struct matching @c kind is set.
 */
struct ParsedCommand {
    CommandKind kind{CommandKind::Help};
    std::optional<InspectOptions> inspect;
    std::optional<BackupOptions> backup;
    std::optional<CleanupOptions> cleanup;
    std::optional<ProcessOptions> process;
    std::optional<MonitorOptions> monitor;
};

/**
 * @brief Hand-rolled long-option parser for the systoolkit commands.
 *
 * The command comes first, then its positional argument, then options in
 * any order. A repeated option keeps its last value and an empty
 * `--pattern` or `--ext` counts as not given. Errors are thrown as
 * AppException with a USAGE_* code.
 */
class CommandLine {
public:
    /**
     * @brief Parse the arguments that follow the program name.
     *
     * An empty argument list parses as `help`.
     */
    static ParsedCommand parse(const std::vector<std::string>& args);

    static std::optional<CommandKind> command_from_name(const std::string& name);

    static std::string usage();

private:
    class Cursor {
    public:
        Cursor(const std::vector<std::string>& args, std::string command);

        bool done() const;
        const std::string& next();
        std::string value_for(const std::string& option);
        std::filesystem::path positional();
        [[noreturn]] void reject(const std::string& option) const;

    private:
        const std::vector<std::string>& args_;
        std::size_t index_{1};
        std::string command_;
    };

    static InspectOptions parse_inspect(Cursor& cursor);
    static BackupOptions parse_backup(Cursor& cursor);
    static CleanupOptions parse_cleanup(Cursor& cursor);
    static ProcessOptions parse_process(Cursor& cursor);
    static int parse_top(const std::string& value);
    static std::optional<std::string> non_empty(std::string value);
};

#endif
