#include "CommandLine.hpp"
#include "AppException.hpp"
#include "ErrorMessages.hpp"

#include <fmt/format.h>

#include <charconv>
#include <system_error>

using ErrorCodes::Code;

CommandLine::Cursor::Cursor(const std::vector<std::string>& args, std::string command)
    : args_(args),
      command_(std::move(command))
{
}


bool CommandLine::Cursor::done() const
{
    return index_ >= args_.size();
}


const std::string& CommandLine::Cursor::next()
{
    return args_.at(index_++);
}


std::string CommandLine::Cursor::value_for(const std::string& option)
{
    if (done()) {
        THROW_APP_ERROR(Code::USAGE_MISSING_OPTION_VALUE, fmt::format("{} {}", command_, option));
    }
    return next();
}


std::filesystem::path CommandLine::Cursor::positional()
{
    if (done() || args_[index_].starts_with("--")) {
        THROW_APP_ERROR(Code::USAGE_MISSING_ARGUMENT, command_);
    }
    return std::filesystem::path(next());
}


void CommandLine::Cursor::reject(const std::string& option) const
{
    THROW_APP_ERROR(Code::USAGE_UNKNOWN_OPTION, fmt::format("{} {}", command_, option));
}


ParsedCommand CommandLine::parse(const std::vector<std::string>& args)
{
    ParsedCommand parsed;
    if (args.empty()) {
        parsed.kind = CommandKind::Help;
        return parsed;
    }

    const auto kind = command_from_name(args.front());
    if (!kind) {
        THROW_APP_ERROR(Code::USAGE_UNKNOWN_COMMAND, args.front());
    }
    parsed.kind = *kind;

    Cursor cursor(args, args.front());
    switch (parsed.kind) {
        case CommandKind::Inspect:
            parsed.inspect = parse_inspect(cursor);
            break;
        case CommandKind::Backup:
            parsed.backup = parse_backup(cursor);
            break;
        case CommandKind::Cleanup:
            parsed.cleanup = parse_cleanup(cursor);
            break;
        case CommandKind::Process:
            parsed.process = parse_process(cursor);
            break;
        case CommandKind::Monitor:
            parsed.monitor = MonitorOptions{};
            [[fallthrough]];
        case CommandKind::Help:
        case CommandKind::Version:
            if (!cursor.done()) {
                cursor.reject(cursor.next());
            }
            break;
    }
    return parsed;
}


std::optional<CommandKind> CommandLine::command_from_name(const std::string& name)
{
    if (name == "help" || name == "-h" || name == "--help") {
        return CommandKind::Help;
    }
    if (name == "version" || name == "-v" || name == "--version") {
        return CommandKind::Version;
    }
    if (name == "inspect") {
        return CommandKind::Inspect;
    }
    if (name == "backup") {
        return CommandKind::Backup;
    }
    if (name == "cleanup") {
        return CommandKind::Cleanup;
    }
    if (name == "process") {
        return CommandKind::Process;
    }
    if (name == "monitor") {
        return CommandKind::Monitor;
    }
    return std::nullopt;
}


InspectOptions CommandLine::parse_inspect(Cursor& cursor)
{
    InspectOptions options;
    options.root = cursor.positional();
    while (!cursor.done()) {
        const std::string& option = cursor.next();
        if (option == "--pattern") {
            options.pattern = non_empty(cursor.value_for(option));
        } else if (option == "--ext") {
            options.extension = non_empty(cursor.value_for(option));
        } else {
            cursor.reject(option);
        }
    }
    return options;
}


BackupOptions CommandLine::parse_backup(Cursor& cursor)
{
    BackupOptions options;
    options.root = cursor.positional();
    while (!cursor.done()) {
        const std::string& option = cursor.next();
        if (option == "--output") {
            options.output = cursor.value_for(option);
        } else if (option == "--ext") {
            options.extension = non_empty(cursor.value_for(option));
        } else {
            cursor.reject(option);
        }
    }
    if (options.output.empty()) {
        THROW_APP_ERROR(Code::USAGE_MISSING_REQUIRED_OPTION, "backup --output");
    }
    return options;
}


CleanupOptions CommandLine::parse_cleanup(Cursor& cursor)
{
    CleanupOptions options;
    options.root = cursor.positional();
    while (!cursor.done()) {
        const std::string& option = cursor.next();
        if (option == "--dry-run") {
            options.dry_run = true;
        } else {
            cursor.reject(option);
        }
    }
    return options;
}


ProcessOptions CommandLine::parse_process(Cursor& cursor)
{
    ProcessOptions options;
    options.file = cursor.positional();
    while (!cursor.done()) {
        const std::string& option = cursor.next();
        if (option == "--top") {
            options.top = parse_top(cursor.value_for(option));
        } else {
            cursor.reject(option);
        }
    }
    return options;
}


int CommandLine::parse_top(const std::string& value)
{
    int top = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, top);
    if (value.empty() || ec != std::errc() || ptr != last) {
        THROW_APP_ERROR_MSG(Code::USAGE_INVALID_OPTION_VALUE,
                            fmt::format(fmt::runtime(_("--top expects an integer, got '{}'")), value),
                            "process --top");
    }
    return top;
}


std::optional<std::string> CommandLine::non_empty(std::string value)
{
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}


std::string CommandLine::usage()
{
    return _(
        "systoolkit - directory inspection, backup and cleanup toolkit\n"
        "\n"
        "Usage:\n"
        "  systoolkit <command> [options]\n"
        "\n"
        "Commands:\n"
        "  help                                   Show this help\n"
        "  version                                Print the version\n"
        "  inspect <dir> [--pattern PAT] [--ext EXT]\n"
        "                                         Summarize a directory, or grep its files for PAT\n"
        "  backup  <dir> --output FILE.tar.gz [--ext EXT]\n"
        "                                         Archive the files below <dir>\n"
        "  cleanup <dir> [--dry-run]              Delete *.tmp, *.log, *~ and *.bak files\n"
        "  process <file> [--top N]               Count lines, words, bytes and frequent tokens\n"
        "  monitor                                Show disks, large directories and busy processes\n"
        "\n"
        "Environment:\n"
        "  SYSTOOLKIT_LOG_LEVEL   trace, debug, info, warn, error, critical or off (default info)\n"
        "  SYSTOOLKIT_LOG_FILE    also write a debug log to this file\n");
}
