#include "CommandRunner.hpp"
#include "Archiver.hpp"
#include "Cleaner.hpp"
#include "ErrorMessages.hpp"
#include "HostMonitor.hpp"
#include "InspectionService.hpp"
#include "Logger.hpp"
#include "Reporter.hpp"
#include "TokenFrequencyCounter.hpp"
#include "Utils.hpp"
#include <app_version.hpp>

#include <fmt/format.h>

#include <fstream>
#include <system_error>

using ErrorCodes::Code;

CommandRunner::CommandRunner(std::ostream& out, std::ostream& err, std::filesystem::path proc_root)
    : out(out),
      err(err),
      proc_root_(std::move(proc_root))
{
}


int CommandRunner::run(const std::vector<std::string>& args)
{
    try {
        return execute(CommandLine::parse(args));
    } catch (const ErrorCodes::AppException& ex) {
        return report_failure(ex);
    }
}


int CommandRunner::execute(const ParsedCommand& command)
{
    auto logger = Logger::get_logger("cli_logger");
    try {
        switch (command.kind) {
            case CommandKind::Help:
                out << CommandLine::usage();
                break;
            case CommandKind::Version:
                out << APP_VERSION.to_string() << '\n';
                break;
            case CommandKind::Inspect:
                run_inspect(command.inspect.value());
                break;
            case CommandKind::Backup:
                run_backup(command.backup.value());
                break;
            case CommandKind::Cleanup:
                run_cleanup(command.cleanup.value());
                break;
            case CommandKind::Process:
                run_process(command.process.value());
                break;
            case CommandKind::Monitor:
                run_monitor();
                break;
        }
    } catch (const ErrorCodes::AppException& ex) {
        return report_failure(ex);
    } catch (const std::filesystem::filesystem_error& ex) {
        if (logger) {
            logger->error("Filesystem error: {}", ex.what());
        }
        err << fmt::format(fmt::runtime(_("Error: {}")), ex.what()) << '\n';
        return kExitFailure;
    }

    out.flush();
    return kExitSuccess;
}


void CommandRunner::run_inspect(const InspectOptions& options)
{
    if (auto logger = Logger::get_logger("cli_logger")) {
        logger->info("Inspecting '{}'", Utils::path_to_utf8(options.root));
    }
    InspectionService service(scanner);
    const InspectionReport report = service.inspect(
        SelectionCriteria{options.root, options.extension, options.pattern});

    Reporter reporter(out);
    reporter.render_inspection(report);
}


void CommandRunner::run_backup(const BackupOptions& options)
{
    if (auto logger = Logger::get_logger("cli_logger")) {
        logger->info("Creating archive '{}'", Utils::path_to_utf8(options.output));
    }
    Archiver archiver(scanner);
    const ArchiveSummary summary = archiver.backup(options.root, options.output, options.extension);

    Reporter reporter(out);
    reporter.render_archive(summary);
}


void CommandRunner::run_cleanup(const CleanupOptions& options)
{
    if (auto logger = Logger::get_logger("cli_logger")) {
        logger->info("Cleaning up '{}'{}", Utils::path_to_utf8(options.root),
                     options.dry_run ? " (dry run)" : "");
    }
    Cleaner cleaner(scanner);
    const CleanupResult result = cleaner.clean(options.root, CleanupRules::defaults(), options.dry_run);

    Reporter reporter(out);
    reporter.render_cleanup(result);
}


void CommandRunner::run_process(const ProcessOptions& options)
{
    const std::string label = Utils::path_to_utf8(options.file);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(options.file, ec)) {
        THROW_APP_ERROR(Code::FILE_NOT_FOUND, label);
    }

    std::ifstream input(options.file, std::ios::binary);
    if (!input) {
        THROW_APP_ERROR(Code::FILE_READ_FAILED, label);
    }
    if (auto logger = Logger::get_logger("cli_logger")) {
        logger->info("Processing '{}'", label);
    }

    TokenFrequencyCounter counter;
    const TextReport report = counter.analyze(input, options.top);
    if (input.bad()) {
        THROW_APP_ERROR(Code::FILE_READ_FAILED, label);
    }

    Reporter reporter(out);
    reporter.render_text_report(options.file, report);
}


void CommandRunner::run_monitor()
{
    std::error_code ec;
    const std::filesystem::path work_dir = std::filesystem::current_path(ec);
    if (ec) {
        if (auto logger = Logger::get_logger("cli_logger")) {
            logger->warn("Cannot determine the working directory: {}", ec.message());
        }
    }

    HostMonitor monitor(scanner, proc_root_);
    const HostSnapshot snapshot = monitor.snapshot(ec ? std::filesystem::path(".") : work_dir);

    Reporter reporter(out);
    reporter.render_host_snapshot(snapshot);
}


int CommandRunner::report_failure(const ErrorCodes::AppException& ex)
{
    if (auto logger = Logger::get_logger("cli_logger")) {
        logger->debug("Command failed: {}", ex.get_full_details());
    }
    out.flush();
    err << fmt::format(fmt::runtime(_("Error: {}")), ex.get_user_message()) << '\n';
    if (ex.is_usage_error()) {
        err << MSG_TRY_HELP << '\n';
    }
    return kExitFailure;
}
