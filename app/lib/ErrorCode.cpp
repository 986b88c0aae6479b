#include "ErrorCode.hpp"
#include "ErrorMessages.hpp"

#include <fmt/format.h>

namespace ErrorCodes {

namespace {

struct CatalogEntry {
    const char* message;
    const char* resolution;
};

CatalogEntry lookup(Code code)
{
    switch (code) {
        case Code::USAGE_MISSING_COMMAND:
            return {_("No command given"), _("Run 'systoolkit help' to list the commands.")};
        case Code::USAGE_UNKNOWN_COMMAND:
            return {_("Unknown command"), _("Run 'systoolkit help' to list the commands.")};
        case Code::USAGE_UNKNOWN_OPTION:
            return {_("Unknown option"), _("Check the options accepted by the command.")};
        case Code::USAGE_MISSING_ARGUMENT:
            return {_("Missing argument"), _("Pass the directory or file the command operates on.")};
        case Code::USAGE_MISSING_OPTION_VALUE:
            return {_("Option requires a value"), _("Pass a value after the option.")};
        case Code::USAGE_INVALID_OPTION_VALUE:
            return {_("Invalid option value"), _("Check the value passed to the option.")};
        case Code::USAGE_MISSING_REQUIRED_OPTION:
            return {_("Missing required option"), _("Add the required option to the command line.")};
        case Code::USAGE_INVALID_PATTERN:
            return {_("Invalid search pattern"), _("Use a POSIX basic regular expression, as for grep.")};
        case Code::FILE_NOT_FOUND:
            return {_("File not found"), _("Check that the file exists and is a regular file.")};
        case Code::FILE_READ_FAILED:
            return {_("Failed to read file"), _("Check the file permissions.")};
        case Code::DIRECTORY_INVALID:
            return {_("Not a directory"), _("Check that the path exists and is a directory.")};
        case Code::DIRECTORY_NOT_WRITABLE:
            return {_("Destination directory is not writable"),
                    _("Choose an output path inside an existing, writable directory.")};
        case Code::PATH_ESCAPES_ROOT:
            return {_("Path escapes the archive root"),
                    _("Only files below the archived directory can be stored.")};
        case Code::ARCHIVE_INIT_FAILED:
            return {_("Failed to initialize the archive writer"), _("Check the libarchive installation.")};
        case Code::ARCHIVE_OPEN_FAILED:
            return {_("Failed to open the archive for writing"), _("Check free space and permissions.")};
        case Code::ARCHIVE_WRITE_FAILED:
            return {_("Failed to write to the archive"), _("Check free space and permissions.")};
        case Code::ARCHIVE_ENTRY_CHANGED:
            return {_("File changed while it was being archived"),
                    _("Run the backup again once the directory is no longer being modified.")};
        case Code::ARCHIVE_FINALIZE_FAILED:
            return {_("Failed to finalize the archive"), _("Check free space and permissions.")};
        case Code::ARCHIVE_COMMIT_FAILED:
            return {_("Failed to move the archive into place"),
                    _("Check that the output path is not an existing directory.")};
        case Code::VALIDATION_INVALID_ARGUMENT:
            return {_("Invalid argument"), _("Check the value passed to the operation.")};
        case Code::UNKNOWN_ERROR:
        default:
            return {_("Unknown error"), _("Run again with SYSTOOLKIT_LOG_LEVEL=debug for details.")};
    }
}

} // namespace

Category category_of(Code code)
{
    const int value = static_cast<int>(code);
    if (value >= 1000 && value < 1100) {
        return Category::Usage;
    }
    if (value >= 1200 && value < 1300) {
        return Category::FileSystem;
    }
    if (value >= 1300 && value < 1400) {
        return Category::Archive;
    }
    if (value >= 1600 && value < 1700) {
        return Category::Validation;
    }
    return Category::Unknown;
}

std::string ErrorInfo::get_user_message() const
{
    if (context.empty()) {
        return message;
    }
    return fmt::format("{}: {}", message, context);
}

std::string ErrorInfo::get_full_details() const
{
    std::string details = fmt::format("[{}] {}", static_cast<int>(code), message);
    if (!context.empty()) {
        details += fmt::format(" ({})", context);
    }
    if (!resolution.empty()) {
        details += fmt::format(". {}", resolution);
    }
    return details;
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const CatalogEntry entry = lookup(code);
    return ErrorInfo(code, entry.message, entry.resolution, context);
}

} // namespace ErrorCodes
