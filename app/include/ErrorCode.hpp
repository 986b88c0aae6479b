#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>

namespace ErrorCodes {

enum class Code {
    UNKNOWN_ERROR = 0,

    // Usage (1000-1099)
    USAGE_MISSING_COMMAND = 1000,
    USAGE_UNKNOWN_COMMAND = 1001,
    USAGE_UNKNOWN_OPTION = 1002,
    USAGE_MISSING_ARGUMENT = 1003,
    USAGE_MISSING_OPTION_VALUE = 1004,
    USAGE_INVALID_OPTION_VALUE = 1005,
    USAGE_MISSING_REQUIRED_OPTION = 1006,
    USAGE_INVALID_PATTERN = 1007,

    // File system (1200-1299)
    FILE_NOT_FOUND = 1200,
    FILE_READ_FAILED = 1201,
    DIRECTORY_INVALID = 1210,
    DIRECTORY_NOT_WRITABLE = 1211,
    PATH_ESCAPES_ROOT = 1220,

    // Archive (1300-1399)
    ARCHIVE_INIT_FAILED = 1300,
    ARCHIVE_OPEN_FAILED = 1301,
    ARCHIVE_WRITE_FAILED = 1302,
    ARCHIVE_ENTRY_CHANGED = 1303,
    ARCHIVE_FINALIZE_FAILED = 1304,
    ARCHIVE_COMMIT_FAILED = 1305,

    // Validation (1600-1699)
    VALIDATION_INVALID_ARGUMENT = 1600
};

enum class Category {
    Usage,
    FileSystem,
    Archive,
    Validation,
    Unknown
};

Category category_of(Code code);

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message plus context, the line shown on the error stream
    std::string get_user_message() const;

    // Code, message, context and resolution; used for debug logs
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
