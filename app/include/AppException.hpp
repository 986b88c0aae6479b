#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace ErrorCodes {

/**
 * @brief The single exception type thrown by systoolkit components.
 *
 * what() returns the user-facing line (message plus context) so that
 * callers which only know std::exception still print something useful.
 */
class AppException : public std::runtime_error {
public:
    explicit AppException(Code code, const std::string& context = "")
        : AppException(ErrorCatalog::get_error_info(code, context)) {}

    // Replaces the catalog message; the catalog resolution is kept
    AppException(Code code, const std::string& custom_message, const std::string& context)
        : AppException(ErrorInfo(code, custom_message,
                                 ErrorCatalog::get_error_info(code).resolution, context)) {}

    explicit AppException(ErrorInfo info)
        : std::runtime_error(info.get_user_message()),
          info_(std::move(info)) {}

    Code get_error_code() const noexcept { return info_.code; }
    int get_error_code_int() const noexcept { return static_cast<int>(info_.code); }
    Category get_category() const { return category_of(info_.code); }

    const ErrorInfo& get_error_info() const noexcept { return info_; }
    std::string get_user_message() const { return info_.get_user_message(); }
    std::string get_full_details() const { return info_.get_full_details(); }

    // Usage errors get a pointer to the help text
    bool is_usage_error() const { return get_category() == Category::Usage; }

private:
    ErrorInfo info_;
};

} // namespace ErrorCodes

#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

#define THROW_APP_ERROR_MSG(code, message, context) \
    throw ErrorCodes::AppException(code, message, context)

#endif // APPEXCEPTION_HPP
