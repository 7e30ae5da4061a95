#ifndef APP_EXCEPTION_HPP
#define APP_EXCEPTION_HPP

#include "ErrorCode.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace ErrorCodes {

/**
 * @brief Exception carrying a catalog error code and the failing context.
 *
 * what() is the short catalog message (or the custom one); the resolution
 * hint is only part of get_user_message().
 */
class AppException : public std::runtime_error {
public:
    explicit AppException(Code code, const std::string& context = "")
        : AppException(ErrorCatalog::get_error_info(code, context)) {}

    AppException(Code code, const std::string& custom_message, const std::string& context)
        : AppException(ErrorInfo(code, custom_message,
                                 ErrorCatalog::get_error_info(code).resolution, context)) {}

    Code get_error_code() const noexcept { return info_.code; }
    int get_error_code_int() const noexcept { return to_int(info_.code); }
    const ErrorInfo& get_error_info() const noexcept { return info_; }
    const std::string& context() const noexcept { return info_.context; }

    std::string get_user_message() const { return info_.get_user_message(); }
    std::string get_full_details() const { return info_.get_full_details(); }

private:
    explicit AppException(ErrorInfo info)
        : std::runtime_error(info.message),
          info_(std::move(info)) {}

    ErrorInfo info_;
};

} // namespace ErrorCodes

// Throws with the catalog message; context names the file or key involved.
#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

#define THROW_APP_ERROR_MSG(code, message, context) \
    throw ErrorCodes::AppException(code, message, context)

#endif // APP_EXCEPTION_HPP
