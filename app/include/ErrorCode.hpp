#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

// Numeric ranges:
//   File system    1200-1299
//   Configuration  1500-1599
//   System         1700-1799
enum class Code {
    SUCCESS = 0,
    UNKNOWN_ERROR = 1,

    FILE_NOT_FOUND = 1200,
    FILE_ACCESS_DENIED = 1201,
    FILE_OPEN_FAILED = 1204,
    FILE_READ_FAILED = 1205,
    FILE_WRITE_FAILED = 1206,
    FILE_DELETE_FAILED = 1207,
    FILE_MOVE_FAILED = 1208,
    DIRECTORY_NOT_FOUND = 1210,
    DIRECTORY_CREATE_FAILED = 1213,
    PATH_INVALID = 1217,

    CONFIG_INVALID = 1500,
    CONFIG_MISSING = 1501,
    CONFIG_PARSE_ERROR = 1502,
    CONFIG_SAVE_FAILED = 1503,
    CONFIG_LOAD_FAILED = 1504,
    CONFIG_REQUIRED_FIELD_MISSING = 1506,

    SYSTEM_ENVIRONMENT_VARIABLE_NOT_SET = 1702,
    SYSTEM_PROCESS_LAUNCH_FAILED = 1706
};

struct ErrorInfo {
    Code code{Code::SUCCESS};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message followed by the resolution hint
    std::string get_user_message() const;

    // Code, message, resolution and technical context on separate lines
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

inline int to_int(Code code) { return static_cast<int>(code); }

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
