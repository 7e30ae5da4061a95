#include "ErrorCode.hpp"

#include <sstream>
#include <unordered_map>

namespace ErrorCodes {

namespace {

struct CatalogEntry {
    const char* message;
    const char* resolution;
};

const std::unordered_map<Code, CatalogEntry>& catalog()
{
    static const std::unordered_map<Code, CatalogEntry> entries = {
        {Code::UNKNOWN_ERROR,
         {"An unexpected error occurred.",
          "Restart the application. If the problem persists, report it with the log file attached."}},
        {Code::FILE_NOT_FOUND,
         {"The file could not be found.",
          "Check that the file exists and that the path is spelled correctly."}},
        {Code::FILE_ACCESS_DENIED,
         {"Access to the file was denied.",
          "Check the file permissions."}},
        {Code::FILE_OPEN_FAILED,
         {"The file could not be opened.",
          "Check that the file exists and is readable."}},
        {Code::FILE_READ_FAILED,
         {"The file could not be read.",
          "Check the file permissions and that the disk is healthy."}},
        {Code::FILE_WRITE_FAILED,
         {"The file could not be written.",
          "Check that the target directory is writable and that the disk is not full."}},
        {Code::FILE_DELETE_FAILED,
         {"The file could not be removed.",
          "Check the permissions of the containing directory."}},
        {Code::FILE_MOVE_FAILED,
         {"The file could not be replaced.",
          "Check the permissions of the containing directory."}},
        {Code::DIRECTORY_NOT_FOUND,
         {"The directory could not be found.",
          "Check that the directory exists."}},
        {Code::DIRECTORY_CREATE_FAILED,
         {"The directory could not be created.",
          "Check the permissions of the parent directory."}},
        {Code::PATH_INVALID,
         {"The path is invalid.",
          "Check the configured path."}},
        {Code::CONFIG_INVALID,
         {"The configuration is invalid.",
          "Reinstall the application or restore the default preferences file."}},
        {Code::CONFIG_MISSING,
         {"The configuration file is missing.",
          "Reinstall the application or run it with --dev from the source tree."}},
        {Code::CONFIG_PARSE_ERROR,
         {"The configuration file could not be parsed.",
          "Check the preferences file for JSON syntax errors."}},
        {Code::CONFIG_SAVE_FAILED,
         {"The configuration could not be saved.",
          "Check that the configuration directory is writable."}},
        {Code::CONFIG_LOAD_FAILED,
         {"The configuration could not be loaded.",
          "Check that the preferences file exists and is readable."}},
        {Code::CONFIG_REQUIRED_FIELD_MISSING,
         {"A required configuration value is missing.",
          "Restore the default preferences file."}},
        {Code::SYSTEM_ENVIRONMENT_VARIABLE_NOT_SET,
         {"A required environment variable is not set.",
          "Check the session environment."}},
        {Code::SYSTEM_PROCESS_LAUNCH_FAILED,
         {"The program could not be started.",
          "Check that the program is installed and executable."}}
    };
    return entries;
}

} // namespace

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + "\n\n" + resolution;
}

std::string ErrorInfo::get_full_details() const
{
    std::ostringstream oss;
    oss << "Error Code: " << static_cast<int>(code) << "\n"
        << "Message: " << message << "\n";
    if (!resolution.empty()) {
        oss << "Resolution: " << resolution << "\n";
    }
    if (!context.empty()) {
        oss << "Details: " << context << "\n";
    }
    return oss.str();
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const auto& entries = catalog();
    auto it = entries.find(code);
    if (it == entries.end()) {
        it = entries.find(Code::UNKNOWN_ERROR);
    }
    return ErrorInfo(code, it->second.message, it->second.resolution, context);
}

} // namespace ErrorCodes
