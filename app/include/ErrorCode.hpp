#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

enum class Code {
    // File System (1200-1299)
    FILE_NOT_FOUND = 1200,
    FILE_OPEN_FAILED = 1204,
    FILE_READ_FAILED = 1205,
    DIRECTORY_INVALID = 1211,
    PATH_TOO_LONG = 1219,

    // Validation (1600-1699)
    VALIDATION_INVALID_FORMAT = 1601,
    VALIDATION_VALUE_OUT_OF_RANGE = 1605,

    // Naming (1800-1899)
    NAMING_NO_PHOTOS = 1800,
    NAMING_EXECUTION_BLOCKED = 1801,

    UNKNOWN_ERROR = 9999
};

struct ErrorInfo {
    Code code;
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message followed by the resolution steps, suitable for dialogs and stderr
    std::string get_user_message() const {
        if (resolution.empty()) {
            return message;
        }
        return message + "\n\n" + resolution;
    }

    // Everything including the numeric code and technical context
    std::string get_full_details() const {
        std::string details = "Error Code: " + std::to_string(static_cast<int>(code)) + "\n" + message;
        if (!resolution.empty()) {
            details += "\n\nResolution:\n" + resolution;
        }
        if (!context.empty()) {
            details += "\n\nDetails: " + context;
        }
        return details;
    }
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "") {
        switch (code) {
            case Code::FILE_NOT_FOUND:
                return ErrorInfo(code, "The requested file could not be found.",
                                 "Check that the path is correct and the file still exists.", context);
            case Code::FILE_OPEN_FAILED:
                return ErrorInfo(code, "The file could not be opened.",
                                 "Make sure the file is not locked by another program and that you have permission to read it.", context);
            case Code::FILE_READ_FAILED:
                return ErrorInfo(code, "The file could not be read.",
                                 "Check the disk and try again.", context);
            case Code::DIRECTORY_INVALID:
                return ErrorInfo(code, "The selected path is not an accessible directory.",
                                 "Choose an existing directory you have access to.", context);
            case Code::PATH_TOO_LONG:
                return ErrorInfo(code, "The output path is too long for this platform.",
                                 "Choose an output directory closer to the root of the drive.", context);
            case Code::VALIDATION_INVALID_FORMAT:
                return ErrorInfo(code, "The input is not in the expected format.",
                                 "Regenerate the photo list from the saved album page.", context);
            case Code::VALIDATION_VALUE_OUT_OF_RANGE:
                return ErrorInfo(code, "A value is out of the allowed range.", "", context);
            case Code::NAMING_NO_PHOTOS:
                return ErrorInfo(code, "No usable photos were found in the input.",
                                 "Make sure the album page was saved completely before loading it.", context);
            case Code::NAMING_EXECUTION_BLOCKED:
                return ErrorInfo(code, "Some photo names must be fixed before downloading.",
                                 "Edit the flagged descriptions or change the naming options.", context);
            case Code::UNKNOWN_ERROR:
            default:
                return ErrorInfo(Code::UNKNOWN_ERROR, "An unexpected error occurred.", "", context);
        }
    }
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
