#include "core/Error.h"

namespace FileCommander {

const char* getCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::FS_SOURCE_MISSING: return "SourceMissing";
        case ErrorCode::FS_DESTINATION_EXISTS: return "DestinationExists";
        case ErrorCode::FS_NOT_A_DIRECTORY: return "NotADirectory";
        case ErrorCode::FS_ALREADY_EXISTS: return "AlreadyExists";
        case ErrorCode::FS_IO_FAILURE: return "UnderlyingIOFailure";
        case ErrorCode::FS_DESTINATION_MISSING: return "DestinationMissing";
        case ErrorCode::SEARCH_NO_MATCH: return "NoMatchFound";
        case ErrorCode::SEARCH_NO_FILES: return "NoFilesFound";
        case ErrorCode::PLAN_UNRECOGNIZED_OPERATION: return "UnrecognizedOperation";
        case ErrorCode::PLAN_NO_OPERATIONS: return "NoOperations";
        case ErrorCode::PLAN_PARSE_ERROR: return "PlanParseError";
        case ErrorCode::VALIDATION_INVALID_INPUT: return "InvalidInput";
        case ErrorCode::VALIDATION_MISSING_FIELD: return "MissingField";
        case ErrorCode::CONFIG_FILE_NOT_FOUND: return "ConfigFileNotFound";
        case ErrorCode::CONFIG_PARSE_ERROR: return "ConfigParseError";
        case ErrorCode::CONFIG_INVALID_VALUE: return "ConfigInvalidValue";
        case ErrorCode::INTERPRETER_NOT_CONFIGURED: return "InterpreterNotConfigured";
        case ErrorCode::INTERPRETER_REQUEST_FAILED: return "InterpreterRequestFailed";
        case ErrorCode::INTERPRETER_BAD_RESPONSE: return "InterpreterBadResponse";
        case ErrorCode::UNKNOWN_ERROR: return "UnknownError";
        default: return "Unknown";
    }
}

Error Error::fromErrorCode(const std::error_code& ec, const std::string& context) {
    if (!ec) {
        return Error::ok();
    }

    ErrorCode code;

    if (ec == std::errc::no_such_file_or_directory) {
        code = ErrorCode::FS_SOURCE_MISSING;
    } else if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty) {
        code = ErrorCode::FS_DESTINATION_EXISTS;
    } else if (ec == std::errc::not_a_directory) {
        code = ErrorCode::FS_NOT_A_DIRECTORY;
    } else {
        code = ErrorCode::FS_IO_FAILURE;
    }

    Error error(code, context, ec.message());
    error.withSystemError(ec.value());
    return error;
}

} // namespace FileCommander
