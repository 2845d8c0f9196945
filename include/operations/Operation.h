#ifndef FILE_COMMANDER_OPERATION_H
#define FILE_COMMANDER_OPERATION_H

#include "core/Error.h"
#include <string>
#include <vector>
#include <variant>

namespace FileCommander {

/**
 * Operation kinds understood by the registry
 */
enum class OperationKind {
    CreateFolder,
    CreateFile,
    Rename,
    Move,
    MoveAll,
    OpenLocation,
    Search,
    PlayBestMatch,
    Unrecognized
};

// Parameters of each operation; empty strings mean "not given"

struct CreateFolderOp {
    std::string folderName;
    std::string location;
};

struct CreateFileOp {
    std::string fileName;
    std::string location;
    std::string content;
};

struct RenameOp {
    std::string oldName;
    std::string newName;
    std::string location;
};

struct MoveOp {
    std::string source;
    std::string destination;
};

struct MoveAllOp {
    std::string sourceDir;
    std::string destinationDir;
};

struct OpenLocationOp {
    std::string location;
};

struct SearchOp {
    std::string searchTerm;
    std::string searchPath;
};

struct PlayBestMatchOp {
    std::string movieName;
};

struct UnrecognizedOp {
    std::string rawKind;   // Operation name as received, may be empty
};

using Operation = std::variant<CreateFolderOp, CreateFileOp, RenameOp, MoveOp, MoveAllOp,
                               OpenLocationOp, SearchOp, PlayBestMatchOp, UnrecognizedOp>;

/**
 * Ordered list of operations, executed first to last
 */
using Plan = std::vector<Operation>;

OperationKind kindOf(const Operation& operation);

/**
 * One row of a search listing
 */
struct SearchRow {
    int index = 0;            // 1-based
    std::string fileName;
    std::string directory;
};

/**
 * Outcome of one executed operation
 */
struct StepResult {
    std::string message;
    bool succeeded = false;
    ErrorCode code = ErrorCode::OK;
    std::vector<SearchRow> rows;

    static StepResult ok(const std::string& message, ErrorCode code = ErrorCode::OK) {
        StepResult r;
        r.message = message;
        r.succeeded = true;
        r.code = code;
        return r;
    }

    static StepResult failure(const std::string& message, ErrorCode code) {
        StepResult r;
        r.message = message;
        r.succeeded = false;
        r.code = code;
        return r;
    }
};

/**
 * Candidate file produced by a media scan
 */
struct FileMatch {
    std::string path;
    int score = 0;
};

} // namespace FileCommander

#endif // FILE_COMMANDER_OPERATION_H
