#include "operations/OperationRegistry.h"
#include "core/LogManager.h"

#include <exception>

namespace FileCommander {

namespace {

std::string param(const std::map<std::string, std::string>& parameters, const std::string& key) {
    auto it = parameters.find(key);
    return it != parameters.end() ? it->second : std::string();
}

/**
 * Routes each alternative to its handler
 */
struct Dispatcher {
    FileOperations& ops;

    StepResult operator()(const CreateFolderOp& op) const {
        return ops.createFolder(op.folderName, op.location);
    }
    StepResult operator()(const CreateFileOp& op) const {
        return ops.createFile(op.fileName, op.location, op.content);
    }
    StepResult operator()(const RenameOp& op) const {
        return ops.renameItem(op.oldName, op.newName, op.location);
    }
    StepResult operator()(const MoveOp& op) const {
        return ops.moveItem(op.source, op.destination);
    }
    StepResult operator()(const MoveAllOp& op) const {
        return ops.moveAllFiles(op.sourceDir, op.destinationDir);
    }
    StepResult operator()(const OpenLocationOp& op) const {
        return ops.openLocation(op.location);
    }
    StepResult operator()(const SearchOp& op) const {
        return ops.searchFiles(op.searchTerm, op.searchPath);
    }
    StepResult operator()(const PlayBestMatchOp& op) const {
        return ops.playBestMatch(op.movieName);
    }
    StepResult operator()(const UnrecognizedOp& op) const {
        LOG_WARNING(LogCategory::Plan, "execute",
                    "Unrecognized operation '" + op.rawKind + "'");
        return StepResult::failure(OperationRegistry::UNRECOGNIZED_MESSAGE,
                                   ErrorCode::PLAN_UNRECOGNIZED_OPERATION);
    }
};

} // anonymous namespace

OperationRegistry::OperationRegistry(FileOperations& operations)
    : m_operations(operations) {
}

const std::vector<OperationSpec>& OperationRegistry::catalog() {
    static const std::vector<OperationSpec> specs = {
        {OperationKind::CreateFolder, "create_folder", "Create a new folder",
            {{"folder_name", false}, {"location", true}}},
        {OperationKind::CreateFile, "create_file", "Create a new file",
            {{"file_name", false}, {"location", true}, {"content", true}}},
        {OperationKind::Rename, "rename_item", "Rename a file or folder",
            {{"old_name", false}, {"new_name", false}, {"location", true}}},
        {OperationKind::Move, "move_item", "Move a file or folder",
            {{"source", false}, {"destination", false}}},
        {OperationKind::MoveAll, "move_all_files", "Move every file from one folder to another",
            {{"source_dir", false}, {"destination_dir", false}}},
        {OperationKind::OpenLocation, "open_file_explorer", "Open the file manager at a location",
            {{"location", true}}},
        {OperationKind::Search, "search_files", "Search for files by name",
            {{"search_term", false}, {"search_path", true}}},
        {OperationKind::PlayBestMatch, "play_movie", "Find a movie by title and play it",
            {{"movie_name", false}}},
    };
    return specs;
}

const OperationSpec* OperationRegistry::findSpec(const std::string& name) {
    for (const auto& spec : catalog()) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

std::string OperationRegistry::kindName(OperationKind kind) {
    for (const auto& spec : catalog()) {
        if (spec.kind == kind) {
            return spec.name;
        }
    }
    return "unknown";
}

Operation OperationRegistry::build(const std::string& name,
                                   const std::map<std::string, std::string>& p) {
    const OperationSpec* spec = findSpec(name);
    if (!spec) {
        return UnrecognizedOp{name};
    }

    switch (spec->kind) {
        case OperationKind::CreateFolder:
            return CreateFolderOp{param(p, "folder_name"), param(p, "location")};
        case OperationKind::CreateFile:
            return CreateFileOp{param(p, "file_name"), param(p, "location"), param(p, "content")};
        case OperationKind::Rename:
            return RenameOp{param(p, "old_name"), param(p, "new_name"), param(p, "location")};
        case OperationKind::Move:
            return MoveOp{param(p, "source"), param(p, "destination")};
        case OperationKind::MoveAll:
            return MoveAllOp{param(p, "source_dir"), param(p, "destination_dir")};
        case OperationKind::OpenLocation:
            return OpenLocationOp{param(p, "location")};
        case OperationKind::Search:
            return SearchOp{param(p, "search_term"), param(p, "search_path")};
        case OperationKind::PlayBestMatch:
            return PlayBestMatchOp{param(p, "movie_name")};
        case OperationKind::Unrecognized:
            break;
    }
    return UnrecognizedOp{name};
}

StepResult OperationRegistry::execute(const Operation& operation) {
    const std::string name = kindName(kindOf(operation));
    try {
        return std::visit(Dispatcher{m_operations}, operation);
    } catch (const std::exception& e) {
        LogManager::instance().log(LogLevel::Error, LogCategory::Plan, name,
                                   "Operation threw", e.what());
        return StepResult::failure("Error: " + std::string(e.what()), ErrorCode::UNKNOWN_ERROR);
    }
}

} // namespace FileCommander
