#include "operations/Operation.h"

namespace FileCommander {

namespace {

struct KindVisitor {
    OperationKind operator()(const CreateFolderOp&) const { return OperationKind::CreateFolder; }
    OperationKind operator()(const CreateFileOp&) const { return OperationKind::CreateFile; }
    OperationKind operator()(const RenameOp&) const { return OperationKind::Rename; }
    OperationKind operator()(const MoveOp&) const { return OperationKind::Move; }
    OperationKind operator()(const MoveAllOp&) const { return OperationKind::MoveAll; }
    OperationKind operator()(const OpenLocationOp&) const { return OperationKind::OpenLocation; }
    OperationKind operator()(const SearchOp&) const { return OperationKind::Search; }
    OperationKind operator()(const PlayBestMatchOp&) const { return OperationKind::PlayBestMatch; }
    OperationKind operator()(const UnrecognizedOp&) const { return OperationKind::Unrecognized; }
};

} // anonymous namespace

OperationKind kindOf(const Operation& operation) {
    return std::visit(KindVisitor{}, operation);
}

} // namespace FileCommander
