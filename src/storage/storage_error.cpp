#include "storage/storage_error.hpp"

namespace OmniStore::Storage
{

const char* OperationToString(Operation op)
{
    switch (op) {
        case Operation::Read:
            return "read";
        case Operation::Write:
            return "write";
        case Operation::Delete:
            return "delete";
        case Operation::Stat:
            return "stat";
        case Operation::List:
            return "list";
        case Operation::CreateDir:
            return "create_dir";
        default:
            return "unknown";
    }
}

StorageError StorageError::WithKind(StorageErrc kind, std::string_view note) const
{
    std::string detail = detail_;
    if (!note.empty()) {
        detail = detail.empty() ? std::string(note) : std::string(note) + ": " + detail;
    }
    return StorageError(kind, op_, path_, std::move(detail));
}

std::string StorageError::ToString() const
{
    std::string out = OperationToString(op_);
    out += ' ';
    out += path_.empty() ? "<none>" : path_;
    out += ": ";
    out += code_.message();
    if (!detail_.empty()) {
        out += " (";
        out += detail_;
        out += ')';
    }
    return out;
}

}  // namespace OmniStore::Storage
