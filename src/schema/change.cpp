#include "schema/change.hpp"

namespace schema {

std::string to_string(ChangeType type) {
    switch (type) {
        case ChangeType::CreateTable: return "CreateTable";
        case ChangeType::DropTable: return "DropTable";
        case ChangeType::AddColumn: return "AddColumn";
        case ChangeType::DropColumn: return "DropColumn";
        case ChangeType::ModifyColumn: return "ModifyColumn";
        case ChangeType::AddConstraint: return "AddConstraint";
        case ChangeType::DropConstraint: return "DropConstraint";
        case ChangeType::AddIndex: return "AddIndex";
        case ChangeType::DropIndex: return "DropIndex";
        case ChangeType::ModifyIndex: return "ModifyIndex";
    }
    return "Unknown";
}

std::optional<std::string> Change::meta(const std::string& key) const {
    auto it = metadata.find(key);
    if (it == metadata.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace schema
