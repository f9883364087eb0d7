#include "schema/operation.hpp"

namespace strata::schema {

OperationKind kind_of(const Operation& op) {
    return std::visit([](const auto& o) -> OperationKind {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, CreateTable>) return OperationKind::CreateTable;
        else if constexpr (std::is_same_v<T, DropTable>) return OperationKind::DropTable;
        else if constexpr (std::is_same_v<T, RenameTable>) return OperationKind::RenameTable;
        else if constexpr (std::is_same_v<T, AddColumn>) return OperationKind::AddColumn;
        else if constexpr (std::is_same_v<T, AlterTableRebuild>) return OperationKind::AlterTableRebuild;
        else if constexpr (std::is_same_v<T, CreateIndex>) return OperationKind::CreateIndex;
        else if constexpr (std::is_same_v<T, DropIndex>) return OperationKind::DropIndex;
        else if constexpr (std::is_same_v<T, RenameIndex>) return OperationKind::RenameIndex;
        else if constexpr (std::is_same_v<T, Execute>) return OperationKind::Execute;
    }, op);
}

std::string describe(const Operation& op) {
    const auto quoted = [](const std::string& s) { return "'" + s + "'"; };

    std::string target = std::visit([&](const auto& o) -> std::string {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, CreateTable>) return quoted(o.table.name);
        else if constexpr (std::is_same_v<T, DropTable>) return quoted(o.name);
        else if constexpr (std::is_same_v<T, RenameTable>) return quoted(o.from) + " to " + quoted(o.to);
        else if constexpr (std::is_same_v<T, AddColumn>) return quoted(o.column.name) + " on " + quoted(o.table_name);
        else if constexpr (std::is_same_v<T, AlterTableRebuild>) return quoted(o.original_name);
        else if constexpr (std::is_same_v<T, CreateIndex>) return quoted(o.index.name) + " on " + quoted(o.index.table_name);
        else if constexpr (std::is_same_v<T, DropIndex>) return quoted(o.name);
        else if constexpr (std::is_same_v<T, RenameIndex>) return quoted(o.from) + " to " + quoted(o.renamed.name);
        else if constexpr (std::is_same_v<T, Execute>) return quoted(o.description);
    }, op);

    return std::string(kind_name(kind_of(op))) + " " + target;
}

} // namespace strata::schema
