#include "schema/index_remap.hpp"

namespace strata::schema {

void ColumnMapping::rename(const std::string& from, const std::string& to) {
    entries_.insert_or_assign(from, to);
}

void ColumnMapping::drop(const std::string& column) {
    entries_.insert_or_assign(column, std::nullopt);
}

std::optional<std::string> ColumnMapping::resolve(const std::string& column) const {
    auto it = entries_.find(column);
    if (it == entries_.end()) return column;
    return it->second;
}

bool ColumnMapping::dropped(const std::string& column) const {
    auto it = entries_.find(column);
    return it != entries_.end() && !it->second;
}

RemappedIndexes remap_indexes(const std::vector<Index>& indexes,
                              const Table& table,
                              const ColumnMapping& mapping) {
    RemappedIndexes out;

    for (const auto& index : indexes) {
        Index rewritten = index;
        rewritten.table_name = table.name;
        bool survives = true;

        for (auto& column : rewritten.columns) {
            auto target = mapping.resolve(column);
            if (!target || !table.column(*target)) {
                survives = false;
                break;
            }
            column = *target;
        }

        if (survives) {
            out.kept.push_back(std::move(rewritten));
        } else {
            out.dropped.push_back(index.name);
        }
    }

    return out;
}

std::vector<Index> retarget_indexes(std::vector<Index> indexes,
                                    const std::string& from,
                                    const std::string& to) {
    for (auto& index : indexes) {
        if (index.table_name == from) {
            index.table_name = to;
        }
    }
    return indexes;
}

} // namespace strata::schema
