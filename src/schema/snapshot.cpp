#include "schema/snapshot.hpp"

namespace strata::schema {

std::vector<std::string> Snapshot::table_names() const {
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& [name, table] : tables_) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> Snapshot::index_names() const {
    std::vector<std::string> names;
    names.reserve(indexes_.size());
    for (const auto& [name, index] : indexes_) {
        names.push_back(name);
    }
    return names;
}

const Table* Snapshot::table(const std::string& name) const {
    auto it = tables_.find(name);
    return it == tables_.end() ? nullptr : &it->second;
}

const Index* Snapshot::index(const std::string& name) const {
    auto it = indexes_.find(name);
    return it == indexes_.end() ? nullptr : &it->second;
}

std::vector<Index> Snapshot::indexes_on(const std::string& table_name) const {
    std::vector<Index> out;
    for (const auto& [name, index] : indexes_) {
        if (index.table_name == table_name) {
            out.push_back(index);
        }
    }
    return out;
}

void Snapshot::put_table(Table table) {
    auto name = table.name;
    tables_.insert_or_assign(std::move(name), std::move(table));
}

bool Snapshot::erase_table(const std::string& name) {
    return tables_.erase(name) > 0;
}

void Snapshot::put_index(Index index) {
    auto name = index.name;
    indexes_.insert_or_assign(std::move(name), std::move(index));
}

bool Snapshot::erase_index(const std::string& name) {
    return indexes_.erase(name) > 0;
}

} // namespace strata::schema
