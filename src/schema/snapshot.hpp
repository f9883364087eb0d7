#pragma once

#include "schema/table.hpp"
#include "schema/index.hpp"
#include <map>
#include <string>
#include <vector>

namespace strata::schema {

/**
 * Snapshot - Every table and index as of one version.
 *
 * Plain values: copying a snapshot copies its tables and indexes, so a later
 * version's edits never reach back into an earlier one.
 */
class Snapshot {
public:
    [[nodiscard]] std::vector<std::string> table_names() const;
    [[nodiscard]] std::vector<std::string> index_names() const;

    [[nodiscard]] const Table* table(const std::string& name) const;
    [[nodiscard]] const Index* index(const std::string& name) const;

    /**
     * Indexes whose table_name is `table_name`, in name order.
     */
    [[nodiscard]] std::vector<Index> indexes_on(const std::string& table_name) const;

    [[nodiscard]] const std::map<std::string, Table>& tables() const { return tables_; }
    [[nodiscard]] const std::map<std::string, Index>& indexes() const { return indexes_; }

    [[nodiscard]] bool empty() const { return tables_.empty() && indexes_.empty(); }

    // Mutators for the version builder's working copy.
    void put_table(Table table);
    bool erase_table(const std::string& name);
    void put_index(Index index);
    bool erase_index(const std::string& name);

    bool operator==(const Snapshot&) const = default;

private:
    std::map<std::string, Table> tables_;
    std::map<std::string, Index> indexes_;
};

} // namespace strata::schema
