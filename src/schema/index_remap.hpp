#pragma once

#include "schema/index.hpp"
#include "schema/table.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata::schema {

/**
 * ColumnMapping - What happened to each pre-edit column of a rebuilt table.
 *
 * A column maps to its post-edit name, or to nullopt when it was dropped.
 * Columns with no entry are treated as unchanged.
 */
class ColumnMapping {
public:
    void rename(const std::string& from, const std::string& to);
    void drop(const std::string& column);

    /**
     * The post-edit name of `column`, or nullopt when it was dropped.
     */
    [[nodiscard]] std::optional<std::string> resolve(const std::string& column) const;

    [[nodiscard]] bool dropped(const std::string& column) const;

private:
    std::map<std::string, std::optional<std::string>> entries_;
};

struct RemappedIndexes {
    std::vector<Index> kept;             // columns rewritten to post-edit names
    std::vector<std::string> dropped;    // names of indexes that lost a column
};

/**
 * Rewrite `indexes` (all on `table`, pre-edit) for the table after a rebuild.
 *
 * An index survives when every one of its columns still exists in `table`
 * after applying `mapping`. The where_clause is carried unchanged.
 */
[[nodiscard]] RemappedIndexes remap_indexes(const std::vector<Index>& indexes,
                                            const Table& table,
                                            const ColumnMapping& mapping);

/**
 * Point every index on `from` at `to`, for a table rename.
 */
[[nodiscard]] std::vector<Index> retarget_indexes(std::vector<Index> indexes,
                                                  const std::string& from,
                                                  const std::string& to);

} // namespace strata::schema
