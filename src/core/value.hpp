#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <optional>
#include <type_traits>

namespace strata {

/**
 * Value - One SQLite cell.
 *
 * A closed sum over the five storage classes the engine knows about. This is
 * the only shape in which row data crosses the storage boundary.
 */
struct Null {
    bool operator==(const Null&) const = default;
};

using Blob = std::vector<uint8_t>;

using Value = std::variant<
    Null,
    int64_t,
    double,
    std::string,
    Blob
>;

enum class StorageClass {
    Null,
    Integer,
    Real,
    Text,
    Blob
};

[[nodiscard]] inline StorageClass storage_class(const Value& value) {
    return std::visit([](const auto& v) -> StorageClass {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>) return StorageClass::Null;
        else if constexpr (std::is_same_v<T, int64_t>) return StorageClass::Integer;
        else if constexpr (std::is_same_v<T, double>) return StorageClass::Real;
        else if constexpr (std::is_same_v<T, std::string>) return StorageClass::Text;
        else if constexpr (std::is_same_v<T, Blob>) return StorageClass::Blob;
    }, value);
}

[[nodiscard]] constexpr std::string_view storage_class_name(StorageClass c) {
    switch (c) {
        case StorageClass::Null: return "null";
        case StorageClass::Integer: return "integer";
        case StorageClass::Real: return "real";
        case StorageClass::Text: return "text";
        case StorageClass::Blob: return "blob";
    }
    return "unknown";
}

[[nodiscard]] inline bool is_null(const Value& value) {
    return std::holds_alternative<Null>(value);
}

// Typed accessors. Return nullopt when the cell holds a different class;
// no implicit conversion between classes.
[[nodiscard]] std::optional<int64_t> as_integer(const Value& value);
[[nodiscard]] std::optional<double> as_real(const Value& value);
[[nodiscard]] std::optional<std::string> as_text(const Value& value);

/**
 * Render a value as a SQL literal ('it''s', 42, X'00ff', NULL).
 */
[[nodiscard]] std::string to_sql_literal(const Value& value);

} // namespace strata
