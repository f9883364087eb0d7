#include "core/value.hpp"

#include <cstdio>

namespace strata {

std::optional<int64_t> as_integer(const Value& value) {
    if (const auto* v = std::get_if<int64_t>(&value)) {
        return *v;
    }
    return std::nullopt;
}

std::optional<double> as_real(const Value& value) {
    if (const auto* v = std::get_if<double>(&value)) {
        return *v;
    }
    return std::nullopt;
}

std::optional<std::string> as_text(const Value& value) {
    if (const auto* v = std::get_if<std::string>(&value)) {
        return *v;
    }
    return std::nullopt;
}

std::string to_sql_literal(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", v);
            return buf;
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::string out = "'";
            for (char c : v) {
                if (c == '\'') out += '\'';
                out += c;
            }
            out += '\'';
            return out;
        } else {
            static constexpr char HEX[] = "0123456789abcdef";
            std::string out = "X'";
            for (uint8_t b : v) {
                out += HEX[b >> 4];
                out += HEX[b & 0x0F];
            }
            out += '\'';
            return out;
        }
    }, value);
}

} // namespace strata
