#include "schema/schema.hpp"
#include "schema/migrator.hpp"

#include <set>

namespace strata::schema {

SchemaBuilder& SchemaBuilder::version(int number, VersionDeclaration declare) {
    entries_.push_back(Entry{.number = number, .declare = std::move(declare)});
    return *this;
}

Schema::Schema(std::string identifier, std::vector<VersionDeclaration> declarations)
    : identifier_(std::move(identifier)),
      declarations_(std::move(declarations)),
      arena_(std::make_unique<Arena>()) {}

Result<Schema, Error> Schema::create(std::string identifier,
                                     const std::function<void(SchemaBuilder&)>& declare) {
    SchemaBuilder builder;
    declare(builder);

    std::vector<VersionDeclaration> declarations;
    int expected = 1;
    for (const auto& entry : builder.entries()) {
        if (entry.number != expected) {
            auto e = Error::declaration(
                "version " + std::to_string(entry.number) + " declared where version " +
                std::to_string(expected) + " was expected");
            return Result<Schema, Error>::err(std::move(e));
        }
        if (!entry.declare) {
            auto e = Error::declaration("version " + std::to_string(entry.number) + " has no declaration");
            e.version = entry.number;
            return Result<Schema, Error>::err(std::move(e));
        }
        declarations.push_back(entry.declare);
        ++expected;
    }

    Schema schema(std::move(identifier), std::move(declarations));
    if (schema.latest_version_number() > 0) {
        auto resolved = schema.resolve(schema.latest_version_number());
        if (resolved.is_err()) {
            return Result<Schema, Error>::err(resolved.unwrap_err());
        }
    }
    return Result<Schema, Error>::ok(std::move(schema));
}

Result<const Version*, Error> Schema::resolve(int number) const {
    std::lock_guard<std::mutex> lock(arena_->mutex);
    auto& versions = arena_->versions;

    while (static_cast<int>(versions.size()) < number) {
        const int next = static_cast<int>(versions.size()) + 1;
        Snapshot previous = versions.empty() ? Snapshot{} : versions.back()->snapshot;

        VersionBuilder builder(next, std::move(previous));
        declarations_[static_cast<size_t>(next - 1)](builder);

        auto built = std::move(builder).build();
        if (built.is_err()) {
            return Result<const Version*, Error>::err(built.unwrap_err());
        }
        versions.push_back(std::make_unique<Version>(std::move(built).unwrap()));
    }

    return Result<const Version*, Error>::ok(versions[static_cast<size_t>(number - 1)].get());
}

const Version* Schema::version(int number) const {
    if (number < 1 || number > latest_version_number()) {
        return nullptr;
    }
    auto resolved = resolve(number);
    return resolved.is_ok() ? resolved.unwrap() : nullptr;
}

const Version* Schema::latest_version() const {
    return version(latest_version_number());
}

std::vector<std::string> Schema::table_names() const {
    const auto* latest = latest_version();
    return latest ? latest->snapshot.table_names() : std::vector<std::string>{};
}

std::vector<std::string> Schema::index_names() const {
    const auto* latest = latest_version();
    return latest ? latest->snapshot.index_names() : std::vector<std::string>{};
}

const Table* Schema::table(const std::string& name) const {
    const auto* latest = latest_version();
    return latest ? latest->snapshot.table(name) : nullptr;
}

const Index* Schema::index(const std::string& name) const {
    const auto* latest = latest_version();
    return latest ? latest->snapshot.index(name) : nullptr;
}

std::vector<std::string> Schema::known_table_names() const {
    std::set<std::string> names;
    for (int n = 1; n <= latest_version_number(); ++n) {
        if (const auto* v = version(n)) {
            for (auto& name : v->snapshot.table_names()) names.insert(std::move(name));
        }
    }
    return {names.begin(), names.end()};
}

std::vector<std::string> Schema::known_index_names() const {
    std::set<std::string> names;
    for (int n = 1; n <= latest_version_number(); ++n) {
        if (const auto* v = version(n)) {
            for (auto& name : v->snapshot.index_names()) names.insert(std::move(name));
        }
    }
    return {names.begin(), names.end()};
}

Result<bool, Error> Schema::migrate(storage::Database& db,
                                    std::optional<int> to,
                                    const MigrateOptions& options) const {
    Migrator migrator(*this, db);
    return migrator.migrate(to, options);
}

Result<void, Error> Schema::reset(storage::Database& db) const {
    Migrator migrator(*this, db);
    return migrator.reset();
}

} // namespace strata::schema
