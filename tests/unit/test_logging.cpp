#include <catch2/catch_test_macros.hpp>
#include "core/logging.hpp"
#include "schema/schema.hpp"
#include "storage/database.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>

using namespace strata;

namespace {

QString read_all(const QString& path) {
    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    return QString::fromUtf8(file.readAll());
}

QString fresh_log_path(const char* name) {
    const auto path = QDir::temp().filePath(QString::fromLatin1(name));
    QFile::remove(path);
    return path;
}

} // namespace

TEST_CASE("Migration tracing follows STRATA_DEBUG_MIGRATIONS", "[logging]") {
    qunsetenv("STRATA_DEBUG_MIGRATIONS");
    REQUIRE_FALSE(migration_debug_enabled());

    qputenv("STRATA_DEBUG_MIGRATIONS", "1");
    REQUIRE(migration_debug_enabled());
    qunsetenv("STRATA_DEBUG_MIGRATIONS");
}

TEST_CASE("File logging is a no-op without STRATA_LOG_FILE", "[logging]") {
    qunsetenv("STRATA_LOG_FILE");
    REQUIRE(log_file_path().isEmpty());

    install_file_logging();
    qCInfo(strataMigrateLog) << "nowhere to go";
    uninstall_file_logging();
}

TEST_CASE("File logging records strata categories only", "[logging]") {
    const auto path = fresh_log_path("strata_test_logging.log");
    qputenv("STRATA_LOG_FILE", path.toUtf8());
    REQUIRE(log_file_path() == path);

    install_file_logging();
    install_file_logging();  // second call keeps the first sink
    qCInfo(strataMigrateLog) << "hello from the migrator";
    qCWarning(strataStorageLog) << "and a storage warning";
    qInfo() << "an application line";
    uninstall_file_logging();
    qCInfo(strataMigrateLog) << "after uninstall";
    qunsetenv("STRATA_LOG_FILE");

    const auto contents = read_all(path);
    REQUIRE(contents.contains(QStringLiteral(" I strata.migrate hello from the migrator")));
    REQUIRE(contents.contains(QStringLiteral(" W strata.storage and a storage warning")));
    REQUIRE_FALSE(contents.contains(QStringLiteral("an application line")));
    REQUIRE_FALSE(contents.contains(QStringLiteral("after uninstall")));
    REQUIRE(contents.count(QStringLiteral("hello from the migrator")) == 1);
}

TEST_CASE("A migration run logs to STRATA_LOG_FILE", "[logging]") {
    const auto path = fresh_log_path("strata_test_migration.log");
    qputenv("STRATA_LOG_FILE", path.toUtf8());

    auto db = storage::Database::open_memory().unwrap();
    auto schema = schema::Schema::create("notes", [](schema::SchemaBuilder& s) {
        s.version(1, [](schema::VersionBuilder& v) {
            v.create_table("notes", [](schema::TableBuilder& t) {
                t.primary_key("id");
                t.column("body", schema::ColumnType::Text);
            });
        });
    }).unwrap();

    auto result = schema.migrate(db);
    uninstall_file_logging();
    qunsetenv("STRATA_LOG_FILE");
    REQUIRE(result.is_ok());

    const auto contents = read_all(path);
    REQUIRE(contents.contains(QStringLiteral("strata.migrate")));
    REQUIRE(contents.contains(QStringLiteral("now at version 1")));
}
