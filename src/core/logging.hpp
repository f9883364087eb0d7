#pragma once

#include <QLoggingCategory>
#include <QString>

// strata.migrate: migration runs, resets and per-operation tracing.
Q_DECLARE_LOGGING_CATEGORY(strataMigrateLog)
// strata.storage: engine wrapper diagnostics.
Q_DECLARE_LOGGING_CATEGORY(strataStorageLog)

namespace strata {

// Routes strata.* log lines to the file named by STRATA_LOG_FILE, stamped
// "<time> <level> <category> <message>". Every message still reaches the
// handler that was installed before. Does nothing when STRATA_LOG_FILE is
// unset or logging is already installed. Migrations call this on entry.
void install_file_logging();

// Restores the previous message handler and closes the log file.
void uninstall_file_logging();

// Returns the log file path taken from STRATA_LOG_FILE (empty when unset).
QString log_file_path();

// Per-operation tracing of migration runs. Enabled by STRATA_DEBUG_MIGRATIONS.
[[nodiscard]] bool migration_debug_enabled();

} // namespace strata
