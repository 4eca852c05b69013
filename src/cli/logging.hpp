#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(uuidv47CliLog)

namespace uuidv47::cli {

// Installs a Qt message handler that stamps time/level/category and writes to
// stderr, plus UUIDV47_LOG_FILE when that variable names a file.
// `verbose` (or UUIDV47_DEBUG=1) enables the debug level for uuidv47.*.
void install_logging(bool verbose);

// Path from UUIDV47_LOG_FILE, or empty.
QString log_file_path();

} // namespace uuidv47::cli
