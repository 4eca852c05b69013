#pragma once

#include <QList>
#include <QString>
#include <QStringList>

#include "core/result.hpp"
#include "crypto/keys.hpp"

class QTextStream;

namespace uuidv47::config {
class KeyStore;
}

namespace uuidv47::cli {

// Process exit codes.
constexpr int EXIT_OK = 0;
constexpr int EXIT_BAD_INPUT = 1;
constexpr int EXIT_NO_KEY = 2;
constexpr int EXIT_USAGE = 64;

/**
 * --key wins when non-empty; otherwise the key store decides.
 */
[[nodiscard]] Result<crypto::Key> resolve_key(const QString& keyOption,
                                              const config::KeyStore& store);

/**
 * Encode every identifier; the first failure aborts the batch. The error names
 * the source line from `lines` when given (see read_ids), otherwise the 1-based
 * input position.
 */
[[nodiscard]] Result<QStringList> encode_all(const QStringList& ids, const crypto::Key& key,
                                             const QList<qsizetype>& lines = {});

[[nodiscard]] Result<QStringList> decode_all(const QStringList& ids, const crypto::Key& key,
                                             const QList<qsizetype>& lines = {});

/**
 * One line per identifier: "<uuid> version=<v> variant=<bits> [timestamp=<iso>]".
 */
[[nodiscard]] Result<QStringList> inspect_all(const QStringList& ids,
                                              const QList<qsizetype>& lines = {});

/**
 * Fresh UUIDv7 values. `countText` empty means 1.
 */
[[nodiscard]] Result<QStringList> generate(const QString& countText);

/**
 * Non-empty trimmed lines from `in`. When `lines` is set it receives the
 * 1-based line number of each returned identifier.
 */
[[nodiscard]] QStringList read_ids(QTextStream& in, QList<qsizetype>* lines = nullptr);

[[nodiscard]] int exit_code_for(const Error& error);

} // namespace uuidv47::cli
