#include "cli/commands.hpp"

#include <QDateTime>
#include <QTextStream>

#include "cli/logging.hpp"
#include "codec/facade.hpp"
#include "config/key_store.hpp"
#include "core/uuid.hpp"
#include "core/uuid_v7.hpp"

namespace uuidv47::cli {

namespace {

constexpr int MAX_GENERATE = 1000000;

using TextTransform = Result<std::string> (*)(std::string_view, const crypto::Key&);

// Names the input by its stdin line when known, else by its 1-based position.
[[nodiscard]] Error at_position(qsizetype index, const QList<qsizetype>& lines,
                                const QString& input, const Error& error) {
    const auto where = index < lines.size()
        ? "line " + std::to_string(lines.at(index))
        : "input " + std::to_string(index + 1);
    return Error{where + " (" + input.toStdString() + "): " + error.message, error.code};
}

[[nodiscard]] Result<QStringList> transform_all(const QStringList& ids,
                                                const QList<qsizetype>& lines,
                                                const crypto::Key& key,
                                                TextTransform transform) {
    QStringList out;
    out.reserve(ids.size());
    for (qsizetype i = 0; i < ids.size(); ++i) {
        const auto result = transform(ids.at(i).toStdString(), key);
        if (result.is_err()) {
            return Result<QStringList>::err(at_position(i, lines, ids.at(i), result.unwrap_err()));
        }
        out.append(QString::fromStdString(result.unwrap()));
    }
    qCDebug(uuidv47CliLog) << "transformed" << out.size() << "identifiers";
    return Result<QStringList>::ok(out);
}

[[nodiscard]] QString describe(const Uuid& id) {
    auto line = QStringLiteral("%1 version=%2 variant=%3")
                    .arg(QString::fromStdString(id.to_string()))
                    .arg(static_cast<int>(id.version()))
                    .arg(static_cast<int>(id.variant()), 2, 2, QLatin1Char('0'));
    if (id.version() == Uuid::VERSION_TIME_ORDERED) {
        const auto when = QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(id.timestamp_ms()))
                              .toUTC();
        line += QStringLiteral(" timestamp=") + when.toString(Qt::ISODateWithMs);
    }
    return line;
}

} // namespace

Result<crypto::Key> resolve_key(const QString& keyOption, const config::KeyStore& store) {
    if (!keyOption.isEmpty()) {
        qCDebug(uuidv47CliLog) << "using key from --key";
        return crypto::parse_key(keyOption.trimmed().toStdString());
    }
    return store.current();
}

Result<QStringList> encode_all(const QStringList& ids, const crypto::Key& key,
                               const QList<qsizetype>& lines) {
    return transform_all(ids, lines, key, &codec::encode_text);
}

Result<QStringList> decode_all(const QStringList& ids, const crypto::Key& key,
                               const QList<qsizetype>& lines) {
    return transform_all(ids, lines, key, &codec::decode_text);
}

Result<QStringList> inspect_all(const QStringList& ids, const QList<qsizetype>& lines) {
    QStringList out;
    out.reserve(ids.size());
    for (qsizetype i = 0; i < ids.size(); ++i) {
        const auto parsed = Uuid::parse(ids.at(i).toStdString());
        if (parsed.is_err()) {
            return Result<QStringList>::err(at_position(i, lines, ids.at(i), parsed.unwrap_err()));
        }
        out.append(describe(parsed.unwrap()));
    }
    return Result<QStringList>::ok(out);
}

Result<QStringList> generate(const QString& countText) {
    int count = 1;
    if (!countText.isEmpty()) {
        bool ok = false;
        count = countText.toInt(&ok);
        if (!ok || count < 1 || count > MAX_GENERATE) {
            return Result<QStringList>::err(Error{
                "count must be between 1 and " + std::to_string(MAX_GENERATE) + ", got '" +
                    countText.toStdString() + "'",
                ErrorCode::InvalidFormat});
        }
    }

    QStringList out;
    out.reserve(count);
    for (int i = 0; i < count; ++i) {
        out.append(QString::fromStdString(generate_v7().to_string()));
    }
    return Result<QStringList>::ok(out);
}

QStringList read_ids(QTextStream& in, QList<qsizetype>* lines) {
    QStringList ids;
    QString line;
    qsizetype number = 0;
    while (in.readLineInto(&line)) {
        ++number;
        const auto trimmed = line.trimmed();
        if (trimmed.isEmpty()) {
            continue;
        }
        ids.append(trimmed);
        if (lines) {
            lines->append(number);
        }
    }
    return ids;
}

int exit_code_for(const Error& error) {
    switch (error.code) {
        case ErrorCode::KeyNotConfigured:
        case ErrorCode::InvalidKey:
            return EXIT_NO_KEY;
        case ErrorCode::InvalidFormat:
        case ErrorCode::UnexpectedVersion:
            return EXIT_BAD_INPUT;
        case ErrorCode::Unknown:
        case ErrorCode::CryptoInit:
        case ErrorCode::Storage:
            break;
    }
    return EXIT_USAGE;
}

} // namespace uuidv47::cli
