#include "config/key_store.hpp"

#include <QLoggingCategory>
#include <QSettings>
#include <QtGlobal>

Q_LOGGING_CATEGORY(uuidv47KeyStoreLog, "uuidv47.keystore")

namespace uuidv47::config {

namespace {

[[nodiscard]] Result<crypto::Key> parse_from(const QString& text, const char* source) {
    const auto utf8 = text.trimmed().toStdString();
    auto parsed = crypto::parse_key(utf8);
    if (parsed.is_err()) {
        qCDebug(uuidv47KeyStoreLog) << "rejecting key from" << source;
        return Result<crypto::Key>::err(Error{
            std::string(source) + ": " + parsed.unwrap_err().message, ErrorCode::InvalidKey});
    }
    qCDebug(uuidv47KeyStoreLog) << "using key from" << source;
    return parsed;
}

} // namespace

KeyStore::KeyStore()
    : settings_(std::make_unique<QSettings>()) {}

KeyStore::KeyStore(const QString& settingsPath)
    : settings_(std::make_unique<QSettings>(settingsPath, QSettings::IniFormat)) {}

KeyStore::~KeyStore() = default;

Result<crypto::Key> KeyStore::current() const {
    if (qEnvironmentVariableIsSet(ENV_VAR)) {
        return parse_from(qEnvironmentVariable(ENV_VAR), ENV_VAR);
    }

    const auto stored = settings_->value(QString::fromLatin1(SETTINGS_KEY)).toString();
    if (!stored.isEmpty()) {
        return parse_from(stored, SETTINGS_KEY);
    }

    return Result<crypto::Key>::err(Error{
        std::string("no key configured (set ") + ENV_VAR + ", pass --key, or run 'keygen --save')",
        ErrorCode::KeyNotConfigured});
}

bool KeyStore::has_key() const {
    return current().is_ok();
}

Result<void> KeyStore::store(const crypto::Key& key) {
    settings_->setValue(QString::fromLatin1(SETTINGS_KEY),
                        QString::fromStdString(crypto::to_string(key)));
    settings_->sync();
    if (settings_->status() != QSettings::NoError) {
        qCWarning(uuidv47KeyStoreLog) << "failed to write" << settings_->fileName();
        return Result<void>::err(Error{
            "failed to write settings file " + settings_->fileName().toStdString(),
            ErrorCode::Storage});
    }
    qCInfo(uuidv47KeyStoreLog) << "stored key in" << settings_->fileName();
    return Result<void>::ok();
}

void KeyStore::clear() {
    settings_->remove(QString::fromLatin1(SETTINGS_KEY));
    settings_->sync();
}

QString KeyStore::location() const {
    return settings_->fileName();
}

} // namespace uuidv47::config
