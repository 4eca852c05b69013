#pragma once

#include <QString>

#include <memory>

#include "core/result.hpp"
#include "crypto/keys.hpp"

class QSettings;

namespace uuidv47::config {

/**
 * KeyStore - the caller-owned "current key".
 *
 * Resolution order for current():
 *   1. UUIDV47_KEY environment variable (must parse if set)
 *   2. the persisted facade/key setting
 *   3. ErrorCode::KeyNotConfigured
 *
 * The codec never sees this object; callers resolve a key here and pass it
 * explicitly to encode/decode.
 */
class KeyStore {
public:
    static constexpr const char* ENV_VAR = "UUIDV47_KEY";
    static constexpr const char* SETTINGS_KEY = "facade/key";

    /**
     * Uses the application's default QSettings location.
     */
    KeyStore();

    /**
     * Uses an INI file at `settingsPath`.
     */
    explicit KeyStore(const QString& settingsPath);

    ~KeyStore();

    KeyStore(const KeyStore&) = delete;
    KeyStore& operator=(const KeyStore&) = delete;

    [[nodiscard]] Result<crypto::Key> current() const;

    [[nodiscard]] bool has_key() const;

    /**
     * Persist `key` as the stored default. The environment override, if set,
     * still wins on the next current() call.
     */
    [[nodiscard]] Result<void> store(const crypto::Key& key);

    void clear();

    [[nodiscard]] QString location() const;

private:
    std::unique_ptr<QSettings> settings_;
};

} // namespace uuidv47::config
