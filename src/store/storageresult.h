#ifndef STORAGERESULT_H
#define STORAGERESULT_H

#include <QString>
#include <utility>

namespace Stash {

/**
 * @brief Outcome of a storage engine call
 *
 * Either Ok(value) or StorageUnavailable(message). The local store inspects
 * it and decides explicitly whether to fall back to the secondary store.
 */
template<typename T>
class StorageResult
{
public:
    static StorageResult ok(T value) {
        StorageResult result;
        result.m_ok = true;
        result.m_value = std::move(value);
        return result;
    }

    static StorageResult unavailable(const QString &message) {
        StorageResult result;
        result.m_ok = false;
        result.m_error = message;
        return result;
    }

    bool isOk() const { return m_ok; }
    bool isUnavailable() const { return !m_ok; }

    const T &value() const { return m_value; }
    T takeValue() { return std::move(m_value); }

    QString error() const { return m_error; }

private:
    StorageResult() = default;

    bool m_ok = false;
    T m_value{};
    QString m_error;
};

/// Result of a mutation: carries no value beyond success
using StorageStatus = StorageResult<bool>;

inline StorageStatus storageOk() { return StorageStatus::ok(true); }

} // namespace Stash

#endif // STORAGERESULT_H
