#pragma once

#include <QLockFile>
#include <QString>

namespace summit::shell::utils {

struct LockConflictInfo {
    qint64 pid = 0;
    QString hostname;
    QString applicationId;
};

//! Lock file guarding a database file: "<database>.lock" next to it.
QString databaseLockFilePath(const QString& databasePath);

bool ensureParentDirectory(const QString& filePath, QString* errorMessage = nullptr);

//! Exclusive writer lock held while the schema is migrated. Released on destruction.
class DatabaseLockGuard {
public:
    explicit DatabaseLockGuard(QString lockFilePath);
    DatabaseLockGuard(const DatabaseLockGuard&) = delete;
    DatabaseLockGuard& operator=(const DatabaseLockGuard&) = delete;
    ~DatabaseLockGuard();

    bool tryAcquire(int timeoutMs = 0);
    void release();
    bool isHeld() const { return m_locked; }
    QString errorString() const { return m_error; }
    LockConflictInfo conflictInfo() const { return m_conflict; }
    QString lockFilePath() const { return m_lockFile.fileName(); }
    bool hasConflict() const { return m_lastError == QLockFile::LockFailedError; }
    QLockFile::LockError lastError() const { return m_lastError; }

private:
    QLockFile m_lockFile;
    QString m_error;
    LockConflictInfo m_conflict;
    bool m_locked = false;
    QLockFile::LockError m_lastError = QLockFile::NoError;
};

QString describeConflict(const LockConflictInfo& conflict);

} // namespace summit::shell::utils
