#include "RuntimeUtils.hpp"

#include <QDir>
#include <QFileInfo>
#include <QObject>
#include <QStringList>

#include <utility>

namespace summit::shell::utils {

QString databaseLockFilePath(const QString& databasePath)
{
    const QFileInfo info(databasePath);
    return info.absoluteDir().filePath(info.fileName() + QStringLiteral(".lock"));
}

bool ensureParentDirectory(const QString& filePath, QString* errorMessage)
{
    const QFileInfo info(filePath);
    QDir directory = info.absoluteDir();
    if (directory.exists())
        return true;
    if (directory.mkpath(QStringLiteral(".")))
        return true;
    if (errorMessage) {
        *errorMessage = QObject::tr("Nie udało się utworzyć katalogu %1.").arg(directory.absolutePath());
    }
    return false;
}

DatabaseLockGuard::DatabaseLockGuard(QString lockFilePath)
    : m_lockFile(std::move(lockFilePath))
{
    // Blokada trzymana jest tylko na czas działania procesu; stare pliki usuwa removeStaleLockFile.
    m_lockFile.setStaleLockTime(0);
}

DatabaseLockGuard::~DatabaseLockGuard()
{
    release();
}

bool DatabaseLockGuard::tryAcquire(int timeoutMs)
{
    m_error.clear();
    m_conflict = {};
    m_lastError = QLockFile::NoError;

    if (m_locked)
        return true;

    if (m_lockFile.tryLock(timeoutMs)) {
        m_locked = true;
        return true;
    }

    m_lastError = m_lockFile.error();
    if (m_lastError == QLockFile::LockFailedError) {
        if (m_lockFile.removeStaleLockFile() && m_lockFile.tryLock(timeoutMs)) {
            m_locked = true;
            m_lastError = QLockFile::NoError;
            return true;
        }
        m_lockFile.getLockInfo(&m_conflict.pid, &m_conflict.hostname, &m_conflict.applicationId);
        m_error = QObject::tr("Baza danych jest używana przez inny proces%1.").arg(describeConflict(m_conflict));
        return false;
    }

    if (m_lastError == QLockFile::PermissionError)
        m_error = QObject::tr("Brak uprawnień do utworzenia blokady bazy danych (%1).").arg(m_lockFile.fileName());
    else
        m_error = QObject::tr("Nieoczekiwany błąd blokady bazy danych (%1).").arg(m_lockFile.fileName());
    return false;
}

void DatabaseLockGuard::release()
{
    if (!m_locked)
        return;
    m_lockFile.unlock();
    m_locked = false;
}

QString describeConflict(const LockConflictInfo& conflict)
{
    QStringList parts;
    if (conflict.pid > 0)
        parts << QObject::tr("PID %1").arg(conflict.pid);
    if (!conflict.hostname.isEmpty())
        parts << QObject::tr("host %1").arg(conflict.hostname);
    if (!conflict.applicationId.isEmpty())
        parts << QObject::tr("aplikacja %1").arg(conflict.applicationId);
    return parts.isEmpty() ? QString() : QStringLiteral(" (%1)").arg(parts.join(QStringLiteral(", ")));
}

} // namespace summit::shell::utils
