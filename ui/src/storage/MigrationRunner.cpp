#include "MigrationRunner.hpp"

#include <QCryptographicHash>
#include <QElapsedTimer>
#include <QHash>
#include <QLoggingCategory>
#include <QObject>
#include <QSet>
#include <QSqlQuery>
#include <QVariant>

#include <utility>

#include "SqlScript.hpp"

Q_LOGGING_CATEGORY(lcMigrations, "summit.shell.storage.migrations")

using summit::storage::compactStatement;
using summit::storage::splitSqlStatements;

const QString MigrationRunner::kBookkeepingTable = QStringLiteral("_summit_migrations");

QByteArray Migration::checksum() const
{
    return QCryptographicHash::hash(sql.toUtf8(), QCryptographicHash::Sha384).toHex();
}

MigrationRunner::MigrationRunner(QSqlDatabase database)
    : m_database(std::move(database))
{
}

bool MigrationRunner::validateOrder(const MigrationList& migrations, StoreError* error)
{
    qint64 previous = 0;
    for (const Migration& migration : migrations) {
        if (migration.version <= 0) {
            return reportStoreError(error, StoreError::make(StoreError::Kind::SchemaError,
                QObject::tr("Wersja migracji musi być dodatnia (%1, \"%2\").")
                    .arg(migration.version)
                    .arg(migration.description)));
        }
        if (migration.version <= previous) {
            return reportStoreError(error, StoreError::make(StoreError::Kind::SchemaError,
                QObject::tr("Migracje muszą mieć rosnące wersje: %1 po %2.")
                    .arg(migration.version)
                    .arg(previous)));
        }
        previous = migration.version;
    }
    return true;
}

bool MigrationRunner::apply(const MigrationList& migrations, Report* report, StoreError* error)
{
    if (!m_database.isOpen()) {
        return reportStoreError(error, StoreError::make(StoreError::Kind::OpenError,
            QObject::tr("Baza danych nie jest otwarta.")));
    }
    if (!validateOrder(migrations, error))
        return false;
    if (!ensureBookkeeping(error))
        return false;

    const auto recorded = appliedMigrations(error);
    if (!recorded.has_value())
        return false;

    QHash<qint64, AppliedMigration> appliedByVersion;
    for (const AppliedMigration& entry : *recorded)
        appliedByVersion.insert(entry.version, entry);

    Report localReport;
    for (const Migration& migration : migrations) {
        if (migration.kind != Migration::Kind::Up) {
            qCDebug(lcMigrations) << "Pomijam migrację typu down" << migration.version;
            continue;
        }

        const auto it = appliedByVersion.constFind(migration.version);
        if (it != appliedByVersion.constEnd()) {
            if (!it->success) {
                return reportStoreError(error, StoreError::make(StoreError::Kind::SchemaError,
                    QObject::tr("Migracja %1 jest oznaczona jako nieudana; baza wymaga ręcznej naprawy.")
                        .arg(migration.version)));
            }
            if (it->checksum != migration.checksum()) {
                qCWarning(lcMigrations) << "Suma kontrolna migracji" << migration.version
                                        << "różni się od zapisanej";
                return reportStoreError(error, StoreError::make(StoreError::Kind::SchemaError,
                    QObject::tr("Migracja %1 (\"%2\") została zmieniona po zastosowaniu.")
                        .arg(migration.version)
                        .arg(migration.description)));
            }
            localReport.skipped.append(migration.version);
            continue;
        }

        if (!applyOne(migration, error))
            return false;
        localReport.applied.append(migration.version);
    }

    QSet<qint64> known;
    for (const Migration& migration : migrations)
        known.insert(migration.version);
    for (const AppliedMigration& entry : *recorded) {
        if (!known.contains(entry.version)) {
            qCWarning(lcMigrations) << "Baza zawiera nieznaną migrację" << entry.version
                                    << entry.description << "- baza jest nowsza niż aplikacja";
            localReport.unknown.append(entry.version);
        }
    }

    if (localReport.applied.isEmpty()) {
        qCDebug(lcMigrations) << "Schemat aktualny, brak migracji do zastosowania";
    }

    if (report)
        *report = localReport;
    return true;
}

bool MigrationRunner::executeBatch(const QString& sql, StoreError* error)
{
    if (!m_database.transaction()) {
        return reportStoreError(error,
            StoreError::fromSqlError(m_database.lastError(), StoreError::Kind::SchemaError));
    }

    StoreError failure;
    if (!executeStatements(sql, &failure))
        return rollbackWith(error, std::move(failure));

    if (!m_database.commit()) {
        return rollbackWith(error,
            StoreError::fromSqlError(m_database.lastError(), StoreError::Kind::SchemaError));
    }
    return true;
}

std::optional<QList<MigrationRunner::AppliedMigration>> MigrationRunner::appliedMigrations(StoreError* error)
{
    if (!ensureBookkeeping(error))
        return std::nullopt;

    QSqlQuery query(m_database);
    const QString sql = QStringLiteral(
        "SELECT version, description, installed_on, success, checksum, execution_time_ms "
        "FROM %1 ORDER BY version ASC").arg(kBookkeepingTable);
    if (!query.exec(sql)) {
        reportStoreError(error, StoreError::fromSqlError(query.lastError(), StoreError::Kind::QueryError, sql));
        return std::nullopt;
    }

    QList<AppliedMigration> result;
    while (query.next()) {
        AppliedMigration entry;
        entry.version = query.value(0).toLongLong();
        entry.description = query.value(1).toString();
        entry.installedOn = query.value(2).toString();
        entry.success = query.value(3).toInt() != 0;
        entry.checksum = query.value(4).toString().toLatin1();
        entry.executionTimeMs = query.value(5).toLongLong();
        result.append(entry);
    }
    return result;
}

bool MigrationRunner::ensureBookkeeping(StoreError* error)
{
    const QString sql = QStringLiteral(
        "CREATE TABLE IF NOT EXISTS %1 ("
        "version INTEGER PRIMARY KEY, "
        "description TEXT NOT NULL, "
        "installed_on TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP, "
        "success INTEGER NOT NULL, "
        "checksum TEXT NOT NULL, "
        "execution_time_ms INTEGER NOT NULL)").arg(kBookkeepingTable);

    QSqlQuery query(m_database);
    if (!query.exec(sql)) {
        qCWarning(lcMigrations) << "Nie udało się utworzyć tabeli migracji:" << query.lastError().text();
        StoreError failure = StoreError::fromSqlError(query.lastError(), StoreError::Kind::SchemaError, sql);
        failure.kind = StoreError::Kind::SchemaError;
        return reportStoreError(error, std::move(failure));
    }
    return true;
}

bool MigrationRunner::executeStatements(const QString& sql, StoreError* error)
{
    const QStringList statements = splitSqlStatements(sql);
    for (const QString& statement : statements) {
        QSqlQuery query(m_database);
        if (!query.exec(statement)) {
            qCWarning(lcMigrations) << "Instrukcja nie powiodła się:" << compactStatement(statement)
                                    << query.lastError().text();
            StoreError failure = StoreError::fromSqlError(query.lastError(), StoreError::Kind::SchemaError, statement);
            failure.kind = StoreError::Kind::SchemaError;
            return reportStoreError(error, std::move(failure));
        }
    }
    return true;
}

bool MigrationRunner::applyOne(const Migration& migration, StoreError* error)
{
    qCInfo(lcMigrations) << "Stosuję migrację" << migration.version << migration.description;

    QElapsedTimer timer;
    timer.start();

    if (!m_database.transaction()) {
        return reportStoreError(error,
            StoreError::fromSqlError(m_database.lastError(), StoreError::Kind::SchemaError));
    }

    StoreError failure;
    if (!executeStatements(migration.sql, &failure)) {
        failure.message = QObject::tr("Migracja %1 (\"%2\") nie powiodła się: %3")
                              .arg(migration.version)
                              .arg(migration.description, failure.message);
        return rollbackWith(error, std::move(failure));
    }

    QSqlQuery record(m_database);
    record.prepare(QStringLiteral(
        "INSERT INTO %1 (version, description, success, checksum, execution_time_ms) "
        "VALUES (:version, :description, 1, :checksum, :elapsed)").arg(kBookkeepingTable));
    record.bindValue(QStringLiteral(":version"), migration.version);
    record.bindValue(QStringLiteral(":description"), migration.description);
    record.bindValue(QStringLiteral(":checksum"), QString::fromLatin1(migration.checksum()));
    record.bindValue(QStringLiteral(":elapsed"), timer.elapsed());
    if (!record.exec()) {
        StoreError bookkeeping = StoreError::fromSqlError(record.lastError(), StoreError::Kind::SchemaError);
        bookkeeping.kind = StoreError::Kind::SchemaError;
        return rollbackWith(error, std::move(bookkeeping));
    }

    if (!m_database.commit()) {
        return rollbackWith(error,
            StoreError::fromSqlError(m_database.lastError(), StoreError::Kind::SchemaError));
    }

    qCInfo(lcMigrations) << "Migracja" << migration.version << "zastosowana w" << timer.elapsed() << "ms";
    return true;
}

bool MigrationRunner::rollbackWith(StoreError* target, StoreError error)
{
    if (!m_database.rollback()) {
        qCWarning(lcMigrations) << "Wycofanie transakcji nie powiodło się:" << m_database.lastError().text();
    }
    return reportStoreError(target, std::move(error));
}
