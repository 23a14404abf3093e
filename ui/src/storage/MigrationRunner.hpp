#pragma once

#include <QList>
#include <QSqlDatabase>
#include <QString>

#include <optional>

#include "Migration.hpp"
#include "StoreError.hpp"

//! Applies versioned migrations to one open connection and records them in a
//! bookkeeping table. Each pending migration runs in its own transaction.
class MigrationRunner {
public:
    struct AppliedMigration {
        qint64 version = 0;
        QString description;
        QString installedOn;
        bool success = false;
        QByteArray checksum;
        qint64 executionTimeMs = 0;
    };

    struct Report {
        QList<qint64> applied;
        QList<qint64> skipped;
        QList<qint64> unknown; // recorded in the store, missing from the list
    };

    static const QString kBookkeepingTable;

    explicit MigrationRunner(QSqlDatabase database);

    bool apply(const MigrationList& migrations, Report* report = nullptr, StoreError* error = nullptr);

    //! Runs every statement of a batch inside one transaction, without touching the bookkeeping.
    bool executeBatch(const QString& sql, StoreError* error = nullptr);

    std::optional<QList<AppliedMigration>> appliedMigrations(StoreError* error = nullptr);

    static bool validateOrder(const MigrationList& migrations, StoreError* error = nullptr);

private:
    bool ensureBookkeeping(StoreError* error);
    bool executeStatements(const QString& sql, StoreError* error);
    bool applyOne(const Migration& migration, StoreError* error);
    bool rollbackWith(StoreError* target, StoreError error);

    QSqlDatabase m_database;
};
