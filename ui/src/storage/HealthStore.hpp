#pragma once

#include <QList>
#include <QObject>
#include <QSqlDatabase>
#include <QString>
#include <QStringList>

#include <optional>

#include "models/HealthRecords.hpp"
#include "storage/Migration.hpp"
#include "storage/MigrationRunner.hpp"
#include "storage/StoreError.hpp"

class QSqlQuery;

//! Handle to one local Summit database file. Every instance owns its own named
//! Qt SQL connection and must be used from the thread that created it.
class HealthStore : public QObject {
    Q_OBJECT

public:
    struct ColumnInfo {
        QString name;
        QString type;
        bool notNull = false;
        bool primaryKey = false;
        QString defaultValue;
    };

    explicit HealthStore(QObject* parent = nullptr);
    ~HealthStore() override;

    bool open(const QString& path, StoreError* error = nullptr);
    void close();
    bool isOpen() const;
    QString databasePath() const { return m_path; }
    QString connectionName() const { return m_connectionName; }
    QSqlDatabase database() const;

    // Schemat
    bool migrate(const MigrationList& migrations,
                 MigrationRunner::Report* report = nullptr,
                 StoreError* error = nullptr);
    bool executeBatch(const QString& sql, StoreError* error = nullptr);
    std::optional<QList<qint64>> appliedVersions(StoreError* error = nullptr);
    QStringList tableNames(StoreError* error = nullptr) const;
    QStringList indexNames(StoreError* error = nullptr) const;
    QList<ColumnInfo> columns(const QString& table, StoreError* error = nullptr) const;

    // Metryki dzienne
    bool insertMetric(const DailyHealthMetric& metric, StoreError* error = nullptr);
    bool upsertMetrics(const QList<DailyHealthMetric>& metrics, StoreError* error = nullptr);
    std::optional<QList<DailyHealthMetric>> metrics(const DateRange& range = {}, StoreError* error = nullptr) const;
    //! Empty result with no error means the table is empty.
    std::optional<DailyHealthMetric> latestMetric(StoreError* error = nullptr) const;
    std::optional<int> metricsCount(StoreError* error = nullptr) const;

    // Vital score
    bool insertVitalScore(const VitalScore& score, StoreError* error = nullptr);
    bool upsertVitalScore(const VitalScore& score, StoreError* error = nullptr);
    std::optional<QList<VitalScore>> vitalScores(const DateRange& range = {}, StoreError* error = nullptr) const;
    std::optional<VitalScore> latestVitalScore(StoreError* error = nullptr) const;

    // Trendy
    bool insertTrend(const Trend& trend, StoreError* error = nullptr);
    bool upsertTrend(const Trend& trend, StoreError* error = nullptr);
    std::optional<QList<Trend>> trends(StoreError* error = nullptr) const;
    std::optional<QList<Trend>> trendsForTimeframe(const QString& timeframe, StoreError* error = nullptr) const;

    bool clearAllData(StoreError* error = nullptr);

signals:
    void dataChanged();

private:
    bool ensureOpen(StoreError* error) const;
    bool execPrepared(QSqlQuery& query, StoreError* error) const;
    bool writeMetric(const DailyHealthMetric& metric, bool upsert, StoreError* error);
    bool writeVitalScore(const VitalScore& score, bool replace, StoreError* error);
    bool writeTrend(const Trend& trend, bool replace, StoreError* error);
    QStringList schemaObjects(const QString& type, StoreError* error) const;

    QString m_connectionName;
    QString m_path;
};

//! Opens dbPath, applies every pending migration in ascending order and closes the file again.
bool applyMigrations(const QString& dbPath,
                     const MigrationList& migrations,
                     MigrationRunner::Report* report = nullptr,
                     StoreError* error = nullptr);
