#include "HealthStore.hpp"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSqlQuery>
#include <QVariant>

#include <atomic>
#include <utility>

Q_LOGGING_CATEGORY(lcHealthStore, "summit.shell.storage.store")

namespace {

constexpr auto kSqliteDriver = "QSQLITE";

std::atomic<int> g_connectionCounter{0};

QVariant toVariant(const std::optional<int>& value)
{
    return value.has_value() ? QVariant(*value) : QVariant(QMetaType::fromType<int>());
}

QVariant toVariant(const std::optional<double>& value)
{
    return value.has_value() ? QVariant(*value) : QVariant(QMetaType::fromType<double>());
}

QVariant textOrNull(const QString& value)
{
    return value.isNull() ? QVariant(QMetaType::fromType<QString>()) : QVariant(value);
}

std::optional<int> optionalInt(const QSqlQuery& query, const QString& column)
{
    const QVariant value = query.value(column);
    if (value.isNull())
        return std::nullopt;
    return value.toInt();
}

std::optional<double> optionalDouble(const QSqlQuery& query, const QString& column)
{
    const QVariant value = query.value(column);
    if (value.isNull())
        return std::nullopt;
    return value.toDouble();
}

DailyHealthMetric readMetric(const QSqlQuery& query)
{
    DailyHealthMetric metric;
    metric.id = query.value(QStringLiteral("id")).toLongLong();
    metric.date = query.value(QStringLiteral("date")).toString();
    metric.bodyBattery = optionalInt(query, QStringLiteral("body_battery"));
    metric.sleepScore = optionalInt(query, QStringLiteral("sleep_score"));
    metric.sleepDurationSeconds = optionalInt(query, QStringLiteral("sleep_duration_seconds"));
    metric.deepSleepSeconds = optionalInt(query, QStringLiteral("deep_sleep_seconds"));
    metric.remSleepSeconds = optionalInt(query, QStringLiteral("rem_sleep_seconds"));
    metric.stressAvg = optionalInt(query, QStringLiteral("stress_avg"));
    metric.restingHr = optionalInt(query, QStringLiteral("resting_hr"));
    metric.hrvAvg = optionalInt(query, QStringLiteral("hrv_avg"));
    metric.intensityMinutes = optionalInt(query, QStringLiteral("intensity_minutes"));
    metric.steps = optionalInt(query, QStringLiteral("steps"));
    metric.createdAt = query.value(QStringLiteral("created_at")).toString();
    metric.updatedAt = query.value(QStringLiteral("updated_at")).toString();
    return metric;
}

VitalScore readVitalScore(const QSqlQuery& query)
{
    VitalScore score;
    score.id = query.value(QStringLiteral("id")).toLongLong();
    score.date = query.value(QStringLiteral("date")).toString();
    score.score = query.value(QStringLiteral("score")).toInt();
    score.sleepComponent = optionalInt(query, QStringLiteral("sleep_component"));
    score.recoveryComponent = optionalInt(query, QStringLiteral("recovery_component"));
    score.strainComponent = optionalInt(query, QStringLiteral("strain_component"));
    score.recommendation = query.value(QStringLiteral("recommendation")).toString();
    score.createdAt = query.value(QStringLiteral("created_at")).toString();
    return score;
}

Trend readTrend(const QSqlQuery& query)
{
    Trend trend;
    trend.id = query.value(QStringLiteral("id")).toLongLong();
    trend.metric = query.value(QStringLiteral("metric")).toString();
    trend.timeframe = query.value(QStringLiteral("timeframe")).toString();
    trend.baseline = optionalDouble(query, QStringLiteral("baseline"));
    trend.currentAvg = optionalDouble(query, QStringLiteral("current_avg"));
    trend.percentChange = optionalDouble(query, QStringLiteral("percent_change"));
    trend.direction = query.value(QStringLiteral("direction")).toString();
    trend.detectedAt = query.value(QStringLiteral("detected_at")).toString();
    return trend;
}

// Warunek WHERE dla opcjonalnego zakresu dat; granice włącznie.
QString rangeClause(const DateRange& range)
{
    QStringList conditions;
    if (!range.startDate.isEmpty())
        conditions << QStringLiteral("date >= :start");
    if (!range.endDate.isEmpty())
        conditions << QStringLiteral("date <= :end");
    if (conditions.isEmpty())
        return {};
    return QStringLiteral(" WHERE ") + conditions.join(QStringLiteral(" AND "));
}

void bindRange(QSqlQuery& query, const DateRange& range)
{
    if (!range.startDate.isEmpty())
        query.bindValue(QStringLiteral(":start"), range.startDate);
    if (!range.endDate.isEmpty())
        query.bindValue(QStringLiteral(":end"), range.endDate);
}

} // namespace

HealthStore::HealthStore(QObject* parent)
    : QObject(parent)
    , m_connectionName(QStringLiteral("summit-store-%1").arg(++g_connectionCounter))
{
}

HealthStore::~HealthStore()
{
    close();
}

bool HealthStore::open(const QString& path, StoreError* error)
{
    close();

    if (path.trimmed().isEmpty()) {
        return reportStoreError(error, StoreError::make(StoreError::Kind::OpenError,
            tr("Nie podano ścieżki bazy danych.")));
    }
    if (!QSqlDatabase::isDriverAvailable(QString::fromLatin1(kSqliteDriver))) {
        return reportStoreError(error, StoreError::make(StoreError::Kind::OpenError,
            tr("Sterownik %1 jest niedostępny.").arg(QString::fromLatin1(kSqliteDriver))));
    }

    const QFileInfo info(path);
    QDir directory = info.absoluteDir();
    if (!directory.exists() && !directory.mkpath(QStringLiteral("."))) {
        return reportStoreError(error, StoreError::make(StoreError::Kind::OpenError,
            tr("Nie udało się utworzyć katalogu bazy danych (%1).").arg(directory.absolutePath())));
    }

    {
        QSqlDatabase db = QSqlDatabase::addDatabase(QString::fromLatin1(kSqliteDriver), m_connectionName);
        db.setDatabaseName(info.absoluteFilePath());
        db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=5000"));
        if (!db.open()) {
            StoreError failure = StoreError::fromSqlError(db.lastError(), StoreError::Kind::OpenError);
            failure.kind = StoreError::Kind::OpenError;
            qCWarning(lcHealthStore) << "Nie udało się otworzyć bazy" << info.absoluteFilePath() << failure.message;
            db = QSqlDatabase();
            QSqlDatabase::removeDatabase(m_connectionName);
            return reportStoreError(error, std::move(failure));
        }
    }

    m_path = info.absoluteFilePath();
    qCDebug(lcHealthStore) << "Otwarto bazę" << m_path << "połączenie" << m_connectionName;
    return true;
}

void HealthStore::close()
{
    if (!QSqlDatabase::contains(m_connectionName))
        return;
    {
        QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
        if (db.isOpen())
            db.close();
    }
    QSqlDatabase::removeDatabase(m_connectionName);
    m_path.clear();
}

bool HealthStore::isOpen() const
{
    if (!QSqlDatabase::contains(m_connectionName))
        return false;
    return QSqlDatabase::database(m_connectionName, false).isOpen();
}

QSqlDatabase HealthStore::database() const
{
    return QSqlDatabase::database(m_connectionName, false);
}

bool HealthStore::migrate(const MigrationList& migrations, MigrationRunner::Report* report, StoreError* error)
{
    if (!ensureOpen(error))
        return false;
    MigrationRunner runner(database());
    MigrationRunner::Report localReport;
    if (!runner.apply(migrations, &localReport, error))
        return false;
    if (!localReport.applied.isEmpty())
        Q_EMIT dataChanged();
    if (report)
        *report = localReport;
    return true;
}

bool HealthStore::executeBatch(const QString& sql, StoreError* error)
{
    if (!ensureOpen(error))
        return false;
    MigrationRunner runner(database());
    return runner.executeBatch(sql, error);
}

std::optional<QList<qint64>> HealthStore::appliedVersions(StoreError* error)
{
    if (!ensureOpen(error))
        return std::nullopt;
    MigrationRunner runner(database());
    const auto applied = runner.appliedMigrations(error);
    if (!applied.has_value())
        return std::nullopt;
    QList<qint64> versions;
    for (const auto& entry : *applied) {
        if (entry.success)
            versions.append(entry.version);
    }
    return versions;
}

QStringList HealthStore::tableNames(StoreError* error) const
{
    QStringList names = schemaObjects(QStringLiteral("table"), error);
    names.removeAll(MigrationRunner::kBookkeepingTable);
    return names;
}

QStringList HealthStore::indexNames(StoreError* error) const
{
    return schemaObjects(QStringLiteral("index"), error);
}

QList<HealthStore::ColumnInfo> HealthStore::columns(const QString& table, StoreError* error) const
{
    if (!ensureOpen(error))
        return {};

    QSqlQuery query(database());
    // PRAGMA nie przyjmuje parametrów; nazwa tabeli pochodzi z sqlite_master.
    if (!schemaObjects(QStringLiteral("table"), error).contains(table))
        return {};
    const QString sql = QStringLiteral("PRAGMA table_info(\"%1\")").arg(table);
    if (!query.exec(sql)) {
        reportStoreError(error, StoreError::fromSqlError(query.lastError(), StoreError::Kind::QueryError, sql));
        return {};
    }

    QList<ColumnInfo> result;
    while (query.next()) {
        ColumnInfo column;
        column.name = query.value(QStringLiteral("name")).toString();
        column.type = query.value(QStringLiteral("type")).toString();
        column.notNull = query.value(QStringLiteral("notnull")).toInt() != 0;
        column.primaryKey = query.value(QStringLiteral("pk")).toInt() != 0;
        column.defaultValue = query.value(QStringLiteral("dflt_value")).toString();
        result.append(column);
    }
    return result;
}

bool HealthStore::insertMetric(const DailyHealthMetric& metric, StoreError* error)
{
    return writeMetric(metric, false, error);
}

bool HealthStore::upsertMetrics(const QList<DailyHealthMetric>& metrics, StoreError* error)
{
    if (!ensureOpen(error))
        return false;

    QString validationError;
    for (const DailyHealthMetric& metric : metrics) {
        if (!metric.validate(&validationError)) {
            return reportStoreError(error, StoreError::make(StoreError::Kind::ValidationError, validationError));
        }
    }
    if (metrics.isEmpty())
        return true;

    QSqlDatabase db = database();
    if (!db.transaction()) {
        return reportStoreError(error, StoreError::fromSqlError(db.lastError(), StoreError::Kind::QueryError));
    }
    for (const DailyHealthMetric& metric : metrics) {
        StoreError failure;
        if (!writeMetric(metric, true, &failure)) {
            if (!db.rollback())
                qCWarning(lcHealthStore) << "Wycofanie transakcji nie powiodło się:" << db.lastError().text();
            return reportStoreError(error, std::move(failure));
        }
    }
    if (!db.commit()) {
        StoreError failure = StoreError::fromSqlError(db.lastError(), StoreError::Kind::QueryError);
        db.rollback();
        return reportStoreError(error, std::move(failure));
    }

    qCDebug(lcHealthStore) << "Zapisano" << metrics.size() << "dni metryk";
    Q_EMIT dataChanged();
    return true;
}

std::optional<QList<DailyHealthMetric>> HealthStore::metrics(const DateRange& range, StoreError* error) const
{
    if (!ensureOpen(error))
        return std::nullopt;
    QString rangeError;
    if (!range.validate(&rangeError)) {
        reportStoreError(error, StoreError::make(StoreError::Kind::ValidationError, rangeError));
        return std::nullopt;
    }

    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT * FROM health_metrics%1 ORDER BY date ASC").arg(rangeClause(range)));
    bindRange(query, range);
    if (!execPrepared(query, error))
        return std::nullopt;

    QList<DailyHealthMetric> result;
    while (query.next())
        result.append(readMetric(query));
    return result;
}

std::optional<DailyHealthMetric> HealthStore::latestMetric(StoreError* error) const
{
    if (!ensureOpen(error))
        return std::nullopt;
    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT * FROM health_metrics ORDER BY date DESC LIMIT 1"));
    if (!execPrepared(query, error) || !query.next())
        return std::nullopt;
    return readMetric(query);
}

std::optional<int> HealthStore::metricsCount(StoreError* error) const
{
    if (!ensureOpen(error))
        return std::nullopt;
    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT COUNT(*) FROM health_metrics"));
    if (!execPrepared(query, error) || !query.next())
        return std::nullopt;
    return query.value(0).toInt();
}

bool HealthStore::insertVitalScore(const VitalScore& score, StoreError* error)
{
    return writeVitalScore(score, false, error);
}

bool HealthStore::upsertVitalScore(const VitalScore& score, StoreError* error)
{
    return writeVitalScore(score, true, error);
}

std::optional<QList<VitalScore>> HealthStore::vitalScores(const DateRange& range, StoreError* error) const
{
    if (!ensureOpen(error))
        return std::nullopt;
    QString rangeError;
    if (!range.validate(&rangeError)) {
        reportStoreError(error, StoreError::make(StoreError::Kind::ValidationError, rangeError));
        return std::nullopt;
    }

    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT * FROM vital_scores%1 ORDER BY date ASC").arg(rangeClause(range)));
    bindRange(query, range);
    if (!execPrepared(query, error))
        return std::nullopt;

    QList<VitalScore> result;
    while (query.next())
        result.append(readVitalScore(query));
    return result;
}

std::optional<VitalScore> HealthStore::latestVitalScore(StoreError* error) const
{
    if (!ensureOpen(error))
        return std::nullopt;
    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT * FROM vital_scores ORDER BY date DESC LIMIT 1"));
    if (!execPrepared(query, error) || !query.next())
        return std::nullopt;
    return readVitalScore(query);
}

bool HealthStore::insertTrend(const Trend& trend, StoreError* error)
{
    return writeTrend(trend, false, error);
}

bool HealthStore::upsertTrend(const Trend& trend, StoreError* error)
{
    return writeTrend(trend, true, error);
}

std::optional<QList<Trend>> HealthStore::trends(StoreError* error) const
{
    if (!ensureOpen(error))
        return std::nullopt;
    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT * FROM trends ORDER BY metric, timeframe"));
    if (!execPrepared(query, error))
        return std::nullopt;

    QList<Trend> result;
    while (query.next())
        result.append(readTrend(query));
    return result;
}

std::optional<QList<Trend>> HealthStore::trendsForTimeframe(const QString& timeframe, StoreError* error) const
{
    if (!ensureOpen(error))
        return std::nullopt;
    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT * FROM trends WHERE timeframe = :timeframe ORDER BY metric"));
    query.bindValue(QStringLiteral(":timeframe"), timeframe);
    if (!execPrepared(query, error))
        return std::nullopt;

    QList<Trend> result;
    while (query.next())
        result.append(readTrend(query));
    return result;
}

bool HealthStore::clearAllData(StoreError* error)
{
    if (!ensureOpen(error))
        return false;

    QSqlDatabase db = database();
    if (!db.transaction())
        return reportStoreError(error, StoreError::fromSqlError(db.lastError(), StoreError::Kind::QueryError));

    const QStringList tables = {
        QStringLiteral("health_metrics"),
        QStringLiteral("vital_scores"),
        QStringLiteral("trends"),
    };
    for (const QString& table : tables) {
        QSqlQuery query(db);
        const QString sql = QStringLiteral("DELETE FROM %1").arg(table);
        if (!query.exec(sql)) {
            StoreError failure = StoreError::fromSqlError(query.lastError(), StoreError::Kind::QueryError, sql);
            db.rollback();
            return reportStoreError(error, std::move(failure));
        }
    }
    if (!db.commit()) {
        StoreError failure = StoreError::fromSqlError(db.lastError(), StoreError::Kind::QueryError);
        db.rollback();
        return reportStoreError(error, std::move(failure));
    }

    qCInfo(lcHealthStore) << "Usunięto wszystkie dane z" << m_path;
    Q_EMIT dataChanged();
    return true;
}

bool HealthStore::ensureOpen(StoreError* error) const
{
    if (isOpen())
        return true;
    return reportStoreError(error, StoreError::make(StoreError::Kind::OpenError,
        tr("Baza danych nie jest otwarta.")));
}

bool HealthStore::execPrepared(QSqlQuery& query, StoreError* error) const
{
    if (query.exec())
        return true;
    const StoreError failure = StoreError::fromSqlError(query.lastError(), StoreError::Kind::QueryError,
                                                        query.lastQuery());
    if (failure.kind == StoreError::Kind::ConstraintViolation)
        qCDebug(lcHealthStore) << "Naruszenie ograniczenia:" << failure.message;
    else
        qCWarning(lcHealthStore) << "Zapytanie nie powiodło się:" << failure.message;
    return reportStoreError(error, failure);
}

bool HealthStore::writeMetric(const DailyHealthMetric& metric, bool upsert, StoreError* error)
{
    if (!ensureOpen(error))
        return false;
    QString validationError;
    if (!metric.validate(&validationError))
        return reportStoreError(error, StoreError::make(StoreError::Kind::ValidationError, validationError));

    QString sql = QStringLiteral(
        "INSERT INTO health_metrics (date, body_battery, sleep_score, sleep_duration_seconds, "
        "deep_sleep_seconds, rem_sleep_seconds, stress_avg, resting_hr, hrv_avg, intensity_minutes, steps) "
        "VALUES (:date, :body_battery, :sleep_score, :sleep_duration_seconds, :deep_sleep_seconds, "
        ":rem_sleep_seconds, :stress_avg, :resting_hr, :hrv_avg, :intensity_minutes, :steps)");
    if (upsert) {
        // created_at zostaje z pierwszego zapisu, updated_at wskazuje ostatnią aktualizację.
        sql += QStringLiteral(
            " ON CONFLICT(date) DO UPDATE SET "
            "body_battery = excluded.body_battery, "
            "sleep_score = excluded.sleep_score, "
            "sleep_duration_seconds = excluded.sleep_duration_seconds, "
            "deep_sleep_seconds = excluded.deep_sleep_seconds, "
            "rem_sleep_seconds = excluded.rem_sleep_seconds, "
            "stress_avg = excluded.stress_avg, "
            "resting_hr = excluded.resting_hr, "
            "hrv_avg = excluded.hrv_avg, "
            "intensity_minutes = excluded.intensity_minutes, "
            "steps = excluded.steps, "
            "updated_at = CURRENT_TIMESTAMP");
    }

    QSqlQuery query(database());
    if (!query.prepare(sql))
        return reportStoreError(error, StoreError::fromSqlError(query.lastError(), StoreError::Kind::QueryError, sql));
    query.bindValue(QStringLiteral(":date"), metric.date);
    query.bindValue(QStringLiteral(":body_battery"), toVariant(metric.bodyBattery));
    query.bindValue(QStringLiteral(":sleep_score"), toVariant(metric.sleepScore));
    query.bindValue(QStringLiteral(":sleep_duration_seconds"), toVariant(metric.sleepDurationSeconds));
    query.bindValue(QStringLiteral(":deep_sleep_seconds"), toVariant(metric.deepSleepSeconds));
    query.bindValue(QStringLiteral(":rem_sleep_seconds"), toVariant(metric.remSleepSeconds));
    query.bindValue(QStringLiteral(":stress_avg"), toVariant(metric.stressAvg));
    query.bindValue(QStringLiteral(":resting_hr"), toVariant(metric.restingHr));
    query.bindValue(QStringLiteral(":hrv_avg"), toVariant(metric.hrvAvg));
    query.bindValue(QStringLiteral(":intensity_minutes"), toVariant(metric.intensityMinutes));
    query.bindValue(QStringLiteral(":steps"), toVariant(metric.steps));
    if (!execPrepared(query, error))
        return false;

    if (!upsert)
        Q_EMIT dataChanged();
    return true;
}

bool HealthStore::writeVitalScore(const VitalScore& score, bool replace, StoreError* error)
{
    if (!ensureOpen(error))
        return false;
    QString validationError;
    if (!score.validate(&validationError))
        return reportStoreError(error, StoreError::make(StoreError::Kind::ValidationError, validationError));

    const QString sql = QStringLiteral(
        "%1 INTO vital_scores (date, score, sleep_component, recovery_component, strain_component, recommendation) "
        "VALUES (:date, :score, :sleep_component, :recovery_component, :strain_component, :recommendation)")
        .arg(replace ? QStringLiteral("INSERT OR REPLACE") : QStringLiteral("INSERT"));

    QSqlQuery query(database());
    if (!query.prepare(sql))
        return reportStoreError(error, StoreError::fromSqlError(query.lastError(), StoreError::Kind::QueryError, sql));
    query.bindValue(QStringLiteral(":date"), score.date);
    query.bindValue(QStringLiteral(":score"), score.score);
    query.bindValue(QStringLiteral(":sleep_component"), toVariant(score.sleepComponent));
    query.bindValue(QStringLiteral(":recovery_component"), toVariant(score.recoveryComponent));
    query.bindValue(QStringLiteral(":strain_component"), toVariant(score.strainComponent));
    query.bindValue(QStringLiteral(":recommendation"), textOrNull(score.recommendation));
    if (!execPrepared(query, error))
        return false;

    Q_EMIT dataChanged();
    return true;
}

bool HealthStore::writeTrend(const Trend& trend, bool replace, StoreError* error)
{
    if (!ensureOpen(error))
        return false;
    QString validationError;
    if (!trend.validate(&validationError))
        return reportStoreError(error, StoreError::make(StoreError::Kind::ValidationError, validationError));

    // Ponowne wykrycie nadpisuje wiersz pary (metric, timeframe) i odświeża detected_at.
    const QString sql = QStringLiteral(
        "%1 INTO trends (metric, timeframe, baseline, current_avg, percent_change, direction, detected_at) "
        "VALUES (:metric, :timeframe, :baseline, :current_avg, :percent_change, :direction, CURRENT_TIMESTAMP)")
        .arg(replace ? QStringLiteral("INSERT OR REPLACE") : QStringLiteral("INSERT"));

    QSqlQuery query(database());
    if (!query.prepare(sql))
        return reportStoreError(error, StoreError::fromSqlError(query.lastError(), StoreError::Kind::QueryError, sql));
    query.bindValue(QStringLiteral(":metric"), trend.metric);
    query.bindValue(QStringLiteral(":timeframe"), trend.timeframe);
    query.bindValue(QStringLiteral(":baseline"), toVariant(trend.baseline));
    query.bindValue(QStringLiteral(":current_avg"), toVariant(trend.currentAvg));
    query.bindValue(QStringLiteral(":percent_change"), toVariant(trend.percentChange));
    query.bindValue(QStringLiteral(":direction"), textOrNull(trend.direction));
    if (!execPrepared(query, error))
        return false;

    Q_EMIT dataChanged();
    return true;
}

QStringList HealthStore::schemaObjects(const QString& type, StoreError* error) const
{
    if (!ensureOpen(error))
        return {};

    QSqlQuery query(database());
    query.prepare(QStringLiteral(
        "SELECT name FROM sqlite_master WHERE type = :type AND name NOT LIKE 'sqlite_%' ORDER BY name"));
    query.bindValue(QStringLiteral(":type"), type);
    if (!execPrepared(query, error))
        return {};

    QStringList names;
    while (query.next())
        names.append(query.value(0).toString());
    return names;
}

bool applyMigrations(const QString& dbPath,
                     const MigrationList& migrations,
                     MigrationRunner::Report* report,
                     StoreError* error)
{
    HealthStore store;
    if (!store.open(dbPath, error))
        return false;
    return store.migrate(migrations, report, error);
}
