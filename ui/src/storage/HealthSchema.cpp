#include "HealthSchema.hpp"

namespace {

// Indeksy nie mają IF NOT EXISTS: ponowne uruchomienie wersji 1 z pominięciem
// tabeli migracji kończy się błędem na CREATE INDEX.
const char kCreateInitialTables[] = R"SQL(
    CREATE TABLE IF NOT EXISTS health_metrics (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        date TEXT NOT NULL UNIQUE,
        body_battery INTEGER,
        sleep_score INTEGER,
        sleep_duration_seconds INTEGER,
        deep_sleep_seconds INTEGER,
        rem_sleep_seconds INTEGER,
        stress_avg INTEGER,
        resting_hr INTEGER,
        hrv_avg INTEGER,
        intensity_minutes INTEGER,
        steps INTEGER,
        created_at TEXT DEFAULT CURRENT_TIMESTAMP,
        updated_at TEXT DEFAULT CURRENT_TIMESTAMP
    );

    CREATE TABLE IF NOT EXISTS vital_scores (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        date TEXT NOT NULL UNIQUE,
        score INTEGER NOT NULL,
        sleep_component INTEGER,
        recovery_component INTEGER,
        strain_component INTEGER,
        recommendation TEXT,
        created_at TEXT DEFAULT CURRENT_TIMESTAMP
    );

    CREATE TABLE IF NOT EXISTS trends (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        metric TEXT NOT NULL,
        timeframe TEXT NOT NULL,
        baseline REAL,
        current_avg REAL,
        percent_change REAL,
        direction TEXT,
        detected_at TEXT DEFAULT CURRENT_TIMESTAMP,
        UNIQUE(metric, timeframe)
    );

    CREATE INDEX idx_health_metrics_date ON health_metrics(date);
    CREATE INDEX idx_vital_scores_date ON vital_scores(date);
    CREATE INDEX idx_trends_metric ON trends(metric, timeframe);
)SQL";

} // namespace

namespace summit::storage {

MigrationList healthMigrations()
{
    Migration initial;
    initial.version = 1;
    initial.description = QStringLiteral("create initial tables");
    initial.sql = QString::fromUtf8(kCreateInitialTables);
    initial.kind = Migration::Kind::Up;
    return {initial};
}

QStringList healthTableNames()
{
    return {QStringLiteral("health_metrics"), QStringLiteral("trends"), QStringLiteral("vital_scores")};
}

QStringList healthIndexNames()
{
    return {
        QStringLiteral("idx_health_metrics_date"),
        QStringLiteral("idx_trends_metric"),
        QStringLiteral("idx_vital_scores_date"),
    };
}

} // namespace summit::storage
