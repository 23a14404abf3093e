#pragma once

#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

struct DailyHealthMetric {
    std::optional<qint64> id;
    QString date; // YYYY-MM-DD
    std::optional<int> bodyBattery;
    std::optional<int> sleepScore;
    std::optional<int> sleepDurationSeconds;
    std::optional<int> deepSleepSeconds;
    std::optional<int> remSleepSeconds;
    std::optional<int> stressAvg;
    std::optional<int> restingHr;
    std::optional<int> hrvAvg;
    std::optional<int> intensityMinutes;
    std::optional<int> steps;
    QString createdAt;
    QString updatedAt;

    //! Checks the writer invariants (calendar date, non-negative values).
    bool validate(QString* errorMessage = nullptr) const;
};

struct VitalScore {
    std::optional<qint64> id;
    QString date;
    int score = 0;
    std::optional<int> sleepComponent;
    std::optional<int> recoveryComponent;
    std::optional<int> strainComponent;
    QString recommendation;
    QString createdAt;

    bool validate(QString* errorMessage = nullptr) const;
};

struct Trend {
    std::optional<qint64> id;
    QString metric;
    QString timeframe;
    std::optional<double> baseline;
    std::optional<double> currentAvg;
    std::optional<double> percentChange;
    QString direction;
    QString detectedAt;

    bool validate(QString* errorMessage = nullptr) const;
};

//! Inclusive date window; an empty bound is open.
struct DateRange {
    QString startDate;
    QString endDate;

    bool isUnbounded() const { return startDate.isEmpty() && endDate.isEmpty(); }
    bool contains(const QString& date) const;
    bool validate(QString* errorMessage = nullptr) const;
};

namespace summit::records {

bool isValidDate(const QString& value);

// Nazwy używane przez logikę trendów; schemat przechowuje dowolny tekst.
QStringList knownTrendMetrics();
QStringList knownTimeframes();
QStringList knownDirections();

} // namespace summit::records
