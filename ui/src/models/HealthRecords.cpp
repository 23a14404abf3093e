#include "HealthRecords.hpp"

#include <QDate>
#include <QObject>
#include <QRegularExpression>

#include <cmath>

namespace {

bool checkNonNegative(const std::optional<int>& value, const char* field, QString* errorMessage)
{
    if (!value.has_value() || *value >= 0)
        return true;
    if (errorMessage) {
        *errorMessage = QObject::tr("Pole %1 nie może być ujemne (%2).")
                            .arg(QString::fromLatin1(field))
                            .arg(*value);
    }
    return false;
}

bool checkFinite(const std::optional<double>& value, const char* field, QString* errorMessage)
{
    if (!value.has_value() || std::isfinite(*value))
        return true;
    if (errorMessage)
        *errorMessage = QObject::tr("Pole %1 musi być liczbą skończoną.").arg(QString::fromLatin1(field));
    return false;
}

bool checkDate(const QString& date, QString* errorMessage)
{
    if (summit::records::isValidDate(date))
        return true;
    if (errorMessage) {
        *errorMessage = date.isEmpty()
            ? QObject::tr("Brak daty rekordu.")
            : QObject::tr("Niepoprawna data rekordu: %1 (oczekiwano YYYY-MM-DD).").arg(date);
    }
    return false;
}

} // namespace

namespace summit::records {

bool isValidDate(const QString& value)
{
    static const QRegularExpression pattern(QStringLiteral("^\\d{4}-\\d{2}-\\d{2}$"));
    if (!pattern.match(value).hasMatch())
        return false;
    return QDate::fromString(value, Qt::ISODate).isValid();
}

QStringList knownTrendMetrics()
{
    return {
        QStringLiteral("body_battery"),
        QStringLiteral("sleep_score"),
        QStringLiteral("sleep_duration"),
        QStringLiteral("deep_sleep"),
        QStringLiteral("rem_sleep"),
        QStringLiteral("stress"),
        QStringLiteral("resting_hr"),
        QStringLiteral("hrv"),
        QStringLiteral("intensity_minutes"),
        QStringLiteral("steps"),
    };
}

QStringList knownTimeframes()
{
    return {
        QStringLiteral("1W"),
        QStringLiteral("2W"),
        QStringLiteral("1M"),
        QStringLiteral("3M"),
        QStringLiteral("6M"),
        QStringLiteral("1Y"),
    };
}

QStringList knownDirections()
{
    return {QStringLiteral("improving"), QStringLiteral("stable"), QStringLiteral("declining")};
}

} // namespace summit::records

bool DailyHealthMetric::validate(QString* errorMessage) const
{
    return checkDate(date, errorMessage)
        && checkNonNegative(bodyBattery, "body_battery", errorMessage)
        && checkNonNegative(sleepScore, "sleep_score", errorMessage)
        && checkNonNegative(sleepDurationSeconds, "sleep_duration_seconds", errorMessage)
        && checkNonNegative(deepSleepSeconds, "deep_sleep_seconds", errorMessage)
        && checkNonNegative(remSleepSeconds, "rem_sleep_seconds", errorMessage)
        && checkNonNegative(stressAvg, "stress_avg", errorMessage)
        && checkNonNegative(restingHr, "resting_hr", errorMessage)
        && checkNonNegative(hrvAvg, "hrv_avg", errorMessage)
        && checkNonNegative(intensityMinutes, "intensity_minutes", errorMessage)
        && checkNonNegative(steps, "steps", errorMessage);
}

bool VitalScore::validate(QString* errorMessage) const
{
    return checkDate(date, errorMessage)
        && checkNonNegative(score, "score", errorMessage)
        && checkNonNegative(sleepComponent, "sleep_component", errorMessage)
        && checkNonNegative(recoveryComponent, "recovery_component", errorMessage)
        && checkNonNegative(strainComponent, "strain_component", errorMessage);
}

bool Trend::validate(QString* errorMessage) const
{
    if (metric.trimmed().isEmpty()) {
        if (errorMessage)
            *errorMessage = QObject::tr("Trend wymaga nazwy metryki.");
        return false;
    }
    if (timeframe.trimmed().isEmpty()) {
        if (errorMessage)
            *errorMessage = QObject::tr("Trend wymaga przedziału czasu.");
        return false;
    }
    return checkFinite(baseline, "baseline", errorMessage)
        && checkFinite(currentAvg, "current_avg", errorMessage)
        && checkFinite(percentChange, "percent_change", errorMessage);
}

bool DateRange::contains(const QString& date) const
{
    if (!startDate.isEmpty() && date < startDate)
        return false;
    if (!endDate.isEmpty() && date > endDate)
        return false;
    return true;
}

bool DateRange::validate(QString* errorMessage) const
{
    for (const QString& bound : {startDate, endDate}) {
        if (!bound.isEmpty() && !summit::records::isValidDate(bound)) {
            if (errorMessage)
                *errorMessage = QObject::tr("Niepoprawna granica zakresu dat: %1.").arg(bound);
            return false;
        }
    }
    if (!startDate.isEmpty() && !endDate.isEmpty() && startDate > endDate) {
        if (errorMessage)
            *errorMessage = QObject::tr("Początek zakresu (%1) jest późniejszy niż koniec (%2).")
                                .arg(startDate, endDate);
        return false;
    }
    return true;
}
