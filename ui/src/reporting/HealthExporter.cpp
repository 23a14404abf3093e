#include "HealthExporter.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLocale>
#include <QLoggingCategory>
#include <QObject>
#include <QSaveFile>
#include <QStringList>

#include <algorithm>
#include <cmath>
#include <iterator>

#include "storage/HealthStore.hpp"

Q_LOGGING_CATEGORY(lcHealthExport, "summit.shell.reporting.export")

namespace {

constexpr int kRecentMetricDays = 7;

void insertOptional(QJsonObject& object, const QString& key, const std::optional<int>& value)
{
    if (value.has_value())
        object.insert(key, *value);
}

void insertOptional(QJsonObject& object, const QString& key, const std::optional<double>& value)
{
    if (value.has_value() && std::isfinite(*value))
        object.insert(key, *value);
}

void insertText(QJsonObject& object, const QString& key, const QString& value)
{
    if (!value.isEmpty())
        object.insert(key, value);
}

QJsonObject metricToJson(const DailyHealthMetric& metric)
{
    QJsonObject object;
    if (metric.id.has_value())
        object.insert(QStringLiteral("id"), static_cast<double>(*metric.id));
    object.insert(QStringLiteral("date"), metric.date);
    insertOptional(object, QStringLiteral("bodyBattery"), metric.bodyBattery);
    insertOptional(object, QStringLiteral("sleepScore"), metric.sleepScore);
    insertOptional(object, QStringLiteral("sleepDurationSeconds"), metric.sleepDurationSeconds);
    insertOptional(object, QStringLiteral("deepSleepSeconds"), metric.deepSleepSeconds);
    insertOptional(object, QStringLiteral("remSleepSeconds"), metric.remSleepSeconds);
    insertOptional(object, QStringLiteral("stressAvg"), metric.stressAvg);
    insertOptional(object, QStringLiteral("restingHr"), metric.restingHr);
    insertOptional(object, QStringLiteral("hrvAvg"), metric.hrvAvg);
    insertOptional(object, QStringLiteral("intensityMinutes"), metric.intensityMinutes);
    insertOptional(object, QStringLiteral("steps"), metric.steps);
    insertText(object, QStringLiteral("createdAt"), metric.createdAt);
    insertText(object, QStringLiteral("updatedAt"), metric.updatedAt);
    return object;
}

QJsonObject scoreToJson(const VitalScore& score)
{
    QJsonObject object;
    if (score.id.has_value())
        object.insert(QStringLiteral("id"), static_cast<double>(*score.id));
    object.insert(QStringLiteral("date"), score.date);
    object.insert(QStringLiteral("score"), score.score);
    insertOptional(object, QStringLiteral("sleepComponent"), score.sleepComponent);
    insertOptional(object, QStringLiteral("recoveryComponent"), score.recoveryComponent);
    insertOptional(object, QStringLiteral("strainComponent"), score.strainComponent);
    insertText(object, QStringLiteral("recommendation"), score.recommendation);
    insertText(object, QStringLiteral("createdAt"), score.createdAt);
    return object;
}

QJsonObject trendToJson(const Trend& trend)
{
    QJsonObject object;
    if (trend.id.has_value())
        object.insert(QStringLiteral("id"), static_cast<double>(*trend.id));
    object.insert(QStringLiteral("metric"), trend.metric);
    object.insert(QStringLiteral("timeframe"), trend.timeframe);
    insertOptional(object, QStringLiteral("baseline"), trend.baseline);
    insertOptional(object, QStringLiteral("currentAvg"), trend.currentAvg);
    insertOptional(object, QStringLiteral("percentChange"), trend.percentChange);
    insertText(object, QStringLiteral("direction"), trend.direction);
    insertText(object, QStringLiteral("detectedAt"), trend.detectedAt);
    return object;
}

QString escapeCsv(const QString& value)
{
    QString escaped = value;
    escaped.replace(QStringLiteral("\""), QStringLiteral("\"\""));
    if (escaped.contains(QLatin1Char(',')) || escaped.contains(QLatin1Char('\n')) || escaped.contains(QLatin1Char('"')))
        return QStringLiteral("\"%1\"").arg(escaped);
    return escaped;
}

QString csvInt(const std::optional<int>& value)
{
    return value.has_value() ? QString::number(*value) : QString();
}

QString csvHours(const std::optional<int>& seconds)
{
    if (!seconds.has_value())
        return {};
    return QLocale::c().toString(*seconds / 3600.0, 'f', 2);
}

QString csvReal(const std::optional<double>& value)
{
    if (!value.has_value() || !std::isfinite(*value))
        return {};
    return QLocale::c().toString(*value, 'f', 4);
}

QString cell(const std::optional<int>& value)
{
    return value.has_value() ? QString::number(*value) : QStringLiteral("-");
}

QString percentCell(const std::optional<double>& value)
{
    if (!value.has_value() || !std::isfinite(*value))
        return QStringLiteral("-");
    return QStringLiteral("%1%").arg(std::lround(*value));
}

} // namespace

std::optional<HealthExportOptions::Format> HealthExporter::parseFormat(const QString& name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QStringLiteral("json"))
        return HealthExportOptions::Format::Json;
    if (normalized == QStringLiteral("csv"))
        return HealthExportOptions::Format::Csv;
    if (normalized == QStringLiteral("markdown") || normalized == QStringLiteral("md"))
        return HealthExportOptions::Format::Markdown;
    if (normalized == QStringLiteral("weekly"))
        return HealthExportOptions::Format::Weekly;
    return std::nullopt;
}

QString HealthExporter::formatName(HealthExportOptions::Format format)
{
    switch (format) {
    case HealthExportOptions::Format::Json:
        return QStringLiteral("json");
    case HealthExportOptions::Format::Csv:
        return QStringLiteral("csv");
    case HealthExportOptions::Format::Markdown:
        return QStringLiteral("markdown");
    case HealthExportOptions::Format::Weekly:
        return QStringLiteral("weekly");
    }
    return {};
}

QString HealthExporter::fileSuffix(HealthExportOptions::Format format)
{
    switch (format) {
    case HealthExportOptions::Format::Markdown:
    case HealthExportOptions::Format::Weekly:
        return QStringLiteral("md");
    default:
        return formatName(format);
    }
}

std::optional<HealthExportData> HealthExporter::collect(const HealthStore& store,
                                                        const QString& version,
                                                        StoreError* error)
{
    const auto metrics = store.metrics({}, error);
    if (!metrics.has_value())
        return std::nullopt;
    const auto scores = store.vitalScores({}, error);
    if (!scores.has_value())
        return std::nullopt;
    const auto trends = store.trends(error);
    if (!trends.has_value())
        return std::nullopt;

    HealthExportData data;
    data.metrics = *metrics;
    data.scores = *scores;
    data.trends = *trends;
    data.exportedAt = QDateTime::currentDateTimeUtc();
    data.version = version;
    return data;
}

QString HealthExporter::render(const HealthExportData& data, const HealthExportOptions& options) const
{
    const HealthExportData filtered = filterByRange(data, options.range);
    switch (options.format) {
    case HealthExportOptions::Format::Json:
        return renderJson(filtered, options);
    case HealthExportOptions::Format::Csv:
        return renderCsv(filtered, options);
    case HealthExportOptions::Format::Markdown:
        return renderMarkdown(filtered, options);
    case HealthExportOptions::Format::Weekly:
        return renderWeeklyReport(filtered, data.exportedAt.toUTC().date());
    }
    return {};
}

bool HealthExporter::exportToFile(const QString& filePath,
                                  const HealthExportData& data,
                                  const HealthExportOptions& options,
                                  QString* errorMessage) const
{
    if (filePath.trimmed().isEmpty()) {
        if (errorMessage)
            *errorMessage = QObject::tr("Nie podano ścieżki eksportu.");
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (errorMessage)
            *errorMessage = QObject::tr("Nie można otworzyć pliku eksportu %1: %2").arg(filePath, file.errorString());
        return false;
    }

    const QByteArray payload = render(data, options).toUtf8();
    if (file.write(payload) != payload.size()) {
        if (errorMessage)
            *errorMessage = QObject::tr("Zapis eksportu nie powiódł się: %1").arg(file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        if (errorMessage)
            *errorMessage = QObject::tr("Nie udało się zatwierdzić pliku eksportu: %1").arg(file.errorString());
        return false;
    }

    qCInfo(lcHealthExport) << "Wyeksportowano dane" << formatName(options.format) << "do" << filePath;
    return true;
}

HealthExportData HealthExporter::filterByRange(const HealthExportData& data, const DateRange& range) const
{
    if (range.isUnbounded())
        return data;

    HealthExportData filtered = data;
    filtered.metrics.clear();
    filtered.scores.clear();
    for (const DailyHealthMetric& metric : data.metrics) {
        if (range.contains(metric.date))
            filtered.metrics.append(metric);
    }
    for (const VitalScore& score : data.scores) {
        if (range.contains(score.date))
            filtered.scores.append(score);
    }
    return filtered;
}

QString HealthExporter::renderJson(const HealthExportData& data, const HealthExportOptions& options) const
{
    QJsonObject root;
    root.insert(QStringLiteral("exportedAt"), data.exportedAt.toUTC().toString(Qt::ISODateWithMs));
    root.insert(QStringLiteral("version"), data.version);

    if (options.includeMetrics) {
        QJsonArray array;
        for (const DailyHealthMetric& metric : data.metrics)
            array.append(metricToJson(metric));
        root.insert(QStringLiteral("metrics"), array);
    }
    if (options.includeScores) {
        QJsonArray array;
        for (const VitalScore& score : data.scores)
            array.append(scoreToJson(score));
        root.insert(QStringLiteral("scores"), array);
    }
    if (options.includeTrends) {
        QJsonArray array;
        for (const Trend& trend : data.trends)
            array.append(trendToJson(trend));
        root.insert(QStringLiteral("trends"), array);
    }

    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString HealthExporter::renderCsv(const HealthExportData& data, const HealthExportOptions& options) const
{
    QStringList lines;

    if (options.includeMetrics && !data.metrics.isEmpty()) {
        lines << QStringLiteral("# Health Metrics");
        lines << QStringLiteral("date,body_battery,sleep_score,sleep_duration_hrs,deep_sleep_hrs,rem_sleep_hrs,"
                                "stress_avg,resting_hr,hrv_avg,intensity_minutes,steps");
        for (const DailyHealthMetric& m : data.metrics) {
            lines << QStringList{
                escapeCsv(m.date),
                csvInt(m.bodyBattery),
                csvInt(m.sleepScore),
                csvHours(m.sleepDurationSeconds),
                csvHours(m.deepSleepSeconds),
                csvHours(m.remSleepSeconds),
                csvInt(m.stressAvg),
                csvInt(m.restingHr),
                csvInt(m.hrvAvg),
                csvInt(m.intensityMinutes),
                csvInt(m.steps),
            }.join(QLatin1Char(','));
        }
        lines << QString();
    }

    if (options.includeScores && !data.scores.isEmpty()) {
        lines << QStringLiteral("# Vital Scores");
        lines << QStringLiteral("date,score,sleep_component,recovery_component,strain_component,recommendation");
        for (const VitalScore& s : data.scores) {
            QString recommendation = s.recommendation;
            recommendation.replace(QStringLiteral("\""), QStringLiteral("\"\""));
            lines << QStringList{
                escapeCsv(s.date),
                QString::number(s.score),
                csvInt(s.sleepComponent),
                csvInt(s.recoveryComponent),
                csvInt(s.strainComponent),
                QStringLiteral("\"%1\"").arg(recommendation),
            }.join(QLatin1Char(','));
        }
        lines << QString();
    }

    if (options.includeTrends && !data.trends.isEmpty()) {
        lines << QStringLiteral("# Trends");
        lines << QStringLiteral("metric,timeframe,baseline,current_avg,percent_change,direction,detected_at");
        for (const Trend& t : data.trends) {
            lines << QStringList{
                escapeCsv(t.metric),
                escapeCsv(t.timeframe),
                csvReal(t.baseline),
                csvReal(t.currentAvg),
                csvReal(t.percentChange),
                escapeCsv(t.direction),
                escapeCsv(t.detectedAt),
            }.join(QLatin1Char(','));
        }
        lines << QString();
    }

    return lines.join(QLatin1Char('\n'));
}

QString HealthExporter::renderMarkdown(const HealthExportData& data, const HealthExportOptions& options) const
{
    QStringList lines;
    const QLocale english(QLocale::English, QLocale::UnitedStates);
    const QString exportDate = english.toString(data.exportedAt.toUTC().date(),
                                                QStringLiteral("dddd, MMMM d, yyyy"));

    lines << QStringLiteral("# Summit Health Report");
    lines << QStringLiteral("> Exported on %1").arg(exportDate);
    lines << QString();

    if (options.includeScores && !data.scores.isEmpty()) {
        const VitalScore& latest = data.scores.last();
        lines << QStringLiteral("## Latest Vital Score: %1/100").arg(latest.score);
        lines << QStringLiteral("*%1*").arg(latest.date);
        lines << QString();
        if (!latest.recommendation.isEmpty()) {
            lines << QStringLiteral("**Recommendation:** %1").arg(latest.recommendation);
            lines << QString();
        }
        lines << QStringLiteral("| Component | Score |");
        lines << QStringLiteral("|-----------|-------|");
        lines << QStringLiteral("| Sleep | %1 |").arg(cell(latest.sleepComponent));
        lines << QStringLiteral("| Recovery | %1 |").arg(cell(latest.recoveryComponent));
        lines << QStringLiteral("| Strain | %1 |").arg(cell(latest.strainComponent));
        lines << QString();
    }

    if (options.includeTrends) {
        QList<Trend> active;
        std::copy_if(data.trends.cbegin(), data.trends.cend(), std::back_inserter(active), [](const Trend& trend) {
            return !trend.direction.isEmpty() && trend.direction != QStringLiteral("stable");
        });
        if (!active.isEmpty()) {
            lines << QStringLiteral("## Active Trends");
            lines << QString();
            lines << QStringLiteral("| Metric | Timeframe | Change | Direction |");
            lines << QStringLiteral("|--------|-----------|--------|-----------|");
            for (const Trend& trend : active) {
                const QString change = percentCell(trend.percentChange);
                const QString marker = trend.direction == QStringLiteral("improving") ? QStringLiteral("^")
                                                                                       : QStringLiteral("v");
                lines << QStringLiteral("| %1 | %2 | %3 | %4 %5 |")
                             .arg(trend.metric, trend.timeframe, change, marker, trend.direction);
            }
            lines << QString();
        }
    }

    if (options.includeMetrics && !data.metrics.isEmpty()) {
        lines << QStringLiteral("## Recent Metrics");
        lines << QString();
        lines << QStringLiteral("| Date | Body Battery | Sleep | Stress | Steps |");
        lines << QStringLiteral("|------|--------------|-------|--------|-------|");
        const int first = std::max(0, static_cast<int>(data.metrics.size()) - kRecentMetricDays);
        for (int i = first; i < data.metrics.size(); ++i) {
            const DailyHealthMetric& m = data.metrics.at(i);
            lines << QStringLiteral("| %1 | %2 | %3 | %4 | %5 |")
                         .arg(m.date, cell(m.bodyBattery), cell(m.sleepScore), cell(m.stressAvg), cell(m.steps));
        }
        lines << QString();
    }

    lines << QStringLiteral("---");
    lines << QStringLiteral("*Generated by Summit v%1*").arg(data.version);

    return lines.join(QLatin1Char('\n'));
}

QString HealthExporter::renderWeeklyReport(const HealthExportData& data, const QDate& today) const
{
    const QDate weekAgo = today.addDays(-kRecentMetricDays);
    const QString since = weekAgo.toString(Qt::ISODate);

    QList<VitalScore> weekScores;
    std::copy_if(data.scores.cbegin(), data.scores.cend(), std::back_inserter(weekScores),
                 [&since](const VitalScore& score) { return score.date >= since; });

    const QLocale english(QLocale::English, QLocale::UnitedStates);
    QStringList lines;
    lines << QStringLiteral("# Weekly Health Summary");
    lines << QStringLiteral("## %1 - %2")
                 .arg(english.toString(weekAgo, QStringLiteral("MMM d")),
                      english.toString(today, QStringLiteral("MMM d, yyyy")));
    lines << QString();

    if (!weekScores.isEmpty()) {
        double total = 0.0;
        for (const VitalScore& score : weekScores)
            total += score.score;
        lines << QStringLiteral("**Average Vital Score:** %1/100").arg(std::lround(total / weekScores.size()));
        lines << QString();
    }

    QStringList observations;
    for (const Trend& trend : data.trends) {
        if (trend.timeframe != QStringLiteral("1W") || trend.direction.isEmpty()
            || trend.direction == QStringLiteral("stable"))
            continue;
        QString line = QStringLiteral("- %1: %2").arg(trend.metric, trend.direction);
        if (trend.percentChange.has_value() && std::isfinite(*trend.percentChange))
            line += QStringLiteral(" (%1)").arg(percentCell(trend.percentChange));
        observations << line;
    }
    if (!observations.isEmpty()) {
        lines << QStringLiteral("### Key Observations");
        lines << QString();
        lines << observations;
        lines << QString();
    }

    lines << QStringLiteral("### Daily Breakdown");
    lines << QString();
    lines << QStringLiteral("| Date | Vital Score | Recommendation |");
    lines << QStringLiteral("|------|-------------|----------------|");
    for (const VitalScore& score : weekScores) {
        // First sentence only.
        const QString summary = score.recommendation.section(QLatin1Char('.'), 0, 0).trimmed();
        lines << QStringLiteral("| %1 | %2 | %3 |")
                     .arg(score.date)
                     .arg(score.score)
                     .arg(summary.isEmpty() ? QStringLiteral("-") : summary);
    }

    return lines.join(QLatin1Char('\n'));
}
