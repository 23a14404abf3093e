#include <QtTest/QtTest>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <limits>

#include "reporting/HealthExporter.hpp"
#include "storage/HealthSchema.hpp"
#include "storage/HealthStore.hpp"

namespace {

DailyHealthMetric metricFor(const QString& date, int steps)
{
    DailyHealthMetric metric;
    metric.date = date;
    metric.bodyBattery = 70;
    metric.sleepScore = 82;
    metric.sleepDurationSeconds = 7 * 3600;
    metric.stressAvg = 30;
    metric.steps = steps;
    return metric;
}

HealthExportData sampleData()
{
    HealthExportData data;
    data.exportedAt = QDateTime::fromString(QStringLiteral("2024-05-06T12:00:00Z"), Qt::ISODate);
    data.version = QStringLiteral("0.1.0");

    for (int day = 1; day <= 9; ++day)
        data.metrics.append(metricFor(QStringLiteral("2024-05-%1").arg(day, 2, 10, QLatin1Char('0')), 1000 * day));

    VitalScore early;
    early.date = QStringLiteral("2024-05-01");
    early.score = 60;
    data.scores.append(early);

    VitalScore latest;
    latest.date = QStringLiteral("2024-05-05");
    latest.score = 75;
    latest.sleepComponent = 80;
    latest.recommendation = QStringLiteral("Take it easy, rest");
    data.scores.append(latest);

    Trend improving;
    improving.metric = QStringLiteral("hrv");
    improving.timeframe = QStringLiteral("1M");
    improving.percentChange = 12.4;
    improving.direction = QStringLiteral("improving");
    data.trends.append(improving);

    Trend stable;
    stable.metric = QStringLiteral("steps");
    stable.timeframe = QStringLiteral("1W");
    stable.percentChange = 1.0;
    stable.direction = QStringLiteral("stable");
    data.trends.append(stable);
    return data;
}

} // namespace

class HealthExporterTest : public QObject {
    Q_OBJECT

private slots:
    void parsesFormatNames();
    void jsonOmitsMissingValues();
    void jsonHonoursRangeAndSections();
    void csvHasSectionsAndHours();
    void csvSkipsEmptySections();
    void markdownSummarisesLatestData();
    void markdownExportDateIsUtc();
    void nonFiniteTrendValuesRenderAsMissing();
    void weeklyReportCoversLastSevenDays();
    void weeklyReportWithoutScores();
    void weeklyFormatUsesExportDate();
    void exportToFileWritesUtf8();
    void exportToFileFailsForMissingDirectory();
    void collectReadsWholeStore();
};

void HealthExporterTest::parsesFormatNames()
{
    QCOMPARE(HealthExporter::parseFormat(QStringLiteral("JSON")), std::optional(HealthExportOptions::Format::Json));
    QCOMPARE(HealthExporter::parseFormat(QStringLiteral(" csv ")), std::optional(HealthExportOptions::Format::Csv));
    QCOMPARE(HealthExporter::parseFormat(QStringLiteral("md")), std::optional(HealthExportOptions::Format::Markdown));
    QCOMPARE(HealthExporter::parseFormat(QStringLiteral("Weekly")), std::optional(HealthExportOptions::Format::Weekly));
    QVERIFY(!HealthExporter::parseFormat(QStringLiteral("xml")).has_value());
    QCOMPARE(HealthExporter::fileSuffix(HealthExportOptions::Format::Weekly), QStringLiteral("md"));
    QCOMPARE(HealthExporter::fileSuffix(HealthExportOptions::Format::Markdown), QStringLiteral("md"));
    QCOMPARE(HealthExporter::formatName(HealthExportOptions::Format::Csv), QStringLiteral("csv"));
}

void HealthExporterTest::jsonOmitsMissingValues()
{
    HealthExporter exporter;
    HealthExportOptions options;
    const QString json = exporter.render(sampleData(), options);

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(json.toUtf8(), &parseError);
    QCOMPARE(parseError.error, QJsonParseError::NoError);
    const QJsonObject root = document.object();
    QCOMPARE(root.value(QStringLiteral("version")).toString(), QStringLiteral("0.1.0"));
    QVERIFY(root.value(QStringLiteral("exportedAt")).toString().startsWith(QStringLiteral("2024-05-06T12:00:00")));

    const QJsonArray metrics = root.value(QStringLiteral("metrics")).toArray();
    QCOMPARE(metrics.size(), 9);
    const QJsonObject first = metrics.first().toObject();
    QCOMPARE(first.value(QStringLiteral("bodyBattery")).toInt(), 70);
    QCOMPARE(first.value(QStringLiteral("sleepDurationSeconds")).toInt(), 7 * 3600);
    QVERIFY(!first.contains(QStringLiteral("hrvAvg")));
    QVERIFY(!first.contains(QStringLiteral("id")));

    const QJsonObject score = root.value(QStringLiteral("scores")).toArray().last().toObject();
    QCOMPARE(score.value(QStringLiteral("recommendation")).toString(), QStringLiteral("Take it easy, rest"));
    QVERIFY(!score.contains(QStringLiteral("strainComponent")));
    QCOMPARE(root.value(QStringLiteral("trends")).toArray().size(), 2);
}

void HealthExporterTest::jsonHonoursRangeAndSections()
{
    HealthExporter exporter;
    HealthExportOptions options;
    options.range.startDate = QStringLiteral("2024-05-02");
    options.range.endDate = QStringLiteral("2024-05-05");
    options.includeTrends = false;

    const QJsonObject root = QJsonDocument::fromJson(exporter.render(sampleData(), options).toUtf8()).object();
    const QJsonArray metrics = root.value(QStringLiteral("metrics")).toArray();
    QCOMPARE(metrics.size(), 4);
    QCOMPARE(metrics.first().toObject().value(QStringLiteral("date")).toString(), QStringLiteral("2024-05-02"));
    QCOMPARE(metrics.last().toObject().value(QStringLiteral("date")).toString(), QStringLiteral("2024-05-05"));
    QCOMPARE(root.value(QStringLiteral("scores")).toArray().size(), 1);
    QVERIFY(!root.contains(QStringLiteral("trends")));
}

void HealthExporterTest::csvHasSectionsAndHours()
{
    HealthExporter exporter;
    HealthExportOptions options;
    options.format = HealthExportOptions::Format::Csv;
    const QStringList lines = exporter.render(sampleData(), options).split(QLatin1Char('\n'));

    QCOMPARE(lines.at(0), QStringLiteral("# Health Metrics"));
    QCOMPARE(lines.at(1), QStringLiteral("date,body_battery,sleep_score,sleep_duration_hrs,deep_sleep_hrs,rem_sleep_hrs,"
                                         "stress_avg,resting_hr,hrv_avg,intensity_minutes,steps"));
    QCOMPARE(lines.at(2), QStringLiteral("2024-05-01,70,82,7.00,,,30,,,,1000"));
    QCOMPARE(lines.at(11), QString());
    QCOMPARE(lines.at(12), QStringLiteral("# Vital Scores"));
    QCOMPARE(lines.at(14), QStringLiteral("2024-05-01,60,,,,\"\""));
    QCOMPARE(lines.at(15), QStringLiteral("2024-05-05,75,80,,,\"Take it easy, rest\""));
    QCOMPARE(lines.at(17), QStringLiteral("# Trends"));
    QVERIFY(lines.at(19).startsWith(QStringLiteral("hrv,1M,,,12.4000,improving")));
}

void HealthExporterTest::csvSkipsEmptySections()
{
    HealthExportData data = sampleData();
    data.metrics.clear();

    HealthExporter exporter;
    HealthExportOptions options;
    options.format = HealthExportOptions::Format::Csv;
    options.includeTrends = false;
    const QString csv = exporter.render(data, options);

    QVERIFY(csv.startsWith(QStringLiteral("# Vital Scores\n")));
    QVERIFY(!csv.contains(QStringLiteral("# Health Metrics")));
    QVERIFY(!csv.contains(QStringLiteral("# Trends")));
}

void HealthExporterTest::markdownSummarisesLatestData()
{
    HealthExporter exporter;
    HealthExportOptions options;
    options.format = HealthExportOptions::Format::Markdown;
    const QString markdown = exporter.render(sampleData(), options);

    QVERIFY(markdown.startsWith(QStringLiteral("# Summit Health Report\n> Exported on Monday, May 6, 2024")));
    QVERIFY(markdown.contains(QStringLiteral("## Latest Vital Score: 75/100")));
    QVERIFY(markdown.contains(QStringLiteral("**Recommendation:** Take it easy, rest")));
    QVERIFY(markdown.contains(QStringLiteral("| Sleep | 80 |")));
    QVERIFY(markdown.contains(QStringLiteral("| Strain | - |")));
    QVERIFY(markdown.contains(QStringLiteral("| hrv | 1M | 12% | ^ improving |")));
    QVERIFY(!markdown.contains(QStringLiteral("| steps | 1W |")));

    // Tylko ostatnie siedem dni.
    QVERIFY(!markdown.contains(QStringLiteral("| 2024-05-02 |")));
    QVERIFY(markdown.contains(QStringLiteral("| 2024-05-03 | 70 | 82 | 30 | 3000 |")));
    QVERIFY(markdown.contains(QStringLiteral("| 2024-05-09 | 70 | 82 | 30 | 9000 |")));
    QVERIFY(markdown.endsWith(QStringLiteral("---\n*Generated by Summit v0.1.0*")));
}

void HealthExporterTest::markdownExportDateIsUtc()
{
    HealthExporter exporter;
    HealthExportOptions options;
    options.format = HealthExportOptions::Format::Markdown;
    HealthExportData data = sampleData();
    data.exportedAt = QDateTime::fromString(QStringLiteral("2024-05-06T23:30:00Z"), Qt::ISODate);
    QVERIFY(exporter.render(data, options).contains(QStringLiteral("> Exported on Monday, May 6, 2024")));

    data.exportedAt = QDateTime::fromString(QStringLiteral("2024-05-07T00:30:00+02:00"), Qt::ISODate);
    QVERIFY(exporter.render(data, options).contains(QStringLiteral("> Exported on Monday, May 6, 2024")));
}

void HealthExporterTest::nonFiniteTrendValuesRenderAsMissing()
{
    HealthExportData data = sampleData();
    Trend broken;
    broken.metric = QStringLiteral("stress");
    broken.timeframe = QStringLiteral("2W");
    broken.baseline = std::numeric_limits<double>::quiet_NaN();
    broken.percentChange = std::numeric_limits<double>::infinity();
    broken.direction = QStringLiteral("declining");
    data.trends.append(broken);

    HealthExporter exporter;
    HealthExportOptions options;
    options.format = HealthExportOptions::Format::Markdown;
    const QString markdown = exporter.render(data, options);
    QVERIFY(markdown.contains(QStringLiteral("| stress | 2W | - | v declining |")));
    QVERIFY(!markdown.contains(QStringLiteral("-9223372036854775808")));

    options.format = HealthExportOptions::Format::Csv;
    const QString csv = exporter.render(data, options);
    QVERIFY(csv.contains(QStringLiteral("stress,2W,,")));
    QVERIFY(!csv.contains(QStringLiteral("inf"), Qt::CaseInsensitive));
    QVERIFY(!csv.contains(QStringLiteral("nan"), Qt::CaseInsensitive));

    options.format = HealthExportOptions::Format::Json;
    const QJsonArray trends =
        QJsonDocument::fromJson(exporter.render(data, options).toUtf8()).object().value(QStringLiteral("trends")).toArray();
    QCOMPARE(trends.size(), 3);
    const QJsonObject last = trends.last().toObject();
    QVERIFY(!last.contains(QStringLiteral("baseline")));
    QVERIFY(!last.contains(QStringLiteral("percentChange")));
}

void HealthExporterTest::weeklyReportCoversLastSevenDays()
{
    HealthExportData data = sampleData();
    data.scores[0].recommendation = QStringLiteral("Sleep more. Skip the run.");
    Trend declining;
    declining.metric = QStringLiteral("stress");
    declining.timeframe = QStringLiteral("1W");
    declining.percentChange = -8.6;
    declining.direction = QStringLiteral("declining");
    data.trends.append(declining);

    HealthExporter exporter;
    const QString report = exporter.renderWeeklyReport(data, QDate(2024, 5, 6));
    QVERIFY(report.startsWith(QStringLiteral("# Weekly Health Summary\n## Apr 29 - May 6, 2024\n\n")));
    QVERIFY(report.contains(QStringLiteral("**Average Vital Score:** 68/100")));
    QVERIFY(report.contains(QStringLiteral("### Key Observations\n\n- stress: declining (-9%)\n")));
    QVERIFY(!report.contains(QStringLiteral("- hrv")));
    QVERIFY(!report.contains(QStringLiteral("- steps")));
    QVERIFY(report.contains(QStringLiteral("| Date | Vital Score | Recommendation |\n|------|-------------|----------------|")));
    QVERIFY(report.contains(QStringLiteral("| 2024-05-01 | 60 | Sleep more |")));
    QVERIFY(report.endsWith(QStringLiteral("| 2024-05-05 | 75 | Take it easy, rest |")));

    // 2024-05-01 wypada poza tygodniem liczonym od 2024-05-10.
    const QString later = exporter.renderWeeklyReport(data, QDate(2024, 5, 10));
    QVERIFY(later.contains(QStringLiteral("## May 3 - May 10, 2024")));
    QVERIFY(later.contains(QStringLiteral("**Average Vital Score:** 75/100")));
    QVERIFY(!later.contains(QStringLiteral("| 2024-05-01 |")));
}

void HealthExporterTest::weeklyReportWithoutScores()
{
    HealthExportData data = sampleData();
    data.scores.last().recommendation.clear();
    HealthExporter exporter;

    const QString empty = exporter.renderWeeklyReport(data, QDate(2024, 6, 30));
    QVERIFY(!empty.contains(QStringLiteral("Average Vital Score")));
    QVERIFY(!empty.contains(QStringLiteral("Key Observations")));
    QVERIFY(empty.endsWith(QStringLiteral("### Daily Breakdown\n\n| Date | Vital Score | Recommendation |\n"
                                          "|------|-------------|----------------|")));

    const QString blank = exporter.renderWeeklyReport(data, QDate(2024, 5, 6));
    QVERIFY(blank.endsWith(QStringLiteral("| 2024-05-05 | 75 | - |")));
}

void HealthExporterTest::weeklyFormatUsesExportDate()
{
    HealthExporter exporter;
    HealthExportOptions options;
    options.format = HealthExportOptions::Format::Weekly;
    const HealthExportData data = sampleData();
    QCOMPARE(exporter.render(data, options), exporter.renderWeeklyReport(data, QDate(2024, 5, 6)));
}

void HealthExporterTest::exportToFileWritesUtf8()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("raport.md"));

    HealthExportData data = sampleData();
    data.scores.last().recommendation = QStringLiteral("Odpocznij, zażółć gęślą jaźń");

    HealthExporter exporter;
    HealthExportOptions options;
    options.format = HealthExportOptions::Format::Markdown;
    QString error;
    QVERIFY2(exporter.exportToFile(path, data, options, &error), qPrintable(error));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QString content = QString::fromUtf8(file.readAll());
    QVERIFY(content.contains(QStringLiteral("zażółć gęślą jaźń")));
}

void HealthExporterTest::exportToFileFailsForMissingDirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    HealthExporter exporter;
    QString error;
    QVERIFY(!exporter.exportToFile(dir.filePath(QStringLiteral("missing/out.json")), sampleData(), {}, &error));
    QVERIFY(!error.isEmpty());
    QVERIFY(!exporter.exportToFile(QString(), sampleData(), {}, &error));
}

void HealthExporterTest::collectReadsWholeStore()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    HealthStore store;
    QVERIFY(store.open(dir.filePath(QStringLiteral("summit.db"))));
    QVERIFY(store.migrate(summit::storage::healthMigrations()));
    QVERIFY(store.upsertMetrics({metricFor(QStringLiteral("2024-05-02"), 2), metricFor(QStringLiteral("2024-05-01"), 1)}));

    StoreError error;
    const auto data = HealthExporter::collect(store, QStringLiteral("9.9.9"), &error);
    QVERIFY2(data.has_value(), qPrintable(error.toString()));
    QCOMPARE(data->metrics.size(), 2);
    QCOMPARE(data->metrics.first().date, QStringLiteral("2024-05-01"));
    QVERIFY(data->scores.isEmpty());
    QCOMPARE(data->version, QStringLiteral("9.9.9"));
    QVERIFY(data->exportedAt.isValid());

    store.close();
    QVERIFY(!HealthExporter::collect(store, QStringLiteral("9.9.9"), &error).has_value());
    QCOMPARE(error.kind, StoreError::Kind::OpenError);
}

QTEST_MAIN(HealthExporterTest)
#include "HealthExporterTest.moc"
