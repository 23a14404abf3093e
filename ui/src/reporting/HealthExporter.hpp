#pragma once

#include <QDate>
#include <QDateTime>
#include <QList>
#include <QString>

#include <optional>

#include "models/HealthRecords.hpp"
#include "storage/StoreError.hpp"

class HealthStore;

struct HealthExportData {
    QList<DailyHealthMetric> metrics;
    QList<VitalScore> scores;
    QList<Trend> trends;
    QDateTime exportedAt;
    QString version;
};

struct HealthExportOptions {
    enum class Format {
        Json,
        Csv,
        Markdown,
        Weekly,
    };

    Format format = Format::Json;
    DateRange range;
    bool includeMetrics = true;
    bool includeScores = true;
    bool includeTrends = true;
};

//! Renders stored health data for the user: JSON for tools, CSV for spreadsheets,
//! Markdown for reading, and a Markdown summary of the last seven days.
//! Metrics and scores honour the date range; trends do not.
class HealthExporter {
public:
    static std::optional<HealthExportOptions::Format> parseFormat(const QString& name);
    static QString formatName(HealthExportOptions::Format format);
    static QString fileSuffix(HealthExportOptions::Format format);

    //! Reads every row of the store into an export snapshot stamped with the current time.
    static std::optional<HealthExportData> collect(const HealthStore& store,
                                                   const QString& version,
                                                   StoreError* error = nullptr);

    QString render(const HealthExportData& data, const HealthExportOptions& options) const;
    bool exportToFile(const QString& filePath,
                      const HealthExportData& data,
                      const HealthExportOptions& options,
                      QString* errorMessage = nullptr) const;

    //! Summary of the scores recorded from `today - 7 days` on, with the weekly trends that moved.
    QString renderWeeklyReport(const HealthExportData& data, const QDate& today) const;

private:
    HealthExportData filterByRange(const HealthExportData& data, const DateRange& range) const;
    QString renderJson(const HealthExportData& data, const HealthExportOptions& options) const;
    QString renderCsv(const HealthExportData& data, const HealthExportOptions& options) const;
    QString renderMarkdown(const HealthExportData& data, const HealthExportOptions& options) const;
};
