#pragma once

#include <QCommandLineParser>
#include <QObject>
#include <QString>

#include <memory>
#include <optional>

#include "reporting/HealthExporter.hpp"
#include "storage/MigrationRunner.hpp"

class HealthStore;

namespace summit::shell::utils {
class DatabaseLockGuard;
}

//! Start-up sequence of the Summit shell: resolves the database, takes the writer
//! lock, brings the schema up to date and optionally exports the stored data.
class Application : public QObject {
    Q_OBJECT

public:
    enum ExitCode {
        ExitOk = 0,
        ExitConfigError = 1,
        ExitMigrationFailed = 2,
        ExitLockConflict = 3,
        ExitExportFailed = 4,
        ExitClearDataFailed = 5,
    };
    Q_ENUM(ExitCode)

    explicit Application(QObject* parent = nullptr);
    ~Application() override;

    void configureParser(QCommandLineParser& parser) const;
    bool applyParser(const QCommandLineParser& parser);

    //! Runs the whole start-up synchronously and returns the process exit code.
    int start();
    void stop();

    QString databasePath() const { return m_databasePath; }
    int lockTimeoutMs() const { return m_lockTimeoutMs; }
    bool exportRequested() const { return m_exportOptions.has_value(); }
    QString exportPath() const { return m_exportPath; }
    std::optional<HealthExportOptions> exportOptions() const { return m_exportOptions; }
    bool clearDataRequested() const { return m_clearData; }
    QString lastError() const { return m_lastError; }
    MigrationRunner::Report migrationReport() const { return m_migrationReport; }
    HealthStore* store() const { return m_store.get(); }

private:
    bool applyExportOptions(const QCommandLineParser& parser);
    int fail(ExitCode code, const QString& message);
    bool runExport();
    void logSummary();

    QString m_databasePath;
    int m_lockTimeoutMs = 0;
    std::optional<HealthExportOptions> m_exportOptions;
    QString m_exportPath;
    bool m_clearData = false;
    QString m_configError;
    QString m_lastError;
    MigrationRunner::Report m_migrationReport;
    std::unique_ptr<summit::shell::utils::DatabaseLockGuard> m_lockGuard;
    std::unique_ptr<HealthStore> m_store;
};
