#include "Application.hpp"

#include <QByteArray>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QStringList>

#include "storage/HealthSchema.hpp"
#include "storage/HealthStore.hpp"
#include "utils/PathUtils.hpp"
#include "utils/RuntimeUtils.hpp"

Q_LOGGING_CATEGORY(lcApp, "summit.shell.app")

namespace {

using summit::shell::utils::expandPath;

std::optional<QString> envValue(const QByteArray& key)
{
    if (!qEnvironmentVariableIsSet(key.constData()))
        return std::nullopt;
    return qEnvironmentVariable(key.constData());
}

// Wartość z linii poleceń ma pierwszeństwo przed zmienną środowiskową.
QString optionOrEnv(const QCommandLineParser& parser, const QString& option, const QByteArray& envKey)
{
    if (parser.isSet(option))
        return parser.value(option).trimmed();
    const auto value = envValue(envKey);
    return value.has_value() ? value->trimmed() : QString();
}

QString joinVersions(const QList<qint64>& versions)
{
    QStringList parts;
    for (qint64 version : versions)
        parts << QString::number(version);
    return parts.isEmpty() ? QStringLiteral("-") : parts.join(QStringLiteral(", "));
}

} // namespace

Application::Application(QObject* parent)
    : QObject(parent)
{
}

Application::~Application()
{
    stop();
}

void Application::configureParser(QCommandLineParser& parser) const {
    parser.setApplicationDescription(tr("Lokalny magazyn danych zdrowotnych Summit"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOption({{"d", "database"}, tr("Ścieżka pliku bazy danych (domyślnie <data-dir>/summit.db)"),
                      tr("path"), QString()});
    parser.addOption({"data-dir", tr("Katalog danych aplikacji"), tr("dir"), QString()});
    parser.addOption({"lock-timeout-ms", tr("Czas oczekiwania na blokadę bazy danych (ms)"), tr("ms"),
                      QStringLiteral("0")});
    parser.addOption({"export-format", tr("Format eksportu danych (json, csv, markdown lub weekly)"), tr("format"),
                      QString()});
    parser.addOption({"export-path", tr("Ścieżka pliku eksportu"), tr("path"), QString()});
    parser.addOption({"export-start", tr("Pierwszy dzień eksportu (YYYY-MM-DD)"), tr("date"), QString()});
    parser.addOption({"export-end", tr("Ostatni dzień eksportu (YYYY-MM-DD)"), tr("date"), QString()});
    parser.addOption({"export-skip-metrics", tr("Pomija metryki dzienne w eksporcie")});
    parser.addOption({"export-skip-scores", tr("Pomija vital score w eksporcie")});
    parser.addOption({"export-skip-trends", tr("Pomija trendy w eksporcie")});
    parser.addOption({"clear-data", tr("Usuwa wszystkie zapisane dane (schemat pozostaje)")});
}

bool Application::applyParser(const QCommandLineParser& parser) {
    m_configError.clear();

    const QString database = optionOrEnv(parser, QStringLiteral("database"), QByteArrayLiteral("SUMMIT_DB_PATH"));
    const QString dataDir = optionOrEnv(parser, QStringLiteral("data-dir"), QByteArrayLiteral("SUMMIT_DATA_DIR"));
    m_databasePath = summit::shell::utils::resolveDatabasePath(database, dataDir);

    m_lockTimeoutMs = 0;
    const QString timeoutText = parser.value(QStringLiteral("lock-timeout-ms")).trimmed();
    if (!timeoutText.isEmpty()) {
        bool ok = false;
        const int timeout = timeoutText.toInt(&ok);
        if (ok && timeout >= 0) {
            m_lockTimeoutMs = timeout;
        } else {
            qCWarning(lcApp) << "Nieprawidłowa wartość --lock-timeout-ms" << timeoutText
                             << "- używam 0 ms";
        }
    }

    m_clearData = parser.isSet(QStringLiteral("clear-data"));

    if (!applyExportOptions(parser)) {
        qCWarning(lcApp) << m_configError;
        return false;
    }
    return true;
}

bool Application::applyExportOptions(const QCommandLineParser& parser)
{
    m_exportOptions.reset();
    m_exportPath.clear();

    const QString formatName = parser.value(QStringLiteral("export-format")).trimmed();
    const QString pathText = parser.value(QStringLiteral("export-path")).trimmed();
    if (formatName.isEmpty()) {
        if (!pathText.isEmpty())
            qCWarning(lcApp) << "Podano --export-path bez --export-format - eksport zostanie pominięty";
        return true;
    }

    const auto format = HealthExporter::parseFormat(formatName);
    if (!format.has_value()) {
        m_configError = tr("Nieznany format eksportu: %1").arg(formatName);
        return false;
    }
    if (pathText.isEmpty()) {
        m_configError = tr("Eksport w formacie %1 wymaga --export-path").arg(HealthExporter::formatName(*format));
        return false;
    }

    HealthExportOptions options;
    options.format = *format;

    const QString start = parser.value(QStringLiteral("export-start")).trimmed();
    const QString end = parser.value(QStringLiteral("export-end")).trimmed();
    if (!start.isEmpty()) {
        if (summit::records::isValidDate(start))
            options.range.startDate = start;
        else
            qCWarning(lcApp) << "Nieprawidłowa data --export-start" << start << "- zakres bez dolnej granicy";
    }
    if (!end.isEmpty()) {
        if (summit::records::isValidDate(end))
            options.range.endDate = end;
        else
            qCWarning(lcApp) << "Nieprawidłowa data --export-end" << end << "- zakres bez górnej granicy";
    }
    QString rangeError;
    if (!options.range.validate(&rangeError)) {
        qCWarning(lcApp) << rangeError << "- eksport obejmie wszystkie dni";
        options.range = {};
    }

    options.includeMetrics = !parser.isSet(QStringLiteral("export-skip-metrics"));
    options.includeScores = !parser.isSet(QStringLiteral("export-skip-scores"));
    options.includeTrends = !parser.isSet(QStringLiteral("export-skip-trends"));

    m_exportOptions = options;
    m_exportPath = expandPath(pathText);
    return true;
}

int Application::start()
{
    m_lastError.clear();
    m_migrationReport = {};

    if (!m_configError.isEmpty())
        return fail(ExitConfigError, m_configError);
    if (m_databasePath.isEmpty())
        return fail(ExitConfigError, tr("Nie ustalono ścieżki bazy danych."));

    QString directoryError;
    if (!summit::shell::utils::ensureParentDirectory(m_databasePath, &directoryError))
        return fail(ExitConfigError, directoryError);

    const QString lockPath = summit::shell::utils::databaseLockFilePath(m_databasePath);
    m_lockGuard = std::make_unique<summit::shell::utils::DatabaseLockGuard>(lockPath);
    if (!m_lockGuard->tryAcquire(m_lockTimeoutMs)) {
        const QString message = m_lockGuard->errorString().isEmpty()
            ? tr("Nie udało się zarezerwować blokady bazy danych (kod błędu %1).")
                  .arg(static_cast<int>(m_lockGuard->lastError()))
            : m_lockGuard->errorString();
        const ExitCode code = m_lockGuard->hasConflict() ? ExitLockConflict : ExitConfigError;
        m_lockGuard.reset();
        return fail(code, message);
    }

    m_store = std::make_unique<HealthStore>();
    StoreError error;
    if (!m_store->open(m_databasePath, &error))
        return fail(ExitMigrationFailed, error.toString());

    if (!m_store->migrate(summit::storage::healthMigrations(), &m_migrationReport, &error)) {
        // Aplikacja nie może działać na częściowo zmigrowanym schemacie.
        qCCritical(lcApp) << "Migracja bazy" << m_databasePath << "nie powiodła się:" << error.toString();
        m_store->close();
        return fail(ExitMigrationFailed, error.toString());
    }

    if (m_clearData) {
        if (!m_store->clearAllData(&error))
            return fail(ExitClearDataFailed, error.toString());
        qCInfo(lcApp) << "Usunięto wszystkie dane z" << m_databasePath;
    }

    if (m_exportOptions.has_value() && !runExport())
        return ExitExportFailed;

    logSummary();
    return ExitOk;
}

void Application::stop()
{
    if (m_store)
        m_store->close();
    if (m_lockGuard)
        m_lockGuard->release();
}

int Application::fail(ExitCode code, const QString& message)
{
    m_lastError = message;
    qCCritical(lcApp) << message;
    return code;
}

bool Application::runExport()
{
    StoreError error;
    const QString version = QCoreApplication::applicationVersion();
    const auto data = HealthExporter::collect(*m_store, version, &error);
    if (!data.has_value()) {
        fail(ExitExportFailed, error.toString());
        return false;
    }

    QString exportError;
    HealthExporter exporter;
    if (!exporter.exportToFile(m_exportPath, *data, *m_exportOptions, &exportError)) {
        fail(ExitExportFailed, exportError);
        return false;
    }
    return true;
}

void Application::logSummary()
{
    StoreError error;
    const auto metricCount = m_store->metricsCount(&error);
    const auto scores = m_store->vitalScores({}, &error);
    const auto trends = m_store->trends(&error);
    if (!metricCount.has_value() || !scores.has_value() || !trends.has_value()) {
        qCWarning(lcApp) << "Nie udało się podsumować zawartości bazy:" << error.toString();
        return;
    }

    qCInfo(lcApp).nospace() << "Baza " << m_databasePath << " gotowa: metryki=" << *metricCount
                            << ", vital score=" << scores->size() << ", trendy=" << trends->size()
                            << ", zastosowane migracje=" << joinVersions(m_migrationReport.applied)
                            << ", pominięte=" << joinVersions(m_migrationReport.skipped);
}
