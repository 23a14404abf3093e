#include "PathUtils.hpp"

#include <QByteArray>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QUrl>
#include <QtGlobal>

#include "storage/HealthSchema.hpp"

namespace {

bool isVariableChar(QChar ch)
{
    return ch.isLetterOrNumber() || ch == QLatin1Char('_');
}

// Fałsz, gdy zmienna nie jest ustawiona; wtedy placeholder zostaje bez zmian.
bool lookupVariable(const QString& name, QString* value)
{
    if (name.isEmpty())
        return false;
    const QByteArray key = name.toUtf8();
    if (!qEnvironmentVariableIsSet(key.constData()))
        return false;
    *value = qEnvironmentVariable(key.constData());
    return true;
}

} // namespace

namespace summit::shell::utils {

QString expandEnvironmentPlaceholders(const QString& text)
{
    QString result;
    result.reserve(text.size());

    int index = 0;
    while (index < text.size()) {
        const QChar ch = text.at(index);
        int end = -1;
        QString name;

        if (ch == QLatin1Char('$') && index + 1 < text.size() && text.at(index + 1) == QLatin1Char('{')) {
            const int close = text.indexOf(QLatin1Char('}'), index + 2);
            if (close > index + 2) {
                name = text.mid(index + 2, close - index - 2);
                end = close + 1;
            }
        } else if (ch == QLatin1Char('$')) {
            int cursor = index + 1;
            while (cursor < text.size() && isVariableChar(text.at(cursor)))
                ++cursor;
            if (cursor > index + 1) {
                name = text.mid(index + 1, cursor - index - 1);
                end = cursor;
            }
        } else if (ch == QLatin1Char('%')) {
            const int close = text.indexOf(QLatin1Char('%'), index + 1);
            if (close > index + 1) {
                name = text.mid(index + 1, close - index - 1);
                end = close + 1;
            }
        }

        if (end < 0) {
            result.append(ch);
            ++index;
            continue;
        }

        QString value;
        if (lookupVariable(name, &value))
            result.append(value);
        else
            result.append(text.mid(index, end - index));
        index = end;
    }

    return result;
}

QString expandPath(const QString& path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty())
        return {};

    QString expanded = expandEnvironmentPlaceholders(trimmed);

    if (expanded.startsWith(QStringLiteral("file:"), Qt::CaseInsensitive)) {
        const QUrl url(expanded);
        if (url.isValid() && url.isLocalFile())
            expanded = url.toLocalFile();
    }

    if (expanded == QStringLiteral("~"))
        expanded = QDir::homePath();
    else if (expanded.startsWith(QStringLiteral("~/")))
        expanded = QDir::homePath() + expanded.mid(1);

    if (QFileInfo(expanded).isRelative())
        expanded = QDir::current().absoluteFilePath(expanded);

    return QDir::cleanPath(expanded);
}

QString defaultDataDirectory()
{
    const QString location = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (!location.isEmpty())
        return QDir::cleanPath(location);
    return expandPath(QStringLiteral("var/data"));
}

QString resolveDatabasePath(const QString& explicitPath, const QString& dataDirectory)
{
    if (!explicitPath.trimmed().isEmpty())
        return expandPath(explicitPath);

    const QString directory = dataDirectory.trimmed().isEmpty() ? defaultDataDirectory()
                                                                : expandPath(dataDirectory);
    return QDir(directory).filePath(QString::fromLatin1(summit::storage::kDatabaseFileName));
}

} // namespace summit::shell::utils
