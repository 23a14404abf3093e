#include "SqlScript.hpp"

#include <QRegularExpression>

#include <algorithm>

namespace {

bool isIdentifierChar(QChar ch)
{
    return ch.isLetterOrNumber() || ch == QLatin1Char('_');
}

bool startsTrigger(const QString& statement)
{
    static const QRegularExpression pattern(
        QStringLiteral("^\\s*CREATE\\s+(TEMP\\s+|TEMPORARY\\s+)?TRIGGER\\b"),
        QRegularExpression::CaseInsensitiveOption);
    return pattern.match(statement).hasMatch();
}

// Zmiana zagnieżdżenia bloku ciała triggera: BEGIN i CASE otwierają, END zamyka.
int blockDepthDelta(const QString& word)
{
    if (word.compare(QStringLiteral("BEGIN"), Qt::CaseInsensitive) == 0
        || word.compare(QStringLiteral("CASE"), Qt::CaseInsensitive) == 0)
        return 1;
    if (word.compare(QStringLiteral("END"), Qt::CaseInsensitive) == 0)
        return -1;
    return 0;
}

} // namespace

namespace summit::storage {

QStringList splitSqlStatements(const QString& script)
{
    QStringList statements;
    QString current;
    current.reserve(script.size());
    QString word;
    int blockDepth = 0;

    auto closeWord = [&]() {
        if (word.isEmpty())
            return;
        const int delta = blockDepthDelta(word);
        if (delta != 0 && startsTrigger(current))
            blockDepth = std::max(0, blockDepth + delta);
        word.clear();
    };

    auto flush = [&]() {
        const QString trimmed = current.trimmed();
        if (!trimmed.isEmpty())
            statements.append(trimmed);
        current.clear();
        blockDepth = 0;
    };

    int index = 0;
    const int size = script.size();
    while (index < size) {
        const QChar ch = script.at(index);

        if (isIdentifierChar(ch)) {
            word.append(ch);
            current.append(ch);
            ++index;
            continue;
        }
        closeWord();

        if (ch == QLatin1Char('-') && index + 1 < size && script.at(index + 1) == QLatin1Char('-')) {
            const int newline = script.indexOf(QLatin1Char('\n'), index + 2);
            index = newline == -1 ? size : newline;
            current.append(QLatin1Char(' '));
            continue;
        }

        if (ch == QLatin1Char('/') && index + 1 < size && script.at(index + 1) == QLatin1Char('*')) {
            const int close = script.indexOf(QStringLiteral("*/"), index + 2);
            index = close == -1 ? size : close + 2;
            current.append(QLatin1Char(' '));
            continue;
        }

        if (ch == QLatin1Char('\'') || ch == QLatin1Char('"') || ch == QLatin1Char('`') || ch == QLatin1Char('[')) {
            const QChar closing = ch == QLatin1Char('[') ? QLatin1Char(']') : ch;
            current.append(ch);
            ++index;
            while (index < size) {
                const QChar inner = script.at(index);
                current.append(inner);
                ++index;
                if (inner != closing)
                    continue;
                // Podwojony cudzysłów to escape, nie koniec literału.
                if (closing != QLatin1Char(']') && index < size && script.at(index) == closing) {
                    current.append(closing);
                    ++index;
                    continue;
                }
                break;
            }
            continue;
        }

        if (ch == QLatin1Char(';')) {
            if (blockDepth > 0) {
                current.append(ch);
                ++index;
                continue;
            }
            flush();
            ++index;
            continue;
        }

        current.append(ch);
        ++index;
    }

    closeWord();
    flush();
    return statements;
}

QString compactStatement(const QString& statement, int maxLength)
{
    QString compact = statement.simplified();
    if (maxLength > 3 && compact.size() > maxLength)
        compact = compact.left(maxLength - 3) + QStringLiteral("...");
    return compact;
}

} // namespace summit::storage
