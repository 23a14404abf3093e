#include <QtTest>

#include <QStringList>

#include "storage/HealthSchema.hpp"
#include "storage/SqlScript.hpp"

using summit::storage::compactStatement;
using summit::storage::splitSqlStatements;

class SqlScriptTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void splitsOnSemicolons()
    {
        const QStringList statements = splitSqlStatements(
            QStringLiteral("CREATE TABLE a (x INTEGER);\n\nCREATE TABLE b (y TEXT);\n"));
        QCOMPARE(statements.size(), 2);
        QCOMPARE(statements.at(0), QStringLiteral("CREATE TABLE a (x INTEGER)"));
        QCOMPARE(statements.at(1), QStringLiteral("CREATE TABLE b (y TEXT)"));
    }

    void keepsTrailingStatementWithoutSemicolon()
    {
        const QStringList statements = splitSqlStatements(QStringLiteral("SELECT 1; SELECT 2"));
        QCOMPARE(statements, QStringList({QStringLiteral("SELECT 1"), QStringLiteral("SELECT 2")}));
    }

    void ignoresEmptyStatements()
    {
        QVERIFY(splitSqlStatements(QStringLiteral(" ; ;\n;")).isEmpty());
        QVERIFY(splitSqlStatements(QString()).isEmpty());
    }

    void honoursQuotedSemicolons()
    {
        const QStringList statements = splitSqlStatements(QStringLiteral(
            "INSERT INTO t VALUES ('a;b');"
            "INSERT INTO t VALUES ('it''s; fine');"
            "SELECT \"odd;name\" FROM [weird;table];"));
        QCOMPARE(statements.size(), 3);
        QCOMPARE(statements.at(0), QStringLiteral("INSERT INTO t VALUES ('a;b')"));
        QCOMPARE(statements.at(1), QStringLiteral("INSERT INTO t VALUES ('it''s; fine')"));
        QCOMPARE(statements.at(2), QStringLiteral("SELECT \"odd;name\" FROM [weird;table]"));
    }

    void dropsComments()
    {
        const QStringList statements = splitSqlStatements(QStringLiteral(
            "-- komentarz; z średnikiem\n"
            "SELECT 1; /* blok; komentarza */ SELECT 2;"));
        QCOMPARE(statements, QStringList({QStringLiteral("SELECT 1"), QStringLiteral("SELECT 2")}));
    }

    void keepsTriggerBodyTogether()
    {
        const QStringList statements = splitSqlStatements(QStringLiteral(
            "CREATE TRIGGER touch AFTER UPDATE ON health_metrics BEGIN\n"
            "  UPDATE health_metrics SET updated_at = CURRENT_TIMESTAMP WHERE id = NEW.id;\n"
            "END;\n"
            "SELECT 1;"));
        QCOMPARE(statements.size(), 2);
        QVERIFY(statements.at(0).startsWith(QStringLiteral("CREATE TRIGGER touch")));
        QVERIFY(statements.at(0).endsWith(QStringLiteral("END")));
        QVERIFY(statements.at(0).contains(QStringLiteral("WHERE id = NEW.id;")));
        QCOMPARE(statements.at(1), QStringLiteral("SELECT 1"));
    }

    void caseInsideTriggerDoesNotEndBody()
    {
        const QStringList statements = splitSqlStatements(QStringLiteral(
            "CREATE TRIGGER classify AFTER INSERT ON trends BEGIN\n"
            "  UPDATE trends SET direction = CASE WHEN NEW.percent_change > 0 THEN 'improving'\n"
            "    ELSE 'declining' END;\n"
            "  UPDATE trends SET baseline = 0 WHERE baseline IS NULL; -- end;\n"
            "  SELECT 'END;';\n"
            "END;\n"
            "SELECT 2;"));
        QCOMPARE(statements.size(), 2);
        QVERIFY(statements.at(0).startsWith(QStringLiteral("CREATE TRIGGER classify")));
        QVERIFY(statements.at(0).contains(QStringLiteral("ELSE 'declining' END;")));
        QVERIFY(statements.at(0).contains(QStringLiteral("WHERE baseline IS NULL;")));
        QVERIFY(statements.at(0).endsWith(QStringLiteral("END")));
        QCOMPARE(statements.at(1), QStringLiteral("SELECT 2"));
    }

    void splitsInitialSchemaIntoSixStatements()
    {
        const auto migrations = summit::storage::healthMigrations();
        QCOMPARE(migrations.size(), 1);
        const QStringList statements = splitSqlStatements(migrations.first().sql);
        QCOMPARE(statements.size(), 6);
        QVERIFY(statements.at(0).startsWith(QStringLiteral("CREATE TABLE IF NOT EXISTS health_metrics")));
        QVERIFY(statements.at(3).startsWith(QStringLiteral("CREATE INDEX idx_health_metrics_date")));
        QVERIFY(statements.at(5).startsWith(QStringLiteral("CREATE INDEX idx_trends_metric")));
    }

    void compactStatementCollapsesWhitespace()
    {
        QCOMPARE(compactStatement(QStringLiteral("CREATE  TABLE\n  a (\n x INTEGER\n)")),
                 QStringLiteral("CREATE TABLE a ( x INTEGER )"));
        const QString shortened = compactStatement(QString(200, QLatin1Char('x')), 20);
        QCOMPARE(shortened.size(), 20);
        QVERIFY(shortened.endsWith(QStringLiteral("...")));
    }
};

QTEST_MAIN(SqlScriptTest)
#include "SqlScriptTest.moc"
