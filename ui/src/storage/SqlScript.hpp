#pragma once

#include <QString>
#include <QStringList>

namespace summit::storage {

//! Split a SQL batch into single statements for drivers that execute one statement per call.
//! Quoted text, comments and CREATE TRIGGER ... BEGIN ... END bodies are kept intact;
//! comments are dropped and empty statements skipped.
QStringList splitSqlStatements(const QString& script);

//! Collapse runs of whitespace so a statement fits on one log line.
QString compactStatement(const QString& statement, int maxLength = 160);

} // namespace summit::storage
