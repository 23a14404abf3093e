#include "StoreError.hpp"

namespace {

constexpr int kSqliteConstraint = 19;

bool isConstraintFailure(const QSqlError& error)
{
    bool ok = false;
    const int code = error.nativeErrorCode().toInt(&ok);
    // Sterownik może zwrócić rozszerzony kod (np. 2067 = SQLITE_CONSTRAINT_UNIQUE).
    if (ok && (code & 0xff) == kSqliteConstraint)
        return true;
    return error.databaseText().contains(QStringLiteral("constraint failed"), Qt::CaseInsensitive);
}

} // namespace

QString StoreError::kindName() const
{
    switch (kind) {
    case Kind::None:
        return QStringLiteral("None");
    case Kind::OpenError:
        return QStringLiteral("OpenError");
    case Kind::SchemaError:
        return QStringLiteral("SchemaError");
    case Kind::ConstraintViolation:
        return QStringLiteral("ConstraintViolation");
    case Kind::ValidationError:
        return QStringLiteral("ValidationError");
    case Kind::QueryError:
        return QStringLiteral("QueryError");
    }
    return QStringLiteral("Unknown");
}

QString StoreError::toString() const
{
    if (!isError())
        return {};
    QString text = QStringLiteral("%1: %2").arg(kindName(), message);
    if (!nativeCode.isEmpty())
        text += QStringLiteral(" [%1]").arg(nativeCode);
    return text;
}

StoreError StoreError::make(Kind kind, const QString& message, const QString& statement)
{
    StoreError error;
    error.kind = kind;
    error.message = message;
    error.statement = statement;
    return error;
}

StoreError StoreError::fromSqlError(const QSqlError& error, Kind fallbackKind, const QString& statement)
{
    StoreError result;
    result.kind = isConstraintFailure(error) ? Kind::ConstraintViolation : fallbackKind;
    result.message = error.text().trimmed();
    if (result.message.isEmpty())
        result.message = QStringLiteral("unknown SQL error");
    result.statement = statement;
    result.nativeCode = error.nativeErrorCode();
    return result;
}
