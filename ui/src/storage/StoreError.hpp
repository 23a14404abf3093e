#pragma once

#include <QSqlError>
#include <QString>

#include <utility>

struct StoreError {
    enum class Kind {
        None,
        OpenError,
        SchemaError,
        ConstraintViolation,
        ValidationError,
        QueryError,
    };

    Kind kind = Kind::None;
    QString message;
    QString statement;
    QString nativeCode;

    bool isError() const { return kind != Kind::None; }
    QString kindName() const;
    QString toString() const;

    static StoreError make(Kind kind, const QString& message, const QString& statement = {});

    //! Maps a driver error to ConstraintViolation (SQLite primary code 19) or fallbackKind.
    static StoreError fromSqlError(const QSqlError& error,
                                   Kind fallbackKind,
                                   const QString& statement = {});
};

//! Assigns the error when the caller asked for it; always returns false.
inline bool reportStoreError(StoreError* target, StoreError error)
{
    if (target)
        *target = std::move(error);
    return false;
}
