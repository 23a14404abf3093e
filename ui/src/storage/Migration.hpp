#pragma once

#include <QByteArray>
#include <QList>
#include <QString>

struct Migration {
    enum class Kind {
        Up,
        Down,
    };

    qint64 version = 0;
    QString description;
    QString sql;
    Kind kind = Kind::Up;

    //! SHA-384 of the SQL text, hex encoded. Stored with every applied version.
    QByteArray checksum() const;
};

using MigrationList = QList<Migration>;
