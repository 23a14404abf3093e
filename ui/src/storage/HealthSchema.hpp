#pragma once

#include <QString>
#include <QStringList>

#include "Migration.hpp"

namespace summit::storage {

inline constexpr char kDatabaseFileName[] = "summit.db";

//! Ordered migrations of the Summit store. Version 1 creates the initial tables.
MigrationList healthMigrations();

//! Tables and indexes the current schema is expected to contain.
QStringList healthTableNames();
QStringList healthIndexNames();

} // namespace summit::storage
