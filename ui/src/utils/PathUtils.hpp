#pragma once

#include <QString>

namespace summit::shell::utils {

//! Expand $VAR, ${VAR} and %VAR% placeholders. Unknown variables are left untouched.
QString expandEnvironmentPlaceholders(const QString& text);

//! Expand '~', environment placeholders and file: URLs; relative paths resolve against the CWD.
QString expandPath(const QString& path);

//! Per-user application data directory (QStandardPaths::AppDataLocation).
QString defaultDataDirectory();

//! Database file to use: an explicit path wins, otherwise summit.db inside dataDirectory
//! (or the default data directory when that is empty too).
QString resolveDatabasePath(const QString& explicitPath, const QString& dataDirectory = {});

} // namespace summit::shell::utils
