#ifndef INCLUDE_SECUREBOX_STORAGE_SQLITE_SQLITESTORAGEREPOSITORYFACTORY_HPP
#define INCLUDE_SECUREBOX_STORAGE_SQLITE_SQLITESTORAGEREPOSITORYFACTORY_HPP

#include "securebox/storage/IStorageRepository.hpp"
#include <memory>

namespace securebox::storage::sqlite
{

// One SQLite database file per vault. Every write builds `<path>.tmp` and renames it over `<path>`.
[[nodiscard]] std::unique_ptr<securebox::storage::IStorageRepository> makeSqliteStorageRepository();

} // namespace securebox::storage::sqlite

#endif // INCLUDE_SECUREBOX_STORAGE_SQLITE_SQLITESTORAGEREPOSITORYFACTORY_HPP
