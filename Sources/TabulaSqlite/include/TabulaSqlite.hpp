#pragma once

// TabulaSqlite - SQLite backend for Tabula
//
//   auto backend = std::make_shared<tabula::sqlite_store>(tabula::configuration{"bands.db"});
//   backend->ensure_tables();

#include "TabulaCore.hpp"
#include "tabula/db.hpp"
#include "tabula/sqlite_store.hpp"
