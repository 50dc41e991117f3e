/*
 * warehouse.cpp  Oct 6th, 2026
 *
 * sqlite implementation of the warehouse bulk load interface
 *
 */

#include "tcf/warehouse.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace tcf {

/* Table names cannot be bound, so only plain identifiers are accepted */
static bool
valid_identifier_(const std::string& name)
{
  if ( name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) ) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_';
  });
}

SqliteWarehouse::SqliteWarehouse(const std::string& path, std::string table)
  : dat::SqliteDB(path), table_(std::move(table))
{
  if ( !valid_identifier_(table_) ) {
    throw std::invalid_argument("tcf::SqliteWarehouse invalid table name: " + table_);
  }

  exec("PRAGMA journal_mode = WAL;");
  exec("CREATE TABLE IF NOT EXISTS " + table_ + " ("
       "  category_id TEXT NOT NULL,"
       "  group_id    TEXT NOT NULL,"
       "  product_id  TEXT NOT NULL,"
       "  update_date TEXT NOT NULL,"
       "  payload     TEXT NOT NULL,"
       "  loaded_at   TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP"
       ");");
  exec("CREATE INDEX IF NOT EXISTS " + table_ + "_product ON " + table_ +
       "(product_id, update_date);");

  insert_sql_ = "INSERT INTO " + table_ +
                " (category_id, group_id, product_id, update_date, payload)"
                " VALUES (?1, ?2, ?3, ?4, json(?5));";
}

/************ load() **************************************/
/* Inserts the whole batch in one transaction, rolled back on any failure
 * so a retried batch is never half present.
 */
void
SqliteWarehouse::load(const std::vector<Record>& batch)
{
  if ( batch.empty() ) {
    return;
  }

  // an exception before commit rolls the whole batch back
  Tx tx(*this);
  insert_rows_(batch);
  tx.commit();
  spdlog::debug("warehouse: {} rows into {}", batch.size(), table_);
}

int64_t
SqliteWarehouse::row_count()
{
  const auto stmt = prepare("SELECT COUNT(*) FROM " + table_ + ";");
  return step(stmt) ? column_int(stmt, 0) : 0;
}

void
SqliteWarehouse::insert_rows_(const std::vector<Record>& batch)
{
  const auto stmt = prepare(insert_sql_);
  for (const auto& record : batch) {
    bind(stmt, 1, record.category_id);
    bind(stmt, 2, record.group_id);
    bind(stmt, 3, record.product_id);
    bind(stmt, 4, record.update_date);
    bind(stmt, 5, boost::json::serialize(record.fields));
    step(stmt);
    rewind(stmt);
  }
}

} // end namespace tcf
