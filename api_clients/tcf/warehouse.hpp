/*
 * warehouse.hpp  Oct 6th, 2026
 *
 * Append-only bulk load interface of the destination store, and the sqlite
 * implementation shipped with tcgfetch.
 */

#ifndef __TCF_WAREHOUSE_HPP
#define __TCF_WAREHOUSE_HPP

#include <string>
#include <vector>

#include "database.hpp"
#include "fetch_support.hpp"

namespace tcf {

/************ tcf::Warehouse ******************************/
/* A batch either loads completely or throws. Delivery is at-least-once, the
 * warehouse is responsible for deduplication if it wants exactly-once.
 */
class Warehouse {
public:
  virtual ~Warehouse() = default;
  virtual void load(const std::vector<Record>& batch) = 0;
};

/************ tcf::SqliteWarehouse ************************/
/* One transaction per batch into an append-only table. Key columns are
 * stored next to the flat payload serialized as json.
 */
class SqliteWarehouse final : public Warehouse, private dat::SqliteDB {
public:
  explicit SqliteWarehouse(const std::string& path, std::string table = "records");

  void load(const std::vector<Record>& batch) override;
  int64_t row_count();

private:
  std::string table_;
  std::string insert_sql_;

  void insert_rows_(const std::vector<Record>& batch);
};

} // end namespace tcf

#endif // !__TCF_WAREHOUSE_HPP
