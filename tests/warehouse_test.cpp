/*
 * warehouse_test.cpp  Oct 12th, 2026
 */

#include <string>

#include <gtest/gtest.h>
#include <sqlite3.h>

#include "test_support.hpp"
#include "tcf/warehouse.hpp"

namespace tcf::test {

class SqliteWarehouseTest : public ScratchDirTest {
protected:
  std::string path() const { return file("catalog.db"); }

  /* Single text column of the first row, read through a separate handle */
  std::string scalar(const std::string& sql)
  {
    sqlite3* db = nullptr;
    EXPECT_EQ(sqlite3_open(path().c_str(), &db), SQLITE_OK);
    sqlite3_stmt* stmt = nullptr;
    EXPECT_EQ(sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr), SQLITE_OK);
    std::string out;
    if ( sqlite3_step(stmt) == SQLITE_ROW ) {
      const auto* text = sqlite3_column_text(stmt, 0);
      out = text ? reinterpret_cast<const char*>(text) : "";
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return out;
  }
};

TEST_F(SqliteWarehouseTest, LoadsBatchesAppendOnly)
{
  SqliteWarehouse wh(path());
  wh.load(make_batch(3));
  wh.load(make_batch(2));
  EXPECT_EQ(wh.row_count(), 5);
}

TEST_F(SqliteWarehouseTest, EmptyBatchIsANoop)
{
  SqliteWarehouse wh(path());
  wh.load({});
  EXPECT_EQ(wh.row_count(), 0);
}

TEST_F(SqliteWarehouseTest, RowsSurviveReopen)
{
  {
    SqliteWarehouse wh(path(), "products");
    wh.load(make_batch(4));
  }
  SqliteWarehouse wh(path(), "products");
  EXPECT_EQ(wh.row_count(), 4);
}

TEST_F(SqliteWarehouseTest, PayloadIsStoredAsJson)
{
  {
    SqliteWarehouse wh(path());
    auto batch = make_batch(1);
    batch.front().fields["product_name"] = "Black Lotus";
    wh.load(batch);
  }

  EXPECT_EQ(scalar("SELECT json_extract(payload, '$.product_name') FROM records;"),
            "Black Lotus");
  EXPECT_EQ(scalar("SELECT category_id || ':' || group_id || ':' || product_id FROM records;"),
            "1:g:0");
  EXPECT_FALSE(scalar("SELECT loaded_at FROM records;").empty());
}

TEST_F(SqliteWarehouseTest, RejectsUnsafeTableNames)
{
  EXPECT_THROW(SqliteWarehouse(path(), "records; DROP TABLE x"), std::invalid_argument);
  EXPECT_THROW(SqliteWarehouse(path(), "1records"), std::invalid_argument);
  EXPECT_THROW(SqliteWarehouse(path(), ""), std::invalid_argument);
}

} // end namespace tcf::test
