#ifndef NEIGHBORHOODS_DATABASE_HH
#define NEIGHBORHOODS_DATABASE_HH

#include <string>
#include <vector>
#include <memory>
#include <utility>
#include "duckdb.hpp"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// database_t
// DuckDB session with the spatial extension loaded; every relation and geometry layer
// of a run lives as a table in this session
/////////////////////////////////////////////////////////////////////////////////////////////////////

class database_t
{
private:
  std::unique_ptr<duckdb::DuckDB> db;
  std::unique_ptr<duckdb::Connection> conn;
  std::string db_path;

public:
  database_t(const std::string& path = ":memory:");

  std::unique_ptr<duckdb::MaterializedQueryResult> query(const std::string& sql);
  void execute(const std::string& sql);

  std::vector<std::string> get_columns(const std::string& table);
  bool has_column(const std::string& table, const std::string& column);
  bool has_table(const std::string& table);
  int64_t count_rows(const std::string& table);
  void drop_columns(const std::string& table, const std::vector<std::string>& columns);

  // (key, value) pairs replace or create `column`; rows whose key is absent stay NULL
  void write_column(const std::string& table, const std::string& key_column, const std::string& column,
    const duckdb::LogicalType& type, const std::vector<std::pair<std::string, duckdb::Value>>& values);

  duckdb::Connection& connection() { return *conn; }
  const std::string& path() const { return db_path; }
};

std::string quote_ident(const std::string& name);
std::string quote_literal(const std::string& text);

#endif
