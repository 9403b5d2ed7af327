#include "database.hh"
#include "errors.hh"
#include <iostream>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// quote_ident
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string quote_ident(const std::string& name)
{
  std::string str("\"");
  for (size_t idx = 0; idx < name.size(); ++idx)
  {
    if (name[idx] == '"') str += '"';
    str += name[idx];
  }
  str += '"';
  return str;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// quote_literal
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string quote_literal(const std::string& text)
{
  std::string str("'");
  for (size_t idx = 0; idx < text.size(); ++idx)
  {
    if (text[idx] == '\'') str += '\'';
    str += text[idx];
  }
  str += '\'';
  return str;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// database_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

database_t::database_t(const std::string& path) : db_path(path)
{
  duckdb::DBConfig config;
  db = std::make_unique<duckdb::DuckDB>(db_path, &config);
  conn = std::make_unique<duckdb::Connection>(*db);

  // the extension is normally present already; INSTALL only when LOAD cannot find it
  std::unique_ptr<duckdb::MaterializedQueryResult> result = conn->Query("LOAD spatial;");
  if (result->HasError())
  {
    conn->Query("INSTALL spatial;");
    result = conn->Query("LOAD spatial;");
    if (result->HasError())
    {
      std::cerr << result->GetError() << std::endl;
      throw fusion_error(error_kind::query_failure, "cannot load the DuckDB spatial extension");
    }
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// query
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::unique_ptr<duckdb::MaterializedQueryResult> database_t::query(const std::string& sql)
{
  std::unique_ptr<duckdb::MaterializedQueryResult> result = conn->Query(sql);
  if (result->HasError())
  {
    std::cerr << result->GetError() << std::endl;
    throw fusion_error(error_kind::query_failure, result->GetError());
  }
  return result;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// execute
/////////////////////////////////////////////////////////////////////////////////////////////////////

void database_t::execute(const std::string& sql)
{
  query(sql);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// get_columns
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<std::string> database_t::get_columns(const std::string& table)
{
  std::vector<std::string> columns;

  std::unique_ptr<duckdb::MaterializedQueryResult> result = query("DESCRIBE " + quote_ident(table) + ";");

  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = result->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      columns.push_back(chunk->GetValue(0, idx).ToString());
    }
  }

  return columns;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// has_column
/////////////////////////////////////////////////////////////////////////////////////////////////////

bool database_t::has_column(const std::string& table, const std::string& column)
{
  std::vector<std::string> columns = get_columns(table);
  for (size_t idx = 0; idx < columns.size(); idx++)
  {
    if (columns[idx] == column) return true;
  }
  return false;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// has_table
/////////////////////////////////////////////////////////////////////////////////////////////////////

bool database_t::has_table(const std::string& table)
{
  std::unique_ptr<duckdb::MaterializedQueryResult> result = query(
    "SELECT COUNT(*) FROM duckdb_tables() WHERE table_name = " + quote_literal(table) + ";");
  duckdb::unique_ptr<duckdb::DataChunk> chunk = result->Fetch();
  return chunk && chunk->size() > 0 && chunk->GetValue(0, 0).GetValue<int64_t>() > 0;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// count_rows
/////////////////////////////////////////////////////////////////////////////////////////////////////

int64_t database_t::count_rows(const std::string& table)
{
  std::unique_ptr<duckdb::MaterializedQueryResult> result = query("SELECT COUNT(*) FROM " + quote_ident(table) + ";");
  duckdb::unique_ptr<duckdb::DataChunk> chunk = result->Fetch();
  if (chunk && chunk->size() > 0)
  {
    return chunk->GetValue(0, 0).GetValue<int64_t>();
  }
  return 0;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// drop_columns
// columns that are not present are ignored
/////////////////////////////////////////////////////////////////////////////////////////////////////

void database_t::drop_columns(const std::string& table, const std::vector<std::string>& columns)
{
  for (size_t idx = 0; idx < columns.size(); idx++)
  {
    execute("ALTER TABLE " + quote_ident(table) + " DROP COLUMN IF EXISTS " + quote_ident(columns[idx]) + ";");
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// write_column
/////////////////////////////////////////////////////////////////////////////////////////////////////

void database_t::write_column(const std::string& table, const std::string& key_column, const std::string& column,
  const duckdb::LogicalType& type, const std::vector<std::pair<std::string, duckdb::Value>>& values)
{
  const std::string staging = "__staging_" + column;

  execute("CREATE OR REPLACE TABLE " + quote_ident(staging) + " (key VARCHAR, value " + type.ToString() + ");");

  try
  {
    duckdb::Appender appender(*conn, staging);
    for (size_t idx = 0; idx < values.size(); idx++)
    {
      appender.BeginRow();
      appender.Append<duckdb::Value>(duckdb::Value(values[idx].first));
      appender.Append<duckdb::Value>(values[idx].second);
      appender.EndRow();
    }
    appender.Close();
  }
  catch (const std::exception& ex)
  {
    std::cerr << ex.what() << std::endl;
    throw fusion_error(error_kind::query_failure, "cannot stage column " + column + ": " + ex.what());
  }

  execute("ALTER TABLE " + quote_ident(table) + " DROP COLUMN IF EXISTS " + quote_ident(column) + ";");
  execute("ALTER TABLE " + quote_ident(table) + " ADD COLUMN " + quote_ident(column) + " " + type.ToString() + ";");
  execute(
    "UPDATE " + quote_ident(table) + " SET " + quote_ident(column) + " = s.value "
    "FROM " + quote_ident(staging) + " s "
    "WHERE CAST(" + quote_ident(table) + "." + quote_ident(key_column) + " AS VARCHAR) = s.key;");
  execute("DROP TABLE " + quote_ident(staging) + ";");
}
