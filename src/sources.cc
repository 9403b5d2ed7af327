#include "sources.hh"
#include "errors.hh"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

/////////////////////////////////////////////////////////////////////////////////////////////////////
// find_recent_csv
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string find_recent_csv(const std::string& directory, const std::string& fragment)
{
  std::error_code ec;
  fs::directory_iterator it(directory, ec);
  if (ec)
  {
    throw fusion_error(error_kind::io_failure, "cannot list " + directory + ": " + ec.message());
  }

  fs::path best;
  fs::file_time_type best_time;
  for (; it != fs::directory_iterator(); ++it)
  {
    const fs::path& path = it->path();
    std::string name = path.filename().string();
    if (path.extension() != ".csv" || name.find(fragment) == std::string::npos)
    {
      continue;
    }

    fs::file_time_type time = fs::last_write_time(path, ec);
    if (ec) continue;
    if (best.empty() || time > best_time)
    {
      best = path;
      best_time = time;
    }
  }

  if (best.empty())
  {
    throw fusion_error(error_kind::io_failure, "no .csv containing '" + fragment + "' in " + directory);
  }

  return best.string();
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// load_points
/////////////////////////////////////////////////////////////////////////////////////////////////////

int64_t load_points(database_t& db, const std::string& csv_path, const std::string& out)
{
  bool has_fips = false;
  std::unique_ptr<duckdb::MaterializedQueryResult> described = db.query(
    "DESCRIBE SELECT * FROM read_csv(" + quote_literal(csv_path) + ", header = true);");
  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = described->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      if (chunk->GetValue(0, idx).ToString() == "county_fips") has_fips = true;
    }
  }
  if (!has_fips)
  {
    throw fusion_error(error_kind::schema_mismatch, csv_path + " has no county_fips column");
  }

  db.execute(
    "CREATE OR REPLACE TABLE " + quote_ident(out) + " AS\n"
    "SELECT * FROM read_csv(" + quote_literal(csv_path) + ", header = true, types = {'county_fips': 'VARCHAR'});");

  db.execute("UPDATE " + quote_ident(out) + " SET county_fips = LPAD(TRIM(county_fips), 5, '0') WHERE county_fips IS NOT NULL;");

  int64_t count = db.count_rows(out);
  std::cout << "Loaded " << count << " neighborhood points from " << csv_path << std::endl;
  return count;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// load_metric_table
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string load_metric_table(database_t& db, const std::string& csv_path, const std::vector<std::string>& key_columns,
  const std::string& value_column, const std::string& out)
{
  const std::string raw = "__raw_" + out;
  db.execute(
    "CREATE OR REPLACE TABLE " + quote_ident(raw) + " AS\n"
    "SELECT * FROM read_csv(" + quote_literal(csv_path) + ", header = true);");

  std::vector<std::string> columns = db.get_columns(raw);
  if (columns.empty())
  {
    throw fusion_error(error_kind::schema_mismatch, csv_path + " has no columns");
  }

  std::string value = value_column;
  if (value.empty())
  {
    value = columns.back();
    std::cout << "Using latest column '" << value << "' of " << csv_path << std::endl;
  }

  std::string select;
  std::vector<std::string> wanted = key_columns;
  wanted.push_back(value);
  for (size_t idx = 0; idx < wanted.size(); idx++)
  {
    bool found = false;
    for (size_t c = 0; c < columns.size(); c++)
    {
      if (columns[c] == wanted[idx]) found = true;
    }
    if (!found)
    {
      throw fusion_error(error_kind::schema_mismatch, csv_path + " has no '" + wanted[idx] + "' column");
    }
    if (idx > 0) select += ", ";
    select += quote_ident(wanted[idx]);
  }

  db.execute(
    "CREATE OR REPLACE TABLE " + quote_ident(out) + " AS\n"
    "SELECT " + select + " FROM " + quote_ident(raw) + " ORDER BY rowid;");
  db.execute("DROP TABLE " + quote_ident(raw) + ";");

  std::cout << "Loaded " << db.count_rows(out) << " rows of " << value << " from " << csv_path << std::endl;
  return value;
}
