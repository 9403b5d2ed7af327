#include "walkability.hh"
#include "errors.hh"
#include <filesystem>
#include <iostream>

namespace
{
  std::string text_of(const duckdb::Value& v)
  {
    return v.IsNull() ? std::string() : v.ToString();
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// walkscore_csv_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

walkscore_csv_t::walkscore_csv_t(database_t& db, const std::string& csv_path)
  : db(db), table("walkscore_source")
{
  if (!std::filesystem::exists(csv_path))
  {
    throw fusion_error(error_kind::io_failure, "walkscore file " + csv_path + " does not exist");
  }

  db.execute(
    "CREATE OR REPLACE TABLE " + quote_ident(table) + " AS\n"
    "SELECT * FROM read_csv(" + quote_literal(csv_path) + ", header = true, all_varchar = true);");

  const char* required[] = { "city_rank", "neighborhood", "walk_score", "transit_score", "bike_score",
    "population", "city_name", "state_id" };
  for (size_t idx = 0; idx < 8; idx++)
  {
    if (!db.has_column(table, required[idx]))
    {
      throw fusion_error(error_kind::schema_mismatch,
        std::string("walkscore file ") + csv_path + " has no '" + required[idx] + "' column");
    }
  }

  std::cout << "Loaded " << db.count_rows(table) << " walkscore rows" << std::endl;
}

std::vector<walkscore_row> walkscore_csv_t::fetch(const std::string& city_name, const std::string& state_id)
{
  std::vector<walkscore_row> rows;

  std::unique_ptr<duckdb::PreparedStatement> stmt = db.connection().Prepare(
    "SELECT city_rank, neighborhood, walk_score, transit_score, bike_score, population FROM " + quote_ident(table) +
    " WHERE city_name = $1 AND state_id = $2 ORDER BY rowid;");
  if (stmt->HasError())
  {
    throw fusion_error(error_kind::query_failure, stmt->GetError());
  }

  duckdb::unique_ptr<duckdb::QueryResult> result = stmt->Execute(city_name, state_id);
  if (result->HasError())
  {
    throw fusion_error(error_kind::query_failure, result->GetError());
  }

  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = result->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      walkscore_row row;
      row.city_rank = text_of(chunk->GetValue(0, idx));
      row.neighborhood = text_of(chunk->GetValue(1, idx));
      row.walk_score = text_of(chunk->GetValue(2, idx));
      row.transit_score = text_of(chunk->GetValue(3, idx));
      row.bike_score = text_of(chunk->GetValue(4, idx));
      row.population = text_of(chunk->GetValue(5, idx));
      rows.push_back(row);
    }
  }

  return rows;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// collect_walkscores
/////////////////////////////////////////////////////////////////////////////////////////////////////

int64_t collect_walkscores(database_t& db, walkability_source_t& source, const std::string& records,
  const std::string& out)
{
  const std::string staging = "__" + out + "_text";

  db.execute(
    "CREATE OR REPLACE TABLE " + quote_ident(staging) + " (city_rank VARCHAR, neighborhood VARCHAR, "
    "walk_score VARCHAR, transit_score VARCHAR, bike_score VARCHAR, population VARCHAR, "
    "city_name VARCHAR, state_id VARCHAR);");

  std::vector<std::pair<std::string, std::string>> cities;
  std::unique_ptr<duckdb::MaterializedQueryResult> distinct = db.query(
    "SELECT DISTINCT CAST(city_name AS VARCHAR), CAST(state_id AS VARCHAR) FROM " + quote_ident(records) +
    " WHERE city_name IS NOT NULL AND state_id IS NOT NULL ORDER BY 1, 2;");
  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = distinct->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      cities.push_back(std::make_pair(chunk->GetValue(0, idx).ToString(), chunk->GetValue(1, idx).ToString()));
    }
  }

  std::vector<std::pair<size_t, std::vector<walkscore_row>>> fetched;
  for (size_t idx = 0; idx < cities.size(); idx++)
  {
    try
    {
      fetched.push_back(std::make_pair(idx, source.fetch(cities[idx].first, cities[idx].second)));
    }
    catch (const fusion_error& ex)
    {
      std::cerr << "warning: no walkscores for " << cities[idx].first << ", " << cities[idx].second
        << ": " << ex.what() << std::endl;
    }
  }

  duckdb::Appender appender(db.connection(), staging);
  for (size_t idx = 0; idx < fetched.size(); idx++)
  {
    const std::pair<std::string, std::string>& city = cities[fetched[idx].first];
    const std::vector<walkscore_row>& rows = fetched[idx].second;
    for (size_t row = 0; row < rows.size(); row++)
    {
      appender.BeginRow();
      appender.Append<duckdb::Value>(duckdb::Value(rows[row].city_rank));
      appender.Append<duckdb::Value>(duckdb::Value(rows[row].neighborhood));
      appender.Append<duckdb::Value>(duckdb::Value(rows[row].walk_score));
      appender.Append<duckdb::Value>(duckdb::Value(rows[row].transit_score));
      appender.Append<duckdb::Value>(duckdb::Value(rows[row].bike_score));
      appender.Append<duckdb::Value>(duckdb::Value(rows[row].population));
      appender.Append<duckdb::Value>(duckdb::Value(city.first));
      appender.Append<duckdb::Value>(duckdb::Value(city.second));
      appender.EndRow();
    }
  }
  appender.Close();

  // scores become numbers; population stays text until it is parsed with the other metrics
  db.execute(
    "CREATE OR REPLACE TABLE " + quote_ident(out) + " AS\n"
    "SELECT TRY_CAST(city_rank AS BIGINT) AS city_rank, neighborhood,\n"
    "  TRY_CAST(walk_score AS DOUBLE) AS walk_score,\n"
    "  TRY_CAST(transit_score AS DOUBLE) AS transit_score,\n"
    "  TRY_CAST(bike_score AS DOUBLE) AS bike_score,\n"
    "  population, city_name, state_id\n"
    "FROM " + quote_ident(staging) + "\n"
    "ORDER BY rowid;");
  db.execute("DROP TABLE " + quote_ident(staging) + ";");

  int64_t count = db.count_rows(out);
  std::cout << "Collected " << count << " walkscore rows for " << cities.size() << " cities" << std::endl;
  return count;
}
