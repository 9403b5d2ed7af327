#include "metrics.hh"
#include "errors.hh"
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace
{
  std::string trim(const std::string& text)
  {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    return text.substr(begin, end - begin);
  }

  // blank text and NaN are missing values, not parse failures
  bool is_missing_text(const std::optional<std::string>& text)
  {
    if (!text) return true;
    std::string str = trim(*text);
    if (str.empty()) return true;
    std::string lower;
    for (size_t idx = 0; idx < str.size(); ++idx)
    {
      lower += static_cast<char>(std::tolower(static_cast<unsigned char>(str[idx])));
    }
    return lower == "nan" || lower == "null" || lower == "none";
  }

  duckdb::Value to_value(std::optional<double> v)
  {
    return v ? duckdb::Value::DOUBLE(*v) : duckdb::Value(duckdb::LogicalType::DOUBLE);
  }

  duckdb::Value to_value(std::optional<int64_t> v)
  {
    return v ? duckdb::Value::BIGINT(*v) : duckdb::Value(duckdb::LogicalType::BIGINT);
  }

  std::optional<double> to_double(const duckdb::Value& v)
  {
    if (v.IsNull()) return std::nullopt;
    return v.GetValue<double>();
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// rent_to_value_ratio
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::optional<double> rent_to_value_ratio(std::optional<double> rent_index, std::optional<double> value_index)
{
  if (!rent_index || !value_index || *value_index == 0.0)
  {
    return std::nullopt;
  }
  return *rent_index / *value_index * 100.0;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// area_sq_mi
/////////////////////////////////////////////////////////////////////////////////////////////////////

double area_sq_mi(double square_meters)
{
  return square_meters / SQUARE_METERS_PER_SQUARE_MILE;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// parse_population
// "12,345" -> 12345
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::optional<int64_t> parse_population(const std::optional<std::string>& text)
{
  if (is_missing_text(text))
  {
    return std::nullopt;
  }

  std::string digits;
  std::string str = trim(*text);
  for (size_t idx = 0; idx < str.size(); ++idx)
  {
    if (str[idx] != ',') digits += str[idx];
  }

  size_t start = (digits[0] == '+' || digits[0] == '-') ? 1 : 0;
  if (start == digits.size() || digits.find_first_not_of("0123456789", start) != std::string::npos)
  {
    return std::nullopt;
  }

  try
  {
    return static_cast<int64_t>(std::stoll(digits));
  }
  catch (const std::out_of_range&)
  {
    return std::nullopt;
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// pop_density
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::optional<double> pop_density(std::optional<int64_t> population, std::optional<double> area)
{
  if (!population || !area || *area == 0.0)
  {
    return std::nullopt;
  }
  return static_cast<double>(*population) / *area;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// derive_ratio
/////////////////////////////////////////////////////////////////////////////////////////////////////

void derive_ratio(database_t& db, const std::string& table, const std::string& key_column,
  const std::string& rent_column, const std::string& value_column, const std::string& out_column)
{
  const std::string required[] = { key_column, rent_column, value_column };
  for (size_t idx = 0; idx < 3; idx++)
  {
    if (!db.has_column(table, required[idx]))
    {
      throw fusion_error(error_kind::schema_mismatch,
        "column '" + required[idx] + "' needed for " + out_column + " is missing from '" + table + "'");
    }
  }

  std::unique_ptr<duckdb::MaterializedQueryResult> result = db.query(
    "SELECT CAST(" + quote_ident(key_column) + " AS VARCHAR), TRY_CAST(" + quote_ident(rent_column) +
    " AS DOUBLE), TRY_CAST(" + quote_ident(value_column) + " AS DOUBLE) FROM " + quote_ident(table) + ";");

  std::vector<std::pair<std::string, duckdb::Value>> values;
  int missing = 0;

  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = result->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      std::optional<double> ratio = rent_to_value_ratio(to_double(chunk->GetValue(1, idx)), to_double(chunk->GetValue(2, idx)));
      if (!ratio) missing++;
      values.push_back(std::make_pair(chunk->GetValue(0, idx).ToString(), to_value(ratio)));
    }
  }

  db.write_column(table, key_column, out_column, duckdb::LogicalType::DOUBLE, values);

  std::cout << "Derived " << out_column << " for " << values.size() << " rows";
  if (missing > 0) std::cout << " (" << missing << " missing)";
  std::cout << std::endl;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// derive_area_and_density
/////////////////////////////////////////////////////////////////////////////////////////////////////

int derive_area_and_density(database_t& db, const std::string& table, const std::string& key_column,
  const std::map<std::string, double>& areas, const std::string& population_column)
{
  bool has_population = db.has_column(table, population_column);
  if (!has_population)
  {
    std::cerr << "warning: '" << table << "' has no " << population_column << " column; density will be missing" << std::endl;
  }

  std::string sql = "SELECT CAST(" + quote_ident(key_column) + " AS VARCHAR), " +
    (has_population ? "CAST(" + quote_ident(population_column) + " AS VARCHAR)" : std::string("NULL")) +
    " FROM " + quote_ident(table) + ";";
  std::unique_ptr<duckdb::MaterializedQueryResult> result = db.query(sql);

  std::vector<std::pair<std::string, duckdb::Value>> population_values;
  std::vector<std::pair<std::string, duckdb::Value>> area_values;
  std::vector<std::pair<std::string, duckdb::Value>> density_values;
  int failures = 0;

  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = result->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      std::string key = chunk->GetValue(0, idx).ToString();

      std::optional<std::string> raw;
      duckdb::Value raw_val = chunk->GetValue(1, idx);
      if (!raw_val.IsNull()) raw = raw_val.ToString();

      std::optional<int64_t> population = parse_population(raw);
      if (!population && !is_missing_text(raw))
      {
        failures++;
        std::cerr << "warning: population '" << *raw << "' of '" << key << "' is not a number" << std::endl;
      }

      std::optional<double> area;
      std::map<std::string, double>::const_iterator it = areas.find(key);
      if (it != areas.end()) area = area_sq_mi(it->second);

      population_values.push_back(std::make_pair(key, to_value(population)));
      area_values.push_back(std::make_pair(key, to_value(area)));
      density_values.push_back(std::make_pair(key, to_value(pop_density(population, area))));
    }
  }

  db.write_column(table, key_column, population_column, duckdb::LogicalType::BIGINT, population_values);
  db.write_column(table, key_column, "area_sq_mi", duckdb::LogicalType::DOUBLE, area_values);
  db.write_column(table, key_column, "pop_density", duckdb::LogicalType::DOUBLE, density_values);

  std::cout << "Derived area and density for " << area_values.size() << " rows";
  if (failures > 0) std::cout << " (" << failures << " unparsable population values)";
  std::cout << std::endl;

  return failures;
}
