#include "dataset.hh"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace
{
  bool has(const fused_dataset_t& dataset, const std::string& column)
  {
    return std::find(dataset.columns.begin(), dataset.columns.end(), column) != dataset.columns.end();
  }

  std::string text_column(const fused_dataset_t& dataset, const std::string& column)
  {
    return has(dataset, column) ? "CAST(" + quote_ident(column) + " AS VARCHAR)" : std::string("CAST(NULL AS VARCHAR)");
  }

  std::string number_column(const fused_dataset_t& dataset, const std::string& column)
  {
    return has(dataset, column) ? "TRY_CAST(" + quote_ident(column) + " AS DOUBLE)" : std::string("CAST(NULL AS DOUBLE)");
  }

  std::string text_of(const duckdb::Value& v)
  {
    return v.IsNull() ? std::string() : v.ToString();
  }

  std::optional<double> number_of(const duckdb::Value& v)
  {
    if (v.IsNull()) return std::nullopt;
    return v.GetValue<double>();
  }

  /////////////////////////////////////////////////////////////////////////////////////////////////////
  // escape_json
  /////////////////////////////////////////////////////////////////////////////////////////////////////

  std::string escape_json(const std::string& input)
  {
    std::string output;
    output.reserve(input.size() + 2);
    output += '"';
    for (size_t idx = 0; idx < input.size(); ++idx)
    {
      char c = input[idx];
      switch (c)
      {
      case '\"': output += "\\\""; break;
      case '\\': output += "\\\\"; break;
      case '\n': output += "\\n"; break;
      case '\r': output += "\\r"; break;
      case '\t': output += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20)
        {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          output += buf;
        }
        else
        {
          output += c;
        }
        break;
      }
    }
    output += '"';
    return output;
  }

  std::string json_value(const duckdb::Value& v, const duckdb::LogicalType& type)
  {
    if (v.IsNull()) return "null";

    if (type.id() == duckdb::LogicalTypeId::BOOLEAN)
    {
      return v.GetValue<bool>() ? "true" : "false";
    }

    if (type.IsNumeric())
    {
      if (type.id() == duckdb::LogicalTypeId::DOUBLE || type.id() == duckdb::LogicalTypeId::FLOAT)
      {
        double d = v.GetValue<double>();
        if (!std::isfinite(d)) return "null";
      }
      return v.ToString();
    }

    return escape_json(v.ToString());
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// get_neighborhoods
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<neighborhood_record> get_neighborhoods(database_t& db, const fused_dataset_t& dataset)
{
  std::vector<neighborhood_record> records;

  std::string sql =
    "SELECT CAST(" + quote_ident(dataset.id_column) + " AS VARCHAR),\n"
    "  " + text_column(dataset, "neighborhood") + ",\n"
    "  " + text_column(dataset, "city_name") + ",\n"
    "  " + text_column(dataset, "state_id") + ",\n"
    "  " + text_column(dataset, "county_fips") + ",\n"
    "  " + number_column(dataset, "neighborhood_ZHVI") + ",\n"
    "  " + number_column(dataset, "city_ZORI") + ",\n"
    "  " + number_column(dataset, "city_ZHVI") + ",\n"
    "  " + number_column(dataset, "city_RTV") + ",\n"
    "  " + number_column(dataset, "walk_score") + ",\n"
    "  " + number_column(dataset, "transit_score") + ",\n"
    "  " + number_column(dataset, "bike_score") + ",\n"
    "  " + (has(dataset, "population") ? std::string("TRY_CAST(population AS BIGINT)") : std::string("CAST(NULL AS BIGINT)")) + ",\n"
    "  " + number_column(dataset, "area_sq_mi") + ",\n"
    "  " + number_column(dataset, "pop_density") + ",\n"
    "  ST_AsGeoJSON(geom),\n"
    "  ST_AsText(geom)\n"
    "FROM " + quote_ident(dataset.table) + "\n"
    "ORDER BY rowid;";

  std::unique_ptr<duckdb::MaterializedQueryResult> result = db.query(sql);

  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = result->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      neighborhood_record rec;
      rec.id = text_of(chunk->GetValue(0, idx));
      rec.neighborhood = text_of(chunk->GetValue(1, idx));
      rec.city_name = text_of(chunk->GetValue(2, idx));
      rec.state_id = text_of(chunk->GetValue(3, idx));
      rec.county_fips = text_of(chunk->GetValue(4, idx));
      rec.neighborhood_zhvi = number_of(chunk->GetValue(5, idx));
      rec.city_zori = number_of(chunk->GetValue(6, idx));
      rec.city_zhvi = number_of(chunk->GetValue(7, idx));
      rec.city_rtv = number_of(chunk->GetValue(8, idx));
      rec.walk_score = number_of(chunk->GetValue(9, idx));
      rec.transit_score = number_of(chunk->GetValue(10, idx));
      rec.bike_score = number_of(chunk->GetValue(11, idx));

      duckdb::Value population = chunk->GetValue(12, idx);
      if (!population.IsNull()) rec.population = population.GetValue<int64_t>();

      rec.area_sq_mi = number_of(chunk->GetValue(13, idx));
      rec.pop_density = number_of(chunk->GetValue(14, idx));
      rec.geojson = text_of(chunk->GetValue(15, idx));
      rec.wkt = text_of(chunk->GetValue(16, idx));
      records.push_back(rec);
    }
  }

  return records;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// export_csv
// boundary as WKT in a "geometry" column
/////////////////////////////////////////////////////////////////////////////////////////////////////

int export_csv(database_t& db, const fused_dataset_t& dataset, const std::string& output_path)
{
  {
    std::ofstream file(output_path);
    if (!file.is_open())
    {
      return -1;
    }
  }

  db.execute(
    "COPY (SELECT * EXCLUDE (geom), ST_AsText(geom) AS geometry FROM " + quote_ident(dataset.table) + " ORDER BY rowid)\n"
    "TO " + quote_literal(output_path) + " (HEADER, DELIMITER ',');");

  int64_t count = db.count_rows(dataset.table);
  std::cout << "Exported " << count << " neighborhoods to " << output_path << std::endl;
  return static_cast<int>(count);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// export_geojson
/////////////////////////////////////////////////////////////////////////////////////////////////////

int export_geojson(database_t& db, const fused_dataset_t& dataset, const std::string& output_path)
{
  std::ofstream file(output_path);
  if (!file.is_open())
  {
    return -1;
  }

  std::unique_ptr<duckdb::MaterializedQueryResult> result = db.query(
    "SELECT * EXCLUDE (geom), ST_AsGeoJSON(geom) AS __geojson FROM " + quote_ident(dataset.table) + " ORDER BY rowid;");

  const std::vector<std::string>& names = result->names;
  const std::vector<duckdb::LogicalType>& types = result->types;
  const size_t geometry_column = names.size() - 1;

  size_t id_column = names.size();
  for (size_t c = 0; c < geometry_column; c++)
  {
    if (names[c] == dataset.id_column) id_column = c;
  }

  file << "{\"type\":\"FeatureCollection\",\"features\":[\n";

  int count = 0;
  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = result->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      if (count > 0) file << ",\n";

      file << "{\"type\":\"Feature\",";
      if (id_column < names.size())
      {
        file << "\"id\":" << escape_json(text_of(chunk->GetValue(id_column, idx))) << ",";
      }

      file << "\"properties\":{";
      for (size_t c = 0; c < geometry_column; c++)
      {
        if (c > 0) file << ",";
        file << escape_json(names[c]) << ":" << json_value(chunk->GetValue(c, idx), types[c]);
      }
      file << "},";

      duckdb::Value geometry = chunk->GetValue(geometry_column, idx);
      file << "\"geometry\":" << (geometry.IsNull() ? std::string("null") : geometry.ToString()) << "}";
      count++;
    }
  }

  file << "\n]}\n";
  file.close();

  std::cout << "Exported " << count << " neighborhoods to " << output_path << std::endl;
  return count;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// print_summary
/////////////////////////////////////////////////////////////////////////////////////////////////////

void print_summary(database_t& db, const fused_dataset_t& dataset)
{
  std::vector<neighborhood_record> records = get_neighborhoods(db, dataset);

  std::cout << "\nNeighborhoods: " << records.size() << "\n";
  std::cout << std::left << std::setw(28) << "Neighborhood"
    << std::setw(20) << "City"
    << std::setw(6) << "State"
    << std::right << std::setw(12) << "Sq mi"
    << std::setw(12) << "Population"
    << std::setw(12) << "Density" << "\n";
  std::cout << std::string(90, '-') << "\n";

  double total_area = 0.0;
  for (size_t idx = 0; idx < records.size(); idx++)
  {
    const neighborhood_record& r = records[idx];
    if (r.area_sq_mi) total_area += *r.area_sq_mi;

    std::cout << std::left << std::setw(28) << r.neighborhood.substr(0, 27)
      << std::setw(20) << r.city_name.substr(0, 19)
      << std::setw(6) << r.state_id
      << std::right << std::fixed << std::setprecision(3)
      << std::setw(12) << (r.area_sq_mi ? *r.area_sq_mi : 0.0)
      << std::setw(12) << (r.population ? std::to_string(*r.population) : std::string("-"))
      << std::setprecision(1)
      << std::setw(12) << (r.pop_density ? *r.pop_density : 0.0) << "\n";
  }

  std::cout << std::string(90, '-') << "\n";
  std::cout << std::left << std::setw(54) << "TOTAL"
    << std::right << std::setprecision(3) << std::setw(12) << total_area << "\n";

  if (!dataset.missing_counties.empty())
  {
    std::cout << "Counties without geography: ";
    for (size_t idx = 0; idx < dataset.missing_counties.size(); idx++)
    {
      if (idx > 0) std::cout << ", ";
      std::cout << dataset.missing_counties[idx];
    }
    std::cout << std::endl;
  }
}
