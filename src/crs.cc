#include "crs.hh"
#include "errors.hh"
#include <cctype>
#include <iostream>
#include <stdexcept>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// crs_t::from_code
// accepts "EPSG:n" or a bare number
/////////////////////////////////////////////////////////////////////////////////////////////////////

crs_t crs_t::from_code(const std::string& code)
{
  std::string digits = code;
  std::string upper;
  for (size_t idx = 0; idx < code.size(); ++idx)
  {
    upper += static_cast<char>(std::toupper(static_cast<unsigned char>(code[idx])));
  }
  if (upper.compare(0, 5, "EPSG:") == 0)
  {
    digits = code.substr(5);
  }

  if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos || digits.size() > 6)
  {
    throw std::invalid_argument("not an EPSG code: '" + code + "'");
  }

  int n = std::stoi(digits);
  crs_t crs;
  crs.code = "EPSG:" + std::to_string(n);

  if (n == 4326 || n == 4269 || n == 4267)
  {
    crs.kind = crs_kind::geographic;
  }
  else if (n == 3857 || n == 5070 || n == 9311 || n == 2163 ||
    (n >= 32601 && n <= 32660) || (n >= 32701 && n <= 32760) || (n >= 26901 && n <= 26923))
  {
    crs.kind = crs_kind::planar;
  }
  else
  {
    throw std::invalid_argument("unsupported reference system '" + code + "'");
  }

  return crs;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// geographic_layer_t, planar_layer_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

geographic_layer_t::geographic_layer_t(const std::string& table, const crs_t& crs) : layer_t(table, crs)
{
  if (crs.kind != crs_kind::geographic)
  {
    throw std::logic_error("layer '" + table + "' tagged geographic with planar system " + crs.code);
  }
}

planar_layer_t::planar_layer_t(const std::string& table, const crs_t& crs) : layer_t(table, crs)
{
  if (crs.kind != crs_kind::planar)
  {
    throw std::logic_error("layer '" + table + "' tagged planar with geographic system " + crs.code);
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// require_same_crs
/////////////////////////////////////////////////////////////////////////////////////////////////////

void require_same_crs(const layer_t& a, const layer_t& b)
{
  if (a.crs() != b.crs())
  {
    throw std::logic_error("layers '" + a.table() + "' (" + a.crs().code + ") and '" + b.table() + "' (" +
      b.crs().code + ") are in different reference systems");
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// make_point_layer
/////////////////////////////////////////////////////////////////////////////////////////////////////

geographic_layer_t make_point_layer(database_t& db, const std::string& table, const std::string& id_column,
  const std::string& lng_column, const std::string& lat_column, const crs_t& crs, const std::string& out)
{
  geographic_layer_t layer(out, crs);

  const std::string required[] = { id_column, lng_column, lat_column };
  for (size_t idx = 0; idx < 3; idx++)
  {
    if (!db.has_column(table, required[idx]))
    {
      throw fusion_error(error_kind::schema_mismatch,
        "column '" + required[idx] + "' needed for point geometry is missing from '" + table + "'");
    }
  }

  std::unique_ptr<duckdb::MaterializedQueryResult> missing = db.query(
    "SELECT CAST(" + quote_ident(id_column) + " AS VARCHAR) FROM " + quote_ident(table) +
    " WHERE TRY_CAST(" + quote_ident(lng_column) + " AS DOUBLE) IS NULL"
    " OR TRY_CAST(" + quote_ident(lat_column) + " AS DOUBLE) IS NULL LIMIT 1;");
  duckdb::unique_ptr<duckdb::DataChunk> chunk = missing->Fetch();
  if (chunk && chunk->size() > 0)
  {
    throw fusion_error(error_kind::schema_mismatch,
      "record '" + chunk->GetValue(0, 0).ToString() + "' of '" + table + "' has no usable coordinates");
  }

  db.execute(
    "CREATE OR REPLACE TABLE " + quote_ident(out) + " AS\n"
    "SELECT CAST(" + quote_ident(id_column) + " AS VARCHAR) AS id,\n"
    "  ROW_NUMBER() OVER (ORDER BY rowid) - 1 AS ord,\n"
    "  ST_Point(CAST(" + quote_ident(lng_column) + " AS DOUBLE), CAST(" + quote_ident(lat_column) + " AS DOUBLE)) AS geom\n"
    "FROM " + quote_ident(table) + "\n"
    "ORDER BY ord;");

  std::cout << "Built " << db.count_rows(out) << " points in " << crs.code << std::endl;
  return layer;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// reproject
/////////////////////////////////////////////////////////////////////////////////////////////////////

namespace
{
  void transform_table(database_t& db, const layer_t& layer, const crs_t& target, const std::string& out)
  {
    if (out == layer.table())
    {
      throw std::logic_error("reprojection of '" + out + "' must write a new table");
    }

    db.execute(
      "CREATE OR REPLACE TABLE " + quote_ident(out) + " AS\n"
      "SELECT id, ord, ST_Transform(geom, " + quote_literal(layer.crs().code) + ", " + quote_literal(target.code) +
      ", always_xy := true) AS geom\n"
      "FROM " + quote_ident(layer.table()) + "\n"
      "ORDER BY ord;");
  }
}

planar_layer_t reproject(database_t& db, const geographic_layer_t& layer, const crs_t& target, const std::string& out)
{
  planar_layer_t result(out, target);
  transform_table(db, layer, target, out);
  return result;
}

geographic_layer_t reproject(database_t& db, const planar_layer_t& layer, const crs_t& target, const std::string& out)
{
  geographic_layer_t result(out, target);
  transform_table(db, layer, target, out);
  return result;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// planar_area
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<std::pair<std::string, double>> planar_area(database_t& db, const planar_layer_t& layer)
{
  std::vector<std::pair<std::string, double>> areas;

  std::unique_ptr<duckdb::MaterializedQueryResult> result = db.query(
    "SELECT id, ST_Area(geom) FROM " + quote_ident(layer.table()) + " ORDER BY ord;");

  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = result->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      areas.push_back(std::make_pair(chunk->GetValue(0, idx).ToString(), chunk->GetValue(1, idx).GetValue<double>()));
    }
  }

  return areas;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// planar_distance
/////////////////////////////////////////////////////////////////////////////////////////////////////

double planar_distance(database_t& db, const planar_layer_t& a, const std::string& a_id,
  const planar_layer_t& b, const std::string& b_id)
{
  require_same_crs(a, b);

  std::unique_ptr<duckdb::MaterializedQueryResult> result = db.query(
    "SELECT ST_Distance(x.geom, y.geom) FROM " + quote_ident(a.table()) + " x, " + quote_ident(b.table()) + " y "
    "WHERE x.id = " + quote_literal(a_id) + " AND y.id = " + quote_literal(b_id) + " LIMIT 1;");

  duckdb::unique_ptr<duckdb::DataChunk> chunk = result->Fetch();
  if (!chunk || chunk->size() == 0)
  {
    throw fusion_error(error_kind::schema_mismatch,
      "no geometry '" + a_id + "' in '" + a.table() + "' or '" + b_id + "' in '" + b.table() + "'");
  }
  return chunk->GetValue(0, 0).GetValue<double>();
}
