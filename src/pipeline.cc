#include "pipeline.hh"
#include "dissolve.hh"
#include "errors.hh"
#include "join.hh"
#include "metrics.hh"
#include "nearest.hh"
#include <iostream>
#include <map>
#include <stdexcept>

namespace
{
  const char* RECORDS = "neighborhoods";
  const char* FUSED = "fused";

  std::vector<std::string> first_column(database_t& db, const std::string& sql)
  {
    std::vector<std::string> values;
    std::unique_ptr<duckdb::MaterializedQueryResult> result = db.query(sql);
    duckdb::unique_ptr<duckdb::DataChunk> chunk;
    while ((chunk = result->Fetch()) != nullptr)
    {
      for (size_t idx = 0; idx < chunk->size(); idx++)
      {
        values.push_back(chunk->GetValue(0, idx).ToString());
      }
    }
    return values;
  }

  std::string join_ids(const std::vector<std::string>& ids)
  {
    std::string str;
    for (size_t idx = 0; idx < ids.size() && idx < 10; idx++)
    {
      if (idx > 0) str += ", ";
      str += ids[idx];
    }
    if (ids.size() > 10) str += ", ...";
    return str;
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// fusion_pipeline_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

fusion_pipeline_t::fusion_pipeline_t(database_t& db, geography_source_t& geography, walkability_source_t* walkability,
  const pipeline_config_t& config)
  : db(db), geography(geography), walkability(walkability), config(config)
{
  if (config.geographic_crs.kind != crs_kind::geographic || config.planar_crs.kind != crs_kind::planar)
  {
    throw std::invalid_argument("pipeline needs a geographic and a planar reference system, got " +
      config.geographic_crs.code + " and " + config.planar_crs.code);
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// run
/////////////////////////////////////////////////////////////////////////////////////////////////////

fused_dataset_t fusion_pipeline_t::run(const source_tables_t& sources)
{
  join_metrics(sources);
  db.drop_columns(RECORDS, config.drop_columns);

  geographic_layer_t points = make_point_layer(db, RECORDS, config.id_column, config.lng_column, config.lat_column,
    config.geographic_crs, "neighborhood_points");

  derive_ratio(db, RECORDS, config.id_column, "city_ZORI", "city_ZHVI", "city_RTV");

  std::vector<county_t> counties = distinct_counties(RECORDS);

  units_report_t report;
  geographic_layer_t units = load_units(db, geography, counties, config.granularity, config.unit_id_field,
    config.retry, config.scratch_directory, "units", &report);

  planar_layer_t planar_points = reproject(db, points, config.planar_crs, "neighborhood_points_planar");
  planar_layer_t planar_units = reproject(db, units, config.planar_crs, "units_planar");

  nearest_assign(db, planar_units, planar_points, "unit_assignments", config.tie_tolerance);
  planar_layer_t grouped = apply_assignment(db, planar_units, "unit_assignments", "units_grouped");

  dissolve_result_t dissolved = dissolve(db, grouped, "boundaries_planar", config.overlap_epsilon);
  std::vector<std::pair<std::string, double>> area_list = planar_area(db, dissolved.boundaries);

  geographic_layer_t boundaries = reproject(db, dissolved.boundaries, config.geographic_crs, "boundaries");

  attach_boundaries(boundaries);

  if (walkability)
  {
    join_walkability();
  }

  std::map<std::string, double> areas(area_list.begin(), area_list.end());
  int failures = derive_area_and_density(db, FUSED, config.id_column, areas, "population");
  if (failures > 0)
  {
    std::cerr << "warning: " << failures << " population values could not be parsed and are missing" << std::endl;
  }

  fused_dataset_t dataset;
  dataset.table = FUSED;
  dataset.rows = db.count_rows(FUSED);
  dataset.columns = db.get_columns(FUSED);
  dataset.id_column = config.id_column;
  dataset.missing_counties = report.missing_counties;
  return dataset;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// join_metrics
// neighborhood home values on name/state/city, city rents and city home values on city/state
/////////////////////////////////////////////////////////////////////////////////////////////////////

void fusion_pipeline_t::join_metrics(const source_tables_t& sources)
{
  join_spec_t neighborhood_values;
  neighborhood_values.left_keys = { config.key_column, "state_id", "city_name" };
  neighborhood_values.right_keys = { "RegionName", "State", "City" };
  neighborhood_values.value_column = sources.neighborhood_value_column;
  neighborhood_values.renamed_value = "neighborhood_ZHVI";
  neighborhood_values.dedup_key = config.key_column;
  left_join(db, sources.points, sources.neighborhood_values, neighborhood_values, RECORDS);

  join_spec_t city_rents;
  city_rents.left_keys = { "city_name", "state_id" };
  city_rents.right_keys = { "RegionName", "State" };
  city_rents.value_column = sources.city_rent_column;
  city_rents.renamed_value = "city_ZORI";
  city_rents.dedup_key = config.key_column;
  left_join(db, RECORDS, sources.city_rents, city_rents, RECORDS);

  join_spec_t city_values;
  city_values.left_keys = { "city_name", "state_id" };
  city_values.right_keys = { "RegionName", "State" };
  city_values.value_column = sources.city_value_column;
  city_values.renamed_value = "city_ZHVI";
  city_values.dedup_key = config.key_column;
  left_join(db, RECORDS, sources.city_values, city_values, RECORDS);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// distinct_counties
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<county_t> fusion_pipeline_t::distinct_counties(const std::string& records)
{
  std::vector<county_t> counties;

  std::vector<std::string> fips = first_column(db,
    "SELECT DISTINCT CAST(county_fips AS VARCHAR) FROM " + quote_ident(records) +
    " WHERE county_fips IS NOT NULL ORDER BY 1;");
  for (size_t idx = 0; idx < fips.size(); idx++)
  {
    counties.push_back(county_t::from_fips(fips[idx]));
  }

  std::cout << "Counties to query: " << counties.size() << std::endl;
  return counties;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// attach_boundaries
// every record gets exactly one boundary and every boundary belongs to a record
/////////////////////////////////////////////////////////////////////////////////////////////////////

void fusion_pipeline_t::attach_boundaries(const geographic_layer_t& boundaries)
{
  const std::string id = "CAST(n." + quote_ident(config.id_column) + " AS VARCHAR)";

  std::vector<std::string> duplicated = first_column(db,
    "SELECT " + id + " FROM " + quote_ident(RECORDS) + " n GROUP BY 1 HAVING COUNT(*) > 1 ORDER BY 1;");
  if (!duplicated.empty())
  {
    throw fusion_error(error_kind::unmatched_boundary,
      "neighborhood ids are not unique: " + join_ids(duplicated));
  }

  std::vector<std::string> without_boundary = first_column(db,
    "SELECT " + id + " FROM " + quote_ident(RECORDS) + " n\n"
    "LEFT JOIN " + quote_ident(boundaries.table()) + " b ON " + id + " = b.id\n"
    "WHERE b.id IS NULL ORDER BY n.rowid;");
  if (!without_boundary.empty())
  {
    throw fusion_error(error_kind::unmatched_boundary,
      std::to_string(without_boundary.size()) + " neighborhoods have no assigned geographic units: " +
      join_ids(without_boundary));
  }

  std::vector<std::string> without_record = first_column(db,
    "SELECT b.id FROM " + quote_ident(boundaries.table()) + " b\n"
    "LEFT JOIN " + quote_ident(RECORDS) + " n ON " + id + " = b.id\n"
    "WHERE n." + quote_ident(config.id_column) + " IS NULL ORDER BY b.ord;");
  if (!without_record.empty())
  {
    throw fusion_error(error_kind::unmatched_boundary,
      std::to_string(without_record.size()) + " boundaries belong to no neighborhood: " + join_ids(without_record));
  }

  db.execute(
    "CREATE OR REPLACE TABLE " + quote_ident(FUSED) + " AS\n"
    "SELECT n.* EXCLUDE (" + quote_ident(config.lat_column) + ", " + quote_ident(config.lng_column) + "), b.geom AS geom\n"
    "FROM " + quote_ident(RECORDS) + " n\n"
    "JOIN " + quote_ident(boundaries.table()) + " b ON " + id + " = b.id\n"
    "ORDER BY n.rowid;");

  std::cout << "Attached " << db.count_rows(FUSED) << " boundaries" << std::endl;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// join_walkability
/////////////////////////////////////////////////////////////////////////////////////////////////////

void fusion_pipeline_t::join_walkability()
{
  collect_walkscores(db, *walkability, FUSED, "walkscores");

  join_spec_t spec;
  spec.left_keys = { config.key_column, "city_name", "state_id" };
  spec.right_keys = { "neighborhood", "city_name", "state_id" };
  spec.dedup_key = config.key_column;
  left_join(db, FUSED, "walkscores", spec, FUSED);
}
