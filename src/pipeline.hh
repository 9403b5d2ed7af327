#ifndef NEIGHBORHOODS_PIPELINE_HH
#define NEIGHBORHOODS_PIPELINE_HH

#include <string>
#include <vector>
#include "crs.hh"
#include "dataset.hh"
#include "geography.hh"
#include "walkability.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// pipeline_config_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct pipeline_config_t
{
  std::string id_column = "id";
  std::string key_column = "neighborhood";
  std::string lat_column = "lat";
  std::string lng_column = "lng";
  granularity_t granularity = granularity_t::block;
  crs_t geographic_crs = crs_t::wgs84();
  crs_t planar_crs = crs_t::conus_albers();
  std::string unit_id_field = "GEOID";
  double tie_tolerance = 1e-9;
  double overlap_epsilon = 1.0;
  retry_policy_t retry;
  std::string scratch_directory;
  std::vector<std::string> drop_columns = { "neighborhood_ascii", "city_id", "timezone", "source" };
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// source_tables_t
// tables already loaded into the session, with the explicit name of each incoming value column
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct source_tables_t
{
  std::string points;
  std::string neighborhood_values;
  std::string neighborhood_value_column;
  std::string city_rents;
  std::string city_rent_column;
  std::string city_values;
  std::string city_value_column;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// fusion_pipeline_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

class fusion_pipeline_t
{
public:
  fusion_pipeline_t(database_t& db, geography_source_t& geography, walkability_source_t* walkability,
    const pipeline_config_t& config);

  fused_dataset_t run(const source_tables_t& sources);

  std::vector<county_t> distinct_counties(const std::string& records);

private:
  void join_metrics(const source_tables_t& sources);
  void attach_boundaries(const geographic_layer_t& boundaries);
  void join_walkability();

  database_t& db;
  geography_source_t& geography;
  walkability_source_t* walkability;
  pipeline_config_t config;
};

#endif
