#ifndef NEIGHBORHOODS_DATASET_HH
#define NEIGHBORHOODS_DATASET_HH

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "database.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// neighborhood_record
// combined boundary and metrics of one neighborhood
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct neighborhood_record
{
  std::string id;
  std::string neighborhood;
  std::string city_name;
  std::string state_id;
  std::string county_fips;
  std::optional<double> neighborhood_zhvi;
  std::optional<double> city_zori;
  std::optional<double> city_zhvi;
  std::optional<double> city_rtv;
  std::optional<double> walk_score;
  std::optional<double> transit_score;
  std::optional<double> bike_score;
  std::optional<int64_t> population;
  std::optional<double> area_sq_mi;
  std::optional<double> pop_density;
  std::string geojson;  // ST_AsGeoJSON geometry
  std::string wkt;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// fused_dataset_t
// the output table of a pipeline run
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct fused_dataset_t
{
  std::string table;
  std::string id_column = "id";
  int64_t rows = 0;
  std::vector<std::string> columns;
  std::vector<std::string> missing_counties;
};

std::vector<neighborhood_record> get_neighborhoods(database_t& db, const fused_dataset_t& dataset);

// both return the number of records written, -1 if the file cannot be opened
int export_csv(database_t& db, const fused_dataset_t& dataset, const std::string& output_path);
int export_geojson(database_t& db, const fused_dataset_t& dataset, const std::string& output_path);

void print_summary(database_t& db, const fused_dataset_t& dataset);

#endif
