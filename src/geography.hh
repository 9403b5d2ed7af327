#ifndef NEIGHBORHOODS_GEOGRAPHY_HH
#define NEIGHBORHOODS_GEOGRAPHY_HH

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "crs.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// granularity_t
// census geography levels, coarse to fine
/////////////////////////////////////////////////////////////////////////////////////////////////////

enum class granularity_t
{
  tract,
  block_group,
  block
};

const char* granularity_name(granularity_t granularity);
granularity_t granularity_from_name(const std::string& name);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// county_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct county_t
{
  std::string state_fips;
  std::string county_fips;

  std::string fips() const { return state_fips + county_fips; }
  static county_t from_fips(const std::string& fips);
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// retry_policy_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct retry_policy_t
{
  int max_attempts = 3;
  std::chrono::milliseconds initial_delay = std::chrono::milliseconds(1000);
  double multiplier = 2.0;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// geography_source_t
// returns a GeoJSON FeatureCollection; throws fusion_error(network_failure) on transient errors
/////////////////////////////////////////////////////////////////////////////////////////////////////

class geography_source_t
{
public:
  virtual ~geography_source_t() {}
  virtual std::string fetch(const county_t& county, granularity_t granularity) = 0;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// tigerweb_source_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct tigerweb_config_t
{
  std::string base_url = "https://tigerweb.geo.census.gov/arcgis/rest/services/TIGERweb/Tracts_Blocks/MapServer/";
  std::string out_fields = "*";
  std::chrono::seconds timeout = std::chrono::seconds(120);
  std::size_t max_response_bytes = 512 * 1024 * 1024;
  std::string cache_directory;
};

class tigerweb_source_t : public geography_source_t
{
public:
  explicit tigerweb_source_t(const tigerweb_config_t& config);
  std::string fetch(const county_t& county, granularity_t granularity) override;
  std::string query_url(const county_t& county, granularity_t granularity) const;

private:
  tigerweb_config_t config;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// directory_source_t
// reads <directory>/<granularity>_<fips>.geojson, as written by the tigerweb cache
/////////////////////////////////////////////////////////////////////////////////////////////////////

class directory_source_t : public geography_source_t
{
public:
  explicit directory_source_t(const std::string& directory);
  std::string fetch(const county_t& county, granularity_t granularity) override;

private:
  std::string directory;
};

std::string geojson_file_name(const county_t& county, granularity_t granularity);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// load_units
// fetches every county (with retries) and concatenates the polygons into one layer keyed by id_field;
// counties that fail or return nothing are logged and skipped
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct units_report_t
{
  int64_t units = 0;
  std::vector<std::string> missing_counties;
};

geographic_layer_t load_units(database_t& db, geography_source_t& source, const std::vector<county_t>& counties,
  granularity_t granularity, const std::string& id_field, const retry_policy_t& retry,
  const std::string& scratch_directory, const std::string& out, units_report_t* report = nullptr);

#endif
