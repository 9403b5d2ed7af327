#include "geography.hh"
#include "errors.hh"
#include <Wt/WIOService.h>
#include <Wt/Http/Client.h>
#include <Wt/Http/Message.h>
#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Utils.h>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

static const char* EMPTY_COLLECTION = "{\"type\":\"FeatureCollection\",\"features\":[]}";

/////////////////////////////////////////////////////////////////////////////////////////////////////
// granularity_name
/////////////////////////////////////////////////////////////////////////////////////////////////////

const char* granularity_name(granularity_t granularity)
{
  switch (granularity)
  {
  case granularity_t::tract: return "tract";
  case granularity_t::block_group: return "block_group";
  case granularity_t::block: return "block";
  }
  return "block";
}

granularity_t granularity_from_name(const std::string& name)
{
  if (name == "tract") return granularity_t::tract;
  if (name == "block_group") return granularity_t::block_group;
  if (name == "block") return granularity_t::block;
  throw std::invalid_argument("unknown census geography '" + name + "' (tract, block_group or block)");
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// county_t::from_fips
// "6037" and "06037" both give state 06, county 037
/////////////////////////////////////////////////////////////////////////////////////////////////////

county_t county_t::from_fips(const std::string& fips)
{
  std::string padded = fips;
  while (padded.size() < 5) padded = "0" + padded;

  if (padded.size() != 5 || padded.find_first_not_of("0123456789") != std::string::npos)
  {
    throw fusion_error(error_kind::schema_mismatch, "'" + fips + "' is not a county FIPS code");
  }

  county_t county;
  county.state_fips = padded.substr(0, 2);
  county.county_fips = padded.substr(2);
  return county;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// geojson_file_name
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string geojson_file_name(const county_t& county, granularity_t granularity)
{
  return std::string(granularity_name(granularity)) + "_" + county.fips() + ".geojson";
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// tigerweb_source_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

tigerweb_source_t::tigerweb_source_t(const tigerweb_config_t& config) : config(config)
{
}

std::string tigerweb_source_t::query_url(const county_t& county, granularity_t granularity) const
{
  // map server sub layers
  int layer = 2;
  switch (granularity)
  {
  case granularity_t::tract: layer = 0; break;
  case granularity_t::block_group: layer = 1; break;
  case granularity_t::block: layer = 2; break;
  }

  std::string where = "COUNTY='" + county.county_fips + "' and STATE='" + county.state_fips + "'";

  return config.base_url + std::to_string(layer) + "/query?where=" + Wt::Utils::urlEncode(where) +
    "&outFields=" + Wt::Utils::urlEncode(config.out_fields) + "&f=geojson";
}

std::string tigerweb_source_t::fetch(const county_t& county, granularity_t granularity)
{
  std::string url = query_url(county, granularity);
  std::cout << "Querying Census API for county_id :" << county.fips() << std::endl;

  Wt::WIOService io;
  io.setThreadCount(1);
  io.start();

  Wt::Http::Client client(io);
  client.setTimeout(config.timeout);
  client.setMaximumResponseSize(config.max_response_bytes);
  client.setFollowRedirect(true);

  std::promise<std::pair<Wt::AsioWrapper::error_code, Wt::Http::Message>> reply;
  std::future<std::pair<Wt::AsioWrapper::error_code, Wt::Http::Message>> pending = reply.get_future();
  client.done().connect([&reply](Wt::AsioWrapper::error_code err, const Wt::Http::Message& response)
    {
      reply.set_value(std::make_pair(err, response));
    });

  if (!client.get(url))
  {
    io.stop();
    throw fusion_error(error_kind::network_failure, "cannot issue request " + url);
  }

  std::pair<Wt::AsioWrapper::error_code, Wt::Http::Message> result = pending.get();
  io.stop();

  if (result.first)
  {
    throw fusion_error(error_kind::network_failure, "HTTP error occurred: " + result.first.message());
  }

  const Wt::Http::Message& response = result.second;
  if (response.status() < 200 || response.status() >= 300)
  {
    throw fusion_error(error_kind::network_failure,
      "HTTP error occurred: status " + std::to_string(response.status()) + " for " + url);
  }

  // the map server reports query errors in a 200 response
  Wt::Json::Object body;
  try
  {
    Wt::Json::parse(response.body(), body);
  }
  catch (const Wt::Json::ParseError& ex)
  {
    throw fusion_error(error_kind::network_failure, std::string("malformed response: ") + ex.what());
  }
  if (body.contains("error"))
  {
    throw fusion_error(error_kind::network_failure, "map server error for county " + county.fips());
  }

  if (!config.cache_directory.empty())
  {
    std::error_code ec;
    fs::create_directories(config.cache_directory, ec);
    std::ofstream file(fs::path(config.cache_directory) / geojson_file_name(county, granularity), std::ios::binary);
    if (file.is_open())
    {
      file << response.body();
    }
    else
    {
      std::cerr << "warning: cannot cache response for county " << county.fips() << std::endl;
    }
  }

  return response.body();
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// directory_source_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

directory_source_t::directory_source_t(const std::string& directory) : directory(directory)
{
}

std::string directory_source_t::fetch(const county_t& county, granularity_t granularity)
{
  fs::path path = fs::path(directory) / geojson_file_name(county, granularity);
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
  {
    std::cerr << "warning: no geography file " << path.string() << std::endl;
    return EMPTY_COLLECTION;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// load_units
/////////////////////////////////////////////////////////////////////////////////////////////////////

namespace
{
  // -1 when the text is not a FeatureCollection
  long count_features(const std::string& text)
  {
    Wt::Json::Object obj;
    try
    {
      Wt::Json::parse(text, obj);
    }
    catch (const Wt::Json::ParseError& ex)
    {
      std::cerr << "warning: " << ex.what() << std::endl;
      return -1;
    }

    if (obj.type("features") != Wt::Json::Type::Array)
    {
      return -1;
    }
    const Wt::Json::Array& features = obj.get("features");
    return static_cast<long>(features.size());
  }

  std::string fetch_with_retry(geography_source_t& source, const county_t& county, granularity_t granularity,
    const retry_policy_t& retry, bool* ok)
  {
    int attempts = retry.max_attempts < 1 ? 1 : retry.max_attempts;
    std::chrono::milliseconds delay = retry.initial_delay;

    for (int attempt = 1; attempt <= attempts; attempt++)
    {
      try
      {
        std::string body = source.fetch(county, granularity);
        *ok = true;
        return body;
      }
      catch (const fusion_error& ex)
      {
        if (ex.kind() != error_kind::network_failure) throw;
        std::cerr << "warning: attempt " << attempt << "/" << attempts << " for county " << county.fips()
          << " failed: " << ex.what() << std::endl;
      }

      if (attempt < attempts)
      {
        std::this_thread::sleep_for(delay);
        delay = std::chrono::milliseconds(static_cast<long long>(delay.count() * retry.multiplier));
      }
    }

    *ok = false;
    return std::string();
  }
}

geographic_layer_t load_units(database_t& db, geography_source_t& source, const std::vector<county_t>& counties,
  granularity_t granularity, const std::string& id_field, const retry_policy_t& retry,
  const std::string& scratch_directory, const std::string& out, units_report_t* report)
{
  geographic_layer_t layer(out, crs_t::wgs84());
  units_report_t local;

  fs::path scratch = scratch_directory.empty() ? fs::temp_directory_path() / "neighborhoods" : fs::path(scratch_directory);
  std::error_code ec;
  fs::create_directories(scratch, ec);
  if (ec)
  {
    throw fusion_error(error_kind::io_failure, "cannot create scratch directory " + scratch.string() + ": " + ec.message());
  }

  db.execute("CREATE OR REPLACE TABLE " + quote_ident(out) + " (id VARCHAR, ord BIGINT, geom GEOMETRY);");

  const std::string name = granularity_name(granularity);

  for (size_t idx = 0; idx < counties.size(); idx++)
  {
    const county_t& county = counties[idx];

    bool ok = false;
    std::string body = fetch_with_retry(source, county, granularity, retry, &ok);
    if (!ok)
    {
      std::cerr << "warning: no " << name << "s for county " << county.fips() << " after " << retry.max_attempts
        << " attempts; its neighborhoods will have no boundary" << std::endl;
      local.missing_counties.push_back(county.fips());
      continue;
    }

    long features = count_features(body);
    if (features <= 0)
    {
      std::cerr << "warning: county " << county.fips() << " returned "
        << (features < 0 ? std::string("an unreadable response") : "no " + name + "s")
        << "; its neighborhoods will have no boundary" << std::endl;
      local.missing_counties.push_back(county.fips());
      continue;
    }

    std::cout << "Number of " << name << "s returned: " << features << std::endl;

    fs::path path = scratch / geojson_file_name(county, granularity);
    {
      std::ofstream file(path, std::ios::binary);
      if (!file.is_open())
      {
        throw fusion_error(error_kind::io_failure, "cannot write " + path.string());
      }
      file << body;
    }

    const std::string read = "ST_Read(" + quote_literal(path.string()) + ")";

    bool has_id = false;
    std::unique_ptr<duckdb::MaterializedQueryResult> described = db.query("DESCRIBE SELECT * FROM " + read + ";");
    duckdb::unique_ptr<duckdb::DataChunk> chunk;
    while ((chunk = described->Fetch()) != nullptr)
    {
      for (size_t row = 0; row < chunk->size(); row++)
      {
        if (chunk->GetValue(0, row).ToString() == id_field) has_id = true;
      }
    }
    if (!has_id)
    {
      throw fusion_error(error_kind::schema_mismatch,
        "geography for county " + county.fips() + " has no '" + id_field + "' field");
    }

    int64_t offset = db.count_rows(out);
    db.execute(
      "INSERT INTO " + quote_ident(out) + "\n"
      "SELECT CAST(" + quote_ident(id_field) + " AS VARCHAR), " + std::to_string(offset) + " + ROW_NUMBER() OVER () - 1, geom\n"
      "FROM " + read + ";");
  }

  local.units = db.count_rows(out);
  std::cout << "Total number of " << name << "s returned: " << local.units << std::endl;

  if (report) *report = local;
  return layer;
}
