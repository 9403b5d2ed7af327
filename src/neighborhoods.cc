#include "dataset.hh"
#include "errors.hh"
#include "pipeline.hh"
#include "sources.hh"
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
  void usage(const char* program)
  {
    std::cout << "Usage: " << program << " [options]\n"
      << "  --zhvi_directory <dir>       Zillow home value CSVs (zhvi_assets)\n"
      << "  --zori_directory <dir>       Zillow rent CSVs (zori_assets)\n"
      << "  --spatial_directory <dir>    neighborhood point CSVs (spatial_assets)\n"
      << "  --walkscore_file <csv>       walkability scores (./csvs/walkscores.csv)\n"
      << "  --geojson_directory <dir>    GeoJSON output (geojsons)\n"
      << "  --csv_directory <dir>        CSV output (csvs)\n"
      << "  --census_geography <level>   tract, block_group or block (block)\n"
      << "  --planar_crs <code>          reference system for distances and areas (EPSG:5070)\n"
      << "  --geography_directory <dir>  read census units from GeoJSON files instead of TIGERweb\n"
      << "  --cache_directory <dir>      keep TIGERweb responses (geojsons/cache)\n"
      << "  --retries <n>                attempts per county (3)\n"
      << "  --db <path>                  DuckDB database (in memory)\n";
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// main
// ./neighborhoods --census_geography tract --db neighborhoods.duckdb
/////////////////////////////////////////////////////////////////////////////////////////////////////

int main(int argc, char* argv[])
{
  std::map<std::string, std::string> options;
  options["zhvi_directory"] = "zhvi_assets";
  options["zori_directory"] = "zori_assets";
  options["spatial_directory"] = "spatial_assets";
  options["walkscore_file"] = "./csvs/walkscores.csv";
  options["geojson_directory"] = "geojsons";
  options["csv_directory"] = "csvs";
  options["census_geography"] = "block";
  options["planar_crs"] = "EPSG:5070";
  options["geography_directory"] = "";
  options["cache_directory"] = "";
  options["retries"] = "3";
  options["db"] = ":memory:";

  for (int idx = 1; idx < argc; idx++)
  {
    std::string arg = argv[idx];
    if (arg == "-h" || arg == "--help")
    {
      usage(argv[0]);
      return 0;
    }
    if (arg.compare(0, 2, "--") != 0 || options.find(arg.substr(2)) == options.end() || idx + 1 >= argc)
    {
      usage(argv[0]);
      return 1;
    }
    options[arg.substr(2)] = argv[++idx];
  }

  try
  {
    pipeline_config_t config;
    config.granularity = granularity_from_name(options["census_geography"]);
    config.planar_crs = crs_t::from_code(options["planar_crs"]);
    config.retry.max_attempts = std::stoi(options["retries"]);
    config.scratch_directory = (fs::path(options["geojson_directory"]) / "scratch").string();

    database_t db(options["db"]);

    std::string points_csv = find_recent_csv(options["spatial_directory"], "neighborhoods");
    std::string zhvi_neighborhood_csv = find_recent_csv(options["zhvi_directory"], "Neighborhood");
    std::string zori_city_csv = find_recent_csv(options["zori_directory"], "City");
    std::string zhvi_city_csv = find_recent_csv(options["zhvi_directory"], "City");

    source_tables_t sources;
    sources.points = "points";
    sources.neighborhood_values = "zhvi_neighborhood";
    sources.city_rents = "zori_city";
    sources.city_values = "zhvi_city";

    if (load_points(db, points_csv, sources.points) <= 0)
    {
      std::cerr << "error: no neighborhoods in " << points_csv << std::endl;
      return 1;
    }

    sources.neighborhood_value_column = load_metric_table(db, zhvi_neighborhood_csv,
      { "RegionName", "State", "City" }, "", sources.neighborhood_values);
    sources.city_rent_column = load_metric_table(db, zori_city_csv,
      { "RegionName", "State" }, "", sources.city_rents);
    sources.city_value_column = load_metric_table(db, zhvi_city_csv,
      { "RegionName", "State" }, "", sources.city_values);

    std::unique_ptr<geography_source_t> geography;
    if (!options["geography_directory"].empty())
    {
      geography.reset(new directory_source_t(options["geography_directory"]));
    }
    else
    {
      tigerweb_config_t tigerweb;
      tigerweb.cache_directory = options["cache_directory"].empty() ?
        (fs::path(options["geojson_directory"]) / "cache").string() : options["cache_directory"];
      geography.reset(new tigerweb_source_t(tigerweb));
    }

    std::unique_ptr<walkscore_csv_t> walkability;
    if (fs::exists(options["walkscore_file"]))
    {
      walkability.reset(new walkscore_csv_t(db, options["walkscore_file"]));
    }
    else
    {
      std::cerr << "warning: " << options["walkscore_file"] << " not found, walkability scores are skipped" << std::endl;
    }

    fusion_pipeline_t pipeline(db, *geography, walkability.get(), config);
    fused_dataset_t dataset = pipeline.run(sources);

    std::string name = std::string(granularity_name(config.granularity)) + "_neighborhoods";
    std::error_code ec;
    fs::create_directories(options["csv_directory"], ec);
    fs::create_directories(options["geojson_directory"], ec);

    std::cout << "Converting " << dataset.rows << " neighborhoods to CSV..." << std::endl;
    std::string csv_path = (fs::path(options["csv_directory"]) / (name + ".csv")).string();
    if (export_csv(db, dataset, csv_path) < 0)
    {
      std::cerr << "error: cannot write " << csv_path << std::endl;
      return 1;
    }

    std::cout << "Converting " << dataset.rows << " neighborhoods to GeoJSON..." << std::endl;
    std::string geojson_path = (fs::path(options["geojson_directory"]) / (name + ".geojson")).string();
    if (export_geojson(db, dataset, geojson_path) < 0)
    {
      std::cerr << "error: cannot write " << geojson_path << std::endl;
      return 1;
    }

    print_summary(db, dataset);
  }
  catch (const fusion_error& e)
  {
    std::cerr << "error [" << error_kind_name(e.kind()) << "]: " << e.what() << std::endl;
    return 1;
  }
  catch (const std::logic_error& e)
  {
    std::cerr << "error: " << e.what() << std::endl;
    usage(argv[0]);
    return 1;
  }

  return 0;
}
