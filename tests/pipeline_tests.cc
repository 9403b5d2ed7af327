#include "test_harness.hh"
#include "dataset.hh"
#include "metrics.hh"
#include "pipeline.hh"
#include "sources.hh"
#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <algorithm>
#include <sstream>

namespace
{
  // GeoJSON square around (lng, lat)
  std::string unit_feature(const std::string& geoid, double lng, double lat, double half)
  {
    std::stringstream s;
    s.precision(10);
    s << "{\"type\":\"Feature\",\"properties\":{\"GEOID\":\"" << geoid << "\",\"STATE\":\"53\",\"COUNTY\":\"033\"},"
      << "\"geometry\":{\"type\":\"Polygon\",\"coordinates\":[["
      << "[" << lng - half << "," << lat - half << "],"
      << "[" << lng + half << "," << lat - half << "],"
      << "[" << lng + half << "," << lat + half << "],"
      << "[" << lng - half << "," << lat + half << "],"
      << "[" << lng - half << "," << lat - half << "]]]}}";
    return s.str();
  }

  std::string collection(const std::vector<std::string>& features)
  {
    std::string text = "{\"type\":\"FeatureCollection\",\"features\":[";
    for (size_t idx = 0; idx < features.size(); idx++)
    {
      if (idx > 0) text += ",";
      text += features[idx];
    }
    return text + "]}";
  }

  struct fixture_t
  {
    fs::path root;
    fs::path spatial;
    fs::path zhvi;
    fs::path zori;
    fs::path geography;
    fs::path scratch;
  };

  // Fremont and Wallingford in King County; two blocks lie next to Fremont, one next to Wallingford
  fixture_t make_fixture(const std::string& extra_points = std::string())
  {
    fixture_t f;
    f.root = MakeTempPath("neighborhoods_pipeline");
    f.spatial = f.root / "spatial_assets";
    f.zhvi = f.root / "zhvi_assets";
    f.zori = f.root / "zori_assets";
    f.geography = f.root / "geography";
    f.scratch = f.root / "scratch";
    fs::create_directories(f.spatial);
    fs::create_directories(f.zhvi);
    fs::create_directories(f.zori);
    fs::create_directories(f.geography);

    WriteText(f.spatial / "usneighborhoods.csv",
      "id,neighborhood,neighborhood_ascii,city_name,state_id,county_fips,lat,lng,source\n"
      "1,Fremont,Fremont,Seattle,WA,53033,47.65,-122.35,osm\n"
      "2,Wallingford,Wallingford,Seattle,WA,53033,47.65,-122.30,osm\n" + extra_points);

    WriteText(f.zhvi / "Neighborhood_zhvi_uc_sfrcondo.csv",
      "RegionID,RegionName,State,City,2024-05-31,2024-06-30\n"
      "10,Fremont,WA,Seattle,790000,800000\n"
      "11,Wallingford,WA,Seattle,880000,900000\n"
      "12,Fremont,CA,Fremont,1500000,1510000\n");

    WriteText(f.zhvi / "City_zhvi_uc_sfrcondo.csv",
      "RegionID,RegionName,State,2024-05-31,2024-06-30\n"
      "20,Seattle,WA,840000,850000\n"
      "21,Portland,OR,540000,550000\n");

    WriteText(f.zori / "City_zori_uc_sfrcondomfr.csv",
      "RegionID,RegionName,State,2024-05-31,2024-06-30\n"
      "30,Seattle,WA,2080,2125\n");

    std::vector<std::string> units;
    units.push_back(unit_feature("530330001001", -122.352, 47.65, 0.0025));
    units.push_back(unit_feature("530330001002", -122.347, 47.65, 0.0025));
    units.push_back(unit_feature("530330002001", -122.300, 47.65, 0.0025));
    WriteText(f.geography / "block_53033.geojson", collection(units));

    return f;
  }

  source_tables_t load_sources(database_t& db, const fixture_t& f)
  {
    source_tables_t sources;
    sources.points = "points";
    sources.neighborhood_values = "zhvi_neighborhood";
    sources.city_rents = "zori_city";
    sources.city_values = "zhvi_city";

    load_points(db, find_recent_csv(f.spatial.string(), "neighborhoods"), sources.points);
    sources.neighborhood_value_column = load_metric_table(db, find_recent_csv(f.zhvi.string(), "Neighborhood"),
      { "RegionName", "State", "City" }, "", sources.neighborhood_values);
    sources.city_rent_column = load_metric_table(db, find_recent_csv(f.zori.string(), "City"),
      { "RegionName", "State" }, "", sources.city_rents);
    sources.city_value_column = load_metric_table(db, find_recent_csv(f.zhvi.string(), "City"),
      { "RegionName", "State" }, "", sources.city_values);
    return sources;
  }

  pipeline_config_t make_config(const fixture_t& f)
  {
    pipeline_config_t config;
    config.scratch_directory = f.scratch.string();
    config.retry.initial_delay = std::chrono::milliseconds(1);
    return config;
  }

  size_t count_lines(const std::string& text)
  {
    return static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
  }

  // network failures for the first `failures` calls, then an empty collection
  class flaky_source_t : public geography_source_t
  {
  public:
    explicit flaky_source_t(int failures) : failures(failures) {}

    std::string fetch(const county_t& county, granularity_t) override
    {
      calls++;
      if (calls <= failures)
      {
        throw fusion_error(error_kind::network_failure, "connection reset for county " + county.fips());
      }
      return collection(std::vector<std::string>());
    }

    int calls = 0;

  private:
    int failures;
  };
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// sources
/////////////////////////////////////////////////////////////////////////////////////////////////////

static void TestSources()
{
  fs::path dir = MakeTempPath("neighborhoods_sources");
  fs::create_directories(dir);
  WriteText(dir / "points.csv", "id,neighborhood,county_fips,lat,lng\n1,Echo Park,6037,34.07,-118.26\n");
  WriteText(dir / "notes.txt", "not a csv");

  EXPECT_EQ(fs::path(find_recent_csv(dir.string(), "points")).filename().string(), std::string("points.csv"));
  EXPECT_FUSION_ERROR(find_recent_csv(dir.string(), "Neighborhood"), error_kind::io_failure);
  EXPECT_FUSION_ERROR(find_recent_csv((dir / "missing").string(), "points"), error_kind::io_failure);

  database_t db;
  EXPECT_EQ(load_points(db, (dir / "points.csv").string(), "points"), static_cast<int64_t>(1));

  std::unique_ptr<duckdb::MaterializedQueryResult> result = db.query("SELECT county_fips FROM points;");
  duckdb::unique_ptr<duckdb::DataChunk> chunk = result->Fetch();
  ASSERT_TRUE(chunk && chunk->size() == 1);
  EXPECT_EQ(chunk->GetValue(0, 0).ToString(), std::string("06037"));

  WriteText(dir / "nofips.csv", "id,neighborhood,lat,lng\n1,Echo Park,34.07,-118.26\n");
  EXPECT_FUSION_ERROR(load_points(db, (dir / "nofips.csv").string(), "bad"), error_kind::schema_mismatch);

  WriteText(dir / "City_zori.csv", "RegionName,State,2024-05-31,2024-06-30\nLos Angeles,CA,2800,2850\n");
  EXPECT_EQ(load_metric_table(db, (dir / "City_zori.csv").string(), { "RegionName", "State" }, "", "zori"),
    std::string("2024-06-30"));
  EXPECT_EQ(db.get_columns("zori").size(), static_cast<size_t>(3));
  EXPECT_FUSION_ERROR(load_metric_table(db, (dir / "City_zori.csv").string(), { "RegionName", "StateName" }, "", "zori"),
    error_kind::schema_mismatch);

  fs::remove_all(dir);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// geography
/////////////////////////////////////////////////////////////////////////////////////////////////////

static void TestCountyAndGranularity()
{
  county_t county = county_t::from_fips("6037");
  EXPECT_EQ(county.state_fips, std::string("06"));
  EXPECT_EQ(county.county_fips, std::string("037"));
  EXPECT_EQ(county.fips(), std::string("06037"));
  EXPECT_FUSION_ERROR(county_t::from_fips("0603A"), error_kind::schema_mismatch);

  EXPECT_TRUE(granularity_from_name("block_group") == granularity_t::block_group);
  EXPECT_EQ(std::string(granularity_name(granularity_t::tract)), std::string("tract"));
  EXPECT_THROW(granularity_from_name("county"), std::invalid_argument);
  EXPECT_EQ(geojson_file_name(county, granularity_t::block), std::string("block_06037.geojson"));

  tigerweb_source_t tigerweb{ tigerweb_config_t() };
  std::string url = tigerweb.query_url(county, granularity_t::tract);
  EXPECT_TRUE(url.find("/MapServer/0/query?where=") != std::string::npos);
  EXPECT_TRUE(url.find("037") != std::string::npos);
  EXPECT_TRUE(url.find("&f=geojson") != std::string::npos);
  EXPECT_TRUE(tigerweb.query_url(county, granularity_t::block).find("/MapServer/2/query") != std::string::npos);
}

static void TestMissingCountyDegrades()
{
  fixture_t f = make_fixture();
  directory_source_t source(f.geography.string());
  database_t db;

  std::vector<county_t> counties = { county_t::from_fips("53033"), county_t::from_fips("53061") };
  units_report_t report;
  retry_policy_t retry;
  retry.initial_delay = std::chrono::milliseconds(1);

  geographic_layer_t units = load_units(db, source, counties, granularity_t::block, "GEOID", retry,
    f.scratch.string(), "units", &report);

  EXPECT_EQ(db.count_rows(units.table()), static_cast<int64_t>(3));
  EXPECT_EQ(report.units, static_cast<int64_t>(3));
  ASSERT_TRUE(report.missing_counties.size() == 1);
  EXPECT_EQ(report.missing_counties[0], std::string("53061"));

  EXPECT_FUSION_ERROR(load_units(db, source, { county_t::from_fips("53033") }, granularity_t::block, "GEOID20",
    retry, f.scratch.string(), "units", nullptr), error_kind::schema_mismatch);

  fs::remove_all(f.root);
}

static void TestRetriesThenDegrades()
{
  database_t db;
  fs::path scratch = MakeTempPath("neighborhoods_retry");

  retry_policy_t retry;
  retry.max_attempts = 3;
  retry.initial_delay = std::chrono::milliseconds(1);

  flaky_source_t recovers(2);
  units_report_t report;
  load_units(db, recovers, { county_t::from_fips("53033") }, granularity_t::tract, "GEOID", retry,
    scratch.string(), "units", &report);
  EXPECT_EQ(recovers.calls, 3);
  // the third attempt succeeds but has no tracts
  EXPECT_EQ(report.missing_counties.size(), static_cast<size_t>(1));

  flaky_source_t broken(10);
  load_units(db, broken, { county_t::from_fips("53033") }, granularity_t::tract, "GEOID", retry,
    scratch.string(), "units", &report);
  EXPECT_EQ(broken.calls, 3);
  EXPECT_EQ(report.units, static_cast<int64_t>(0));
  EXPECT_EQ(report.missing_counties.size(), static_cast<size_t>(1));

  fs::remove_all(scratch);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// pipeline
/////////////////////////////////////////////////////////////////////////////////////////////////////

static void TestEndToEnd()
{
  fixture_t f = make_fixture();
  WriteText(f.root / "walkscores.csv",
    "city_rank,neighborhood,walk_score,transit_score,bike_score,population,city_name,state_id\n"
    "1,Fremont,93,62,88,\"12,345\",Seattle,WA\n"
    "2,Belltown,98,96,79,\"11,961\",Seattle,WA\n");

  database_t db;
  source_tables_t sources = load_sources(db, f);
  directory_source_t geography(f.geography.string());
  walkscore_csv_t walkability(db, (f.root / "walkscores.csv").string());

  fusion_pipeline_t pipeline(db, geography, &walkability, make_config(f));
  fused_dataset_t dataset = pipeline.run(sources);

  EXPECT_EQ(dataset.rows, static_cast<int64_t>(2));
  EXPECT_TRUE(dataset.missing_counties.empty());
  EXPECT_EQ(db.count_rows("boundaries"), static_cast<int64_t>(2));
  EXPECT_FALSE(std::find(dataset.columns.begin(), dataset.columns.end(), "neighborhood_ascii") != dataset.columns.end());
  EXPECT_FALSE(std::find(dataset.columns.begin(), dataset.columns.end(), "lat") != dataset.columns.end());

  std::vector<neighborhood_record> records = get_neighborhoods(db, dataset);
  ASSERT_TRUE(records.size() == 2);

  const neighborhood_record& fremont = records[0];
  const neighborhood_record& wallingford = records[1];
  EXPECT_EQ(fremont.neighborhood, std::string("Fremont"));
  EXPECT_EQ(wallingford.neighborhood, std::string("Wallingford"));
  EXPECT_TRUE(fremont.wkt.find("POLYGON") != std::string::npos);
  EXPECT_FALSE(wallingford.geojson.empty());

  ASSERT_TRUE(fremont.neighborhood_zhvi.has_value());
  EXPECT_NEAR(*fremont.neighborhood_zhvi, 800000.0, 1e-6);
  ASSERT_TRUE(fremont.city_rtv.has_value());
  EXPECT_NEAR(*fremont.city_rtv, 2125.0 / 850000.0 * 100.0, 1e-9);

  ASSERT_TRUE(fremont.population.has_value());
  EXPECT_EQ(*fremont.population, static_cast<int64_t>(12345));
  ASSERT_TRUE(fremont.walk_score.has_value());
  EXPECT_NEAR(*fremont.walk_score, 93.0, 1e-9);
  EXPECT_FALSE(wallingford.walk_score.has_value());
  EXPECT_FALSE(wallingford.population.has_value());
  EXPECT_FALSE(wallingford.pop_density.has_value());

  // two blocks make up Fremont, one Wallingford, and no area is lost
  ASSERT_TRUE(fremont.area_sq_mi.has_value() && wallingford.area_sq_mi.has_value());
  std::unique_ptr<duckdb::MaterializedQueryResult> result = db.query("SELECT SUM(ST_Area(geom)) FROM units_planar;");
  duckdb::unique_ptr<duckdb::DataChunk> chunk = result->Fetch();
  ASSERT_TRUE(chunk && chunk->size() == 1);
  double unit_sq_mi = area_sq_mi(chunk->GetValue(0, 0).GetValue<double>());
  EXPECT_NEAR(*fremont.area_sq_mi + *wallingford.area_sq_mi, unit_sq_mi, 1e-6 * unit_sq_mi);
  EXPECT_NEAR(*fremont.area_sq_mi, 2.0 * *wallingford.area_sq_mi, 0.01 * *fremont.area_sq_mi);

  ASSERT_TRUE(fremont.pop_density.has_value());
  EXPECT_NEAR(*fremont.pop_density, 12345.0 / *fremont.area_sq_mi, 1e-6);

  fs::path csv_path = f.root / "block_neighborhoods.csv";
  EXPECT_EQ(export_csv(db, dataset, csv_path.string()), 2);
  std::string csv = ReadText(csv_path);
  EXPECT_EQ(count_lines(csv), static_cast<size_t>(3));
  EXPECT_TRUE(csv.find("geometry") != std::string::npos);

  fs::path geojson_path = f.root / "block_neighborhoods.geojson";
  EXPECT_EQ(export_geojson(db, dataset, geojson_path.string()), 2);
  Wt::Json::Object geojson;
  Wt::Json::parse(ReadText(geojson_path), geojson);
  const Wt::Json::Array& features = geojson.get("features");
  ASSERT_TRUE(features.size() == 2);
  const Wt::Json::Object& first = features[0];
  const Wt::Json::Object& properties = first.get("properties");
  EXPECT_EQ(static_cast<std::string>(properties.get("neighborhood")), std::string("Fremont"));
  EXPECT_TRUE(properties.get("walk_score").type() == Wt::Json::Type::Number);
  const Wt::Json::Object& second = features[1];
  const Wt::Json::Object& second_properties = second.get("properties");
  EXPECT_TRUE(second_properties.get("walk_score").isNull());

  EXPECT_EQ(export_csv(db, dataset, (f.root / "missing" / "out.csv").string()), -1);

  fs::remove_all(f.root);
}

static void TestNeighborhoodWithoutUnits()
{
  // far to the east of every block
  fixture_t f = make_fixture("3,Redmond Downtown,Redmond Downtown,Redmond,WA,53033,47.67,-122.12,osm\n");

  database_t db;
  source_tables_t sources = load_sources(db, f);
  directory_source_t geography(f.geography.string());

  fusion_pipeline_t pipeline(db, geography, nullptr, make_config(f));
  EXPECT_FUSION_ERROR(pipeline.run(sources), error_kind::unmatched_boundary);

  fs::remove_all(f.root);
}

static void TestPlanarCrsIsRequired()
{
  fixture_t f = make_fixture();
  database_t db;
  directory_source_t geography(f.geography.string());

  pipeline_config_t config = make_config(f);
  config.planar_crs = crs_t::from_code("EPSG:4269");
  EXPECT_THROW(fusion_pipeline_t(db, geography, nullptr, config), std::invalid_argument);

  fs::remove_all(f.root);
}

int main()
{
  TestSources();
  TestCountyAndGranularity();
  TestMissingCountyDegrades();
  TestRetriesThenDegrades();
  TestEndToEnd();
  TestNeighborhoodWithoutUnits();
  TestPlanarCrsIsRequired();

  return Finish("neighborhoods_pipeline_tests");
}
