#include "test_harness.hh"
#include "metrics.hh"
#include <map>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// pure functions
/////////////////////////////////////////////////////////////////////////////////////////////////////

static void TestRentToValueRatio()
{
  std::optional<double> ratio = rent_to_value_ratio(2000.0, 400000.0);
  ASSERT_TRUE(ratio.has_value());
  EXPECT_NEAR(*ratio, 0.5, 1e-12);

  EXPECT_FALSE(rent_to_value_ratio(2000.0, 0.0).has_value());
  EXPECT_FALSE(rent_to_value_ratio(std::nullopt, 400000.0).has_value());
  EXPECT_FALSE(rent_to_value_ratio(2000.0, std::nullopt).has_value());
}

static void TestAreaConversion()
{
  EXPECT_NEAR(area_sq_mi(SQUARE_METERS_PER_SQUARE_MILE), 1.0, 1e-12);
  EXPECT_NEAR(area_sq_mi(1609.344 * 1609.344), 1.0, 1e-9);
  EXPECT_NEAR(area_sq_mi(0.0), 0.0, 1e-12);
}

static void TestParsePopulation()
{
  EXPECT_EQ(parse_population(std::string("12,345")), std::optional<int64_t>(12345));
  EXPECT_EQ(parse_population(std::string(" 1,234,567 ")), std::optional<int64_t>(1234567));
  EXPECT_EQ(parse_population(std::string("0")), std::optional<int64_t>(0));

  EXPECT_FALSE(parse_population(std::string("")).has_value());
  EXPECT_FALSE(parse_population(std::string("   ")).has_value());
  EXPECT_FALSE(parse_population(std::string("NaN")).has_value());
  EXPECT_FALSE(parse_population(std::nullopt).has_value());
  EXPECT_FALSE(parse_population(std::string("about 300")).has_value());
  EXPECT_FALSE(parse_population(std::string(",")).has_value());
}

static void TestPopDensity()
{
  std::optional<double> density = pop_density(static_cast<int64_t>(5000), 2.5);
  ASSERT_TRUE(density.has_value());
  EXPECT_NEAR(*density, 2000.0, 1e-9);

  EXPECT_FALSE(pop_density(std::nullopt, 2.5).has_value());
  EXPECT_FALSE(pop_density(static_cast<int64_t>(5000), std::nullopt).has_value());
  EXPECT_FALSE(pop_density(static_cast<int64_t>(5000), 0.0).has_value());
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// table write-back
/////////////////////////////////////////////////////////////////////////////////////////////////////

static void TestDeriveRatioColumn()
{
  database_t db;
  db.execute(
    "CREATE TABLE n AS SELECT * FROM (VALUES "
    "('1', 2000.0, 400000.0), ('2', 1500.0, 0.0), ('3', NULL, 300000.0)) t(id, city_ZORI, city_ZHVI);");

  derive_ratio(db, "n", "id", "city_ZORI", "city_ZHVI", "city_RTV");

  std::unique_ptr<duckdb::MaterializedQueryResult> result = db.query("SELECT city_RTV FROM n ORDER BY id;");
  duckdb::unique_ptr<duckdb::DataChunk> chunk = result->Fetch();
  ASSERT_TRUE(chunk && chunk->size() == 3);
  EXPECT_NEAR(chunk->GetValue(0, 0).GetValue<double>(), 0.5, 1e-12);
  EXPECT_TRUE(chunk->GetValue(0, 1).IsNull());
  EXPECT_TRUE(chunk->GetValue(0, 2).IsNull());

  EXPECT_FUSION_ERROR(derive_ratio(db, "n", "id", "city_ZORI", "metro_ZHVI", "metro_RTV"), error_kind::schema_mismatch);
}

static void TestDeriveAreaAndDensity()
{
  database_t db;
  db.execute(
    "CREATE TABLE n AS SELECT * FROM (VALUES "
    "('a', '12,345'), ('b', ''), ('c', 'lots'), ('d', '100')) t(id, population);");

  std::map<std::string, double> areas;
  areas["a"] = 2.0 * SQUARE_METERS_PER_SQUARE_MILE;
  areas["b"] = SQUARE_METERS_PER_SQUARE_MILE;
  areas["c"] = SQUARE_METERS_PER_SQUARE_MILE;

  int failures = derive_area_and_density(db, "n", "id", areas, "population");
  EXPECT_EQ(failures, 1);

  std::unique_ptr<duckdb::MaterializedQueryResult> result = db.query(
    "SELECT population, area_sq_mi, pop_density FROM n ORDER BY id;");
  duckdb::unique_ptr<duckdb::DataChunk> chunk = result->Fetch();
  ASSERT_TRUE(chunk && chunk->size() == 4);

  EXPECT_EQ(chunk->GetValue(0, 0).GetValue<int64_t>(), static_cast<int64_t>(12345));
  EXPECT_NEAR(chunk->GetValue(1, 0).GetValue<double>(), 2.0, 1e-9);
  EXPECT_NEAR(chunk->GetValue(2, 0).GetValue<double>(), 6172.5, 1e-6);

  EXPECT_TRUE(chunk->GetValue(0, 1).IsNull());
  EXPECT_NEAR(chunk->GetValue(1, 1).GetValue<double>(), 1.0, 1e-9);
  EXPECT_TRUE(chunk->GetValue(2, 1).IsNull());

  EXPECT_TRUE(chunk->GetValue(0, 2).IsNull());
  EXPECT_TRUE(chunk->GetValue(2, 2).IsNull());

  // no boundary area for d
  EXPECT_EQ(chunk->GetValue(0, 3).GetValue<int64_t>(), static_cast<int64_t>(100));
  EXPECT_TRUE(chunk->GetValue(1, 3).IsNull());
  EXPECT_TRUE(chunk->GetValue(2, 3).IsNull());
}

int main()
{
  TestRentToValueRatio();
  TestAreaConversion();
  TestParsePopulation();
  TestPopDensity();
  TestDeriveRatioColumn();
  TestDeriveAreaAndDensity();

  return Finish("neighborhoods_metrics_tests");
}
