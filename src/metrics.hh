#ifndef NEIGHBORHOODS_METRICS_HH
#define NEIGHBORHOODS_METRICS_HH

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "database.hh"

const double SQUARE_METERS_PER_SQUARE_MILE = 2589988.110336;

/////////////////////////////////////////////////////////////////////////////////////////////////////
// derived metrics; a missing input or a zero divisor gives a missing result
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::optional<double> rent_to_value_ratio(std::optional<double> rent_index, std::optional<double> value_index);
double area_sq_mi(double square_meters);
std::optional<int64_t> parse_population(const std::optional<std::string>& text);
std::optional<double> pop_density(std::optional<int64_t> population, std::optional<double> area);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// derive_ratio
// writes rent_to_value_ratio of two columns of `table` into out_column
/////////////////////////////////////////////////////////////////////////////////////////////////////

void derive_ratio(database_t& db, const std::string& table, const std::string& key_column,
  const std::string& rent_column, const std::string& value_column, const std::string& out_column);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// derive_area_and_density
// areas are square meters keyed like key_column; replaces population with its parsed value and
// writes area_sq_mi and pop_density. Returns the number of population values that failed to parse
/////////////////////////////////////////////////////////////////////////////////////////////////////

int derive_area_and_density(database_t& db, const std::string& table, const std::string& key_column,
  const std::map<std::string, double>& areas, const std::string& population_column);

#endif
