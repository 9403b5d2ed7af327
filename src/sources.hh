#ifndef NEIGHBORHOODS_SOURCES_HH
#define NEIGHBORHOODS_SOURCES_HH

#include <string>
#include <vector>
#include "database.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// find_recent_csv
// most recently modified .csv in `directory` whose file name contains `fragment`
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string find_recent_csv(const std::string& directory, const std::string& fragment);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// load_points
// neighborhood point file; county_fips is read as text and zero-padded to five characters
/////////////////////////////////////////////////////////////////////////////////////////////////////

int64_t load_points(database_t& db, const std::string& csv_path, const std::string& out);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// load_metric_table
// keeps key_columns and one value column; an empty value_column selects the last column of the
// file (the newest month of a Zillow export). Returns the name of the value column
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string load_metric_table(database_t& db, const std::string& csv_path, const std::vector<std::string>& key_columns,
  const std::string& value_column, const std::string& out);

#endif
