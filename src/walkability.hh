#ifndef NEIGHBORHOODS_WALKABILITY_HH
#define NEIGHBORHOODS_WALKABILITY_HH

#include <string>
#include <vector>
#include <utility>
#include "database.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// walkscore_row
// one neighborhood of a city ranking; population is kept as published ("12,345")
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct walkscore_row
{
  std::string city_rank;
  std::string neighborhood;
  std::string walk_score;
  std::string transit_score;
  std::string bike_score;
  std::string population;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// walkability_source_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

class walkability_source_t
{
public:
  virtual ~walkability_source_t() {}
  virtual std::vector<walkscore_row> fetch(const std::string& city_name, const std::string& state_id) = 0;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// walkscore_csv_t
// answers from a walkscores.csv with columns city_rank, neighborhood, walk_score, transit_score,
// bike_score, population, city_name, state_id
/////////////////////////////////////////////////////////////////////////////////////////////////////

class walkscore_csv_t : public walkability_source_t
{
public:
  walkscore_csv_t(database_t& db, const std::string& csv_path);
  std::vector<walkscore_row> fetch(const std::string& city_name, const std::string& state_id) override;

private:
  database_t& db;
  std::string table;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// collect_walkscores
// fetches every distinct (city_name, state_id) of `records` into table `out`; a failing city is
// logged and contributes no rows
/////////////////////////////////////////////////////////////////////////////////////////////////////

int64_t collect_walkscores(database_t& db, walkability_source_t& source, const std::string& records,
  const std::string& out);

#endif
