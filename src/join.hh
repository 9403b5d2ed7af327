#ifndef NEIGHBORHOODS_JOIN_HH
#define NEIGHBORHOODS_JOIN_HH

#include <string>
#include <vector>
#include <utility>
#include "database.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// join_spec_t
// value_column names the incoming column of the right relation before suffixing;
// renamed_value without value_column renames the last result column (deprecated)
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct join_spec_t
{
  std::vector<std::string> left_keys;
  std::vector<std::string> right_keys;
  std::pair<std::string, std::string> suffixes = std::make_pair(std::string("_left"), std::string("_right"));
  std::string value_column;
  std::string renamed_value;
  std::string dedup_key = "neighborhood";
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// left_join
// left join of two tables into `out`, dropping right keys and keeping the first row per dedup_key;
// returns the columns of `out`
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<std::string> left_join(database_t& db, const std::string& left, const std::string& right,
  const join_spec_t& spec, const std::string& out);

#endif
