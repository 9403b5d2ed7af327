#ifndef NEIGHBORHOODS_DISSOLVE_HH
#define NEIGHBORHOODS_DISSOLVE_HH

#include <string>
#include <vector>
#include "crs.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// dissolve_result_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct group_overlap_t
{
  std::string group_id;
  double unit_area = 0.0;
  double union_area = 0.0;
};

struct dissolve_result_t
{
  planar_layer_t boundaries;
  std::vector<std::pair<std::string, int64_t>> unit_counts;
  std::vector<group_overlap_t> overlaps;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// dissolve
// one (multi)polygon per id of `units`; a group whose unit areas exceed its union area by more
// than epsilon (plus a relative 1e-9) is reported as overlapping
/////////////////////////////////////////////////////////////////////////////////////////////////////

dissolve_result_t dissolve(database_t& db, const planar_layer_t& units, const std::string& out, double epsilon = 1.0);

#endif
