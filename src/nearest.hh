#ifndef NEIGHBORHOODS_NEAREST_HH
#define NEIGHBORHOODS_NEAREST_HH

#include <string>
#include <vector>
#include "crs.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// assignment_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct assignment_t
{
  std::string query_id;
  std::string reference_id;
  double distance = 0.0;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// nearest_assign
// each query (by centroid) goes to the closest reference; references within `tolerance` of the
// minimum distance are tied and the lowest ord wins. Writes (query_id, reference_id, distance,
// query_ord) to `out` and returns the same rows in query order
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<assignment_t> nearest_assign(database_t& db, const planar_layer_t& queries,
  const planar_layer_t& references, const std::string& out, double tolerance = 1e-9);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// apply_assignment
// layer of the query geometries keyed by their assigned reference id
/////////////////////////////////////////////////////////////////////////////////////////////////////

planar_layer_t apply_assignment(database_t& db, const planar_layer_t& queries,
  const std::string& assignments, const std::string& out);

#endif
