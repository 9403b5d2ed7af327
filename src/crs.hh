#ifndef NEIGHBORHOODS_CRS_HH
#define NEIGHBORHOODS_CRS_HH

#include <string>
#include <vector>
#include <utility>
#include "database.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// crs_t
// coordinate reference system; geographic systems are in degrees, planar systems in meters
/////////////////////////////////////////////////////////////////////////////////////////////////////

enum class crs_kind
{
  geographic,
  planar
};

struct crs_t
{
  std::string code;
  crs_kind kind = crs_kind::geographic;

  static crs_t from_code(const std::string& code);
  static crs_t wgs84() { return from_code("EPSG:4326"); }
  static crs_t conus_albers() { return from_code("EPSG:5070"); }

  bool operator==(const crs_t& other) const { return code == other.code; }
  bool operator!=(const crs_t& other) const { return code != other.code; }
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// layer_t
// a table (id VARCHAR, ord BIGINT, geom GEOMETRY) tagged with its reference system;
// ord is the iteration order used for tie-breaking
/////////////////////////////////////////////////////////////////////////////////////////////////////

class layer_t
{
public:
  const std::string& table() const { return table_; }
  const crs_t& crs() const { return crs_; }

protected:
  layer_t(const std::string& table, const crs_t& crs) : table_(table), crs_(crs) {}

  std::string table_;
  crs_t crs_;
};

class geographic_layer_t : public layer_t
{
public:
  geographic_layer_t(const std::string& table, const crs_t& crs);
};

// distance and area are only defined on this type
class planar_layer_t : public layer_t
{
public:
  planar_layer_t(const std::string& table, const crs_t& crs);
};

void require_same_crs(const layer_t& a, const layer_t& b);

geographic_layer_t make_point_layer(database_t& db, const std::string& table, const std::string& id_column,
  const std::string& lng_column, const std::string& lat_column, const crs_t& crs, const std::string& out);

planar_layer_t reproject(database_t& db, const geographic_layer_t& layer, const crs_t& target, const std::string& out);
geographic_layer_t reproject(database_t& db, const planar_layer_t& layer, const crs_t& target, const std::string& out);

std::vector<std::pair<std::string, double>> planar_area(database_t& db, const planar_layer_t& layer);
double planar_distance(database_t& db, const planar_layer_t& a, const std::string& a_id,
  const planar_layer_t& b, const std::string& b_id);

#endif
