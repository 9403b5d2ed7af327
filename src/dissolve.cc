#include "dissolve.hh"
#include <iostream>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// dissolve
/////////////////////////////////////////////////////////////////////////////////////////////////////

dissolve_result_t dissolve(database_t& db, const planar_layer_t& units, const std::string& out, double epsilon)
{
  dissolve_result_t result = { planar_layer_t(out, units.crs()), {}, {} };

  const std::string stats = "__dissolve_" + out;

  // groups are ordered by their first unit; ord is renumbered from 0
  db.execute(
    "CREATE OR REPLACE TABLE " + quote_ident(stats) + " AS\n"
    "SELECT id,\n"
    "  ROW_NUMBER() OVER (ORDER BY MIN(ord)) - 1 AS ord,\n"
    "  CASE WHEN COUNT(*) = 1 THEN FIRST(geom) ELSE ST_Union_Agg(geom) END AS geom,\n"
    "  COUNT(*) AS unit_count,\n"
    "  SUM(ST_Area(geom)) AS unit_area\n"
    "FROM " + quote_ident(units.table()) + "\n"
    "GROUP BY id\n"
    "ORDER BY ord;");

  db.execute(
    "CREATE OR REPLACE TABLE " + quote_ident(out) + " AS\n"
    "SELECT id, ord, geom FROM " + quote_ident(stats) + " ORDER BY ord;");

  std::unique_ptr<duckdb::MaterializedQueryResult> rows = db.query(
    "SELECT id, unit_count, unit_area, ST_Area(geom) FROM " + quote_ident(stats) + " ORDER BY ord;");

  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = rows->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      std::string id = chunk->GetValue(0, idx).ToString();
      int64_t count = chunk->GetValue(1, idx).GetValue<int64_t>();
      double unit_area = chunk->GetValue(2, idx).GetValue<double>();
      double union_area = chunk->GetValue(3, idx).GetValue<double>();

      result.unit_counts.push_back(std::make_pair(id, count));

      if (unit_area - union_area > epsilon + 1e-9 * unit_area)
      {
        group_overlap_t overlap;
        overlap.group_id = id;
        overlap.unit_area = unit_area;
        overlap.union_area = union_area;
        result.overlaps.push_back(overlap);
        std::cerr << "warning: units of '" << id << "' overlap by " << (unit_area - union_area)
          << " square units; upstream geometry may be corrupt" << std::endl;
      }
    }
  }

  db.execute("DROP TABLE " + quote_ident(stats) + ";");

  std::cout << "Dissolved " << db.count_rows(units.table()) << " units into "
    << result.unit_counts.size() << " boundaries" << std::endl;

  return result;
}
