#include "nearest.hh"
#include "errors.hh"
#include <iomanip>
#include <iostream>
#include <sstream>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// nearest_assign
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<assignment_t> nearest_assign(database_t& db, const planar_layer_t& queries,
  const planar_layer_t& references, const std::string& out, double tolerance)
{
  require_same_crs(queries, references);

  if (db.count_rows(references.table()) == 0)
  {
    throw fusion_error(error_kind::no_reference_geometry,
      "no reference geometry in '" + references.table() + "' to assign '" + queries.table() + "' against");
  }

  std::stringstream tol;
  tol << std::setprecision(17) << tolerance;

  // per query: every reference within tolerance of the closest one, smallest ord first
  db.execute(
    "CREATE OR REPLACE TABLE " + quote_ident(out) + " AS\n"
    "WITH candidates AS (\n"
    "  SELECT q.id AS query_id, q.ord AS query_ord, r.id AS reference_id, r.ord AS reference_ord,\n"
    "    ST_Distance(ST_Centroid(q.geom), r.geom) AS distance\n"
    "  FROM " + quote_ident(queries.table()) + " q CROSS JOIN " + quote_ident(references.table()) + " r\n"
    "),\n"
    "closest AS (\n"
    "  SELECT query_ord, MIN(distance) AS min_distance FROM candidates GROUP BY query_ord\n"
    ")\n"
    "SELECT ANY_VALUE(c.query_id) AS query_id,\n"
    "  arg_min(c.reference_id, c.reference_ord) AS reference_id,\n"
    "  MIN(c.distance) AS distance,\n"
    "  c.query_ord AS query_ord\n"
    "FROM candidates c JOIN closest m ON c.query_ord = m.query_ord\n"
    "WHERE c.distance <= m.min_distance + " + tol.str() + "\n"
    "GROUP BY c.query_ord\n"
    "ORDER BY c.query_ord;");

  std::vector<assignment_t> assignments;

  std::unique_ptr<duckdb::MaterializedQueryResult> result = db.query(
    "SELECT query_id, reference_id, distance FROM " + quote_ident(out) + " ORDER BY query_ord;");

  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = result->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      assignment_t a;
      a.query_id = chunk->GetValue(0, idx).ToString();
      a.reference_id = chunk->GetValue(1, idx).ToString();
      a.distance = chunk->GetValue(2, idx).GetValue<double>();
      assignments.push_back(a);
    }
  }

  std::cout << "Assigned " << assignments.size() << " of " << db.count_rows(queries.table())
    << " geographic units to " << db.count_rows(references.table()) << " neighborhoods" << std::endl;

  return assignments;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// apply_assignment
/////////////////////////////////////////////////////////////////////////////////////////////////////

planar_layer_t apply_assignment(database_t& db, const planar_layer_t& queries,
  const std::string& assignments, const std::string& out)
{
  planar_layer_t layer(out, queries.crs());

  std::unique_ptr<duckdb::MaterializedQueryResult> orphans = db.query(
    "SELECT q.id FROM " + quote_ident(queries.table()) + " q\n"
    "LEFT JOIN " + quote_ident(assignments) + " a ON q.ord = a.query_ord\n"
    "WHERE a.reference_id IS NULL ORDER BY q.ord LIMIT 1;");
  duckdb::unique_ptr<duckdb::DataChunk> chunk = orphans->Fetch();
  if (chunk && chunk->size() > 0)
  {
    throw fusion_error(error_kind::unmatched_boundary,
      "geographic unit '" + chunk->GetValue(0, 0).ToString() + "' has no assigned neighborhood");
  }

  db.execute(
    "CREATE OR REPLACE TABLE " + quote_ident(out) + " AS\n"
    "SELECT a.reference_id AS id, q.ord AS ord, q.geom AS geom\n"
    "FROM " + quote_ident(queries.table()) + " q\n"
    "JOIN " + quote_ident(assignments) + " a ON q.ord = a.query_ord\n"
    "ORDER BY q.ord;");

  return layer;
}
