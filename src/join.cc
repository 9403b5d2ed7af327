#include "join.hh"
#include "errors.hh"
#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>

namespace
{
  struct projected_column
  {
    std::string expr;
    std::string name;
  };

  bool contains(const std::vector<std::string>& list, const std::string& item)
  {
    return std::find(list.begin(), list.end(), item) != list.end();
  }

  void check_keys(const std::string& table, const std::vector<std::string>& columns,
    const std::vector<std::string>& keys)
  {
    for (size_t idx = 0; idx < keys.size(); idx++)
    {
      if (!contains(columns, keys[idx]))
      {
        throw fusion_error(error_kind::schema_mismatch,
          "join key '" + keys[idx] + "' is not a column of '" + table + "'");
      }
    }
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// left_join
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<std::string> left_join(database_t& db, const std::string& left, const std::string& right,
  const join_spec_t& spec, const std::string& out)
{
  if (spec.left_keys.empty() || spec.left_keys.size() != spec.right_keys.size())
  {
    throw fusion_error(error_kind::schema_mismatch,
      "join of '" + left + "' and '" + right + "' needs the same non-zero number of keys on both sides");
  }

  std::vector<std::string> left_columns = db.get_columns(left);
  std::vector<std::string> right_columns = db.get_columns(right);
  check_keys(left, left_columns, spec.left_keys);
  check_keys(right, right_columns, spec.right_keys);

  std::vector<std::string> incoming;
  for (size_t idx = 0; idx < right_columns.size(); idx++)
  {
    if (!contains(spec.right_keys, right_columns[idx])) incoming.push_back(right_columns[idx]);
  }

  std::set<std::string> collisions;
  for (size_t idx = 0; idx < incoming.size(); idx++)
  {
    if (contains(left_columns, incoming[idx])) collisions.insert(incoming[idx]);
  }

  std::vector<projected_column> projection;
  for (size_t idx = 0; idx < left_columns.size(); idx++)
  {
    const std::string& c = left_columns[idx];
    projected_column col;
    col.expr = "l." + quote_ident(c);
    col.name = collisions.count(c) ? c + spec.suffixes.first : c;
    projection.push_back(col);
  }

  size_t first_incoming = projection.size();
  for (size_t idx = 0; idx < incoming.size(); idx++)
  {
    const std::string& c = incoming[idx];
    projected_column col;
    col.expr = "r." + quote_ident(c);
    col.name = collisions.count(c) ? c + spec.suffixes.second : c;
    projection.push_back(col);
  }

  /////////////////////////////////////////////////////////////////////////////////////////////////////
  // rename the incoming value column
  /////////////////////////////////////////////////////////////////////////////////////////////////////

  if (!spec.renamed_value.empty())
  {
    size_t target = projection.size();
    if (!spec.value_column.empty())
    {
      for (size_t idx = 0; idx < incoming.size(); idx++)
      {
        if (incoming[idx] == spec.value_column) target = first_incoming + idx;
      }
      if (target == projection.size())
      {
        throw fusion_error(error_kind::schema_mismatch,
          "value column '" + spec.value_column + "' is not a non-key column of '" + right + "'");
      }
    }
    else
    {
      target = projection.size() - 1;
      std::cerr << "warning: renaming last column '" << projection[target].name << "' of join '"
        << left << "' x '" << right << "' to '" << spec.renamed_value << "'" << std::endl;
    }

    for (size_t idx = 0; idx < projection.size(); idx++)
    {
      if (idx != target && projection[idx].name == spec.renamed_value)
      {
        throw fusion_error(error_kind::schema_mismatch,
          "renamed value column '" + spec.renamed_value + "' already exists in join of '" + left + "'");
      }
    }
    projection[target].name = spec.renamed_value;
  }

  std::string dedup_expr;
  for (size_t idx = 0; idx < projection.size(); idx++)
  {
    if (projection[idx].name == spec.dedup_key) dedup_expr = projection[idx].expr;
  }
  if (dedup_expr.empty())
  {
    throw fusion_error(error_kind::schema_mismatch,
      "de-duplication key '" + spec.dedup_key + "' is not a column of the join of '" + left + "' and '" + right + "'");
  }

  /////////////////////////////////////////////////////////////////////////////////////////////////////
  // build statement
  /////////////////////////////////////////////////////////////////////////////////////////////////////

  const std::string staging = "__join_" + out;

  std::stringstream sql;
  sql << "CREATE OR REPLACE TABLE " << quote_ident(staging) << " AS\nSELECT ";
  for (size_t idx = 0; idx < projection.size(); idx++)
  {
    sql << projection[idx].expr << " AS " << quote_ident(projection[idx].name) << ",\n  ";
  }
  sql << "l.rowid AS __left_row, r.rowid AS __right_row\n"
    << "FROM " << quote_ident(left) << " AS l\nLEFT JOIN " << quote_ident(right) << " AS r ON ";
  for (size_t idx = 0; idx < spec.left_keys.size(); idx++)
  {
    if (idx > 0) sql << " AND ";
    sql << "l." << quote_ident(spec.left_keys[idx]) << " = r." << quote_ident(spec.right_keys[idx]);
  }
  sql << "\nQUALIFY ROW_NUMBER() OVER (PARTITION BY " << dedup_expr << " ORDER BY l.rowid, r.rowid) = 1\n"
    << "ORDER BY __left_row, __right_row;";

  int64_t before = db.count_rows(left);

  db.execute(sql.str());
  db.drop_columns(staging, { "__left_row", "__right_row" });
  db.execute("DROP TABLE IF EXISTS " + quote_ident(out) + ";");
  db.execute("ALTER TABLE " + quote_ident(staging) + " RENAME TO " + quote_ident(out) + ";");

  int64_t after = db.count_rows(out);
  std::cout << "Joined '" << right << "' onto '" << left << "': " << after << " rows";
  if (after < before)
  {
    std::cout << " (" << (before - after) << " duplicate " << spec.dedup_key << " rows dropped)";
  }
  std::cout << std::endl;

  std::vector<std::string> columns;
  for (size_t idx = 0; idx < projection.size(); idx++)
  {
    columns.push_back(projection[idx].name);
  }
  return columns;
}
