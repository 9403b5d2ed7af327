#include "errors.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// error_kind_name
/////////////////////////////////////////////////////////////////////////////////////////////////////

const char* error_kind_name(error_kind kind)
{
  switch (kind)
  {
  case error_kind::schema_mismatch: return "schema_mismatch";
  case error_kind::no_reference_geometry: return "no_reference_geometry";
  case error_kind::unmatched_boundary: return "unmatched_boundary";
  case error_kind::numeric_coercion_failure: return "numeric_coercion_failure";
  case error_kind::network_failure: return "network_failure";
  case error_kind::query_failure: return "query_failure";
  case error_kind::io_failure: return "io_failure";
  }
  return "unknown";
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// fusion_error
/////////////////////////////////////////////////////////////////////////////////////////////////////

fusion_error::fusion_error(error_kind kind, const std::string& message)
  : std::runtime_error(message), kind_(kind)
{
}
