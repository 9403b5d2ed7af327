#ifndef NEIGHBORHOODS_ERRORS_HH
#define NEIGHBORHOODS_ERRORS_HH

#include <stdexcept>
#include <string>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// error_kind
/////////////////////////////////////////////////////////////////////////////////////////////////////

enum class error_kind
{
  schema_mismatch,
  no_reference_geometry,
  unmatched_boundary,
  numeric_coercion_failure,
  network_failure,
  query_failure,
  io_failure
};

const char* error_kind_name(error_kind kind);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// fusion_error
/////////////////////////////////////////////////////////////////////////////////////////////////////

class fusion_error : public std::runtime_error
{
public:
  fusion_error(error_kind kind, const std::string& message);
  error_kind kind() const { return kind_; }

private:
  error_kind kind_;
};

#endif
