// =============================================================================
// fixrec - Type Tree Inspector
// Version: 1.0.0
// =============================================================================
// Diagnostic rendering of a record schema: field names, shapes and layout
// tags, nested records indented below their parent field.
// =============================================================================

#ifndef FIXREC_SCHEMA_INSPECTOR_HPP
#define FIXREC_SCHEMA_INSPECTOR_HPP

#include <fixrec/schema/shape.hpp>
#include <ostream>

namespace fixrec {
namespace schema {

[[nodiscard]] String describe_shape(const FieldShape& shape);
[[nodiscard]] String describe_schema(const SchemaInfo& schema);

void print_schema(std::ostream& out, const SchemaInfo& schema);

} // namespace schema
} // namespace fixrec

#endif // FIXREC_SCHEMA_INSPECTOR_HPP
