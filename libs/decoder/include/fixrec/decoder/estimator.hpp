// =============================================================================
// fixrec - Field Count Estimator
// Version: 1.0.0
// =============================================================================
// Answers "how many fields, starting at field_offset, fit completely in this
// buffer?" so that a stream reader can decode a partial record and carry the
// remaining bytes over to the next chunk.
//
// Field extents are summed in declaration order, which assumes the tagged
// fields occupy consecutive, non-overlapping ranges. Schemas with
// overlapping fields (aliases of the same bytes) are undercounted.
// =============================================================================

#ifndef FIXREC_DECODER_ESTIMATOR_HPP
#define FIXREC_DECODER_ESTIMATOR_HPP

#include <fixrec/decoder/record_schema.hpp>

namespace fixrec {

struct FieldEstimate {
    Size count = 0;
    // Bytes covered by the `count` fitting fields
    Size consumed = 0;
    // Tail of the buffer from (end of the first field that did not fit -
    // its length); empty when every field fits or that point is past the
    // end. For a single-value field this is where the field starts. Views
    // the estimated buffer.
    BufferView remainder;
};

[[nodiscard]] Result<FieldEstimate> estimate(BufferView buffer, const schema::SchemaInfo& schema,
                                             Size field_offset = 0);

template<DecodableRecord Record>
[[nodiscard]] Result<FieldEstimate> estimate(BufferView buffer, Size field_offset = 0) {
    return estimate(buffer, schema_of<Record>(), field_offset);
}

} // namespace fixrec

#endif // FIXREC_DECODER_ESTIMATOR_HPP
