// =============================================================================
// fixrec - Chunked Record Decoder
// Version: 1.0.0
// =============================================================================
// Feeds a record that arrives in pieces (a socket, a reader with a small
// buffer) through decode(): each chunk is appended to the pending bytes, the
// estimator reports how many of the remaining fields are now complete, and
// exactly those fields are decoded. Bytes of the fields decoded so far are
// dropped, so pending() always starts at the next field to decode.
//
// Like the estimator, this assumes tagged fields occupy consecutive,
// non-overlapping byte ranges in declaration order.
// =============================================================================

#ifndef FIXREC_DECODER_CHUNKED_DECODER_HPP
#define FIXREC_DECODER_CHUNKED_DECODER_HPP

#include <fixrec/decoder/decoder.hpp>
#include <fixrec/decoder/estimator.hpp>

namespace fixrec {

template<typename Record>
class ChunkedDecoder {
private:
    const RecordSchema<Record>& schema_;
    Record& target_;
    String pending_;
    Size next_field_ = 0;
    
    // Field index one past the next `tagged` tagged fields
    Size advance(Size tagged) const {
        Size index = next_field_;
        while (index < schema_.size() && tagged > 0) {
            if (!schema_.field(index).is_inert()) --tagged;
            ++index;
        }
        return index;
    }
    
public:
    ChunkedDecoder(const RecordSchema<Record>& schema, Record& target)
        : schema_(schema), target_(target) {}
    
    /**
     * @brief Append a chunk and decode every field it completes.
     * @return number of tagged fields decoded by this call
     */
    [[nodiscard]] Result<Size> feed(BufferView chunk) {
        pending_.append(chunk.data(), chunk.size());
        if (complete()) return Size{0};
        
        auto fit = estimate(pending_, schema_, next_field_);
        if (fit.is_error()) return std::move(fit.error());
        if (fit->count == 0) return Size{0};
        
        const Size end = advance(fit->count);
        auto decoded = decode(pending_, schema_, &target_, next_field_, end - next_field_);
        if (decoded.is_error()) return std::move(decoded.error());
        
        pending_.erase(0, fit->consumed);
        next_field_ = end;
        return fit->count;
    }
    
    // Decodes whatever the pending bytes cover of the remaining fields.
    // Fields with no bytes at all are left untouched; a field cut short
    // fails with TRUNCATED_FIELD unless the schema clips.
    [[nodiscard]] Result<void> finish() {
        if (complete() || pending_.empty()) return make_success();
        
        auto decoded = decode(pending_, schema_, &target_, next_field_, 0);
        pending_.clear();
        next_field_ = schema_.size();
        return decoded;
    }
    
    // True once no tagged field is left to decode
    [[nodiscard]] bool complete() const {
        for (Size i = next_field_; i < schema_.size(); ++i) {
            if (!schema_.field(i).is_inert()) return false;
        }
        return true;
    }
    
    [[nodiscard]] Size next_field() const { return next_field_; }
    [[nodiscard]] StringView pending() const { return pending_; }
};

} // namespace fixrec

#endif // FIXREC_DECODER_CHUNKED_DECODER_HPP
