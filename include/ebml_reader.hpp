//
//  ebml_reader.hpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "ebml_ids.hpp"

namespace cadencefix {

struct ByteRange {
    size_t offset = 0;
    size_t length = 0;

    size_t end() const { return offset + length; }
};

// One decoded element header. Offsets point into the caller's buffer.
struct EbmlElement {
    ElementId id = ElementId::Void;
    ByteRange id_span;
    ByteRange size_span;
    // Payload extent. For unknown-size elements this runs to the end of the enclosing scope.
    ByteRange payload;
    // Declared payload size; std::nullopt for the unknown-size sentinel.
    std::optional<uint64_t> declared_size;

    bool unknown_size() const { return !declared_size.has_value(); }
    size_t total_length() const { return payload.end() - id_span.offset; }
};

// Single-pass reader over one nesting level of [start, start + length). It never recurses; the
// caller re-enters with a child's payload range. Stops after an unknown-size element because
// that element extends to the end of the scope.
//
// next() throws EbmlError on unrecognized ids, malformed vints and truncated elements.
class ElementReader {
   public:
    ElementReader(const std::vector<uint8_t> &buffer, size_t start, size_t length);
    ElementReader(const std::vector<uint8_t> &buffer, const ByteRange &scope);

    // Decode the next element into |out|. Returns false once the scope is exhausted.
    bool next(EbmlElement &out);

    size_t cursor() const { return cursor_; }
    size_t scope_end() const { return end_; }

   private:
    const uint8_t *data_;
    size_t cursor_;
    size_t end_;
    bool finished_ = false;
};

// Big-endian unsigned integer payload (0..8 bytes).
uint64_t read_unsigned(const std::vector<uint8_t> &buffer, const ByteRange &payload);

// IEEE float payload of 0, 4 or 8 bytes. Throws EbmlError(MalformedElement) for other widths.
double read_float(const std::vector<uint8_t> &buffer, const ByteRange &payload);

}  // namespace cadencefix
