//
//  ebml_reader.cpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "ebml_reader.hpp"

#include <cstring>
#include <sstream>

#include "ebml_error.hpp"
#include "logging.hpp"
#include "vint.hpp"

namespace cadencefix {

namespace {

// Width of the vint starting at |pos|, with the marker and the remaining bytes checked against
// the scope end.
size_t checked_vint_length(const uint8_t *data, size_t pos, size_t end, const char *what) {
    if (pos >= end) {
        std::ostringstream oss;
        oss << what << " at offset " << pos << " runs past scope end " << end;
        throw EbmlError(EbmlErrorKind::Truncated, pos, oss.str());
    }
    if (data[pos] == 0) {
        std::ostringstream oss;
        oss << what << " at offset " << pos << " has no length marker";
        throw EbmlError(EbmlErrorKind::MalformedVint, pos, oss.str());
    }
    const size_t width = vint_length(data[pos]);
    if (width > end - pos) {
        std::ostringstream oss;
        oss << what << " at offset " << pos << " needs " << width << " bytes, "
            << (end - pos) << " left";
        throw EbmlError(EbmlErrorKind::Truncated, pos, oss.str());
    }
    return width;
}

}  // namespace

ElementReader::ElementReader(const std::vector<uint8_t> &buffer, size_t start, size_t length)
    : data_(buffer.data()), cursor_(start), end_(start + length) {
    if (start > buffer.size() || length > buffer.size() - start) {
        std::ostringstream oss;
        oss << "scope [" << start << ", +" << length << ") exceeds buffer of " << buffer.size()
            << " bytes";
        throw EbmlError(EbmlErrorKind::Truncated, start, oss.str());
    }
}

ElementReader::ElementReader(const std::vector<uint8_t> &buffer, const ByteRange &scope)
    : ElementReader(buffer, scope.offset, scope.length) {}

bool ElementReader::next(EbmlElement &out) {
    if (finished_ || cursor_ >= end_) {
        finished_ = true;
        return false;
    }

    const size_t id_pos = cursor_;
    const size_t id_width = checked_vint_length(data_, id_pos, end_, "element id");
    const uint64_t raw_id = decode_id(data_ + id_pos, id_width);
    std::optional<ElementId> id;
    if (raw_id <= 0xFFFFFFFFull) {
        id = lookup_element_id(static_cast<uint32_t>(raw_id));
    }
    if (!id) {
        CF_LOG("ebml", "unrecognized id bytes: " << hex_prefix(data_ + id_pos, id_width));
        std::ostringstream oss;
        oss << "unknown element 0x" << std::hex << raw_id << std::dec << " at offset " << id_pos;
        throw EbmlError(EbmlErrorKind::UnrecognizedId, id_pos, oss.str());
    }

    const size_t size_pos = id_pos + id_width;
    const size_t size_width = checked_vint_length(data_, size_pos, end_, "element size");
    const std::optional<uint64_t> size = decode_size(data_ + size_pos, size_width);
    const size_t payload_pos = size_pos + size_width;

    out.id = *id;
    out.id_span = ByteRange{id_pos, id_width};
    out.size_span = ByteRange{size_pos, size_width};
    out.declared_size = size;

    if (!size) {
        out.payload = ByteRange{payload_pos, end_ - payload_pos};
        cursor_ = end_;
        finished_ = true;
        return true;
    }

    if (*size > end_ - payload_pos) {
        std::ostringstream oss;
        oss << element_name(*id) << " at offset " << id_pos << " declares " << *size
            << " payload bytes, " << (end_ - payload_pos) << " left in scope";
        throw EbmlError(EbmlErrorKind::Truncated, id_pos, oss.str());
    }
    out.payload = ByteRange{payload_pos, static_cast<size_t>(*size)};
    cursor_ = payload_pos + static_cast<size_t>(*size);
    return true;
}

uint64_t read_unsigned(const std::vector<uint8_t> &buffer, const ByteRange &payload) {
    if (payload.length > 8) {
        throw EbmlError(EbmlErrorKind::MalformedElement, payload.offset,
                        "unsigned integer payload wider than 8 bytes");
    }
    uint64_t value = 0;
    for (size_t i = 0; i < payload.length; ++i) {
        value = (value << 8) | buffer[payload.offset + i];
    }
    return value;
}

double read_float(const std::vector<uint8_t> &buffer, const ByteRange &payload) {
    if (payload.length == 0) {
        return 0.0;
    }
    if (payload.length == 4) {
        uint32_t bits = static_cast<uint32_t>(read_unsigned(buffer, payload));
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        return f;
    }
    if (payload.length == 8) {
        uint64_t bits = read_unsigned(buffer, payload);
        double d;
        std::memcpy(&d, &bits, sizeof(d));
        return d;
    }
    throw EbmlError(EbmlErrorKind::MalformedElement, payload.offset,
                    "float payload must be 0, 4 or 8 bytes");
}

}  // namespace cadencefix
