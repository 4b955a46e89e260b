//
//  vint.cpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "vint.hpp"

#include <sstream>

#include "ebml_error.hpp"

namespace cadencefix {

namespace {

// All-ones value pattern for a size field of |width| bytes.
constexpr uint64_t all_ones(size_t width) { return (uint64_t(1) << (7 * width)) - 1; }

}  // namespace

size_t vint_length(uint8_t first_byte) {
    for (size_t length = 1; length <= kMaxVintWidth; ++length) {
        if (first_byte & (0x80 >> (length - 1))) {
            return length;
        }
    }
    throw EbmlError(EbmlErrorKind::MalformedVint, 0, "vint length marker missing (first byte 0x00)");
}

uint64_t decode_id(const uint8_t *p, size_t width) {
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value = (value << 8) | p[i];
    }
    return value;
}

std::optional<uint64_t> decode_size(const uint8_t *p, size_t width) {
    uint64_t value = p[0] & ((0xFFu >> width) & 0xFF);
    for (size_t i = 1; i < width; ++i) {
        value = (value << 8) | p[i];
    }
    if (value == all_ones(width) || value > kMaxExactVintValue) {
        return std::nullopt;
    }
    return value;
}

bool size_fits_width(uint64_t value, size_t width) {
    if (width == 0 || width > kMaxVintWidth) {
        return false;
    }
    return value < all_ones(width);
}

size_t minimal_size_width(uint64_t value) {
    for (size_t width = 1; width <= kMaxVintWidth; ++width) {
        if (size_fits_width(value, width)) {
            return width;
        }
    }
    return kMaxVintWidth;
}

std::vector<uint8_t> encode_fixed_width(uint64_t value, size_t width) {
    if (!size_fits_width(value, width)) {
        std::ostringstream oss;
        oss << "value " << value << " does not fit a " << width << "-byte vint";
        throw EbmlError(EbmlErrorKind::MalformedVint, 0, oss.str());
    }
    std::vector<uint8_t> out(width);
    for (size_t i = 0; i < width; ++i) {
        out[width - 1 - i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
    out[0] |= static_cast<uint8_t>(0x80 >> (width - 1));
    return out;
}

std::vector<uint8_t> encode_unknown_size(size_t width) {
    if (width == 0 || width > kMaxVintWidth) {
        throw EbmlError(EbmlErrorKind::MalformedVint, 0, "invalid vint width for unknown size");
    }
    std::vector<uint8_t> out(width, 0xFF);
    out[0] = static_cast<uint8_t>(0xFF >> (width - 1));
    return out;
}

std::vector<uint8_t> encode_id(uint32_t id) {
    std::vector<uint8_t> out;
    bool started = false;
    for (int shift = 24; shift >= 0; shift -= 8) {
        uint8_t b = static_cast<uint8_t>((id >> shift) & 0xFF);
        if (b != 0 || started || shift == 0) {
            out.push_back(b);
            started = true;
        }
    }
    return out;
}

}  // namespace cadencefix
