//
//  ebml_writer.hpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

#include "ebml_ids.hpp"

namespace cadencefix {

// ------------- Helper write functions ---------------------------------------

inline void write_u8(std::vector<uint8_t> &p, uint8_t v) { p.push_back(v); }

inline void write_u16(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u64(std::vector<uint8_t> &p, uint64_t v) {
    p.push_back((v >> 56) & 0xFF);
    p.push_back((v >> 48) & 0xFF);
    p.push_back((v >> 40) & 0xFF);
    p.push_back((v >> 32) & 0xFF);
    p.push_back((v >> 24) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_f64(std::vector<uint8_t> &p, double d) {
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    write_u64(p, bits);
}

// ------------- Element builders ---------------------------------------------

// Element with the smallest size field that fits |payload|.
std::vector<uint8_t> make_element(ElementId id, const std::vector<uint8_t> &payload);

// Unsigned integer element with a payload of exactly |width| bytes (1..8). Throws EbmlError
// if |value| needs more bytes.
std::vector<uint8_t> make_uint_element(ElementId id, uint64_t value, size_t width);

// 8-byte IEEE double element.
std::vector<uint8_t> make_float_element(ElementId id, double value);

}  // namespace cadencefix
