//
//  vint.hpp
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

namespace cadencefix {

inline constexpr size_t kMaxVintWidth = 8;

// Largest size value accepted as exact; anything above decodes as unknown size.
inline constexpr uint64_t kMaxExactVintValue = (uint64_t(1) << 53) - 1;

// Encoded width (1..8) signalled by the first set bit of |first_byte|. Throws
// EbmlError(MalformedVint) when the byte is zero.
size_t vint_length(uint8_t first_byte);

// Big-endian accumulation of |width| bytes, length marker included.
uint64_t decode_id(const uint8_t *p, size_t width);

// Big-endian accumulation with the length marker stripped. std::nullopt is the unknown-size
// sentinel: all value bits set, or a value above kMaxExactVintValue.
std::optional<uint64_t> decode_size(const uint8_t *p, size_t width);

// True if |value| is encodable as a size of |width| bytes (all-ones is reserved).
bool size_fits_width(uint64_t value, size_t width);

// Smallest width able to carry |value| as a known size.
size_t minimal_size_width(uint64_t value);

// Size field of exactly |width| bytes. Throws EbmlError(MalformedVint) if it does not fit.
std::vector<uint8_t> encode_fixed_width(uint64_t value, size_t width);

// Unknown-size sentinel of |width| bytes (0xFF for one byte, 0x01 FF .. FF for eight).
std::vector<uint8_t> encode_unknown_size(size_t width);

// Identifier bytes for a canonical id value (marker bits already part of the value).
std::vector<uint8_t> encode_id(uint32_t id);

}  // namespace cadencefix
