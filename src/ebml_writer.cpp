//
//  ebml_writer.cpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "ebml_writer.hpp"

#include <sstream>

#include "ebml_error.hpp"
#include "vint.hpp"

namespace cadencefix {

std::vector<uint8_t> make_element(ElementId id, const std::vector<uint8_t> &payload) {
    std::vector<uint8_t> out = encode_id(static_cast<uint32_t>(id));
    const auto size = encode_fixed_width(payload.size(), minimal_size_width(payload.size()));
    out.insert(out.end(), size.begin(), size.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

std::vector<uint8_t> make_uint_element(ElementId id, uint64_t value, size_t width) {
    if (width == 0 || width > 8 || (width < 8 && (value >> (8 * width)) != 0)) {
        std::ostringstream oss;
        oss << element_name(id) << " value " << value << " does not fit " << width << " bytes";
        throw EbmlError(EbmlErrorKind::MalformedElement, 0, oss.str());
    }
    std::vector<uint8_t> payload;
    payload.reserve(width);
    for (size_t i = width; i > 0; --i) {
        write_u8(payload, static_cast<uint8_t>((value >> (8 * (i - 1))) & 0xFF));
    }
    return make_element(id, payload);
}

std::vector<uint8_t> make_float_element(ElementId id, double value) {
    std::vector<uint8_t> payload;
    payload.reserve(8);
    write_f64(payload, value);
    return make_element(id, payload);
}

}  // namespace cadencefix
