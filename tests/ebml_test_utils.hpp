//
//  ebml_test_utils.hpp
//  CadenceFix
//
//  Test-only helpers to build tiny EBML containers and read them back. Kept independent of the
//  library code to avoid self-consistency bugs.
//

#pragma once

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace ebml_test_utils {

constexpr uint32_t kEBML = 0x1A45DFA3;
constexpr uint32_t kEBMLVersion = 0x4286;
constexpr uint32_t kDocType = 0x4282;
constexpr uint32_t kSegment = 0x18538067;
constexpr uint32_t kInfo = 0x1549A966;
constexpr uint32_t kTimecodeScale = 0x2AD7B1;
constexpr uint32_t kDuration = 0x4489;
constexpr uint32_t kMuxingApp = 0x4D80;
constexpr uint32_t kWritingApp = 0x5741;
constexpr uint32_t kTracks = 0x1654AE6B;
constexpr uint32_t kTrackEntry = 0xAE;
constexpr uint32_t kTrackNumber = 0xD7;
constexpr uint32_t kCodecID = 0x86;
constexpr uint32_t kCluster = 0x1F43B675;
constexpr uint32_t kTimecode = 0xE7;
constexpr uint32_t kSimpleBlock = 0xA3;
constexpr uint32_t kVoid = 0xEC;

// ------------- Writers ------------------------------------------------------

inline void append_id(std::vector<uint8_t> &buf, uint32_t id) {
    if (id > 0xFFFFFF) buf.push_back(static_cast<uint8_t>(id >> 24));
    if (id > 0xFFFF) buf.push_back(static_cast<uint8_t>(id >> 16));
    if (id > 0xFF) buf.push_back(static_cast<uint8_t>(id >> 8));
    buf.push_back(static_cast<uint8_t>(id));
}

inline void append_size(std::vector<uint8_t> &buf, uint64_t size, size_t width) {
    for (size_t i = width; i > 0; --i) {
        uint8_t b = static_cast<uint8_t>((size >> (8 * (i - 1))) & 0xFF);
        if (i == width) {
            b |= static_cast<uint8_t>(0x80 >> (width - 1));
        }
        buf.push_back(b);
    }
}

inline void append_unknown_size(std::vector<uint8_t> &buf, size_t width) {
    buf.push_back(static_cast<uint8_t>(0xFF >> (width - 1)));
    for (size_t i = 1; i < width; ++i) {
        buf.push_back(0xFF);
    }
}

inline size_t smallest_width(uint64_t size) {
    size_t width = 1;
    while (width < 8 && size >= (uint64_t(1) << (7 * width)) - 1) {
        ++width;
    }
    return width;
}

inline void append_element(std::vector<uint8_t> &buf, uint32_t id,
                           const std::vector<uint8_t> &payload, size_t size_width = 0) {
    append_id(buf, id);
    append_size(buf, payload.size(), size_width ? size_width : smallest_width(payload.size()));
    buf.insert(buf.end(), payload.begin(), payload.end());
}

inline void append_unknown_element(std::vector<uint8_t> &buf, uint32_t id,
                                   const std::vector<uint8_t> &payload, size_t size_width = 8) {
    append_id(buf, id);
    append_unknown_size(buf, size_width);
    buf.insert(buf.end(), payload.begin(), payload.end());
}

inline std::vector<uint8_t> uint_payload(uint64_t v, size_t width) {
    std::vector<uint8_t> p;
    for (size_t i = width; i > 0; --i) {
        p.push_back(static_cast<uint8_t>((v >> (8 * (i - 1))) & 0xFF));
    }
    return p;
}

inline std::vector<uint8_t> float_payload(double d) {
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    return uint_payload(bits, 8);
}

inline std::vector<uint8_t> string_payload(const std::string &s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// SimpleBlock payload: track number vint, int16 relative timecode, flags, frame data.
inline std::vector<uint8_t> simple_block(int16_t timecode, size_t frame_bytes, uint8_t fill) {
    std::vector<uint8_t> p;
    p.push_back(0x81);  // track 1
    p.push_back(static_cast<uint8_t>((static_cast<uint16_t>(timecode) >> 8) & 0xFF));
    p.push_back(static_cast<uint8_t>(static_cast<uint16_t>(timecode) & 0xFF));
    p.push_back(0x80);  // keyframe
    p.insert(p.end(), frame_bytes, fill);
    return p;
}

inline std::vector<uint8_t> make_ebml_header(const std::string &doc_type = "webm") {
    std::vector<uint8_t> payload;
    append_element(payload, kEBMLVersion, uint_payload(1, 1));
    append_element(payload, kDocType, string_payload(doc_type));
    std::vector<uint8_t> out;
    append_element(out, kEBML, payload);
    return out;
}

inline std::vector<uint8_t> make_tracks() {
    std::vector<uint8_t> entry;
    append_element(entry, kTrackNumber, uint_payload(1, 1));
    append_element(entry, kCodecID, string_payload("V_VP8"));
    std::vector<uint8_t> tracks;
    append_element(tracks, kTrackEntry, entry);
    std::vector<uint8_t> out;
    append_element(out, kTracks, tracks);
    return out;
}

// Shape of a synthetic capture. Source timestamps are deliberately irregular.
struct RecordingLayout {
    std::vector<size_t> blocks_per_cluster{5, 5};
    size_t timecode_scale_width = 3;
    uint64_t timecode_scale = 1000000;
    std::optional<double> source_duration;
    bool segment_unknown_size = true;
    bool cluster_unknown_size = false;
    size_t cluster_timecode_width = 2;
    size_t frame_bytes = 6;
};

inline std::vector<uint8_t> make_info(const RecordingLayout &layout) {
    std::vector<uint8_t> info;
    append_element(info, kTimecodeScale,
                   uint_payload(layout.timecode_scale, layout.timecode_scale_width));
    if (layout.source_duration) {
        append_element(info, kDuration, float_payload(*layout.source_duration));
    }
    append_element(info, kMuxingApp, string_payload("Chrome"));
    append_element(info, kWritingApp, string_payload("Chrome"));
    std::vector<uint8_t> out;
    append_element(out, kInfo, info);
    return out;
}

inline std::vector<uint8_t> make_recording(const RecordingLayout &layout = RecordingLayout{}) {
    std::vector<uint8_t> body = make_info(layout);
    auto tracks = make_tracks();
    body.insert(body.end(), tracks.begin(), tracks.end());

    size_t frame = 0;
    for (size_t blocks : layout.blocks_per_cluster) {
        std::vector<uint8_t> cluster;
        const uint64_t jittery_base = frame * 17 + 3;
        append_element(cluster, kTimecode,
                       uint_payload(jittery_base, layout.cluster_timecode_width));
        for (size_t i = 0; i < blocks; ++i, ++frame) {
            const auto rel = static_cast<int16_t>(i * 16 + (i * 7) % 5);
            append_element(cluster, kSimpleBlock,
                           simple_block(rel, layout.frame_bytes, static_cast<uint8_t>(frame)));
        }
        if (layout.cluster_unknown_size) {
            append_unknown_element(body, kCluster, cluster);
        } else {
            append_element(body, kCluster, cluster);
        }
    }

    std::vector<uint8_t> out = make_ebml_header();
    if (layout.segment_unknown_size) {
        append_unknown_element(out, kSegment, body);
    } else {
        append_element(out, kSegment, body, 8);
    }
    return out;
}

inline std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>> &parts) {
    std::vector<uint8_t> out;
    for (const auto &p : parts) {
        out.insert(out.end(), p.begin(), p.end());
    }
    return out;
}

// ------------- Independent reader -------------------------------------------

struct TestElement {
    uint32_t id = 0;
    size_t offset = 0;          // first byte of the id
    size_t size_width = 0;
    size_t payload_offset = 0;
    size_t payload_end = 0;     // scope end for unknown-size elements
    std::optional<uint64_t> size;
};

inline size_t vint_width(uint8_t b) {
    for (size_t w = 1; w <= 8; ++w) {
        if (b & (0x80 >> (w - 1))) return w;
    }
    return 0;
}

inline bool is_master(uint32_t id) {
    return id == kEBML || id == kSegment || id == kInfo || id == kTracks || id == kTrackEntry ||
           id == kCluster;
}

inline uint64_t be_uint(const std::vector<uint8_t> &buf, size_t offset, size_t len) {
    uint64_t v = 0;
    for (size_t i = 0; i < len; ++i) v = (v << 8) | buf[offset + i];
    return v;
}

inline double be_double(const std::vector<uint8_t> &buf, size_t offset) {
    uint64_t bits = be_uint(buf, offset, 8);
    double d;
    std::memcpy(&d, &bits, sizeof(d));
    return d;
}

// Parse one level; returns std::nullopt if any element overruns [start, end).
inline std::optional<std::vector<TestElement>> parse_level(const std::vector<uint8_t> &buf,
                                                           size_t start, size_t end) {
    std::vector<TestElement> out;
    size_t pos = start;
    while (pos < end) {
        TestElement e;
        e.offset = pos;
        size_t idw = vint_width(buf[pos]);
        if (idw == 0 || pos + idw > end) return std::nullopt;
        e.id = static_cast<uint32_t>(be_uint(buf, pos, idw));
        pos += idw;
        if (pos >= end) return std::nullopt;
        size_t sw = vint_width(buf[pos]);
        if (sw == 0 || pos + sw > end) return std::nullopt;
        uint64_t raw = be_uint(buf, pos, sw) & ((uint64_t(1) << (7 * sw)) - 1);
        e.size_width = sw;
        pos += sw;
        e.payload_offset = pos;
        if (raw == (uint64_t(1) << (7 * sw)) - 1) {
            e.payload_end = end;
            out.push_back(e);
            return out;
        }
        e.size = raw;
        if (raw > end - pos) return std::nullopt;
        e.payload_end = pos + raw;
        pos = e.payload_end;
        out.push_back(e);
    }
    return out;
}

// Every known-size master is exactly filled by its children.
inline bool scopes_consistent(const std::vector<uint8_t> &buf, size_t start, size_t end) {
    auto level = parse_level(buf, start, end);
    if (!level) return false;
    for (const auto &e : *level) {
        if (is_master(e.id) && !scopes_consistent(buf, e.payload_offset, e.payload_end)) {
            return false;
        }
    }
    return true;
}

inline bool scopes_consistent(const std::vector<uint8_t> &buf) {
    return scopes_consistent(buf, 0, buf.size());
}

// All elements with |id| in document order, descending into masters.
inline void find_all(const std::vector<uint8_t> &buf, size_t start, size_t end, uint32_t id,
                     std::vector<TestElement> &out) {
    auto level = parse_level(buf, start, end);
    if (!level) return;
    for (const auto &e : *level) {
        if (e.id == id) out.push_back(e);
        if (is_master(e.id)) find_all(buf, e.payload_offset, e.payload_end, id, out);
    }
}

inline std::vector<TestElement> find_all(const std::vector<uint8_t> &buf, uint32_t id) {
    std::vector<TestElement> out;
    find_all(buf, 0, buf.size(), id, out);
    return out;
}

inline std::vector<int16_t> block_timecodes(const std::vector<uint8_t> &buf) {
    std::vector<int16_t> out;
    for (const auto &e : find_all(buf, kSimpleBlock)) {
        out.push_back(static_cast<int16_t>(be_uint(buf, e.payload_offset + 1, 2)));
    }
    return out;
}

inline std::vector<uint64_t> cluster_timecodes(const std::vector<uint8_t> &buf) {
    std::vector<uint64_t> out;
    for (const auto &e : find_all(buf, kTimecode)) {
        out.push_back(be_uint(buf, e.payload_offset, e.payload_end - e.payload_offset));
    }
    return out;
}

inline std::filesystem::path write_temp_file(const std::vector<uint8_t> &data,
                                             const std::string &name) {
    auto tmp = std::filesystem::temp_directory_path() / name;
    std::ofstream out(tmp, std::ios::binary);
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return tmp;
}

inline std::vector<uint8_t> read_whole_file(const std::filesystem::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)),
                                std::istreambuf_iterator<char>());
}

}  // namespace ebml_test_utils
