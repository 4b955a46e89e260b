// Unit coverage for the frame-rate rewrite: per-element handlers, size accounting and failure
// behavior.
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <vector>

#include "ebml_error.hpp"
#include "ebml_test_utils.hpp"
#include "logging.hpp"
#include "retimer.hpp"

using namespace cadencefix;
using namespace ebml_test_utils;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[retimer_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

std::vector<uint8_t> retime(const std::vector<uint8_t> &raw, double fps, uint64_t frames,
                            RetimeStats *stats = nullptr) {
    return fix_frame_rate(raw, fps, frames, stats).flatten(raw);
}

bool contains(const std::vector<uint8_t> &hay, const std::vector<uint8_t> &needle) {
    return std::search(hay.begin(), hay.end(), needle.begin(), needle.end()) != hay.end();
}

template <typename Fn>
bool throws_kind(Fn fn, EbmlErrorKind kind) {
    try {
        fn();
    } catch (const EbmlError &e) {
        return e.kind() == kind;
    }
    return false;
}

bool test_structure_of_default_recording() {
    const auto raw = make_recording();
    RetimeStats stats;
    const auto out = retime(raw, 60.0, 10, &stats);
    bool ok = true;

    ok &= check(scopes_consistent(out), "output sizes are consistent");
    const auto header = make_ebml_header();
    ok &= check(std::equal(header.begin(), header.end(), out.begin()),
                "EBML header passes through unchanged");
    ok &= check(contains(out, make_tracks()), "Tracks passes through unchanged");

    auto segments = find_all(out, kSegment);
    ok &= check(segments.size() == 1 && !segments[0].size, "Segment has unknown size");
    ok &= check(segments.size() == 1 && segments[0].size_width == 8,
                "Segment keeps its 8-byte size field");

    auto clusters = find_all(out, kCluster);
    ok &= check(clusters.size() == 2, "both clusters present");
    for (const auto &c : clusters) {
        ok &= check(!c.size.has_value(), "Cluster has unknown size");
        ok &= check(c.size_width == 1, "Cluster keeps its source size width");
    }

    auto scales = find_all(out, kTimecodeScale);
    ok &= check(scales.size() == 1, "one TimecodeScale");
    const std::vector<uint8_t> canonical_scale = {0x2A, 0xD7, 0xB1, 0x84, 0x00, 0x0F, 0x42, 0x40};
    ok &= check(contains(out, canonical_scale), "TimecodeScale is the canonical 4-byte 1000000");

    for (const auto &tc : find_all(out, kTimecode)) {
        ok &= check(tc.size && *tc.size == 4, "cluster Timecode is 4 bytes");
    }

    auto durations = find_all(out, kDuration);
    ok &= check(durations.size() == 1, "exactly one Duration");
    if (durations.size() == 1) {
        ok &= check(be_double(out, durations[0].payload_offset) == 10.0 / 60.0 * 1000.0,
                    "Duration is frame_count / fps * 1000");
    }

    // Frame data is untouched; only bytes 1..2 of each block change.
    auto src_blocks = find_all(raw, kSimpleBlock);
    auto out_blocks = find_all(out, kSimpleBlock);
    ok &= check(src_blocks.size() == out_blocks.size(), "same number of blocks");
    for (size_t i = 0; i < std::min(src_blocks.size(), out_blocks.size()); ++i) {
        const auto &s = src_blocks[i];
        const auto &o = out_blocks[i];
        ok &= check(s.size == o.size, "block size unchanged");
        ok &= check(raw[s.payload_offset] == out[o.payload_offset], "track byte unchanged");
        ok &= check(std::equal(raw.begin() + s.payload_offset + 3, raw.begin() + s.payload_end,
                               out.begin() + o.payload_offset + 3),
                    "frame payload unchanged");
    }

    ok &= check(stats.frames == 10, "stats.frames");
    ok &= check(stats.clusters == 2, "stats.clusters");
    ok &= check(stats.dropped_durations == 0, "no source Duration dropped");
    ok &= check(stats.injected_durations == 1, "one Duration injected");
    ok &= check(!stats.block_timecode_wrapped, "no wrap at 10 frames");
    return ok;
}

bool test_known_size_segment_and_unknown_clusters() {
    RecordingLayout layout;
    layout.segment_unknown_size = false;
    layout.cluster_unknown_size = true;
    layout.blocks_per_cluster = {3, 4, 2};
    const auto raw = make_recording(layout);
    const auto out = retime(raw, 30.0, 9);
    bool ok = true;
    ok &= check(scopes_consistent(out), "sizes consistent");
    auto segments = find_all(out, kSegment);
    ok &= check(segments.size() == 1 && !segments[0].size, "known Segment becomes unknown");
    ok &= check(cluster_timecodes(out) == std::vector<uint64_t>({0, 100, 233}),
                "cluster timecodes follow the frame ordinal at cluster start");
    ok &= check(block_timecodes(out) ==
                    std::vector<int16_t>({0, 33, 67, 100, 133, 167, 200, 233, 267}),
                "block timecodes at 30 fps");
    return ok;
}

bool test_existing_duration_replaced() {
    RecordingLayout layout;
    layout.source_duration = 12345.0;
    const auto raw = make_recording(layout);
    RetimeStats stats;
    const auto out = retime(raw, 25.0, 10, &stats);
    bool ok = true;
    auto durations = find_all(out, kDuration);
    ok &= check(durations.size() == 1, "old Duration removed, new one added");
    if (durations.size() == 1) {
        ok &= check(be_double(out, durations[0].payload_offset) == 400.0, "10 frames at 25 fps");
        // Injected after every surviving Info child.
        auto info = find_all(out, kInfo);
        ok &= check(!info.empty() && durations[0].payload_end == info[0].payload_end,
                    "Duration is the last Info child");
    }
    ok &= check(stats.dropped_durations == 1, "stats.dropped_durations");
    ok &= check(scopes_consistent(out), "sizes consistent after replacement");

    // Info payload: same size, the dropped and injected Durations are both 11 bytes and the
    // scale was already 3 bytes -> grows by 1.
    auto info_in = find_all(raw, kInfo);
    auto info_out = find_all(out, kInfo);
    ok &= check(info_in.size() == 1 && info_out.size() == 1 &&
                    *info_out[0].size == *info_in[0].size + 1,
                "Info size accounts for scale growth only");
    return ok;
}

bool test_timecode_scale_widths() {
    bool ok = true;
    for (size_t width = 1; width <= 8; ++width) {
        RecordingLayout layout;
        layout.timecode_scale_width = width;
        layout.timecode_scale = width >= 3 ? 1000000 : 100;
        const auto raw = make_recording(layout);
        const auto out = retime(raw, 60.0, 10);

        const std::string tag = " (source width " + std::to_string(width) + ")";
        auto scales = find_all(out, kTimecodeScale);
        ok &= check(scales.size() == 1 && scales[0].size && *scales[0].size == 4,
                    "TimecodeScale is 4 bytes" + tag);
        if (scales.size() == 1) {
            ok &= check(be_uint(out, scales[0].payload_offset, 4) == 1000000,
                        "TimecodeScale value" + tag);
        }
        auto info_in = find_all(raw, kInfo);
        auto info_out = find_all(out, kInfo);
        const int64_t expected = static_cast<int64_t>(*info_in[0].size) +
                                 (4 - static_cast<int64_t>(width)) + 11;
        ok &= check(static_cast<int64_t>(*info_out[0].size) == expected, "Info size" + tag);
        ok &= check(scopes_consistent(out), "sizes consistent" + tag);
    }
    return ok;
}

bool test_info_size_field_widens() {
    // Info payload close to the 1-byte size limit: 7-byte scale + 113-byte Void = 120.
    std::vector<uint8_t> info_payload;
    append_element(info_payload, kTimecodeScale, uint_payload(1000000, 3));
    append_element(info_payload, kVoid, std::vector<uint8_t>(111, 0));
    std::vector<uint8_t> body;
    append_element(body, kInfo, info_payload, 1);
    std::vector<uint8_t> cluster;
    append_element(cluster, kTimecode, uint_payload(0, 1));
    append_element(cluster, kSimpleBlock, simple_block(0, 2, 0x55));
    append_element(body, kCluster, cluster);
    std::vector<uint8_t> raw = make_ebml_header();
    append_unknown_element(raw, kSegment, body);

    const auto out = retime(raw, 60.0, 1);
    bool ok = true;
    auto info = find_all(out, kInfo);
    ok &= check(info.size() == 1 && info[0].size && *info[0].size == 132, "Info grows to 132");
    ok &= check(info.size() == 1 && info[0].size_width == 2, "size field widened to 2 bytes");
    ok &= check(scopes_consistent(out), "sizes consistent after widening");
    return ok;
}

bool test_repeat_runs_are_stable() {
    RecordingLayout layout;
    layout.source_duration = 1.0;
    layout.timecode_scale_width = 8;
    layout.blocks_per_cluster = {4, 4, 4};
    const auto raw = make_recording(layout);
    const auto first = retime(raw, 24.0, 12);
    const auto again = retime(raw, 24.0, 12);
    const auto second = retime(first, 24.0, 12);
    bool ok = true;
    ok &= check(first == again, "same input gives same output");
    ok &= check(first == second, "rewriting the output again changes nothing");
    return ok;
}

bool test_chunks_reference_source() {
    RecordingLayout layout;
    layout.frame_bytes = 400;
    const auto raw = make_recording(layout);
    const ChunkList chunks = fix_frame_rate(raw, 60.0, 10);
    size_t owned = 0;
    for (const auto &c : chunks.chunks()) {
        if (c.owned) {
            owned += c.size();
        }
    }
    bool ok = true;
    ok &= check(chunks.total_size() == chunks.flatten(raw).size(), "total_size matches flatten");
    ok &= check(owned < 200, "frame payloads are sliced, not copied");
    return ok;
}

bool test_failures_are_atomic() {
    bool ok = true;

    // SimpleBlock too short to hold its timecode.
    {
        std::vector<uint8_t> cluster;
        append_element(cluster, kTimecode, uint_payload(0, 1));
        append_element(cluster, kSimpleBlock, std::vector<uint8_t>{0x81, 0x00});
        std::vector<uint8_t> raw = make_ebml_header();
        std::vector<uint8_t> body;
        append_element(body, kCluster, cluster);
        append_unknown_element(raw, kSegment, body);

        ok &= check(throws_kind([&] { fix_frame_rate(raw, 60.0, 1); },
                                EbmlErrorKind::MalformedElement),
                    "short SimpleBlock is fatal");
        auto outcome = try_fix_frame_rate(raw, 60.0, 1);
        ok &= check(!outcome.status.ok && outcome.needs_fallback(), "try variant reports failure");
        ok &= check(outcome.chunks.empty(), "no partial output");
        ok &= check(outcome.status.message.find("malformed element") != std::string::npos,
                    "message names the error kind");
    }

    // Unknown top-level identifier.
    {
        std::vector<uint8_t> raw = {0x81, 0x81, 0x00};
        auto outcome = try_fix_frame_rate(raw, 60.0, 0);
        ok &= check(!outcome.status.ok, "unknown top-level id fails");
        ok &= check(outcome.chunks.count() == 0 && outcome.chunks.total_size() == 0,
                    "zero output chunks");
        ok &= check(outcome.status.message.find("unrecognized id") != std::string::npos,
                    "message names unrecognized id");
    }

    // Unknown identifier deep inside an otherwise valid recording.
    {
        auto raw = make_recording();
        raw.push_back(0x81);  // trailing garbage lands inside the unknown-size Segment
        raw.push_back(0x80);
        auto outcome = try_fix_frame_rate(raw, 60.0, 10);
        ok &= check(!outcome.status.ok && outcome.chunks.empty(), "late failure discards output");
    }

    // Rates that cannot produce timestamps.
    const auto raw = make_recording();
    ok &= check(throws_kind([&] { fix_frame_rate(raw, 0.0, 10); }, EbmlErrorKind::Unsupported),
                "fps 0");
    ok &= check(throws_kind([&] { fix_frame_rate(raw, -30.0, 10); }, EbmlErrorKind::Unsupported),
                "negative fps");
    ok &= check(throws_kind([&] { fix_frame_rate(raw, std::nan(""), 10); },
                            EbmlErrorKind::Unsupported),
                "NaN fps");
    ok &= check(throws_kind([&] {
                    fix_frame_rate(raw, std::numeric_limits<double>::infinity(), 10);
                }, EbmlErrorKind::Unsupported),
                "infinite fps");
    return ok;
}

bool test_block_timecode_wraps_past_int16() {
    RecordingLayout layout;
    layout.blocks_per_cluster = {40};
    layout.frame_bytes = 1;
    const auto raw = make_recording(layout);
    RetimeStats stats;
    const auto out = retime(raw, 1.0, 40, &stats);
    const auto tcs = block_timecodes(out);
    bool ok = true;
    ok &= check(stats.block_timecode_wrapped, "wrap flagged");
    ok &= check(tcs.size() == 40, "all blocks rewritten");
    if (tcs.size() == 40) {
        ok &= check(tcs[32] == 32000, "last value in range");
        ok &= check(tcs[33] == static_cast<int16_t>(33000 - 65536), "low 16 bits kept");
    }
    return ok;
}

bool test_frame_count_is_trusted() {
    // Ten blocks, but the producer reported twelve: Duration follows the reported count.
    const auto raw = make_recording();
    const auto out = retime(raw, 60.0, 12);
    auto durations = find_all(out, kDuration);
    bool ok = check(durations.size() == 1 &&
                        be_double(out, durations[0].payload_offset) == 12.0 / 60.0 * 1000.0,
                    "Duration uses the supplied frame count");
    ok &= check(block_timecodes(out).size() == 10, "only present blocks are rewritten");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_structure_of_default_recording();
    ok &= test_known_size_segment_and_unknown_clusters();
    ok &= test_existing_duration_replaced();
    ok &= test_timecode_scale_widths();
    ok &= test_info_size_field_widens();
    ok &= test_repeat_runs_are_stable();
    ok &= test_chunks_reference_source();
    ok &= test_failures_are_atomic();
    ok &= test_block_timecode_wraps_past_int16();
    ok &= test_frame_count_is_trusted();
    return ok ? 0 : 1;
}
