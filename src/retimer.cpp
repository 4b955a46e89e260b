//
//  retimer.cpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "retimer.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <sstream>

#include "ebml_error.hpp"
#include "ebml_reader.hpp"
#include "ebml_writer.hpp"
#include "logging.hpp"
#include "vint.hpp"

namespace cadencefix {

namespace {

// SimpleBlock payload: track number (1 byte) followed by a signed 16-bit relative timecode.
constexpr size_t kBlockTimecodeOffset = 1;
constexpr size_t kBlockHeaderMin = 3;

struct RetimeContext {
    const std::vector<uint8_t> &buffer;
    double fps;
    uint64_t frame_count;

    uint64_t global_frame_index = 0;
    uint64_t cluster_frame_index = 0;
    uint64_t cluster_start_frame = 0;
    std::optional<size_t> timecode_scale_original_width;

    RetimeStats stats;
};

void rewrite_level(RetimeContext &ctx, const ByteRange &scope, ChunkList &out);

void require_known_size(const EbmlElement &el) {
    if (el.unknown_size()) {
        std::ostringstream oss;
        oss << element_name(el.id) << " at offset " << el.id_span.offset
            << " has unknown size";
        throw EbmlError(EbmlErrorKind::MalformedElement, el.id_span.offset, oss.str());
    }
}

void emit_verbatim(const EbmlElement &el, ChunkList &out) {
    out.append_source(el.id_span);
    out.append_source(el.size_span);
    out.append_source(el.payload);
}

// Segment/Cluster: payload length is only known after this pass, so the size becomes the
// unknown-size sentinel (same field width as the source).
void emit_unknown_size_container(RetimeContext &ctx, const EbmlElement &el, ChunkList &out) {
    out.append_source(el.id_span);
    out.append_bytes(encode_unknown_size(el.size_span.length));
    rewrite_level(ctx, el.payload, out);
}

// Container whose size must match its rewritten children. The source size width is kept when
// the new size still fits it.
void emit_sized_container(const EbmlElement &el, ChunkList &&children, ChunkList &out) {
    out.append_source(el.id_span);
    if (el.unknown_size()) {
        out.append_bytes(encode_unknown_size(el.size_span.length));
    } else {
        const uint64_t new_size = children.total_size();
        const size_t width = size_fits_width(new_size, el.size_span.length)
                                 ? el.size_span.length
                                 : minimal_size_width(new_size);
        out.append_bytes(encode_fixed_width(new_size, width));
    }
    out.append(std::move(children));
}

void rewrite_info(RetimeContext &ctx, const EbmlElement &el, ChunkList &out) {
    ChunkList children;
    ctx.timecode_scale_original_width.reset();
    rewrite_level(ctx, el.payload, children);

    const double duration_ms = static_cast<double>(ctx.frame_count) / ctx.fps * 1000.0;
    auto duration = make_float_element(ElementId::Duration, duration_ms);
    const size_t duration_bytes = duration.size();
    children.append_bytes(std::move(duration));
    ctx.stats.injected_durations++;

    const int64_t delta = static_cast<int64_t>(children.total_size()) -
                          static_cast<int64_t>(el.payload.length);
    CF_LOG("retime", "Info payload " << el.payload.length << " -> " << children.total_size()
                                     << " bytes (delta " << delta << ", duration "
                                     << duration_ms << " ms in " << duration_bytes
                                     << " bytes, source scale width "
                                     << (ctx.timecode_scale_original_width
                                             ? static_cast<int64_t>(
                                                   *ctx.timecode_scale_original_width)
                                             : -1)
                                     << ")");
    emit_sized_container(el, std::move(children), out);
}

void rewrite_timecode_scale(RetimeContext &ctx, const EbmlElement &el, ChunkList &out) {
    require_known_size(el);
    if (el.payload.length > 8) {
        throw EbmlError(EbmlErrorKind::MalformedElement, el.id_span.offset,
                        "TimecodeScale payload wider than 8 bytes");
    }
    ctx.timecode_scale_original_width = el.payload.length;
    CF_LOG("retime", "TimecodeScale " << read_unsigned(ctx.buffer, el.payload) << " ("
                                      << el.payload.length << " bytes) -> "
                                      << kCanonicalTimecodeScale);
    out.append_bytes(make_uint_element(ElementId::TimecodeScale, kCanonicalTimecodeScale,
                                       kCanonicalTimestampWidth));
}

void rewrite_cluster_timecode(RetimeContext &ctx, const EbmlElement &el, ChunkList &out) {
    require_known_size(el);
    const int64_t timecode = frame_timestamp_ms(ctx.cluster_start_frame, ctx.fps);
    CF_LOG("retime", "cluster timecode: start frame " << ctx.cluster_start_frame << " -> "
                                                      << timecode << " ms");
    out.append_bytes(make_uint_element(ElementId::Timecode, static_cast<uint64_t>(timecode),
                                       kCanonicalTimestampWidth));
}

void rewrite_simple_block(RetimeContext &ctx, const EbmlElement &el, ChunkList &out) {
    require_known_size(el);
    if (el.payload.length < kBlockHeaderMin) {
        std::ostringstream oss;
        oss << "SimpleBlock at offset " << el.id_span.offset << " has " << el.payload.length
            << " payload bytes, need at least " << kBlockHeaderMin;
        throw EbmlError(EbmlErrorKind::MalformedElement, el.id_span.offset, oss.str());
    }

    const int64_t timecode = frame_timestamp_ms(ctx.global_frame_index, ctx.fps);
    if (timecode > std::numeric_limits<int16_t>::max() && !ctx.stats.block_timecode_wrapped) {
        CF_LOG("warn", "relative block timecode " << timecode << " ms at frame "
                                                  << ctx.global_frame_index
                                                  << " exceeds 16 bits; wrapping");
        ctx.stats.block_timecode_wrapped = true;
    }

    std::vector<uint8_t> field;
    write_u16(field, static_cast<uint16_t>(static_cast<uint64_t>(timecode) & 0xFFFF));

    out.append_source(el.id_span);
    out.append_source(el.size_span);
    out.append_source(ByteRange{el.payload.offset, kBlockTimecodeOffset});
    out.append_bytes(std::move(field));
    out.append_source(ByteRange{el.payload.offset + kBlockTimecodeOffset + 2,
                                el.payload.length - kBlockTimecodeOffset - 2});

    ctx.global_frame_index++;
    ctx.cluster_frame_index++;
    ctx.stats.frames++;
}

void rewrite_element(RetimeContext &ctx, const EbmlElement &el, ChunkList &out) {
    switch (el.id) {
        case ElementId::EBML: {
            ChunkList children;
            rewrite_level(ctx, el.payload, children);
            emit_sized_container(el, std::move(children), out);
            break;
        }
        case ElementId::Segment:
            emit_unknown_size_container(ctx, el, out);
            break;
        case ElementId::Cluster:
            if (ctx.stats.clusters > 0) {
                CF_LOG("retime", "cluster " << (ctx.stats.clusters - 1) << " held "
                                            << ctx.cluster_frame_index << " frames");
            }
            ctx.cluster_frame_index = 0;
            ctx.cluster_start_frame = ctx.global_frame_index;
            ctx.stats.clusters++;
            emit_unknown_size_container(ctx, el, out);
            break;
        case ElementId::Info:
            rewrite_info(ctx, el, out);
            break;
        case ElementId::TimecodeScale:
            rewrite_timecode_scale(ctx, el, out);
            break;
        case ElementId::Duration:
            CF_LOG("retime", "dropping source Duration (" << el.total_length() << " bytes)");
            ctx.stats.dropped_durations++;
            break;
        case ElementId::Timecode:
            rewrite_cluster_timecode(ctx, el, out);
            break;
        case ElementId::SimpleBlock:
            rewrite_simple_block(ctx, el, out);
            break;
        default:
            emit_verbatim(el, out);
            break;
    }
}

void rewrite_level(RetimeContext &ctx, const ByteRange &scope, ChunkList &out) {
    ElementReader reader(ctx.buffer, scope);
    EbmlElement el;
    while (reader.next(el)) {
        rewrite_element(ctx, el, out);
    }
}

}  // namespace

int64_t frame_timestamp_ms(uint64_t index, double fps) {
    return std::llround(static_cast<double>(index) * 1000.0 / fps);
}

ChunkList fix_frame_rate(const std::vector<uint8_t> &buffer, double fps, uint64_t frame_count,
                         RetimeStats *stats) {
    if (!std::isfinite(fps) || fps <= 0.0) {
        std::ostringstream oss;
        oss << "frame rate must be a positive number, got " << fps;
        throw EbmlError(EbmlErrorKind::Unsupported, 0, oss.str());
    }

    RetimeContext ctx{buffer, fps, frame_count};
    ChunkList out;
    rewrite_level(ctx, ByteRange{0, buffer.size()}, out);

    if (ctx.global_frame_index != frame_count) {
        CF_LOG("warn", "frame count " << frame_count << " differs from " << ctx.global_frame_index
                                      << " SimpleBlocks found; Duration uses " << frame_count);
    }
    CF_LOG("retime", "rewrote " << ctx.stats.frames << " frames in " << ctx.stats.clusters
                                << " clusters at " << fps << " fps, " << buffer.size()
                                << " -> " << out.total_size() << " bytes in " << out.count()
                                << " chunks");
    if (stats) {
        *stats = ctx.stats;
    }
    return out;
}

RetimeOutcome try_fix_frame_rate(const std::vector<uint8_t> &buffer, double fps,
                                 uint64_t frame_count) {
    RetimeOutcome outcome;
    try {
        outcome.chunks = fix_frame_rate(buffer, fps, frame_count, &outcome.stats);
        outcome.status.ok = true;
    } catch (const EbmlError &e) {
        outcome.status.message = std::string(error_kind_name(e.kind())) + ": " + e.what();
        outcome.chunks = ChunkList{};
    } catch (const std::exception &e) {
        outcome.status.message = e.what();
        outcome.chunks = ChunkList{};
    }
    return outcome;
}

}  // namespace cadencefix
