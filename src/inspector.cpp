//
//  inspector.cpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "inspector.hpp"

#include <cstddef>

#include "ebml_error.hpp"
#include "ebml_reader.hpp"
#include "logging.hpp"

namespace cadencefix {

namespace {

void walk(const std::vector<uint8_t> &buffer, const ByteRange &scope, ContainerSummary &out) {
    ElementReader reader(buffer, scope);
    EbmlElement el;
    while (reader.next(el)) {
        out.element_count++;
        switch (el.id) {
            case ElementId::EBML:
            case ElementId::Info:
                walk(buffer, el.payload, out);
                break;
            case ElementId::Segment:
                out.segment_unknown_size = el.unknown_size();
                walk(buffer, el.payload, out);
                break;
            case ElementId::Cluster: {
                ClusterSummary c;
                c.unknown_size = el.unknown_size();
                out.clusters.push_back(c);
                walk(buffer, el.payload, out);
                break;
            }
            case ElementId::DocType:
                out.doc_type.assign(buffer.begin() + static_cast<std::ptrdiff_t>(el.payload.offset),
                                    buffer.begin() + static_cast<std::ptrdiff_t>(el.payload.end()));
                // Strings may be zero-padded.
                while (!out.doc_type.empty() && out.doc_type.back() == '\0') {
                    out.doc_type.pop_back();
                }
                break;
            case ElementId::TimecodeScale:
                out.timecode_scale = read_unsigned(buffer, el.payload);
                break;
            case ElementId::Duration:
                out.duration = read_float(buffer, el.payload);
                out.duration_count++;
                break;
            case ElementId::Timecode:
                if (!out.clusters.empty()) {
                    out.clusters.back().timecode = read_unsigned(buffer, el.payload);
                }
                break;
            case ElementId::SimpleBlock: {
                if (el.payload.length < 3) {
                    throw EbmlError(EbmlErrorKind::MalformedElement, el.id_span.offset,
                                    "SimpleBlock shorter than its header");
                }
                const size_t p = el.payload.offset + 1;
                const uint16_t raw = static_cast<uint16_t>((buffer[p] << 8) | buffer[p + 1]);
                out.block_timecodes.push_back(static_cast<int16_t>(raw));
                if (!out.clusters.empty()) {
                    out.clusters.back().block_count++;
                }
                break;
            }
            default:
                break;
        }
    }
}

}  // namespace

ContainerSummary inspect_container(const std::vector<uint8_t> &buffer) {
    ContainerSummary summary;
    walk(buffer, ByteRange{0, buffer.size()}, summary);
    CF_LOG("ebml", "inspected " << summary.element_count << " elements, doc type '"
                                << summary.doc_type << "', " << summary.clusters.size()
                                << " clusters, " << summary.block_timecodes.size() << " frames");
    return summary;
}

uint64_t count_frames(const std::vector<uint8_t> &buffer) {
    return inspect_container(buffer).block_timecodes.size();
}

}  // namespace cadencefix
