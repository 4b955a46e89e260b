//
//  retimer.hpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "chunk_list.hpp"

namespace cadencefix {

inline constexpr uint32_t kCanonicalTimecodeScale = 1000000;  // 1 ms ticks
inline constexpr size_t kCanonicalTimestampWidth = 4;

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `message` describes what went wrong.
 */
struct RetimeStatus {
    bool ok{false};
    std::string message;
};

// Counters collected while rewriting, for logging and tests.
struct RetimeStats {
    uint64_t frames = 0;             // SimpleBlocks rewritten
    uint64_t clusters = 0;           // Clusters entered
    uint64_t dropped_durations = 0;  // pre-existing Duration elements removed
    uint64_t injected_durations = 0;
    bool block_timecode_wrapped = false;  // a relative timecode exceeded int16
};

/**
 * @brief Outcome of a rewrite attempt.
 *
 * On success `chunks` holds the rewritten container. On failure `chunks` is empty and the caller
 * decides whether to fall back to the raw input.
 */
struct RetimeOutcome {
    RetimeStatus status;
    ChunkList chunks;
    RetimeStats stats;

    bool needs_fallback() const { return !status.ok; }
};

// Millisecond timestamp of frame |index| at a constant |fps|: round(index * 1000 / fps).
int64_t frame_timestamp_ms(uint64_t index, double fps);

/**
 * @brief Rewrite the temporal metadata of a recorded container to a constant frame rate.
 *
 * Segment and Cluster sizes become unknown-size, TimecodeScale is forced to 1,000,000, every
 * Cluster Timecode and SimpleBlock relative timecode is derived from frame ordinals, and Info
 * receives a freshly computed Duration of frame_count / fps * 1000 ms.
 *
 * @param buffer Complete raw container. Never modified.
 * @param fps Target frame rate, finite and > 0.
 * @param frame_count Number of frames the producer submitted.
 * @param stats Optional counters.
 * @return Output spans in document order.
 * @throws EbmlError on any structural or rewrite failure; no partial output is produced.
 */
ChunkList fix_frame_rate(const std::vector<uint8_t> &buffer, double fps, uint64_t frame_count,
                         RetimeStats *stats = nullptr);

// Non-throwing variant of fix_frame_rate().
RetimeOutcome try_fix_frame_rate(const std::vector<uint8_t> &buffer, double fps,
                                 uint64_t frame_count);

}  // namespace cadencefix
