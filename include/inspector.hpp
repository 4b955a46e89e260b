//
//  inspector.hpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cadencefix {

struct ClusterSummary {
    std::optional<uint64_t> timecode;
    bool unknown_size = false;
    uint64_t block_count = 0;
};

// Read-only view of the timing-relevant parts of a container.
struct ContainerSummary {
    std::string doc_type;
    std::optional<uint64_t> timecode_scale;
    std::optional<double> duration;
    size_t duration_count = 0;  // number of Duration elements under Info
    bool segment_unknown_size = false;
    std::vector<ClusterSummary> clusters;
    std::vector<int16_t> block_timecodes;  // relative timecode of every SimpleBlock
    uint64_t element_count = 0;
};

// Decode the container structure without rewriting anything. Throws EbmlError on the same
// conditions as the retimer.
ContainerSummary inspect_container(const std::vector<uint8_t> &buffer);

// Number of SimpleBlock elements in the container.
uint64_t count_frames(const std::vector<uint8_t> &buffer);

}  // namespace cadencefix
