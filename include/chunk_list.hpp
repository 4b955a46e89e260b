//
//  chunk_list.hpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "ebml_reader.hpp"

namespace cadencefix {

// A span of output: either a slice of the source buffer or bytes built during the rewrite.
struct OutputChunk {
    bool owned = false;
    ByteRange source;            // valid when !owned
    std::vector<uint8_t> bytes;  // valid when owned

    size_t size() const { return owned ? bytes.size() : source.length; }
};

// Ordered output spans; concatenated they form the rewritten container.
class ChunkList {
   public:
    void append_source(const ByteRange &range);
    void append_bytes(std::vector<uint8_t> bytes);
    void append(ChunkList &&other);

    const std::vector<OutputChunk> &chunks() const { return chunks_; }
    size_t count() const { return chunks_.size(); }
    bool empty() const { return chunks_.empty(); }
    size_t total_size() const { return total_size_; }

    // Concatenate every chunk. |source| must be the buffer the slices were taken from.
    std::vector<uint8_t> flatten(const std::vector<uint8_t> &source) const;

   private:
    std::vector<OutputChunk> chunks_;
    size_t total_size_ = 0;
};

}  // namespace cadencefix
