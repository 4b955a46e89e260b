//
//  chunk_list.cpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "chunk_list.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace cadencefix {

void ChunkList::append_source(const ByteRange &range) {
    if (range.length == 0) {
        return;
    }
    OutputChunk c;
    c.source = range;
    total_size_ += range.length;
    chunks_.push_back(std::move(c));
}

void ChunkList::append_bytes(std::vector<uint8_t> bytes) {
    if (bytes.empty()) {
        return;
    }
    OutputChunk c;
    c.owned = true;
    c.bytes = std::move(bytes);
    total_size_ += c.bytes.size();
    chunks_.push_back(std::move(c));
}

void ChunkList::append(ChunkList &&other) {
    total_size_ += other.total_size_;
    chunks_.insert(chunks_.end(), std::make_move_iterator(other.chunks_.begin()),
                   std::make_move_iterator(other.chunks_.end()));
    other.chunks_.clear();
    other.total_size_ = 0;
}

std::vector<uint8_t> ChunkList::flatten(const std::vector<uint8_t> &source) const {
    std::vector<uint8_t> out;
    out.reserve(total_size_);
    for (const auto &c : chunks_) {
        if (c.owned) {
            out.insert(out.end(), c.bytes.begin(), c.bytes.end());
            continue;
        }
        if (c.source.end() > source.size()) {
            throw std::out_of_range("output chunk slice exceeds source buffer");
        }
        out.insert(out.end(), source.begin() + static_cast<std::ptrdiff_t>(c.source.offset),
                   source.begin() + static_cast<std::ptrdiff_t>(c.source.end()));
    }
    return out;
}

}  // namespace cadencefix
