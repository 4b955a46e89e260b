//
//  ebml_error.hpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cadencefix {

enum class EbmlErrorKind {
    UnrecognizedId,    // identifier outside the schema table
    MalformedVint,     // no length marker, or a value that cannot be encoded
    Truncated,         // element runs past the end of its scope
    MalformedElement,  // element present but its payload has the wrong shape
    Unsupported,       // invalid request (e.g. non-positive frame rate)
};

const char *error_kind_name(EbmlErrorKind kind);

// Fatal decode/rewrite failure. Thrown by the reader and the retimer, converted into a status by
// the public API.
class EbmlError : public std::runtime_error {
   public:
    EbmlError(EbmlErrorKind kind, size_t offset, const std::string &what);

    EbmlErrorKind kind() const { return kind_; }
    size_t offset() const { return offset_; }

   private:
    EbmlErrorKind kind_;
    size_t offset_;
};

}  // namespace cadencefix
