//
//  ebml_error.cpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "ebml_error.hpp"

namespace cadencefix {

const char *error_kind_name(EbmlErrorKind kind) {
    switch (kind) {
        case EbmlErrorKind::UnrecognizedId:
            return "unrecognized id";
        case EbmlErrorKind::MalformedVint:
            return "malformed vint";
        case EbmlErrorKind::Truncated:
            return "truncated";
        case EbmlErrorKind::MalformedElement:
            return "malformed element";
        case EbmlErrorKind::Unsupported:
            return "unsupported";
    }
    return "unknown";
}

EbmlError::EbmlError(EbmlErrorKind kind, size_t offset, const std::string &what)
    : std::runtime_error(what), kind_(kind), offset_(offset) {}

}  // namespace cadencefix
