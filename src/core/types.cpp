/**
 * MixGraph - Type Helpers
 */

#include "mixgraph/types.h"
#include <algorithm>

namespace mixgraph {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:     return "InvalidArgument";
        case ErrorCode::MissingInput:        return "MissingInput";
        case ErrorCode::DecodeError:         return "DecodeError";
        case ErrorCode::NoMatch:             return "NoMatch";
        case ErrorCode::BeatTrackingFailure: return "BeatTrackingFailure";
        case ErrorCode::Timeout:             return "Timeout";
        case ErrorCode::StoreError:          return "StoreError";
        case ErrorCode::GraphPath:           return "GraphPath";
        case ErrorCode::Unknown:
        default:                             return "Unknown";
    }
}

const char* refine_status_name(RefineStatus status) {
    switch (status) {
        case RefineStatus::Refined:   return "refined";
        case RefineStatus::RoughOnly: return "rough-only";
        case RefineStatus::Timeout:   return "timeout";
        case RefineStatus::NoMatch:
        default:                      return "no-match";
    }
}

FeatureMatrix FeatureMatrix::slice(size_t begin, size_t end) const {
    end = std::min(end, frames);
    if (begin >= end) return FeatureMatrix(channels, 0);

    FeatureMatrix out(channels, end - begin);
    for (int c = 0; c < channels; ++c) {
        std::copy(row(c) + begin, row(c) + end, out.row(c));
    }
    return out;
}

} // namespace mixgraph
