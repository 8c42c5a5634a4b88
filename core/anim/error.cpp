#include "error.hpp"

#include "../log.hpp"

namespace splinerig::core::anim {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Cycle: return "cycle";
    case ErrorKind::MissingDriver: return "missing_driver";
    case ErrorKind::InvalidFrameCount: return "invalid_frame_count";
    case ErrorKind::EmptyPath: return "empty_path";
    case ErrorKind::SelfDrive: return "self_drive";
    case ErrorKind::DuplicateName: return "duplicate_name";
    case ErrorKind::MalformedPoint: return "malformed_point";
    case ErrorKind::OffsetClamped: return "offset_clamped";
    case ErrorKind::InvalidParameter: return "invalid_parameter";
    }
    return "unknown";
}

void report(Diagnostics& out, ErrorKind kind, const std::string& layer, const std::string& message) {
    out.push_back(Diagnostic{kind, layer, message});
    log::message(std::string("[") + errorKindName(kind) + "] " + (layer.empty() ? "" : "layer '" + layer + "': ") + message);
}

} // namespace splinerig::core::anim
