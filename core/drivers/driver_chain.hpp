#pragma once

#include "../anim/layer.hpp"
#include "../anim/point.hpp"

#include <map>
#include <string>

namespace splinerig::core::drivers {

using anim::Path;
using math::Vec2;

// World-space frames of every layer resolved so far, keyed by layer name.
using ResolvedPaths = std::map<std::string, Path>;

// Rotates about the first point of the path; positive degrees turn counter-clockwise.
Path rotatePath(const Path& path, double degrees);

// Blends every interior point with its neighbours, weight smooth/2 per side.
// smooth is clamped to [0,1]; endpoints are left untouched.
Path smoothPath(const Path& path, double smooth);

// Raw driver path with the relation's rotate and smooth applied.
Path transformDriverPath(const Path& raw, const anim::DriverSpec& relation);

// Whether the relation needs the driver's path re-baked instead of reusing its frames.
inline bool reshapesDriver(const anim::DriverSpec& relation) {
    return relation.rotateDegrees != 0.0 || relation.smooth > 0.0;
}

// driven[i] + (motion[i] - motion[0]) * deltaScale. Empty motion leaves driven as is;
// a shorter motion holds its last sample.
Path applyDriverOffset(const Path& driven, const Path& motion, double deltaScale);

} // namespace splinerig::core::drivers
