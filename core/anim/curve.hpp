#pragma once

#include "point.hpp"

#include <memory>
#include <optional>
#include <string>

namespace splinerig::core::anim {

enum class Interpolation {
    Linear,
    Cardinal,
    Basis,
    Points,
};

std::optional<Interpolation> parseInterpolation(const std::string& name);
const char* interpolationName(Interpolation interp);

// Expands sparse control points into a dense polyline. Output samples that
// coincide with an input control point keep its isControl/highlighted tags.
class Curve {
public:
    explicit Curve(int stepsPerSegment) : steps_(stepsPerSegment < 1 ? 1 : stepsPerSegment) {}
    virtual ~Curve() = default;

    virtual Interpolation kind() const = 0;
    virtual Path densify(const Path& controls) const = 0;

    int stepsPerSegment() const { return steps_; }

protected:
    int steps_;
};

// Identity densifier used by Linear and Points.
class LinearCurve : public Curve {
public:
    explicit LinearCurve(int stepsPerSegment = 3, Interpolation kind = Interpolation::Linear)
        : Curve(stepsPerSegment), kind_(kind) {}
    Interpolation kind() const override { return kind_; }
    Path densify(const Path& controls) const override;

private:
    Interpolation kind_;
};

// Catmull-Rom with clamped end tangents. Highlighted points are doubled.
class CardinalCurve : public Curve {
public:
    explicit CardinalCurve(int stepsPerSegment = 3) : Curve(stepsPerSegment) {}
    Interpolation kind() const override { return Interpolation::Cardinal; }
    Path densify(const Path& controls) const override;
};

// Uniform cubic B-spline. Highlighted points are tripled.
class BasisCurve : public Curve {
public:
    explicit BasisCurve(int stepsPerSegment = 3) : Curve(stepsPerSegment) {}
    Interpolation kind() const override { return Interpolation::Basis; }
    Path densify(const Path& controls) const override;
};

std::unique_ptr<Curve> createCurve(Interpolation interp, int stepsPerSegment = 3);

} // namespace splinerig::core::anim
