#pragma once

#include "types.hpp"

#include <boost/qvm/mat.hpp>
#include <boost/qvm/vec.hpp>
#include <boost/qvm/vec_mat_operations.hpp>
#include <cmath>

namespace splinerig::core::math {

struct Mat2 {
    boost::qvm::mat<double, 2, 2> a{};

    // Counter-clockwise rotation in a y-up frame.
    static Mat2 rotation(double radians) {
        Mat2 out{};
        const double c = std::cos(radians);
        const double s = std::sin(radians);
        out.a.a[0][0] = c;
        out.a.a[0][1] = -s;
        out.a.a[1][0] = s;
        out.a.a[1][1] = c;
        return out;
    }

    Vec2 transform(const Vec2& v) const {
        boost::qvm::vec<double, 2> in{{v.x, v.y}};
        boost::qvm::vec<double, 2> r = boost::qvm::operator*(a, in);
        return Vec2{r.a[0], r.a[1]};
    }

    Vec2 transformAbout(const Vec2& p, const Vec2& pivot) const {
        return transform(p - pivot) + pivot;
    }
};

} // namespace splinerig::core::math
