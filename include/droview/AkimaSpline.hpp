#pragma once

#include "Types.hpp"
#include <boost/math/interpolators/makima.hpp>
#include <vector>

namespace droview {

/* Modified Akima interpolation, held constant outside the anchors
 * (tabulated input functions must not extrapolate below zero). */
class AkimaSpline {
private:
    mutable decltype(boost::math::interpolators::makima(
        std::vector<Real>(), std::vector<Real>())) spline_;

    Real x_min_, x_max_;
    Real y_min_, y_max_;

public:
    AkimaSpline(const Vector& x, const Vector& y);

    Real operator()(Real x) const;
    Vector operator()(const Vector& x) const;
};

} // namespace droview
