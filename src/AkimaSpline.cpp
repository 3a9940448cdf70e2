#include "droview/AkimaSpline.hpp"
#include <stdexcept>

namespace droview {

// anchors as the std::vector boost::math expects; makima needs >= 4
static std::vector<Real> anchors(const Vector& v, Eigen::Index expected,
                                 bool increasing = false)
{
    if (v.size() != expected)
        throw std::invalid_argument("AkimaSpline: abscissa and ordinate differ in length");
    if (v.size() < 4)
        throw std::invalid_argument("AkimaSpline: need at least 4 anchors");
    if (increasing)
        for (Eigen::Index i = 1; i < v.size(); ++i)
            if (!(v[i] > v[i - 1]))
                throw std::invalid_argument("AkimaSpline: abscissa must be strictly increasing");
    return std::vector<Real>(v.data(), v.data() + v.size());
}

AkimaSpline::AkimaSpline(const Vector& x, const Vector& y)
    : spline_(anchors(x, y.size(), true), anchors(y, x.size())),
      x_min_(x[0]),
      x_max_(x[x.size() - 1])
{
    y_min_ = y[0];
    y_max_ = y[y.size() - 1];
}

Real AkimaSpline::operator()(Real x) const
{
    if (x <= x_min_) return y_min_;
    if (x >= x_max_) return y_max_;
    return spline_(x);
}

Vector AkimaSpline::operator()(const Vector& x) const
{
    return x.unaryExpr([this](Real v) { return (*this)(v); });
}

} // namespace droview
