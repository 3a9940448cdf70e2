#include "droview/ExpConvolution.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace droview;

namespace {

Vector uneven_grid()
{
    Vector t(7);
    t << 0.0, 0.1, 0.3, 0.35, 1.0, 2.5, 4.0;
    return t;
}

} // namespace

TEST(ExpConv, ConstantInputIsExact)
{
    const Vector t = uneven_grid();
    const double T = 0.7;
    const Vector f = expconv(T, t, Vector::Ones(t.size()));
    for (int i = 0; i < t.size(); ++i)
        EXPECT_NEAR(f[i], T * (1.0 - std::exp(-t[i] / T)), 1e-12);
}

TEST(ExpConv, LinearInputIsExact)
{
    // ∫₀ᵗ τ e^{-(t-τ)/T} dτ = T t − T² (1 − e^{-t/T})
    const Vector t = uneven_grid();
    const double T = 1.3;
    const Vector f = expconv(T, t, t);
    for (int i = 0; i < t.size(); ++i)
        EXPECT_NEAR(f[i], T * t[i] - T * T * (1.0 - std::exp(-t[i] / T)), 1e-12);
}

TEST(ExpConv, InfiniteTimeConstantIsRunningIntegral)
{
    const Vector t = uneven_grid();
    const Vector x = t.array().square();
    const Vector f = expconv(std::numeric_limits<double>::infinity(), t, x);
    const Vector F = cumulative_trapz(t, x);
    for (int i = 0; i < t.size(); ++i) EXPECT_DOUBLE_EQ(f[i], F[i]);
}

TEST(ExpConv, ZeroTimeConstantGivesZero)
{
    const Vector t = uneven_grid();
    EXPECT_TRUE(expconv(0.0, t, t).isZero());
}

TEST(ExpConv, RejectsBadInput)
{
    const Vector t = uneven_grid();
    EXPECT_THROW(expconv(-1.0, t, t), std::invalid_argument);
    EXPECT_THROW(expconv(1.0, t, Vector::Ones(3)), std::invalid_argument);
    EXPECT_THROW(cumulative_trapz(t, Vector::Ones(3)), std::invalid_argument);
}

TEST(CumulativeTrapz, Triangle)
{
    Vector t(3), x(3);
    t << 0.0, 1.0, 2.0;
    x << 0.0, 2.0, 0.0;
    const Vector F = cumulative_trapz(t, x);
    EXPECT_DOUBLE_EQ(F[0], 0.0);
    EXPECT_DOUBLE_EQ(F[1], 1.0);
    EXPECT_DOUBLE_EQ(F[2], 2.0);
}
