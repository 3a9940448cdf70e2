#include "droview/MapResolver.hpp"
#include "droview/Statistics.hpp"
#include "droview/Errors.hpp"
#include "TestFixtures.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <set>
#include <utility>

using namespace droview;
using namespace droview::testing;

namespace {

std::set<std::pair<int, int>> crosshair_cells(const Voxel& v)
{
    return {{v.x - 3, v.y}, {v.x - 2, v.y}, {v.x + 2, v.y}, {v.x + 3, v.y},
            {v.x, v.y - 3}, {v.x, v.y - 2}, {v.x, v.y + 2}, {v.x, v.y + 3}};
}

} // namespace

/* --------------------------------------------------------------------- */
/*                             crosshair                                 */
/* --------------------------------------------------------------------- */
TEST(ParameterMap, SameShapeChangedOnlyOnCrosshair)
{
    const Dataset ds = viewer_dataset(10, 8);
    const Voxel v{4, 3};
    const auto view = resolve_parameter_map(ds, ModelId::Exchange, "PS", v);
    const Matrix& src = ds.parameter_map(ModelId::Exchange, "PS");

    ASSERT_EQ(view.map.rows(), src.rows());
    ASSERT_EQ(view.map.cols(), src.cols());

    const auto cross = crosshair_cells(v);
    for (int y = 0; y < ds.ny(); ++y)
        for (int x = 0; x < ds.nx(); ++x) {
            if (cross.count({x, y})) EXPECT_EQ(view.map(x, y), 0.0) << x << "," << y;
            else                     EXPECT_EQ(view.map(x, y), src(x, y)) << x << "," << y;
        }
}

TEST(ParameterMap, CentreAndGapAreLeftOpen)
{
    Matrix m = Matrix::Constant(9, 9, 7.0);
    apply_crosshair(m, {4, 4});
    EXPECT_EQ(m(4, 4), 7.0);
    EXPECT_EQ(m(3, 4), 7.0);
    EXPECT_EQ(m(5, 4), 7.0);
    EXPECT_EQ(m(4, 3), 7.0);
    EXPECT_EQ(m(4, 5), 7.0);
    EXPECT_EQ(m(3, 3), 7.0);                // diagonals untouched
    EXPECT_EQ((m.array() == 0.0).count(), 8);
}

TEST(ParameterMap, CrosshairIsIdempotent)
{
    const Dataset ds = viewer_dataset(10, 8);
    const Voxel v{5, 4};
    const auto view = resolve_parameter_map(ds, ModelId::Tofts, "Kt", v);
    Matrix again = view.map;
    apply_crosshair(again, v);
    EXPECT_EQ(again, view.map);
}

TEST(ParameterMap, CrosshairClipsAtTheBorder)
{
    Matrix m = Matrix::Constant(5, 4, 1.0);
    EXPECT_NO_THROW(apply_crosshair(m, {0, 0}));
    EXPECT_EQ(m(2, 0), 0.0);
    EXPECT_EQ(m(3, 0), 0.0);
    EXPECT_EQ(m(0, 2), 0.0);
    EXPECT_EQ(m(0, 3), 0.0);
    EXPECT_EQ((m.array() == 0.0).count(), 4);

    Matrix far = Matrix::Constant(5, 4, 1.0);
    EXPECT_NO_THROW(apply_crosshair(far, {20, -20}));
    EXPECT_EQ((far.array() == 0.0).count(), 0);
}

TEST(ParameterMap, StoredMapIsNotModified)
{
    const Dataset ds = viewer_dataset(10, 8);
    const Matrix before = ds.parameter_map(ModelId::Uptake, "vp");
    resolve_parameter_map(ds, ModelId::Uptake, "vp", {4, 4});
    EXPECT_EQ(ds.parameter_map(ModelId::Uptake, "vp"), before);
}

/* --------------------------------------------------------------------- */
/*                            colour bounds                              */
/* --------------------------------------------------------------------- */
TEST(ParameterMap, BoundsAreZeroToNinetiethPercentile)
{
    const Dataset ds = viewer_dataset(10, 8);
    const auto view = resolve_parameter_map(ds, ModelId::ExtendedTofts, "kep", {4, 4});
    const double q90 = quantile(finite_values(ds.parameter_map(ModelId::ExtendedTofts, "kep")), 0.9);
    EXPECT_EQ(view.bounds.first, 0.0);
    EXPECT_DOUBLE_EQ(view.bounds.second, q90);
}

TEST(ParameterMap, BoundsIgnoreInvalidEntries)
{
    // 10 x 10 map, values in [0, 100], every tenth voxel invalid
    const int n = 10;
    Matrix kt(n, n);
    std::vector<double> valid;
    for (int y = 0; y < n; ++y)
        for (int x = 0; x < n; ++x) {
            const int i = x + n * y;
            if (i % 10 == 3) { kt(x, y) = kNaN; continue; }
            kt(x, y) = std::fmod(37.0 * i, 101.0) * (100.0 / 100.0);
            valid.push_back(kt(x, y));
        }

    ModelFits mf;
    mf.parameters = {{"Kt", kt}, {"ve", filled(n, n, 0.2)}, {"vp", filled(n, n, 0.0)}};
    mf.rss = filled(n, n, 0.0);
    std::map<ModelId, ModelFits> fits;
    fits.emplace(ModelId::Tofts, std::move(mf));
    const Dataset ds(Vector::LinSpaced(4, 0, 3), Vector::Zero(4),
                     Matrix::Zero(n * n, 4), n, n, std::move(fits));

    const auto view = resolve_parameter_map(ds, ModelId::Tofts, "Kt", {5, 5});
    EXPECT_EQ(valid.size(), 90u);
    EXPECT_DOUBLE_EQ(view.bounds.second, quantile(valid, 0.9));
}

TEST(ParameterMap, AllInvalidIsEmptyDistribution)
{
    ModelFits mf;
    mf.parameters = {{"Kt", filled(7, 7, kNaN)}, {"ve", filled(7, 7, kNaN)}, {"vp", filled(7, 7, kNaN)}};
    mf.rss = filled(7, 7, kNaN);
    std::map<ModelId, ModelFits> fits;
    fits.emplace(ModelId::Tofts, std::move(mf));
    const Dataset ds(Vector::LinSpaced(4, 0, 3), Vector::Zero(4),
                     Matrix::Zero(49, 4), 7, 7, std::move(fits));

    EXPECT_THROW(resolve_parameter_map(ds, ModelId::Tofts, "Kt", {3, 3}), EmptyDistributionError);
}

TEST(ParameterMap, UnknownKeysPropagate)
{
    const Dataset ds = small_dataset();
    EXPECT_THROW(resolve_parameter_map(ds, ModelId::Exchange, "Fp", {1, 1}), UnknownModelError);
    EXPECT_THROW(resolve_parameter_map(ds, ModelId::Tofts, "Fp", {1, 1}), UnknownParameterError);
}

/* --------------------------------------------------------------------- */
/*                        lowest-residual map                            */
/* --------------------------------------------------------------------- */
class BestModelTest : public ::testing::Test {
protected:
    static constexpr int nx = 4, ny = 3;

    std::map<ModelId, Matrix> all_invalid() const
    {
        std::map<ModelId, Matrix> rss;
        for (ModelId id : kAllModels) rss.emplace(id, filled(nx, ny, kNaN));
        return rss;
    }

    std::vector<ModelId> canonical{kAllModels.begin(), kAllModels.end()};
};

TEST_F(BestModelTest, SingleValidModelWins)
{
    auto rss = all_invalid();
    rss[ModelId::Uptake](1, 2) = 0.01;
    const IndexMap best = resolve_best_model_map(dataset_with_rss(rss, nx, ny), canonical);
    EXPECT_EQ(best(1, 2), 2);
}

TEST_F(BestModelTest, AllInvalidIsUndefinedNotZero)
{
    auto rss = all_invalid();
    rss[ModelId::Tofts](0, 0) = 0.5;
    const IndexMap best = resolve_best_model_map(dataset_with_rss(rss, nx, ny), canonical);
    EXPECT_EQ(best(0, 0), 3);
    EXPECT_EQ(best(1, 0), kUndefinedModel);
    EXPECT_EQ(best(3, 2), kUndefinedModel);
    EXPECT_NE(kUndefinedModel, 0);
}

TEST_F(BestModelTest, TiesGoToTheEarlierModel)
{
    std::map<ModelId, Matrix> rss;
    rss.emplace(ModelId::Exchange,      filled(nx, ny, 0.2));
    rss.emplace(ModelId::ExtendedTofts, filled(nx, ny, 0.1));
    rss.emplace(ModelId::Uptake,        filled(nx, ny, 0.3));
    rss.emplace(ModelId::Tofts,         filled(nx, ny, 0.1));
    const Dataset ds = dataset_with_rss(rss, nx, ny);

    for (int run = 0; run < 3; ++run) {
        const IndexMap best = resolve_best_model_map(ds, canonical);
        EXPECT_TRUE((best.array() == 1).all());
    }
}

TEST_F(BestModelTest, InvalidLosesAgainstAnyValidResidual)
{
    auto rss = all_invalid();
    rss[ModelId::Exchange]      = filled(nx, ny, 1e9);
    rss[ModelId::ExtendedTofts](2, 1) = 0.0;
    const IndexMap best = resolve_best_model_map(dataset_with_rss(rss, nx, ny), canonical);
    EXPECT_EQ(best(2, 1), 1);
    EXPECT_EQ(best(0, 0), 0);
}

TEST_F(BestModelTest, PicksMinimumPerVoxel)
{
    std::map<ModelId, Matrix> rss;
    for (ModelId id : kAllModels) rss.emplace(id, filled(nx, ny, 1.0));
    rss[ModelId::Tofts](0, 1)         = 0.2;
    rss[ModelId::Uptake](0, 1)        = 0.3;
    rss[ModelId::ExtendedTofts](3, 2) = 0.9;
    rss[ModelId::Exchange](3, 2)      = kNaN;
    const IndexMap best = resolve_best_model_map(dataset_with_rss(rss, nx, ny), canonical);

    EXPECT_EQ(best.rows(), nx);
    EXPECT_EQ(best.cols(), ny);
    EXPECT_EQ(best(0, 1), 3);
    EXPECT_EQ(best(3, 2), 1);
    EXPECT_EQ(best(1, 1), 0);
}

TEST_F(BestModelTest, IndexRefersToGivenOrder)
{
    auto rss = all_invalid();
    rss[ModelId::Uptake](1, 1) = 0.01;
    const std::vector<ModelId> order = {ModelId::Uptake, ModelId::Tofts};
    const IndexMap best = resolve_best_model_map(dataset_with_rss(rss, nx, ny), order);
    EXPECT_EQ(best(1, 1), 0);
}

TEST_F(BestModelTest, ModelMissingFromDatasetThrows)
{
    const Dataset ds = small_dataset();
    EXPECT_THROW(resolve_best_model_map(ds, canonical), UnknownModelError);
}

/* --------------------------------------------------------------------- */
/*                          residual panels                              */
/* --------------------------------------------------------------------- */
TEST(ResidualPanels, OnePanelPerModelWithFixedScale)
{
    const Dataset ds = viewer_dataset(10, 8);
    const auto panels = resolve_residual_panels(ds);
    ASSERT_EQ(panels.size(), 4u);
    for (std::size_t k = 0; k < panels.size(); ++k) {
        EXPECT_EQ(panels[k].model, kAllModels[k]);
        EXPECT_EQ(panels[k].bounds, (std::pair<double, double>{0.0, 5e-4}));
        EXPECT_EQ(panels[k].map, ds.residual_map(kAllModels[k]));
    }
}
