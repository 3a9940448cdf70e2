#include "droview/SelectionState.hpp"
#include "droview/Errors.hpp"
#include "TestFixtures.hpp"
#include <gtest/gtest.h>

using namespace droview;
using namespace droview::testing;

class SelectionStateTest : public ::testing::Test {
protected:
    Dataset        ds  = viewer_dataset(10, 8);
    ModelRegistry  reg = ModelRegistry::standard();
    SelectionState sel = SelectionState::defaults(ds, reg);
};

TEST_F(SelectionStateTest, Defaults)
{
    EXPECT_EQ(sel.models(), reg.canonical_order());
    EXPECT_EQ(sel.primary(), ModelId::Exchange);
    EXPECT_EQ(sel.parameter(), "Tp");
    EXPECT_EQ(sel.voxel(), (Voxel{5, 4}));
    EXPECT_EQ(sel.figure_width(), 600);
    EXPECT_EQ(sel.figure_height(), 400);
    EXPECT_NO_THROW(sel.validate(ds, reg));
}

TEST_F(SelectionStateTest, DefaultsOnlyOfferDatasetModels)
{
    std::map<ModelId, Matrix> rss{{ModelId::Uptake, filled(10, 8, 0.1)},
                                  {ModelId::Tofts,  filled(10, 8, 0.2)}};
    const Dataset partial = dataset_with_rss(rss, 10, 8);
    const SelectionState s = SelectionState::defaults(partial, reg, 800, 500);

    EXPECT_EQ(s.models(), (std::vector<ModelId>{ModelId::Uptake, ModelId::Tofts}));
    EXPECT_EQ(s.parameter(), "vp");
    EXPECT_EQ(s.figure_width(), 800);
    EXPECT_EQ(s.figure_height(), 500);
}

TEST_F(SelectionStateTest, VoxelRangeKeepsCrosshairInside)
{
    EXPECT_EQ(SelectionState::voxel_range(10), (std::pair<int, int>{3, 7}));
    EXPECT_EQ(SelectionState::voxel_range(64), (std::pair<int, int>{3, 61}));
}

TEST_F(SelectionStateTest, UpdatesReplaceOneField)
{
    const SelectionState moved = sel.with_voxel({3, 3});
    EXPECT_EQ(moved.voxel(), (Voxel{3, 3}));
    EXPECT_EQ(moved.models(), sel.models());
    EXPECT_EQ(moved.parameter(), sel.parameter());
    EXPECT_EQ(sel.voxel(), (Voxel{5, 4}));

    const SelectionState ps = sel.with_parameter("PS");
    EXPECT_EQ(ps.parameter(), "PS");
    EXPECT_EQ(ps.voxel(), sel.voxel());
    EXPECT_EQ(sel.parameter(), "Tp");

    const SelectionState big = sel.with_figure_size(1200, 900);
    EXPECT_EQ(big.figure_width(), 1200);
    EXPECT_EQ(big.figure_height(), 900);
    EXPECT_EQ(sel.figure_width(), 600);
}

TEST_F(SelectionStateTest, NewPrimaryRebuildsParameterMenu)
{
    const SelectionState tofts = sel.with_models({ModelId::Tofts, ModelId::Uptake}, reg);
    EXPECT_EQ(tofts.primary(), ModelId::Tofts);
    EXPECT_EQ(tofts.parameter(), "vp");
    EXPECT_NO_THROW(tofts.validate(ds, reg));

    // still valid for the new primary: kept
    const SelectionState ve = sel.with_parameter("ve")
                                 .with_models({ModelId::ExtendedTofts}, reg);
    EXPECT_EQ(ve.parameter(), "ve");
}

TEST_F(SelectionStateTest, EmptySelection)
{
    const SelectionState none = sel.with_models({}, reg);
    EXPECT_THROW(none.primary(), SelectionError);
    EXPECT_THROW(none.validate(ds, reg), SelectionError);
}

TEST_F(SelectionStateTest, ParameterMustBelongToPrimary)
{
    EXPECT_THROW(sel.with_parameter("Kt").validate(ds, reg), SelectionError);
    EXPECT_THROW(sel.with_parameter("").validate(ds, reg), SelectionError);
}

TEST_F(SelectionStateTest, DuplicateModel)
{
    const auto dup = sel.with_models({ModelId::Tofts, ModelId::Tofts}, reg);
    EXPECT_THROW(dup.validate(ds, reg), SelectionError);
}

TEST_F(SelectionStateTest, ModelMissingFromDataset)
{
    std::map<ModelId, Matrix> rss{{ModelId::Tofts, filled(10, 8, 0.2)}};
    const Dataset tofts_only = dataset_with_rss(rss, 10, 8);
    const auto s = SelectionState::defaults(tofts_only, reg)
                       .with_models({ModelId::Tofts, ModelId::Uptake}, reg);
    EXPECT_THROW(s.validate(tofts_only, reg), SelectionError);
}

TEST_F(SelectionStateTest, VoxelMustLeaveRoomForCrosshair)
{
    EXPECT_NO_THROW(sel.with_voxel({3, 3}).validate(ds, reg));
    EXPECT_NO_THROW(sel.with_voxel({6, 4}).validate(ds, reg));
    EXPECT_THROW(sel.with_voxel({2, 4}).validate(ds, reg), SelectionError);
    EXPECT_THROW(sel.with_voxel({7, 4}).validate(ds, reg), SelectionError);
    EXPECT_THROW(sel.with_voxel({5, 5}).validate(ds, reg), SelectionError);
}

TEST_F(SelectionStateTest, FigureSizeMustBePositive)
{
    EXPECT_THROW(sel.with_figure_size(0, 400).validate(ds, reg), SelectionError);
    EXPECT_THROW(sel.with_figure_size(600, -1).validate(ds, reg), SelectionError);
}
