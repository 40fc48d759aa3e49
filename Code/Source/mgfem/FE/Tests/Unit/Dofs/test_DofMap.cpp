/**
 * @file test_DofMap.cpp
 * @brief Unit tests for the cell to DOF table and its owner lookup
 */

#include <gtest/gtest.h>

#include "FE/Dofs/DofMap.h"
#include "FE/Core/FEException.h"

#include <vector>

using mgfem::FE::DofException;
using mgfem::FE::FEException;
using mgfem::FE::GlobalIndex;
using mgfem::FE::LocalIndex;
using mgfem::FE::dofs::DofMap;
using mgfem::FE::dofs::DofMapState;

namespace {

// Two intervals sharing DOF 1: [0 1] [1 2]
DofMap makeTwoCellMapBuilding() {
    DofMap map;
    map.reserve(2, 2);
    map.setCellDofs(0, std::vector<GlobalIndex>{0, 1});
    map.setCellDofs(1, std::vector<GlobalIndex>{1, 2});
    map.setNumDofs(3);
    return map;
}

} // namespace

TEST(DofMap, DefaultConstruction) {
    DofMap map;
    EXPECT_FALSE(map.isFinalized());
    EXPECT_EQ(map.state(), DofMapState::Building);
    EXPECT_EQ(map.getNumCells(), 0);
    EXPECT_EQ(map.getNumDofs(), 0);
    EXPECT_TRUE(map.getDofOwners().empty());
}

TEST(DofMap, FinalizeAndQuery) {
    auto map = makeTwoCellMapBuilding();
    EXPECT_NO_THROW(map.finalize());
    EXPECT_TRUE(map.isFinalized());
    EXPECT_EQ(map.getNumCells(), 2);
    EXPECT_EQ(map.getNumDofs(), 3);
    EXPECT_EQ(map.getMaxDofsPerCell(), static_cast<LocalIndex>(2));

    auto c0 = map.getCellDofs(0);
    ASSERT_EQ(c0.size(), 2u);
    EXPECT_EQ(c0[0], 0);
    EXPECT_EQ(c0[1], 1);

    auto c1 = map.getCellDofs(1);
    ASSERT_EQ(c1.size(), 2u);
    EXPECT_EQ(c1[0], 1);
    EXPECT_EQ(c1[1], 2);

    EXPECT_EQ(map.localToGlobal(1, static_cast<LocalIndex>(0)), 1);
    EXPECT_EQ(map.localToGlobal(1, static_cast<LocalIndex>(1)), 2);
    EXPECT_EQ(map.getNumCellDofs(0), static_cast<LocalIndex>(2));
    EXPECT_THROW(map.localToGlobal(1, static_cast<LocalIndex>(2)), FEException);
    EXPECT_THROW(map.getCellDofs(2), DofException);
}

TEST(DofMap, OwnerIsFirstReferencingCell) {
    auto map = makeTwoCellMapBuilding();
    map.finalize();

    EXPECT_EQ(map.getDofOwner(0).cell, 0);
    EXPECT_EQ(map.getDofOwner(0).local, static_cast<LocalIndex>(0));
    // DOF 1 is shared; the lower cell owns it
    EXPECT_EQ(map.getDofOwner(1).cell, 0);
    EXPECT_EQ(map.getDofOwner(1).local, static_cast<LocalIndex>(1));
    EXPECT_EQ(map.getDofOwner(2).cell, 1);
    EXPECT_EQ(map.getDofOwner(2).local, static_cast<LocalIndex>(1));
    EXPECT_EQ(map.getDofOwners().size(), 3u);

    EXPECT_THROW(map.getDofOwner(3), DofException);
}

TEST(DofMap, Multiplicity) {
    auto map = makeTwoCellMapBuilding();
    map.finalize();
    const auto mult = map.getDofMultiplicity();
    ASSERT_EQ(mult.size(), 3u);
    EXPECT_EQ(mult[0], 1u);
    EXPECT_EQ(mult[1], 2u);
    EXPECT_EQ(mult[2], 1u);
}

TEST(DofMap, OwnerRequiresFinalize) {
    auto map = makeTwoCellMapBuilding();
    EXPECT_THROW(map.getDofOwner(0), FEException);
}

TEST(DofMap, FinalizeValidatesDofRange) {
    DofMap map;
    map.reserve(1, 2);
    map.setCellDofs(0, std::vector<GlobalIndex>{0, 10});
    map.setNumDofs(2);

    EXPECT_FALSE(map.validate());
    EXPECT_FALSE(map.validationError().empty());
    EXPECT_THROW(map.finalize(), FEException);
}

TEST(DofMap, FinalizeRejectsUnreferencedDofs) {
    DofMap map;
    map.setCellDofs(0, std::vector<GlobalIndex>{0, 2});
    map.setNumDofs(3);
    EXPECT_TRUE(map.validate());
    EXPECT_THROW(map.finalize(), DofException);
}

TEST(DofMap, SetCellDofsOutOfOrderThrows) {
    DofMap map;
    map.reserve(2, 2);
    EXPECT_THROW(map.setCellDofs(1, std::vector<GlobalIndex>{0, 1}), FEException);
    EXPECT_NO_THROW(map.setCellDofs(0, std::vector<GlobalIndex>{1, 2}));
}

TEST(DofMap, RawArrays) {
    auto map = makeTwoCellMapBuilding();
    map.finalize();
    const auto offsets = map.getOffsets();
    ASSERT_EQ(offsets.size(), 3u);
    EXPECT_EQ(offsets[0], 0);
    EXPECT_EQ(offsets[1], 2);
    EXPECT_EQ(offsets[2], 4);
    EXPECT_EQ(map.getDofIndices().size(), 4u);
}

TEST(DofMap, MutationsAfterFinalizeThrow) {
    auto map = makeTwoCellMapBuilding();
    map.finalize();

    EXPECT_THROW(map.setNumDofs(3), FEException);
    EXPECT_THROW(map.reserve(2, 2), FEException);
    EXPECT_THROW(map.setCellDofs(2, std::vector<GlobalIndex>{0, 1}), FEException);
    EXPECT_THROW(map.finalize(), FEException);
}
