/// @file tests/formulation/test_adjust_to_target.cpp
/// @brief Unit tests for FormulationService weight operations.
///
/// Test categories:
///   - adjust_to_target_weight: scaling, locks, exactness, every failure
///   - set_ingredient_amount: plain edits, maintain_total, rollback
///   - ScopedLockOverride restoration
///   - normalize_to_100g / scale_all / distribute_percentages
///   - Lock toggles

#include <gtest/gtest.h>
#include "../test_support.hpp"
#include "fce/formulation.hpp"

using namespace fce;
using namespace fce::formulation;
using fce::testing::D;
using fce::testing::make_formulation;

namespace {

Decimal amount(const model::Formulation& f, std::size_t i) {
    return f.ingredients()[i].amount_g();
}

}  // namespace

// ─── adjust_to_target_weight ─────────────────────────────────────────────────

TEST(FormulationService_Adjust, LockedStaysUnlockedScales) {
    auto f = make_formulation({"50", "30", "20"}, {true, false, false});
    ASSERT_EQ(FormulationService::adjust_to_target_weight(f, Decimal(150)), Status::Ok);
    EXPECT_EQ(amount(f, 0), Decimal(50));
    EXPECT_EQ(amount(f, 1), Decimal(60));
    EXPECT_EQ(amount(f, 2), Decimal(40));
    EXPECT_EQ(f.total_weight(), Decimal(150));
}

TEST(FormulationService_Adjust, NonTerminatingFactor_TotalExact) {
    auto f = make_formulation({"1", "1", "1"});
    ASSERT_EQ(FormulationService::adjust_to_target_weight(f, Decimal(100)), Status::Ok);
    EXPECT_EQ(f.total_weight(), Decimal(100));
}

TEST(FormulationService_Adjust, LockedBetweenUnlocked_TotalExact) {
    auto f = make_formulation({"1", "50", "1", "1"}, {false, true, false, false});
    ASSERT_EQ(FormulationService::adjust_to_target_weight(f, Decimal(250)), Status::Ok);
    EXPECT_EQ(amount(f, 1), Decimal(50));
    EXPECT_EQ(f.total_weight(), Decimal(250));
}

TEST(FormulationService_Adjust, InterleavedLocks_TotalExact) {
    auto f = make_formulation({"2", "50", "2", "50", "2"}, {false, true, false, true, false});
    ASSERT_EQ(FormulationService::adjust_to_target_weight(f, Decimal(300)), Status::Ok);
    EXPECT_EQ(amount(f, 1), Decimal(50));
    EXPECT_EQ(amount(f, 3), Decimal(50));
    EXPECT_EQ(f.total_weight(), Decimal(300));
}

TEST(FormulationService_Adjust, SeventhsTarget_TotalExact) {
    // 1105/7 to 28 digits; a full-residual step lands on a half-even tie.
    const Decimal target = D("157.8571428571428571428571429");
    auto f = make_formulation({"896.39", "123"});
    ASSERT_EQ(FormulationService::adjust_to_target_weight(f, target), Status::Ok);
    EXPECT_EQ(f.total_weight(), target);
}

TEST(FormulationService_Adjust, ThirdsAroundLock_TotalExact) {
    auto f = make_formulation({"1", "10", "1", "1"}, {false, true, false, false});
    ASSERT_EQ(FormulationService::adjust_to_target_weight(f, Decimal(110)), Status::Ok);
    EXPECT_EQ(amount(f, 1), Decimal(10));
    EXPECT_EQ(f.total_weight(), Decimal(110));
}

TEST(FormulationService_Adjust, Shrink) {
    auto f = make_formulation({"100", "100"});
    ASSERT_EQ(FormulationService::adjust_to_target_weight(f, Decimal(50)), Status::Ok);
    EXPECT_EQ(amount(f, 0), Decimal(25));
    EXPECT_EQ(amount(f, 1), Decimal(25));
}

TEST(FormulationService_Adjust, TargetNotPositive) {
    auto f = make_formulation({"10"});
    EXPECT_EQ(FormulationService::adjust_to_target_weight(f, Decimal()), Status::TargetNotPositive);
    EXPECT_EQ(FormulationService::adjust_to_target_weight(f, D("-5")), Status::TargetNotPositive);
    EXPECT_EQ(amount(f, 0), Decimal(10));
}

TEST(FormulationService_Adjust, LockedExceedsTarget_Unchanged) {
    auto f = make_formulation({"80", "20"}, {true, false});
    EXPECT_EQ(FormulationService::adjust_to_target_weight(f, Decimal(50)), Status::LockedExceedsTarget);
    EXPECT_EQ(amount(f, 0), Decimal(80));
    EXPECT_EQ(amount(f, 1), Decimal(20));
}

TEST(FormulationService_Adjust, AllLocked) {
    auto f = make_formulation({"40", "60"}, {true, true});
    EXPECT_EQ(FormulationService::adjust_to_target_weight(f, Decimal(150)), Status::AllLockedCannotReachTarget);
    EXPECT_EQ(FormulationService::adjust_to_target_weight(f, Decimal(100)), Status::Ok);
}

TEST(FormulationService_Adjust, UnlockedZeroWeight) {
    auto f = make_formulation({"40", "0"}, {true, false});
    EXPECT_EQ(FormulationService::adjust_to_target_weight(f, Decimal(100)), Status::UnlockedZeroWeight);
    EXPECT_EQ(amount(f, 1), Decimal());
}

TEST(FormulationService_Adjust, LockedEqualsTarget_UnlockedGoToZero) {
    auto f = make_formulation({"50", "30"}, {true, false});
    ASSERT_EQ(FormulationService::adjust_to_target_weight(f, Decimal(50)), Status::Ok);
    EXPECT_TRUE(amount(f, 1).is_zero());
}

// ─── set_ingredient_amount ───────────────────────────────────────────────────

TEST(FormulationService_SetAmount, PlainEdit) {
    auto f = make_formulation({"50", "50"});
    ASSERT_EQ(FormulationService::set_ingredient_amount(f, 0, Decimal(70), false), Status::Ok);
    EXPECT_EQ(amount(f, 0), Decimal(70));
    EXPECT_EQ(f.total_weight(), Decimal(120));
}

TEST(FormulationService_SetAmount, MaintainTotal_OthersAbsorb) {
    auto f = make_formulation({"50", "30", "20"});
    ASSERT_EQ(FormulationService::set_ingredient_amount(f, 0, Decimal(60), true), Status::Ok);
    EXPECT_EQ(amount(f, 0), Decimal(60));
    EXPECT_EQ(amount(f, 1), Decimal(24));
    EXPECT_EQ(amount(f, 2), Decimal(16));
    EXPECT_EQ(f.total_weight(), Decimal(100));
}

TEST(FormulationService_SetAmount, MaintainTotal_LockedBetween_TotalExact) {
    auto f = make_formulation({"5", "40", "5", "5", "5"}, {false, true, false, false, false});
    ASSERT_EQ(FormulationService::set_ingredient_amount(f, 0, Decimal(1), true), Status::Ok);
    EXPECT_EQ(amount(f, 0), Decimal(1));
    EXPECT_EQ(amount(f, 1), Decimal(40));
    EXPECT_EQ(f.total_weight(), Decimal(60));
}

TEST(FormulationService_SetAmount, MaintainTotal_LockRestored) {
    auto f = make_formulation({"50", "50"});
    ASSERT_EQ(FormulationService::set_ingredient_amount(f, 0, Decimal(20), true), Status::Ok);
    EXPECT_FALSE(f.ingredients()[0].locked());
    EXPECT_EQ(amount(f, 1), Decimal(80));
}

TEST(FormulationService_SetAmount, MaintainTotal_FailureRollsBack) {
    // Edited amount alone exceeds the old total of 100.
    auto f = make_formulation({"50", "50"});
    EXPECT_EQ(FormulationService::set_ingredient_amount(f, 0, Decimal(150), true), Status::LockedExceedsTarget);
    EXPECT_EQ(amount(f, 0), Decimal(50));
    EXPECT_EQ(amount(f, 1), Decimal(50));
    EXPECT_FALSE(f.ingredients()[0].locked());
}

TEST(FormulationService_SetAmount, MaintainTotal_NoOthersFree_RollsBack) {
    auto f = make_formulation({"50", "50"}, {false, true});
    EXPECT_EQ(FormulationService::set_ingredient_amount(f, 0, Decimal(40), true),
              Status::AllLockedCannotReachTarget);
    EXPECT_EQ(amount(f, 0), Decimal(50));
}

TEST(FormulationService_SetAmount, Negative_Rejected) {
    auto f = make_formulation({"50"});
    EXPECT_EQ(FormulationService::set_ingredient_amount(f, 0, D("-1"), false), Status::NegativeAmount);
}

TEST(FormulationService_SetAmount, BadIndex_Rejected) {
    auto f = make_formulation({"50"});
    EXPECT_EQ(FormulationService::set_ingredient_amount(f, 3, Decimal(1), false), Status::InvalidIndex);
}

// ─── ScopedLockOverride ──────────────────────────────────────────────────────

TEST(ScopedLockOverride, RestoresPreviousState) {
    auto f = make_formulation({"10"}, {true});
    {
        const ScopedLockOverride guard(f.ingredients()[0], false);
        EXPECT_FALSE(f.ingredients()[0].locked());
    }
    EXPECT_TRUE(f.ingredients()[0].locked());
}

// ─── Proportional scaling ────────────────────────────────────────────────────

TEST(FormulationService_Normalize, ToHundredIgnoringLocks) {
    auto f = make_formulation({"150", "50"}, {true, false});
    ASSERT_EQ(FormulationService::normalize_to_100g(f), Status::Ok);
    EXPECT_EQ(amount(f, 0), Decimal(75));
    EXPECT_EQ(amount(f, 1), Decimal(25));
}

TEST(FormulationService_Normalize, ZeroTotal_NoOp) {
    auto f = make_formulation({"0", "0"});
    EXPECT_EQ(FormulationService::normalize_to_100g(f), Status::Ok);
    EXPECT_TRUE(f.total_weight().is_zero());
}

TEST(FormulationService_Normalize, ThirdsSumExactly) {
    auto f = make_formulation({"1", "1", "1"});
    ASSERT_EQ(FormulationService::normalize_to_100g(f), Status::Ok);
    EXPECT_EQ(f.total_weight(), Decimal(100));
}

TEST(FormulationService_Normalize, UnevenAmounts_SumExactly) {
    auto f = make_formulation({"68", "22.6", "81", "13", "77.1"});
    ASSERT_EQ(FormulationService::normalize_to_100g(f), Status::Ok);
    EXPECT_EQ(f.total_weight(), Decimal(100));
}

TEST(FormulationService_ScaleAll, Doubles) {
    auto f = make_formulation({"12.5", "7.5"}, {true, false});
    ASSERT_EQ(FormulationService::scale_all(f, Decimal(2)), Status::Ok);
    EXPECT_EQ(amount(f, 0), Decimal(25));
    EXPECT_EQ(amount(f, 1), Decimal(15));
}

TEST(FormulationService_ScaleAll, FactorNotPositive) {
    auto f = make_formulation({"10"});
    EXPECT_EQ(FormulationService::scale_all(f, Decimal()), Status::FactorNotPositive);
    EXPECT_EQ(FormulationService::scale_all(f, D("-2")), Status::FactorNotPositive);
    EXPECT_EQ(amount(f, 0), Decimal(10));
}

TEST(FormulationService_Distribute, KeepsPercentages) {
    auto f = make_formulation({"60", "40"});
    ASSERT_EQ(FormulationService::distribute_percentages(f, Decimal(500)), Status::Ok);
    EXPECT_EQ(amount(f, 0), Decimal(300));
    EXPECT_EQ(amount(f, 1), Decimal(200));
}

TEST(FormulationService_Distribute, UnevenAmounts_TotalExact) {
    auto f = make_formulation({"7", "63", "19", "47.9", "83", "51"});
    ASSERT_EQ(FormulationService::distribute_percentages(f, Decimal(300)), Status::Ok);
    EXPECT_EQ(f.total_weight(), Decimal(300));
}

TEST(FormulationService_Distribute, TargetNotPositive) {
    auto f = make_formulation({"60", "40"});
    EXPECT_EQ(FormulationService::distribute_percentages(f, Decimal()), Status::TargetNotPositive);
}

// ─── Locks ───────────────────────────────────────────────────────────────────

TEST(FormulationService_Locks, LockUnlockToggle) {
    auto f = make_formulation({"10", "20"});
    ASSERT_EQ(FormulationService::lock_ingredient(f, 1), Status::Ok);
    EXPECT_TRUE(f.ingredients()[1].locked());
    ASSERT_EQ(FormulationService::toggle_lock(f, 1), Status::Ok);
    EXPECT_FALSE(f.ingredients()[1].locked());
    ASSERT_EQ(FormulationService::toggle_lock(f, 0), Status::Ok);
    ASSERT_EQ(FormulationService::unlock_ingredient(f, 0), Status::Ok);
    EXPECT_FALSE(f.ingredients()[0].locked());
}

TEST(FormulationService_Locks, BadIndex) {
    auto f = make_formulation({"10"});
    EXPECT_EQ(FormulationService::lock_ingredient(f, 1), Status::InvalidIndex);
    EXPECT_EQ(FormulationService::unlock_ingredient(f, 1), Status::InvalidIndex);
    EXPECT_EQ(FormulationService::toggle_lock(f, 1), Status::InvalidIndex);
}

TEST(FormulationService_Status, Messages) {
    EXPECT_STREQ(to_string(Status::TargetNotPositive), "target must be positive");
    EXPECT_STREQ(to_string(Status::LockedExceedsTarget), "locked exceeds target");
}
