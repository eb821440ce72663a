/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/track_store.hpp"
#include "states/creation_state.hpp"
#include "states/edit_state.hpp"
#include "states/file_state.hpp"
#include "states/locomotion_state.hpp"
#include "states/view_state.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace dolly;
using namespace dolly::states;
using namespace dolly::test;
using input::Hand;
using input::HandInput;
using track::TrackRole;

namespace {

    constexpr float EPS = 1e-4f;

    void expectVec3Near(const glm::vec3& actual, const glm::vec3& expected, const float eps = EPS) {
        EXPECT_NEAR(actual.x, expected.x, eps);
        EXPECT_NEAR(actual.y, expected.y, eps);
        EXPECT_NEAR(actual.z, expected.z, eps);
    }

    HandInput withPrimary(HandInput in) {
        in.primary = true;
        in.primary_down = true;
        return in;
    }

    HandInput withSecondary(HandInput in) {
        in.secondary = true;
        in.secondary_down = true;
        return in;
    }

} // namespace

// ---------------------------------------------------------------------------
// Menu polling
// ---------------------------------------------------------------------------

TEST(UserStateMenuTest, RecessiveFlickRequestsState) {
    StateHarness h;
    CreationState creation;
    h.menu.next = static_cast<int>(StateId::EDIT);

    EXPECT_EQ(h.run(creation, HandInput{}, menuFlick()), StateId::EDIT);
    EXPECT_EQ(h.menu.calls, 1);
}

TEST(UserStateMenuTest, GripHeldBlocksMenu) {
    StateHarness h;
    CreationState creation;
    h.menu.next = static_cast<int>(StateId::EDIT);

    auto recessive = menuFlick();
    recessive.grip_button = true;
    EXPECT_EQ(h.run(creation, HandInput{}, recessive), StateId::CREATION);
    EXPECT_EQ(h.menu.calls, 0);
}

TEST(UserStateMenuTest, DominantFlickDoesNotOpenMenu) {
    StateHarness h;
    CreationState creation;
    h.menu.next = static_cast<int>(StateId::EDIT);

    EXPECT_EQ(h.run(creation, menuFlick(), HandInput{}), StateId::CREATION);
    EXPECT_EQ(h.menu.calls, 0);
}

TEST(UserStateMenuTest, InvalidMenuIndexStays) {
    StateHarness h;
    CreationState creation;
    h.menu.next = 9;

    EXPECT_EQ(h.run(creation, HandInput{}, menuFlick()), StateId::CREATION);
}

// ---------------------------------------------------------------------------
// Creation
// ---------------------------------------------------------------------------

TEST(CreationStateTest, FourPlacementsBuildPair) {
    StateHarness h;
    CreationState creation;
    const glm::vec3 p0{0.0f, 0.0f, 0.0f};
    const glm::vec3 p1{1.0f, 0.0f, 0.0f};
    const glm::vec3 l0{0.0f, 1.0f, 2.0f};
    const glm::vec3 l1{1.0f, 1.0f, 2.0f};

    h.run(creation, triggerPress(p0), HandInput{});
    h.run(creation, HandInput{}, triggerPress(p1));
    h.run(creation, triggerPress(l0), HandInput{});
    EXPECT_EQ(creation.placedCount(), 3u);
    EXPECT_TRUE(h.registry.empty());

    h.run(creation, triggerPress(l1), HandInput{});
    ASSERT_EQ(h.registry.size(), 1u);
    EXPECT_EQ(creation.placedCount(), 0u);

    const auto& pair = h.registry.at(0);
    expectVec3Near(pair.position().controlPoints()[0], p0);
    expectVec3Near(pair.position().controlPoints()[1], p1);
    expectVec3Near(pair.look().controlPoints()[0], l0);
    expectVec3Near(pair.look().controlPoints()[1], l1);
    EXPECT_FLOAT_EQ(pair.cursor(), 0.0f);
    EXPECT_FALSE(pair.position().needsRefresh());
}

TEST(CreationStateTest, HeldTriggerPlacesOnce) {
    StateHarness h;
    CreationState creation;

    h.run(creation, triggerPress({0.0f, 0.0f, 0.0f}), HandInput{});
    h.run(creation, triggerHeld({0.0f, 0.0f, 0.0f}), HandInput{});
    h.run(creation, triggerHeld({0.0f, 0.0f, 0.0f}), HandInput{});
    EXPECT_EQ(creation.placedCount(), 1u);
}

TEST(CreationStateTest, DominantWinsSimultaneousPress) {
    StateHarness h;
    CreationState creation;
    const glm::vec3 dominant{1.0f, 2.0f, 3.0f};

    h.run(creation, triggerPress(dominant), triggerPress({9.0f, 9.0f, 9.0f}));
    ASSERT_EQ(creation.placedCount(), 1u);
    expectVec3Near(creation.placement(0), dominant);
}

TEST(CreationStateTest, LeavingDiscardsPartialPlacements) {
    StateHarness h;
    CreationState creation;
    h.run(creation, triggerPress({0.0f, 0.0f, 0.0f}), HandInput{});
    h.run(creation, triggerPress({1.0f, 0.0f, 0.0f}), HandInput{});

    h.menu.next = static_cast<int>(StateId::LOCOMOTION);
    EXPECT_EQ(h.run(creation, HandInput{}, menuFlick()), StateId::LOCOMOTION);
    EXPECT_EQ(creation.placedCount(), 0u);
    EXPECT_TRUE(h.registry.empty());
}

TEST(CreationStateTest, ReselectingCreateKeepsPlacements) {
    StateHarness h;
    CreationState creation;
    h.run(creation, triggerPress({0.0f, 0.0f, 0.0f}), HandInput{});

    h.menu.next = static_cast<int>(StateId::CREATION);
    EXPECT_EQ(h.run(creation, HandInput{}, menuFlick()), StateId::CREATION);
    EXPECT_EQ(creation.placedCount(), 1u);
}

// ---------------------------------------------------------------------------
// Locomotion
// ---------------------------------------------------------------------------

TEST(LocomotionStateTest, CastGrowsAndTeleportsOnRelease) {
    StateHarness h;
    LocomotionState locomotion(2.0f, 0.0f);

    h.run(locomotion, triggerPress({0.0f, 0.0f, 0.0f}), HandInput{}, 0.5f);
    ASSERT_EQ(locomotion.castingHand(), Hand::DOMINANT);
    EXPECT_FLOAT_EQ(locomotion.castDistance(), 0.0f);
    expectVec3Near(locomotion.marker(), {0.0f, 0.0f, 0.0f});

    h.run(locomotion, triggerHeld({0.0f, 0.0f, 0.0f}), HandInput{}, 0.5f);
    EXPECT_FLOAT_EQ(locomotion.castDistance(), 1.0f);
    h.run(locomotion, triggerHeld({0.0f, 0.0f, 0.0f}), HandInput{}, 0.5f);
    EXPECT_FLOAT_EQ(locomotion.castDistance(), 2.0f);
    expectVec3Near(locomotion.marker(), {0.0f, 0.0f, 2.0f});
    expectVec3Near(h.rig.position, {0.0f, 0.0f, 0.0f});

    h.run(locomotion, handAt({0.0f, 0.0f, 0.0f}), HandInput{}, 0.5f);
    expectVec3Near(h.rig.position, {0.0f, 0.0f, 2.0f});
    EXPECT_FALSE(locomotion.castingHand().has_value());
    EXPECT_FLOAT_EQ(locomotion.castDistance(), 0.0f);
}

TEST(LocomotionStateTest, HeightOffsetLowersMarker) {
    StateHarness h;
    LocomotionState locomotion(2.0f, 1.5f);

    h.run(locomotion, triggerPress({0.0f, 2.0f, 0.0f}), HandInput{});
    expectVec3Near(locomotion.marker(), {0.0f, 0.5f, 0.0f});
}

TEST(LocomotionStateTest, OnlyOneHandCastsAtATime) {
    StateHarness h;
    LocomotionState locomotion(2.0f, 0.0f);

    h.run(locomotion, HandInput{}, triggerPress({0.0f, 0.0f, 0.0f}), 0.5f);
    ASSERT_EQ(locomotion.castingHand(), Hand::RECESSIVE);

    h.run(locomotion, triggerPress({5.0f, 0.0f, 0.0f}), triggerHeld({0.0f, 0.0f, 0.0f}), 0.5f);
    EXPECT_EQ(locomotion.castingHand(), Hand::RECESSIVE);
    expectVec3Near(locomotion.marker(), {0.0f, 0.0f, 1.0f});
}

TEST(LocomotionStateTest, LeavingCancelsCast) {
    StateHarness h;
    LocomotionState locomotion(2.0f, 0.0f);
    h.run(locomotion, triggerPress({0.0f, 0.0f, 0.0f}), HandInput{});

    h.menu.next = static_cast<int>(StateId::CREATION);
    EXPECT_EQ(h.run(locomotion, triggerHeld({0.0f, 0.0f, 0.0f}), menuFlick()), StateId::CREATION);
    EXPECT_FALSE(locomotion.castingHand().has_value());
    expectVec3Near(h.rig.position, {0.0f, 0.0f, 0.0f});
}

// ---------------------------------------------------------------------------
// Edit
// ---------------------------------------------------------------------------

class EditStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        h.registry.add(makePair({0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f},
                                {0.0f, 1.0f, 0.0f}, {1.0f, 1.0f, 0.0f}));
        h.registry.refreshAll();
    }

    track::TrackPair& pair(const size_t i = 0) { return h.registry.at(i); }

    StateHarness h;
    EditState edit{0.075f, 0.3f};
};

TEST_F(EditStateTest, TriggerDragsControlPoint) {
    h.run(edit, triggerPress({0.0f, 0.0f, 0.05f}), HandInput{});
    const auto& sel = edit.selection(Hand::DOMINANT);
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(sel->role, TrackRole::POSITION);
    EXPECT_EQ(sel->kind, SelectionKind::CONTROL_POINT);
    EXPECT_EQ(sel->index, 0u);

    h.run(edit, triggerHeld({0.0f, 0.5f, 0.0f}), HandInput{});
    expectVec3Near(pair().position().controlPoints()[0], {0.0f, 0.5f, 0.0f});
    EXPECT_FALSE(pair().position().needsRefresh());

    h.run(edit, handAt({0.0f, 0.8f, 0.0f}), HandInput{});
    EXPECT_FALSE(edit.selection(Hand::DOMINANT).has_value());
    expectVec3Near(pair().position().controlPoints()[0], {0.0f, 0.5f, 0.0f});
}

TEST_F(EditStateTest, LookTrackPointsSelectable) {
    h.run(edit, triggerPress({1.0f, 1.0f, 0.0f}), HandInput{});
    const auto& sel = edit.selection(Hand::DOMINANT);
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(sel->role, TrackRole::LOOK);
    EXPECT_EQ(sel->index, 1u);
}

TEST_F(EditStateTest, NothingInRadiusSelectsNothing) {
    h.run(edit, triggerPress({0.5f, 0.5f, 0.5f}), gripHeld({0.5f, 0.5f, 0.5f}));
    EXPECT_FALSE(edit.selection(Hand::DOMINANT).has_value());
    EXPECT_FALSE(edit.selection(Hand::RECESSIVE).has_value());
}

TEST_F(EditStateTest, GripDragsCheckpointOnBothTracks) {
    pair().addCheckpoint(0.5f);
    pair().refresh();

    h.run(edit, gripHeld({0.5f, 0.0f, 0.0f}), HandInput{});
    const auto& sel = edit.selection(Hand::DOMINANT);
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(sel->kind, SelectionKind::CHECKPOINT);
    EXPECT_EQ(sel->index, 1u);

    h.run(edit, gripHeld({0.8f, 0.0f, 0.0f}), HandInput{});
    EXPECT_NEAR(pair().position().checkpointT(1), 0.8f, 0.011f);
    EXPECT_NEAR(pair().look().checkpointT(1), 0.8f, 0.011f);
    EXPECT_TRUE(pair().checkpointsInSync());

    h.run(edit, handAt({0.8f, 0.0f, 0.0f}), HandInput{});
    EXPECT_FALSE(edit.selection(Hand::DOMINANT).has_value());
}

TEST_F(EditStateTest, ThumbstickAdjustsCheckpointSpeedMirrored) {
    const float start = pair().position().checkpointSpeed(0);

    h.run(edit, gripHeld({0.0f, 0.0f, 0.0f}), HandInput{});
    ASSERT_TRUE(edit.selection(Hand::DOMINANT).has_value());

    h.run(edit, gripHeld({0.0f, 0.0f, 0.0f}, {0.0f, 1.0f}), HandInput{}, 0.1f);
    EXPECT_NEAR(pair().position().checkpointSpeed(0), start + 0.03f, EPS);
    EXPECT_NEAR(pair().look().checkpointSpeed(0), start + 0.03f, EPS);

    // Clamped to the speed range
    h.run(edit, gripHeld({0.0f, 0.0f, 0.0f}, {0.0f, -1.0f}), HandInput{}, 10.0f);
    EXPECT_FLOAT_EQ(pair().position().checkpointSpeed(0), pair().position().speedRange().min);
    EXPECT_TRUE(pair().checkpointsInSync());
}

TEST_F(EditStateTest, GrabbingHeldPointTakesItOver) {
    h.run(edit, triggerPress({0.0f, 0.0f, 0.0f}), HandInput{});
    ASSERT_TRUE(edit.selection(Hand::DOMINANT).has_value());

    h.run(edit, triggerHeld({0.0f, 0.0f, 0.0f}), triggerPress({0.0f, 0.0f, 0.0f}));
    EXPECT_FALSE(edit.selection(Hand::DOMINANT).has_value());
    ASSERT_TRUE(edit.selection(Hand::RECESSIVE).has_value());
    EXPECT_EQ(edit.selection(Hand::RECESSIVE)->index, 0u);
}

TEST_F(EditStateTest, PrimaryAddsMidpointControlPoint) {
    h.run(edit, triggerPress({1.0f, 0.0f, 0.0f}), HandInput{});
    ASSERT_EQ(edit.selection(Hand::DOMINANT)->index, 1u);

    h.run(edit, withPrimary(triggerHeld({1.0f, 0.0f, 0.0f})), HandInput{});
    ASSERT_EQ(pair().position().controlPointCount(), 3u);
    expectVec3Near(pair().position().controlPoints()[1], {0.5f, 0.0f, 0.0f});
    EXPECT_EQ(pair().look().controlPointCount(), 2u);

    // The held endpoint moved up one slot
    EXPECT_EQ(edit.selection(Hand::DOMINANT)->index, 2u);
    expectVec3Near(pair().position().controlPoints()[2], {1.0f, 0.0f, 0.0f});
}

TEST_F(EditStateTest, SecondaryAddsCheckpointOnlyForPositionSelection) {
    h.run(edit, triggerPress({1.0f, 1.0f, 0.0f}), HandInput{});
    ASSERT_EQ(edit.selection(Hand::DOMINANT)->role, TrackRole::LOOK);
    h.run(edit, withSecondary(triggerHeld({1.0f, 1.0f, 0.0f})), HandInput{});
    EXPECT_EQ(pair().position().checkpointCount(), 2u);

    h.run(edit, handAt({}), HandInput{});
    h.run(edit, triggerPress({0.0f, 0.0f, 0.0f}), HandInput{});
    h.run(edit, withSecondary(triggerHeld({0.0f, 0.0f, 0.0f})), HandInput{});
    EXPECT_EQ(pair().position().checkpointCount(), 3u);
    EXPECT_EQ(pair().look().checkpointCount(), 3u);
    EXPECT_FLOAT_EQ(pair().position().checkpointT(1), 0.5f);
}

TEST_F(EditStateTest, RecessivePrimaryDeletesCheckpointMirrored) {
    pair().addCheckpoint(0.5f);
    pair().refresh();

    h.run(edit, HandInput{}, gripHeld({0.5f, 0.0f, 0.0f}));
    ASSERT_TRUE(edit.selection(Hand::RECESSIVE).has_value());

    h.run(edit, HandInput{}, withPrimary(gripHeld({0.5f, 0.0f, 0.0f})));
    EXPECT_EQ(pair().position().checkpointCount(), 2u);
    EXPECT_EQ(pair().look().checkpointCount(), 2u);
    EXPECT_FALSE(edit.selection(Hand::RECESSIVE).has_value());
}

TEST_F(EditStateTest, EndpointsCannotBeDeleted) {
    h.run(edit, HandInput{}, triggerPress({0.0f, 0.0f, 0.0f}));
    h.run(edit, HandInput{}, withPrimary(triggerHeld({0.0f, 0.0f, 0.0f})));
    EXPECT_EQ(pair().position().controlPointCount(), 2u);
    EXPECT_FALSE(edit.selection(Hand::RECESSIVE).has_value());
}

TEST_F(EditStateTest, DeletingControlPointShiftsOtherHand) {
    auto& position = pair().position();
    position.moveControlPoint(1, {3.0f, 0.0f, 0.0f});
    position.addControlPoint({1.0f, 0.0f, 0.0f});
    position.addControlPoint({2.0f, 0.0f, 0.0f});
    position.refresh();
    ASSERT_EQ(position.controlPointCount(), 4u);
    expectVec3Near(position.controlPoints()[2], {2.0f, 0.0f, 0.0f});

    h.run(edit, triggerPress({3.0f, 0.0f, 0.0f}), triggerPress({1.0f, 0.0f, 0.0f}));
    ASSERT_EQ(edit.selection(Hand::DOMINANT)->index, 3u);
    ASSERT_EQ(edit.selection(Hand::RECESSIVE)->index, 1u);

    h.run(edit, triggerHeld({3.0f, 0.0f, 0.0f}), withPrimary(triggerHeld({1.0f, 0.0f, 0.0f})));
    EXPECT_EQ(position.controlPointCount(), 3u);
    EXPECT_FALSE(edit.selection(Hand::RECESSIVE).has_value());
    ASSERT_TRUE(edit.selection(Hand::DOMINANT).has_value());
    EXPECT_EQ(edit.selection(Hand::DOMINANT)->index, 2u);
    expectVec3Near(position.controlPoints()[2], {3.0f, 0.0f, 0.0f});
}

TEST_F(EditStateTest, DeletingPairClearsHolderAndShiftsOthers) {
    h.registry.add(makePair({0.0f, 0.0f, 5.0f}, {1.0f, 0.0f, 5.0f},
                            {0.0f, 1.0f, 5.0f}, {1.0f, 1.0f, 5.0f}));

    h.run(edit, triggerPress({0.0f, 0.0f, 5.0f}), triggerPress({0.0f, 0.0f, 0.0f}));
    ASSERT_EQ(edit.selection(Hand::DOMINANT)->pair, 1u);
    ASSERT_EQ(edit.selection(Hand::RECESSIVE)->pair, 0u);

    h.run(edit, triggerHeld({0.0f, 0.0f, 5.0f}), withSecondary(triggerHeld({0.0f, 0.0f, 0.0f})));
    ASSERT_EQ(h.registry.size(), 1u);
    EXPECT_FALSE(edit.selection(Hand::RECESSIVE).has_value());
    ASSERT_TRUE(edit.selection(Hand::DOMINANT).has_value());
    EXPECT_EQ(edit.selection(Hand::DOMINANT)->pair, 0u);

    // The surviving selection still drags the right point
    h.run(edit, triggerHeld({0.0f, 0.5f, 5.0f}), HandInput{});
    expectVec3Near(h.registry.at(0).position().controlPoints()[0], {0.0f, 0.5f, 5.0f});
}

TEST_F(EditStateTest, DeletingPairClearsHeldCheckpoint) {
    pair().addCheckpoint(0.5f);
    pair().refresh();

    h.run(edit, gripHeld({0.5f, 0.0f, 0.0f}), triggerPress({0.0f, 0.0f, 0.0f}));
    ASSERT_EQ(edit.selection(Hand::DOMINANT)->kind, SelectionKind::CHECKPOINT);
    ASSERT_EQ(edit.selection(Hand::RECESSIVE)->kind, SelectionKind::CONTROL_POINT);

    h.run(edit, gripHeld({0.5f, 0.0f, 0.0f}), withSecondary(triggerHeld({0.0f, 0.0f, 0.0f})));
    EXPECT_EQ(h.registry.size(), 0u);
    EXPECT_FALSE(edit.selection(Hand::DOMINANT).has_value());
    EXPECT_FALSE(edit.selection(Hand::RECESSIVE).has_value());

    // Nothing left to drag
    h.run(edit, gripHeld({0.8f, 0.0f, 0.0f}), HandInput{});
    EXPECT_FALSE(edit.selection(Hand::DOMINANT).has_value());
}

TEST_F(EditStateTest, DeletingPairShiftsHeldCheckpointOnLaterPair) {
    h.registry.add(makePair({0.0f, 0.0f, 5.0f}, {1.0f, 0.0f, 5.0f},
                            {0.0f, 1.0f, 5.0f}, {1.0f, 1.0f, 5.0f}));
    pair(1).addCheckpoint(0.5f);
    pair(1).refresh();

    h.run(edit, gripHeld({0.5f, 0.0f, 5.0f}), triggerPress({0.0f, 0.0f, 0.0f}));
    ASSERT_EQ(edit.selection(Hand::DOMINANT)->pair, 1u);
    ASSERT_EQ(edit.selection(Hand::RECESSIVE)->pair, 0u);

    h.run(edit, gripHeld({0.5f, 0.0f, 5.0f}), withSecondary(triggerHeld({0.0f, 0.0f, 0.0f})));
    ASSERT_EQ(h.registry.size(), 1u);
    EXPECT_FALSE(edit.selection(Hand::RECESSIVE).has_value());
    const auto& sel = edit.selection(Hand::DOMINANT);
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(sel->pair, 0u);
    EXPECT_EQ(sel->kind, SelectionKind::CHECKPOINT);
    EXPECT_EQ(sel->index, 1u);

    h.run(edit, gripHeld({0.8f, 0.0f, 5.0f}), HandInput{});
    EXPECT_NEAR(h.registry.at(0).position().checkpointT(1), 0.8f, 0.011f);
    EXPECT_TRUE(h.registry.at(0).checkpointsInSync());
}

TEST_F(EditStateTest, LeavingClearsSelections) {
    h.run(edit, triggerPress({0.0f, 0.0f, 0.0f}), HandInput{});
    h.menu.next = static_cast<int>(StateId::VIEW);
    EXPECT_EQ(h.run(edit, triggerHeld({0.0f, 0.0f, 0.0f}), menuFlick()), StateId::VIEW);
    EXPECT_FALSE(edit.selection(Hand::DOMINANT).has_value());
}

// ---------------------------------------------------------------------------
// View
// ---------------------------------------------------------------------------

class ViewStateTest : public ::testing::Test {
protected:
    void addPairs(const int count) {
        for (int i = 0; i < count; ++i) {
            const float z = static_cast<float>(i);
            h.registry.add(makePair({0.0f, 0.0f, z}, {1.0f, 0.0f, z}, {0.0f, 1.0f, z}, {1.0f, 1.0f, z}));
        }
    }

    StateHarness h;
    ViewState view;
};

TEST_F(ViewStateTest, EmptyRegistryReturnsToTeleport) {
    h.menu.setHighlighted(static_cast<int>(StateId::VIEW));
    EXPECT_EQ(h.run(view, HandInput{}, HandInput{}), StateId::LOCOMOTION);
    EXPECT_EQ(h.menu.highlighted(), static_cast<int>(StateId::LOCOMOTION));
    EXPECT_FALSE(view.camera().has_value());
}

TEST_F(ViewStateTest, EntryStartsAtCursorAndAdvances) {
    addPairs(1);
    h.registry.at(0).setCursor(0.4f);

    EXPECT_EQ(h.run(view, HandInput{}, HandInput{}, 0.0f), StateId::VIEW);
    EXPECT_TRUE(view.active());
    EXPECT_FLOAT_EQ(view.travel(), 0.4f);
    ASSERT_TRUE(view.camera().has_value());
    expectVec3Near(view.camera()->position, {0.4f, 0.0f, 0.0f});
    expectVec3Near(view.camera()->look_at, {0.4f, 1.0f, 0.0f});
    EXPECT_EQ(h.feedback.dominant(), "Track 1");

    const float speed = h.registry.at(0).position().speedAt(0.4f);
    h.run(view, HandInput{}, HandInput{}, 1.0f);
    EXPECT_NEAR(view.travel(), 0.4f + speed, EPS);
}

TEST_F(ViewStateTest, TravelLoopsPastEnd) {
    addPairs(1);
    h.registry.at(0).setCursor(0.99f);
    h.run(view, HandInput{}, HandInput{}, 0.0f);
    const auto before = view.camera();

    h.run(view, HandInput{}, HandInput{}, 1.0f);
    EXPECT_FLOAT_EQ(view.travel(), 0.0f);
    ASSERT_TRUE(view.camera().has_value());
    expectVec3Near(view.camera()->position, before->position);
}

TEST_F(ViewStateTest, DominantThumbstickCyclesPairs) {
    addPairs(3);
    h.run(view, HandInput{}, HandInput{});
    EXPECT_EQ(view.pairIndex(), 0u);

    h.run(view, axisFlick(1.0f), HandInput{});
    EXPECT_EQ(view.pairIndex(), 1u);
    EXPECT_EQ(h.feedback.dominant(), "Track 2");
    h.run(view, axisFlick(1.0f), HandInput{});
    EXPECT_EQ(view.pairIndex(), 2u);
    h.run(view, axisFlick(1.0f), HandInput{});
    EXPECT_EQ(view.pairIndex(), 0u);

    h.run(view, axisFlick(-1.0f), HandInput{});
    EXPECT_EQ(view.pairIndex(), 2u);
    EXPECT_EQ(h.feedback.dominant(), "Track 3");
}

TEST_F(ViewStateTest, CyclingStartsFromNewPairCursor) {
    addPairs(2);
    h.registry.at(1).setCursor(0.7f);
    h.run(view, HandInput{}, HandInput{});

    h.run(view, axisFlick(1.0f), HandInput{});
    EXPECT_FLOAT_EQ(view.travel(), 0.7f);
}

TEST_F(ViewStateTest, RecessiveThumbstickAlsoCycles) {
    addPairs(2);
    h.run(view, HandInput{}, HandInput{});

    // The same flick opens the menu, which answers with the current state
    h.menu.next = static_cast<int>(StateId::VIEW);
    EXPECT_EQ(h.run(view, HandInput{}, axisFlick(1.0f)), StateId::VIEW);
    EXPECT_EQ(view.pairIndex(), 1u);
}

TEST_F(ViewStateTest, LeavingClearsDisplay) {
    addPairs(1);
    h.run(view, HandInput{}, HandInput{});
    ASSERT_EQ(h.feedback.dominant(), "Track 1");

    h.menu.next = static_cast<int>(StateId::EDIT);
    EXPECT_EQ(h.run(view, HandInput{}, menuFlick()), StateId::EDIT);
    EXPECT_TRUE(h.feedback.dominant().empty());
    EXPECT_FALSE(view.camera().has_value());
    EXPECT_FALSE(view.active());
}

// ---------------------------------------------------------------------------
// File
// ---------------------------------------------------------------------------

class FileStateTest : public ::testing::Test {
protected:
    FileStateTest()
        : store(dir.path()) {}

    TempDir dir;
    io::JsonTrackStore store;
    StateHarness h;
};

TEST_F(FileStateTest, SaveLoadAndDelete) {
    h.registry.add(makePair({0.0f, 0.0f, 0.0f}, {2.0f, 0.0f, 0.0f},
                            {0.0f, 1.0f, 0.0f}, {2.0f, 1.0f, 0.0f}));
    FileState file(store);
    ASSERT_TRUE(file.newFileSelected());

    h.run(file, HandInput{}, HandInput{});
    EXPECT_EQ(h.feedback.dominant(), NEW_FILE_LABEL);

    h.run(file, withPrimary(HandInput{}), HandInput{});
    ASSERT_EQ(file.files().size(), 1u);
    EXPECT_EQ(file.files()[0].filename().string(), "track_state_1.json");
    EXPECT_TRUE(file.newFileSelected());
    EXPECT_TRUE(store.exists(file.files()[0]));

    h.registry.clear();
    h.run(file, axisFlick(1.0f), HandInput{});
    EXPECT_EQ(file.selectedIndex(), 0u);
    EXPECT_EQ(h.feedback.dominant(), file.files()[0].string());

    h.run(file, withSecondary(HandInput{}), HandInput{});
    ASSERT_EQ(h.registry.size(), 1u);
    expectVec3Near(h.registry.at(0).position().controlPoints()[1], {2.0f, 0.0f, 0.0f});
    expectVec3Near(h.registry.at(0).look().controlPoints()[0], {0.0f, 1.0f, 0.0f});

    const auto saved = file.files()[0];
    h.run(file, HandInput{}, withSecondary(HandInput{}));
    EXPECT_TRUE(file.files().empty());
    EXPECT_TRUE(file.newFileSelected());
    EXPECT_FALSE(store.exists(saved));
}

TEST_F(FileStateTest, CyclingWrapsThroughNewFileSlot) {
    track::TrackRegistry registry;
    registry.add(makePair({}, {1.0f, 0.0f, 0.0f}, {}, {1.0f, 0.0f, 0.0f}));
    ASSERT_TRUE(store.write(store.nextNewPath(), registry.makeSaveData()));
    ASSERT_TRUE(store.write(store.nextNewPath(), registry.makeSaveData()));

    FileState file(store);
    ASSERT_EQ(file.files().size(), 2u);
    EXPECT_EQ(file.selectedIndex(), 2u);

    h.run(file, axisFlick(1.0f), HandInput{});
    EXPECT_EQ(file.selectedIndex(), 0u);
    h.run(file, axisFlick(-1.0f), HandInput{});
    EXPECT_TRUE(file.newFileSelected());
    h.run(file, axisFlick(-1.0f), HandInput{});
    EXPECT_EQ(file.selectedIndex(), 1u);
}

TEST_F(FileStateTest, SavingOverSelectedFile) {
    h.registry.add(makePair({}, {1.0f, 0.0f, 0.0f}, {}, {1.0f, 0.0f, 0.0f}));
    ASSERT_TRUE(store.write(store.nextNewPath(), h.registry.makeSaveData()));
    FileState file(store);

    h.registry.add(makePair({}, {0.0f, 0.0f, 1.0f}, {}, {0.0f, 0.0f, 1.0f}));
    h.run(file, axisFlick(1.0f), HandInput{});
    h.run(file, withPrimary(HandInput{}), HandInput{});
    EXPECT_EQ(file.files().size(), 1u);
    EXPECT_TRUE(file.newFileSelected());
    EXPECT_EQ(store.read(file.files()[0]).position_tracks.size(), 2u);
}

TEST_F(FileStateTest, LoadingStraightTrackUsesMidpointSpeeds) {
    // A freshly created straight track as persisted: endpoint checkpoints only
    track::SaveData data;
    const auto state = track::BezierTrack({0.0f, 0.0f, 0.0f}, {2.0f, 0.0f, 0.0f}).makeSaveState();
    ASSERT_EQ(state.checkpoint_t_values.size(), 2u);
    data.position_tracks.push_back(state);
    data.look_tracks.push_back(state);
    ASSERT_TRUE(store.write(store.nextNewPath(), data));

    FileState file(store);
    h.run(file, axisFlick(1.0f), HandInput{});
    h.run(file, withSecondary(HandInput{}), HandInput{});

    ASSERT_EQ(h.registry.size(), 1u);
    const auto& position = h.registry.at(0).position();
    EXPECT_TRUE(position.isStraight());
    ASSERT_EQ(position.checkpointCount(), 2u);
    EXPECT_FLOAT_EQ(position.checkpointSpeed(0), position.speedRange().midpoint());
    EXPECT_FLOAT_EQ(position.checkpointSpeed(1), position.speedRange().midpoint());
}

TEST_F(FileStateTest, MissingFileIsSkipped) {
    h.registry.add(makePair({}, {1.0f, 0.0f, 0.0f}, {}, {1.0f, 0.0f, 0.0f}));
    const auto path = store.nextNewPath();
    ASSERT_TRUE(store.write(path, h.registry.makeSaveData()));
    FileState file(store);
    std::filesystem::remove(path);

    h.registry.add(makePair({}, {0.0f, 1.0f, 0.0f}, {}, {0.0f, 1.0f, 0.0f}));
    h.run(file, axisFlick(1.0f), HandInput{});
    h.run(file, withSecondary(HandInput{}), HandInput{});
    EXPECT_EQ(h.registry.size(), 2u);
}

TEST_F(FileStateTest, LeavingResetsSelection) {
    h.registry.add(makePair({}, {1.0f, 0.0f, 0.0f}, {}, {1.0f, 0.0f, 0.0f}));
    ASSERT_TRUE(store.write(store.nextNewPath(), h.registry.makeSaveData()));
    FileState file(store);
    h.run(file, axisFlick(1.0f), HandInput{});
    ASSERT_FALSE(file.newFileSelected());

    h.menu.next = static_cast<int>(StateId::LOCOMOTION);
    EXPECT_EQ(h.run(file, HandInput{}, menuFlick()), StateId::LOCOMOTION);
    EXPECT_TRUE(file.newFileSelected());
    EXPECT_TRUE(h.feedback.dominant().empty());
}
