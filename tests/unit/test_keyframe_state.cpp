#include <gtest/gtest.h>
#include <kinema/errors.hpp>

#include "anim/keyframe_state.hpp"
#include "anim/keyframe_store.hpp"
#include "util/fake_collaborators.hpp"

using namespace kinema;
using kinema::test::FakeNotifier;
using kinema::test::make_clip;

// ─── State derivation ────────────────────────────────────────────────────────

TEST(KeyframeState, NoneWithoutConfig)
{
    Clip clip = make_clip("c", 100, 250);
    EXPECT_EQ(keyframe_state_at(clip, 150), KeyframeState::None);

    KeyframeUIState ui = keyframe_ui_state_at(clip, 150);
    EXPECT_FALSE(ui.has_animation);
    EXPECT_FALSE(ui.is_on_keyframe);
}

TEST(KeyframeState, NoneWhenDisabledEvenWithKeyframes)
{
    Clip clip = make_clip("c", 100, 250);
    insert_keyframe(clip, 50, clip.baseline);
    EXPECT_EQ(keyframe_state_at(clip, 150), KeyframeState::None);
}

TEST(KeyframeState, OnAndBetween)
{
    Clip clip = make_clip("c", 100, 250);
    enable_animation(clip);
    insert_keyframe(clip, 50, clip.baseline);

    EXPECT_EQ(keyframe_state_at(clip, 150), KeyframeState::OnKeyframe);
    EXPECT_EQ(keyframe_state_at(clip, 151), KeyframeState::BetweenKeyframes);

    KeyframeUIState ui = keyframe_ui_state_at(clip, 150);
    EXPECT_TRUE(ui.has_animation);
    EXPECT_TRUE(ui.is_on_keyframe);
    EXPECT_FALSE(keyframe_ui_state_at(clip, 151).is_on_keyframe);
}

TEST(KeyframeState, Names)
{
    EXPECT_STREQ(keyframe_state_name(KeyframeState::BetweenKeyframes), "between-keyframes");
    EXPECT_STREQ(toggle_action_name(ToggleAction::RemovedLast), "removed-last");
    EXPECT_STREQ(property_change_result_name(PropertyChangeResult::CreatedKeyframe),
                 "created-keyframe");
}

// ─── Preconditions ───────────────────────────────────────────────────────────

TEST(KeyframeState, RangeCheckWarnsThenThrows)
{
    Clip         clip = make_clip("c", 100, 250);
    FakeNotifier notifier;

    EXPECT_NO_THROW(require_frame_in_range(clip, 100, notifier));
    EXPECT_NO_THROW(require_frame_in_range(clip, 250, notifier));
    EXPECT_TRUE(notifier.warnings.empty());

    EXPECT_THROW(require_frame_in_range(clip, 400, notifier), OutOfRangeError);
    ASSERT_EQ(notifier.warnings.size(), 1u);
    EXPECT_EQ(notifier.warnings[0].title, "Frame out of range");
}

TEST(KeyframeState, OutOfRangeErrorCarriesFrames)
{
    Clip         clip = make_clip("c", 100, 250);
    FakeNotifier notifier;
    try
    {
        require_frame_in_range(clip, 99, notifier);
        FAIL() << "expected OutOfRangeError";
    }
    catch (const OutOfRangeError& e)
    {
        EXPECT_EQ(e.frame(), 99);
        EXPECT_EQ(e.range_start(), 100);
        EXPECT_EQ(e.range_end(), 250);
    }
}

TEST(KeyframeState, PropertyValidation)
{
    Clip image = make_clip("img", 0, 10, MediaKind::Image);
    EXPECT_NO_THROW(require_valid_property(image, PropertyId::Opacity, 0.5));
    EXPECT_THROW(require_valid_property(image, PropertyId::Volume, 0.5), ValidationError);
    EXPECT_THROW(require_valid_property(image, PropertyId::Opacity, 1.5), ValidationError);

    EXPECT_NO_THROW(require_valid_properties(image, image.baseline));
    EXPECT_THROW(require_valid_properties(image, AnimatableProperties(AudioProperties{})),
                 ValidationError);
}

// ─── Toggle ──────────────────────────────────────────────────────────────────

TEST(KeyframeState, ToggleFromNoneEnablesAndCreates)
{
    Clip clip = make_clip("c", 100, 250);
    EXPECT_EQ(toggle_keyframe(clip, 100), ToggleAction::Created);

    EXPECT_TRUE(has_animation(clip));
    ASSERT_EQ(keyframe_count(clip), 1u);
    EXPECT_EQ(clip.animation->keyframes[0].frame_position, 0);
    EXPECT_EQ(clip.animation->keyframes[0].properties, clip.baseline);
}

TEST(KeyframeState, ToggleFromNoneDropsStaleKeyframes)
{
    Clip clip = make_clip("c", 100, 250);
    insert_keyframe(clip, 10, clip.baseline);   // disabled config with a leftover
    toggle_keyframe(clip, 150);
    EXPECT_EQ(keyframe_frames(clip), (std::vector<Frame>{150}));
}

TEST(KeyframeState, ToggleBetweenAddsAndOnRemoves)
{
    Clip clip = make_clip("c", 100, 250);
    toggle_keyframe(clip, 100);

    EXPECT_EQ(toggle_keyframe(clip, 200), ToggleAction::Created);
    EXPECT_EQ(keyframe_count(clip), 2u);

    EXPECT_EQ(toggle_keyframe(clip, 200), ToggleAction::Removed);
    EXPECT_TRUE(has_animation(clip));

    EXPECT_EQ(toggle_keyframe(clip, 100), ToggleAction::RemovedLast);
    EXPECT_FALSE(has_animation(clip));
    ASSERT_TRUE(clip.animation.has_value());
    EXPECT_FALSE(clip.animation->is_enabled);
}

// ─── Property change ─────────────────────────────────────────────────────────

TEST(KeyframeState, ChangeWithoutAnimationOnlyTouchesBaseline)
{
    Clip clip = make_clip("c", 100, 250);
    EXPECT_EQ(apply_property_change(clip, 180, PropertyId::Opacity, 0.5),
              PropertyChangeResult::NoAnimation);
    EXPECT_DOUBLE_EQ(*get_property(clip.baseline, PropertyId::Opacity), 0.5);
    EXPECT_EQ(keyframe_count(clip), 0u);
}

TEST(KeyframeState, ChangeOnKeyframeUpdatesItAndBaseline)
{
    Clip clip = make_clip("c", 100, 250);
    toggle_keyframe(clip, 150);

    EXPECT_EQ(apply_property_change(clip, 150, PropertyId::X, 42.0),
              PropertyChangeResult::UpdatedKeyframe);
    EXPECT_DOUBLE_EQ(*get_property(find_keyframe_at(clip, 150)->properties, PropertyId::X), 42.0);
    EXPECT_DOUBLE_EQ(*get_property(clip.baseline, PropertyId::X), 42.0);
    EXPECT_EQ(keyframe_count(clip), 1u);
}

TEST(KeyframeState, ChangeBetweenCreatesKeyframe)
{
    Clip clip = make_clip("c", 100, 250);
    toggle_keyframe(clip, 100);

    EXPECT_EQ(apply_property_change(clip, 180, PropertyId::Opacity, 0.5),
              PropertyChangeResult::CreatedKeyframe);

    const Keyframe* created = find_keyframe_at(clip, 180);
    ASSERT_NE(created, nullptr);
    EXPECT_EQ(created->frame_position, 80);
    EXPECT_DOUBLE_EQ(*get_property(created->properties, PropertyId::Opacity), 0.5);
    EXPECT_DOUBLE_EQ(*get_property(created->properties, PropertyId::Width), 640.0);

    // First keyframe keeps the old opacity.
    EXPECT_DOUBLE_EQ(*get_property(find_keyframe_at(clip, 100)->properties, PropertyId::Opacity),
                     1.0);
    EXPECT_DOUBLE_EQ(*get_property(clip.baseline, PropertyId::Opacity), 0.5);
}
