#include <gtest/gtest.h>
#include <kinema/kinema.hpp>

#include "anim/keyframe_store.hpp"
#include "history/command_history.hpp"
#include "util/fake_collaborators.hpp"

using namespace kinema;
using kinema::test::FakeNotifier;
using kinema::test::FakePlayhead;
using kinema::test::FakeRenderer;
using kinema::test::make_clip;

namespace
{

class KeyframeEngineTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        clips.add(make_clip("v1", 100, 250));
        clips.add(make_clip("a1", 0, 300, MediaKind::Audio));
    }

    Clip& clip(const ClipId& id = "v1") { return *clips.find_clip(id); }

    ClipRegistry   clips;
    FakeRenderer   renderer;
    FakeNotifier   notifier;
    FakePlayhead   playhead;
    KeyframeEngine engine{clips, renderer, EngineConfig{}, &notifier, &playhead};
};

}   // anonymous namespace

// ─── Construction ────────────────────────────────────────────────────────────

TEST(KeyframeEngine, RejectsInvalidConfig)
{
    ClipRegistry clips;
    FakeRenderer renderer;
    EngineConfig config;
    config.frame_rate = -1.0;
    EXPECT_THROW(KeyframeEngine(clips, renderer, config), ValidationError);
}

TEST(KeyframeEngine, WorksWithoutNotifierOrPlayhead)
{
    ClipRegistry clips;
    FakeRenderer renderer;
    clips.add(make_clip("v1", 0, 10));

    KeyframeEngine engine(clips, renderer);
    EXPECT_THROW(engine.toggle_keyframe("v1", 50), OutOfRangeError);
    EXPECT_EQ(engine.toggle_keyframe("v1", 5), KeyframeState::OnKeyframe);
}

// ─── Toggle scenario ─────────────────────────────────────────────────────────

TEST_F(KeyframeEngineTest, ToggleTwiceAtClipStart)
{
    EXPECT_EQ(engine.toggle_keyframe("v1", 100), KeyframeState::OnKeyframe);
    ASSERT_EQ(clip().animation->keyframes.size(), 1u);
    EXPECT_EQ(clip().animation->keyframes[0].frame_position, 0);

    EXPECT_EQ(engine.toggle_keyframe("v1", 100), KeyframeState::None);
    EXPECT_TRUE(clip().animation->keyframes.empty());
    EXPECT_FALSE(clip().animation->is_enabled);
    EXPECT_EQ(engine.undo_description(), "Toggle keyframe at 00:00:03.10");
}

TEST_F(KeyframeEngineTest, StateIsDefinedWithoutConfig)
{
    EXPECT_EQ(engine.state_at("v1", 0), KeyframeState::None);
    EXPECT_EQ(engine.state_at("v1", 1000), KeyframeState::None);
    EXPECT_FALSE(engine.ui_state_at("v1", 150).has_animation);
}

// ─── Rescale scenario ────────────────────────────────────────────────────────

TEST_F(KeyframeEngineTest, RescaleHalvesKeyframes)
{
    engine.toggle_keyframe("v1", 100);
    engine.toggle_keyframe("v1", 250);

    engine.rescale("v1", TimeRange{100, 175});
    ASSERT_EQ(clip().animation->keyframes.size(), 2u);
    EXPECT_EQ(clip().animation->keyframes[0].frame_position, 0);
    EXPECT_EQ(clip().animation->keyframes[1].frame_position, 75);
    EXPECT_TRUE(engine.validate("v1").empty());
}

TEST_F(KeyframeEngineTest, OneFrameShrinkKeepsTrailingKeyframeInRange)
{
    engine.toggle_keyframe("v1", 100);
    engine.toggle_keyframe("v1", 250);

    engine.rescale("v1", TimeRange{100, 249});
    EXPECT_EQ(engine.keyframe_frames("v1"), (std::vector<Frame>{100, 249}));
    EXPECT_TRUE(engine.validate("v1").empty());
    ASSERT_FALSE(renderer.pushes.empty());
    EXPECT_EQ(renderer.pushes.back().keyframes.size(), 2u);

    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.keyframe_frames("v1"), (std::vector<Frame>{100, 250}));
}

// ─── Property change scenario ────────────────────────────────────────────────

TEST_F(KeyframeEngineTest, PropertyChangeBetweenKeyframes)
{
    engine.toggle_keyframe("v1", 100);
    engine.toggle_keyframe("v1", 250);
    const AnimatableProperties live = clip().baseline;

    engine.update_property("v1", 180, PropertyId::Opacity, 0.5);

    EXPECT_EQ(engine.keyframe_frames("v1"), (std::vector<Frame>{100, 180, 250}));
    const Keyframe* kf = find_keyframe_at(clip(), 180);
    ASSERT_NE(kf, nullptr);

    AnimatableProperties expected = live;
    set_property(expected, PropertyId::Opacity, 0.5);
    EXPECT_EQ(kf->properties, expected);
    EXPECT_EQ(engine.state_at("v1", 180), KeyframeState::OnKeyframe);
}

TEST_F(KeyframeEngineTest, PushHappensBeforeImmediateWrite)
{
    engine.toggle_keyframe("v1", 100);
    renderer.reset_log();

    engine.update_property("v1", 100, PropertyId::Rotation, 30.0);
    ASSERT_EQ(renderer.events.size(), 2u);
    EXPECT_EQ(renderer.events[0], "push:v1");
    EXPECT_EQ(renderer.events[1], "set:v1:angle");
}

// ─── Out of range scenario ───────────────────────────────────────────────────

TEST_F(KeyframeEngineTest, OutOfRangeLeavesEverythingUnchanged)
{
    engine.toggle_keyframe("v1", 100);
    const size_t          undo_depth = engine.history().undo_count();
    const AnimationConfig before     = *clip().animation;
    renderer.reset_log();

    EXPECT_THROW(engine.toggle_keyframe("v1", 400), OutOfRangeError);
    EXPECT_THROW(engine.update_property("v1", 400, PropertyId::X, 5.0), OutOfRangeError);
    EXPECT_THROW(engine.create_keyframe("v1", 99), OutOfRangeError);

    EXPECT_EQ(*clip().animation, before);
    EXPECT_EQ(engine.history().undo_count(), undo_depth);
    EXPECT_TRUE(renderer.events.empty());
    EXPECT_EQ(notifier.warnings.size(), 3u);
    EXPECT_EQ(notifier.errors.size(), 3u);
}

TEST_F(KeyframeEngineTest, UnknownClip)
{
    EXPECT_THROW(engine.state_at("missing", 0), NotFoundError);
    EXPECT_THROW(engine.toggle_keyframe("missing", 0), NotFoundError);
    EXPECT_THROW(engine.attach("missing"), NotFoundError);
    EXPECT_FALSE(engine.can_undo());
}

// ─── Undo / redo ─────────────────────────────────────────────────────────────

TEST_F(KeyframeEngineTest, UndoRestoresIdenticalState)
{
    const AnimatableProperties           baseline0  = clip().baseline;
    const std::optional<AnimationConfig> animation0 = clip().animation;

    engine.toggle_keyframe("v1", 100);
    engine.update_property("v1", 180, PropertyId::Opacity, 0.5);
    engine.update_property("v1", 100, PropertyId::X, -42.0);
    engine.create_keyframe("v1", 220);
    engine.delete_keyframe("v1", 180);
    engine.rescale("v1", TimeRange{100, 200});
    engine.clear_keyframes("v1");

    const AnimatableProperties           baseline_end  = clip().baseline;
    const std::optional<AnimationConfig> animation_end = clip().animation;

    while (engine.undo())
    {
    }
    EXPECT_EQ(clip().baseline, baseline0);
    EXPECT_EQ(clip().animation, animation0);
    EXPECT_EQ(clip().range, (TimeRange{100, 250}));

    while (engine.redo())
    {
    }
    EXPECT_EQ(clip().baseline, baseline_end);
    EXPECT_EQ(clip().animation, animation_end);
    EXPECT_EQ(clip().range, (TimeRange{100, 200}));
}

TEST_F(KeyframeEngineTest, GroupUndoesAsOne)
{
    engine.begin_group("Keyframe burst");
    engine.toggle_keyframe("v1", 100);
    engine.toggle_keyframe("v1", 150);
    engine.toggle_keyframe("v1", 200);
    engine.end_group();

    EXPECT_EQ(engine.keyframe_frames("v1").size(), 3u);
    EXPECT_EQ(engine.undo_description(), "Keyframe burst");

    EXPECT_TRUE(engine.undo());
    EXPECT_FALSE(engine.has_animation("v1"));
    EXPECT_FALSE(engine.can_undo());
}

TEST_F(KeyframeEngineTest, FailedPushIsReportedAndNotRecorded)
{
    renderer.fail_next_push = true;
    EXPECT_THROW(engine.toggle_keyframe("v1", 120), SyncError);
    EXPECT_FALSE(engine.can_undo());
    EXPECT_EQ(notifier.errors.size(), 1u);

    // Model is ahead of the renderer; a resync brings it back in line.
    EXPECT_TRUE(engine.has_animation("v1"));
    engine.resync("v1");
    EXPECT_FALSE(renderer.pushes.back().empty());
}

TEST_F(KeyframeEngineTest, FailedRedoIsNotReplayed)
{
    engine.toggle_keyframe("v1", 120);
    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.state_at("v1", 120), KeyframeState::None);

    renderer.fail_next_push = true;
    EXPECT_THROW(engine.redo(), SyncError);
    EXPECT_EQ(engine.state_at("v1", 120), KeyframeState::OnKeyframe);
    EXPECT_FALSE(engine.can_redo());
    EXPECT_FALSE(engine.redo());
    EXPECT_EQ(engine.state_at("v1", 120), KeyframeState::OnKeyframe);

    engine.resync("v1");
    EXPECT_EQ(renderer.pushes.back().keyframes.size(), 1u);
}

// ─── Navigation ──────────────────────────────────────────────────────────────

TEST_F(KeyframeEngineTest, Navigation)
{
    engine.toggle_keyframe("v1", 120);
    engine.toggle_keyframe("v1", 200);

    EXPECT_EQ(engine.next_keyframe("v1", 100), 120);
    EXPECT_EQ(engine.next_keyframe("v1", 120), 200);
    EXPECT_EQ(engine.previous_keyframe("v1", 250), 200);
    EXPECT_FALSE(engine.previous_keyframe("v1", 120).has_value());
    EXPECT_NE(engine.describe("v1").find("2 keyframe(s)"), std::string::npos);
}

// ─── Inbound sync ────────────────────────────────────────────────────────────

TEST_F(KeyframeEngineTest, InboundEditsOnlyTouchBaseline)
{
    engine.toggle_keyframe("v1", 100);
    engine.attach("v1");
    const AnimationConfig before = *clip().animation;

    RendererPropsChange change;
    change.opacity = 0.4;
    change.rect    = RendererRect{.x = 0.0, .y = 0.0};
    renderer.emit("v1", change);

    EXPECT_EQ(*clip().animation, before);
    EXPECT_DOUBLE_EQ(*get_property(clip().baseline, PropertyId::Opacity), 0.4);
    EXPECT_DOUBLE_EQ(*get_property(clip().baseline, PropertyId::X), -640.0);
    EXPECT_DOUBLE_EQ(*get_property(clip().baseline, PropertyId::Y), -360.0);

    engine.detach("v1");
    change.opacity = 0.9;
    renderer.emit("v1", change);
    EXPECT_DOUBLE_EQ(*get_property(clip().baseline, PropertyId::Opacity), 0.4);
}

TEST_F(KeyframeEngineTest, AudioVolumeEdits)
{
    engine.toggle_keyframe("a1", 0);
    engine.update_property("a1", 150, PropertyId::Volume, 0.25);
    EXPECT_EQ(engine.keyframe_frames("a1"), (std::vector<Frame>{0, 150}));
    EXPECT_DOUBLE_EQ(renderer.last_set("volume"), 0.25);

    EXPECT_THROW(engine.update_property("a1", 150, PropertyId::Width, 10.0), ValidationError);
}

// ─── Persistence ─────────────────────────────────────────────────────────────

TEST_F(KeyframeEngineTest, ExportImportRoundTrip)
{
    EXPECT_TRUE(engine.export_animation("v1").empty());

    engine.toggle_keyframe("v1", 100);
    engine.update_property("v1", 180, PropertyId::Opacity, 0.5);
    const std::string     json     = engine.export_animation("v1");
    const AnimationConfig exported = *clip().animation;

    engine.clear_keyframes("v1");
    engine.import_animation("v1", json);
    EXPECT_EQ(*clip().animation, exported);

    EXPECT_TRUE(engine.undo());
    EXPECT_TRUE(clip().animation->keyframes.empty());
}

TEST_F(KeyframeEngineTest, ImportRejectsForeignKind)
{
    engine.toggle_keyframe("a1", 0);
    const std::string audio_json = engine.export_animation("a1");
    EXPECT_THROW(engine.import_animation("v1", audio_json), ValidationError);
    EXPECT_FALSE(clip().animation.has_value());
}
