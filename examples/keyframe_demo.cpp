// Keyframe Demo
// Drives the engine against a console renderer: toggles keyframes, edits a
// property between keyframes, retimes the clip, then undoes everything.

#include <future>
#include <iostream>
#include <kinema/kinema.hpp>

using namespace kinema;

namespace
{

// Prints every call instead of compositing.
class ConsoleRenderer : public Renderer
{
   public:
    std::future<void> push_animation(const Clip& clip, const AnimationDescription& desc) override
    {
        std::cout << "  push " << clip.id << ": " << desc.keyframes.size() << " keyframe(s), "
                  << desc.duration_us << " us\n";
        for (const auto& kf : desc.keyframes)
            std::cout << "    " << kf.key() << " opacity=" << kf.value("opacity").value_or(-1) << '\n';

        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }

    void set_property(const Clip& clip, std::string_view name, double value) override
    {
        std::cout << "  set " << clip.id << "." << name << " = " << value << '\n';
    }

    SubscriptionId on_props_change(const ClipId& clip_id, PropsChangeCallback callback) override
    {
        clip_id_  = clip_id;
        callback_ = std::move(callback);
        return 1;
    }

    void remove_props_listener(SubscriptionId) override { callback_ = nullptr; }

    // Simulates the user dragging the sprite in the preview.
    void drag_to(double x, double y)
    {
        if (!callback_)
            return;
        RendererPropsChange change;
        change.rect = RendererRect{.x = x, .y = y};
        std::cout << "  drag " << clip_id_ << " to (" << x << ", " << y << ")\n";
        callback_(change);
    }

   private:
    ClipId              clip_id_;
    PropsChangeCallback callback_;
};

class ConsolePlayhead : public PlayheadController
{
   public:
    void seek_to(Frame absolute_frame) override
    {
        std::cout << "  seek " << absolute_frame << '\n';
    }
};

void print_state(const KeyframeEngine& engine, const ClipId& id, Frame frame)
{
    std::cout << "state @" << frame << ": " << keyframe_state_name(engine.state_at(id, frame))
              << '\n';
}

}   // anonymous namespace

int main()
{
    Logger::instance().add_sink(sinks::console_sink());

    ClipRegistry clips;
    Clip         clip;
    clip.id    = "title-card";
    clip.kind  = MediaKind::Image;
    clip.range = TimeRange{100, 250};

    ImageProperties props;
    props.width   = 640;
    props.height  = 360;
    clip.baseline = props;
    clips.add(std::move(clip));

    ConsoleRenderer renderer;
    ConsolePlayhead playhead;
    EngineConfig    config;
    if (!config.load(EngineConfig::default_path()))
        KINEMA_LOG_INFO("demo", "No saved engine config; using defaults");

    KeyframeEngine engine(clips, renderer, config, nullptr, &playhead);
    engine.attach("title-card");

    std::cout << "\n== toggle at 100 and 250\n";
    engine.toggle_keyframe("title-card", 100);
    engine.toggle_keyframe("title-card", 250);
    print_state(engine, "title-card", 180);

    std::cout << "\n== fade to 0.5 at 180\n";
    engine.update_property("title-card", 180, PropertyId::Opacity, 0.5);
    print_state(engine, "title-card", 180);

    std::cout << "\n== drag in preview (baseline only)\n";
    renderer.drag_to(100.0, 50.0);

    std::cout << "\n== trim clip to [100, 175]\n";
    engine.rescale("title-card", TimeRange{100, 175});
    std::cout << engine.describe("title-card") << '\n';

    std::cout << "\n== edit outside the clip\n";
    try
    {
        engine.toggle_keyframe("title-card", 400);
    }
    catch (const OutOfRangeError& e)
    {
        std::cout << "  rejected: " << e.what() << '\n';
    }

    std::cout << "\n== saved form\n" << engine.export_animation("title-card");

    std::cout << "\n== undo all\n";
    while (engine.can_undo())
    {
        std::cout << "undo: " << engine.undo_description() << '\n';
        engine.undo();
    }
    print_state(engine, "title-card", 100);

    return 0;
}
