#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <kinema/config.hpp>
#include <sstream>
#include <system_error>

#include "io/json_util.hpp"

namespace kinema
{

namespace
{

constexpr int CONFIG_VERSION = 1;

}   // anonymous namespace

std::string EngineConfig::check() const
{
    if (!std::isfinite(frame_rate) || frame_rate <= 0.0)
        return "frame_rate must be positive";
    if (canvas_width <= 0 || canvas_height <= 0)
        return "canvas size must be positive";
    if (history_limit == 0)
        return "history_limit must be at least 1";
    return {};
}

// ─── JSON serialization ──────────────────────────────────────────────────────

std::string EngineConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << CONFIG_VERSION << ",\n";
    os << "  \"frameRate\": " << json::format_number(frame_rate) << ",\n";
    os << "  \"canvasWidth\": " << canvas_width << ",\n";
    os << "  \"canvasHeight\": " << canvas_height << ",\n";
    os << "  \"historyLimit\": " << history_limit << ",\n";
    os << "  \"seekOnExecute\": " << (seek_on_execute ? "true" : "false") << ",\n";
    os << "  \"logLevel\": \"" << json::escape(Logger::level_to_string(log_level)) << "\"\n";
    os << "}\n";
    return os.str();
}

bool EngineConfig::deserialize(const std::string& json_text)
{
    if (json_text.empty())
        return false;

    if (auto version = json::read_number(json_text, "version"))
    {
        if (*version > CONFIG_VERSION)
        {
            KINEMA_LOG_WARN("kinema.config", "Unsupported config version {}", *version);
            return false;
        }
    }

    // Missing keys keep their current values.
    EngineConfig next = *this;
    if (auto v = json::read_number(json_text, "frameRate"))
        next.frame_rate = *v;
    if (auto v = json::read_number(json_text, "canvasWidth"))
        next.canvas_width = static_cast<int>(*v);
    if (auto v = json::read_number(json_text, "canvasHeight"))
        next.canvas_height = static_cast<int>(*v);
    if (auto v = json::read_number(json_text, "historyLimit"))
        next.history_limit = *v < 0.0 ? 0 : static_cast<size_t>(*v);
    if (auto v = json::read_bool(json_text, "seekOnExecute"))
        next.seek_on_execute = *v;
    if (auto name = json::read_string(json_text, "logLevel"))
    {
        auto level = Logger::level_from_string(*name);
        if (!level)
        {
            KINEMA_LOG_WARN("kinema.config", "Unknown log level '{}'", *name);
            return false;
        }
        next.log_level = *level;
    }

    std::string problem = next.check();
    if (!problem.empty())
    {
        KINEMA_LOG_WARN("kinema.config", "Rejected config: {}", problem);
        return false;
    }

    *this = next;
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool EngineConfig::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            KINEMA_LOG_ERROR("kinema.config",
                             "Cannot create config directory {}: {}",
                             dir.string(),
                             ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        KINEMA_LOG_ERROR("kinema.config", "Cannot open {} for writing", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool EngineConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(text))
    {
        KINEMA_LOG_WARN("kinema.config", "Ignoring invalid config file {}", path);
        return false;
    }
    KINEMA_LOG_INFO("kinema.config", "Loaded config from {}", path);
    return true;
}

std::string EngineConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "engine.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "kinema";
    return (dir / "engine.json").string();
}

}   // namespace kinema
