#include <kinema/collaborators.hpp>
#include <kinema/logger.hpp>

namespace kinema
{

void LogNotificationSink::warn(const std::string& title, const std::string& message)
{
    KINEMA_LOG_WARN("kinema.engine", "{}: {}", title, message);
}

void LogNotificationSink::error(const std::string& title, const std::string& message)
{
    KINEMA_LOG_ERROR("kinema.engine", "{}: {}", title, message);
}

}   // namespace kinema
