#include <Quanta/Logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace Quanta::Logging
{
    std::shared_ptr<spdlog::logger> GetLogger()
    {
        static const std::shared_ptr<spdlog::logger> logger = [] {
            if (auto existing = spdlog::get(QUANTA_LOGGER_NAME))
                return existing;

            auto created = spdlog::stderr_color_mt(QUANTA_LOGGER_NAME);
            created->set_level(static_cast<spdlog::level::level_enum>(QUANTA_DEFAULT_LOG_LEVEL));
            return created;
        }();
        return logger;
    }

    void SetLevel(spdlog::level::level_enum level)
    {
        GetLogger()->set_level(level);
    }
}// namespace Quanta::Logging
