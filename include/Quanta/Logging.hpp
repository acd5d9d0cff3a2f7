/// @file Logging.hpp
/// @brief Access to the spdlog logger shared by the Quanta library.
#pragma once

#include <Quanta/Defines.hpp>

#include <spdlog/spdlog.h>

#include <memory>

namespace Quanta::Logging
{
    /// @brief Returns the library logger.
    ///
    /// @details The logger is registered with spdlog under `QUANTA_LOGGER_NAME` the first time this is
    /// called, writing to stderr at `QUANTA_DEFAULT_LOG_LEVEL`. If the application registered a logger
    /// under that name beforehand, that logger is used instead.
    [[nodiscard]] QUANTA_API std::shared_ptr<spdlog::logger> GetLogger();

    /// @brief Changes the level of the library logger.
    QUANTA_API void SetLevel(spdlog::level::level_enum level);
}// namespace Quanta::Logging
