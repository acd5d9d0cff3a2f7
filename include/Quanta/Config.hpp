/// @file Config.hpp
/// @brief Compile-time configuration macros for Quanta.
#pragma once

// Internal consistency checks (QUANTA_ASSERT) abort when enabled. Unit declaration errors are always fatal.
#ifndef QUANTA_ENABLE_ASSERTS
#define QUANTA_ENABLE_ASSERTS 1
#endif

// Name under which the library logger is registered with spdlog.
#ifndef QUANTA_LOGGER_NAME
#define QUANTA_LOGGER_NAME "quanta"
#endif

// Initial level of the library logger, using spdlog's numeric levels (0 trace .. 6 off).
#ifndef QUANTA_DEFAULT_LOG_LEVEL
#define QUANTA_DEFAULT_LOG_LEVEL 3
#endif
