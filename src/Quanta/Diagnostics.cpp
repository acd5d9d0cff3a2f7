#include <Quanta/Defines.hpp>
#include <Quanta/Logging.hpp>

#include <cstdlib>

namespace Quanta::detail
{
    void FatalError(const char* message, const char* file, int line) noexcept
    {
        const auto logger = Logging::GetLogger();
        logger->critical("{} ({}:{})", message, file, line);
        logger->flush();
        std::abort();
    }
}// namespace Quanta::detail
