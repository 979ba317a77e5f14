#include <spdlog/spdlog.h>

#include <metaloader/context.hpp>
#include <metaloader/version.hpp>

namespace metaloader
{
    Context::Context()
        : user_agent(default_user_agent())
    {
        set_verbosity(0);
    }

    void Context::set_verbosity(int v)
    {
        verbosity = v;
        if (v > 1)
        {
            spdlog::set_level(spdlog::level::debug);
        }
        else if (v > 0)
        {
            spdlog::set_level(spdlog::level::info);
        }
        else
        {
            spdlog::set_level(spdlog::level::warn);
        }
    }

    void Context::set_log_level(spdlog::level::level_enum log_level)
    {
        spdlog::set_level(log_level);
    }

    std::string default_user_agent()
    {
        return "metaloader/" METALOADER_VERSION_STRING;
    }
}
