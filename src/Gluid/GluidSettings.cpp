#include <Gluid/GluidSettings.h>

#include <Common/Exception.h>
#include <Common/logger_useful.h>

#include <Poco/Util/AbstractConfiguration.h>


namespace Gluid
{

namespace ErrorCodes
{
    extern const int BAD_ARGUMENTS;
}

void GluidSettings::loadFromConfig(const Poco::Util::AbstractConfiguration & config, const std::string & config_prefix)
{
    entropy = config.getUInt64(config_prefix + ".entropy", GluidLayout::MaxEntropy);
    validate();

    LOG_DEBUG(getLogger("GluidSettings"), "Loaded settings from '{}': entropy {}", config_prefix, entropy);
}

void GluidSettings::validate() const
{
    if (entropy == 0 || entropy > GluidLayout::MaxEntropy)
        throw Exception(ErrorCodes::BAD_ARGUMENTS,
            "Setting 'entropy' must be between 1 and {}, got {}", GluidLayout::MaxEntropy, entropy);
}

}
