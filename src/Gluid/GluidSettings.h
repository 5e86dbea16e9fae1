#pragma once

#include <Gluid/GluidLayout.h>

#include <string>

namespace Poco { namespace Util { class AbstractConfiguration; } }

namespace Gluid
{

struct GluidSettings
{
    /// Number of namespace digest bytes mixed into an identifier, see NamespaceMask.
    /// Changing it changes every identifier produced with a namespace.
    size_t entropy = GluidLayout::MaxEntropy;

    /// Reads <config_prefix>.entropy. Missing keys keep their defaults.
    void loadFromConfig(const Poco::Util::AbstractConfiguration & config, const std::string & config_prefix);

    /// Throws BAD_ARGUMENTS.
    void validate() const;
};

}
