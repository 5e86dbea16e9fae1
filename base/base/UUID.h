#pragma once

#include <base/strong_typedef.h>
#include <base/types.h>

namespace Gluid
{
    /// The 16 bytes of a UUID in RFC 4122 (network) order, most significant byte first.
    using UUID = StrongTypedef<UInt128, struct UUIDTag>;
}
