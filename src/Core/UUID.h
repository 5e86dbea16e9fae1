#pragma once

#include <array>

#include <base/UUID.h>
#include <base/types.h>

namespace Poco { class UUID; }

namespace Gluid
{

namespace UUIDHelpers
{
    constexpr size_t BytesSize = 16;

    /// UUID bytes in RFC 4122 order, exactly as they appear in the text form and on the wire.
    using Bytes = std::array<UInt8, BytesSize>;

    UUID fromBytes(const Bytes & bytes);
    Bytes toBytes(const UUID & uuid);

    /// First and last 8 bytes of the RFC 4122 representation, as big-endian integers.
    UInt64 getHighBytes(const UUID & uuid);
    UInt64 getLowBytes(const UUID & uuid);

    /// Generate random UUID (version 4, RFC variant).
    UUID generateV4();

    constexpr UUID Nil{};
}

/// Canonical lowercase 8-4-4-4-12 text form.
String formatUUID(const UUID & uuid);

/// Throws CANNOT_PARSE_UUID if `text` is not a UUID.
UUID parseUUID(const String & text);
bool tryParseUUID(const String & text, UUID & uuid);

Poco::UUID toPocoUUID(const UUID & uuid);
UUID fromPocoUUID(const Poco::UUID & uuid);

}
