#include <Core/UUID.h>

#include <Common/Exception.h>

#include <Poco/UUID.h>
#include <Poco/UUIDGenerator.h>


namespace Gluid
{

namespace ErrorCodes
{
    extern const int CANNOT_PARSE_UUID;
}

namespace UUIDHelpers
{
    UUID fromBytes(const Bytes & bytes)
    {
        UInt128 value = 0;
        for (UInt8 byte : bytes)
            value = (value << 8) | byte;
        return UUID{value};
    }

    Bytes toBytes(const UUID & uuid)
    {
        Bytes bytes;
        UInt128 value = uuid.toUnderType();
        for (size_t i = BytesSize; i > 0; --i)
        {
            bytes[i - 1] = static_cast<UInt8>(value & 0xFF);
            value >>= 8;
        }
        return bytes;
    }

    UInt64 getHighBytes(const UUID & uuid)
    {
        return static_cast<UInt64>(uuid.toUnderType() >> 64);
    }

    UInt64 getLowBytes(const UUID & uuid)
    {
        return static_cast<UInt64>(uuid.toUnderType());
    }

    UUID generateV4()
    {
        return fromPocoUUID(Poco::UUIDGenerator::defaultGenerator().createRandom());
    }
}

String formatUUID(const UUID & uuid)
{
    return toPocoUUID(uuid).toString();
}

UUID parseUUID(const String & text)
{
    UUID uuid;
    if (!tryParseUUID(text, uuid))
        throw Exception(ErrorCodes::CANNOT_PARSE_UUID, "Cannot parse UUID from '{}'", text);
    return uuid;
}

bool tryParseUUID(const String & text, UUID & uuid)
{
    Poco::UUID parsed;
    if (!parsed.tryParse(text))
        return false;
    uuid = fromPocoUUID(parsed);
    return true;
}

Poco::UUID toPocoUUID(const UUID & uuid)
{
    const auto bytes = UUIDHelpers::toBytes(uuid);
    Poco::UUID res;
    res.copyFrom(reinterpret_cast<const char *>(bytes.data()));
    return res;
}

UUID fromPocoUUID(const Poco::UUID & uuid)
{
    UUIDHelpers::Bytes bytes;
    uuid.copyTo(reinterpret_cast<char *>(bytes.data()));
    return UUIDHelpers::fromBytes(bytes);
}

}
