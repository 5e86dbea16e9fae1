#include <Gluid/GluidCodec.h>

#include <Core/UUID.h>


namespace Gluid
{

GluidCodec::GluidCodec(const GluidSettings & settings_)
    : settings(settings_)
    , log(getLogger("GluidCodec"))
{
    settings.validate();
}

UUID GluidCodec::encode(Int32 value, NamespaceName namespace_name) const
{
    return encode(value, 0, namespace_name);
}

UUID GluidCodec::encode(Int32 value1, Int32 value2, NamespaceName namespace_name) const
{
    return encodeLanes(static_cast<UInt32>(value1), static_cast<UInt32>(value2), namespace_name);
}

UUID GluidCodec::encode(Int64 value, NamespaceName namespace_name) const
{
    const auto bits = static_cast<UInt64>(value);
    return encodeLanes(static_cast<UInt32>(bits), static_cast<UInt32>(bits >> 32), namespace_name);
}

UUID GluidCodec::encodeLanes(UInt32 lower_lane, UInt32 upper_lane, NamespaceName namespace_name) const
{
    auto bytes = GluidLayout::pack(lower_lane, upper_lane);
    NamespaceMask::create(namespace_name, settings.entropy).apply(bytes);
    return GluidLayout::toUUID(bytes);
}

bool GluidCodec::isGluid(const UUID & uuid)
{
    return GluidLayout::hasMarkers(GluidLayout::fromUUID(uuid));
}

std::optional<GluidLayout::Bytes> GluidCodec::tryUnmask(const UUID & uuid, NamespaceName namespace_name) const
{
    auto bytes = GluidLayout::fromUUID(uuid);

    if (!GluidLayout::hasMarkers(bytes))
    {
        LOG_TRACE(log, "{} is not a Gluid", formatUUID(uuid));
        return {};
    }

    NamespaceMask::create(namespace_name, settings.entropy).apply(bytes);

    if (!GluidLayout::hasTag(bytes))
    {
        LOG_TRACE(log, "{} is not linked to the requested namespace", formatUUID(uuid));
        return {};
    }

    return bytes;
}

bool GluidCodec::isLinked(const UUID & uuid, NamespaceName namespace_name) const
{
    return tryUnmask(uuid, namespace_name).has_value();
}

std::optional<Int32> GluidCodec::toInt32(const UUID & uuid, NamespaceName namespace_name) const
{
    auto bytes = tryUnmask(uuid, namespace_name);
    if (!bytes)
        return {};
    return static_cast<Int32>(GluidLayout::unpackLowerLane(*bytes));
}

std::optional<Int64> GluidCodec::toInt64(const UUID & uuid, NamespaceName namespace_name) const
{
    auto bytes = tryUnmask(uuid, namespace_name);
    if (!bytes)
        return {};

    const UInt64 lower = GluidLayout::unpackLowerLane(*bytes);
    const UInt64 upper = GluidLayout::unpackUpperLane(*bytes);
    return static_cast<Int64>(lower | (upper << 32));
}

std::optional<Int32> GluidCodec::secondInt32(const UUID & uuid, NamespaceName namespace_name) const
{
    auto bytes = tryUnmask(uuid, namespace_name);
    if (!bytes)
        return {};
    return static_cast<Int32>(GluidLayout::unpackUpperLane(*bytes));
}


namespace
{

const GluidCodec & getDefaultCodec()
{
    static const GluidCodec codec;
    return codec;
}

}

UUID encode(Int32 value, NamespaceName namespace_name)
{
    return getDefaultCodec().encode(value, namespace_name);
}

UUID encode(Int32 value1, Int32 value2, NamespaceName namespace_name)
{
    return getDefaultCodec().encode(value1, value2, namespace_name);
}

UUID encode(Int64 value, NamespaceName namespace_name)
{
    return getDefaultCodec().encode(value, namespace_name);
}

bool isGluid(const UUID & uuid)
{
    return GluidCodec::isGluid(uuid);
}

bool isLinked(const UUID & uuid, NamespaceName namespace_name)
{
    return getDefaultCodec().isLinked(uuid, namespace_name);
}

std::optional<Int32> toInt32(const UUID & uuid, NamespaceName namespace_name)
{
    return getDefaultCodec().toInt32(uuid, namespace_name);
}

std::optional<Int64> toInt64(const UUID & uuid, NamespaceName namespace_name)
{
    return getDefaultCodec().toInt64(uuid, namespace_name);
}

std::optional<Int32> secondInt32(const UUID & uuid, NamespaceName namespace_name)
{
    return getDefaultCodec().secondInt32(uuid, namespace_name);
}

}
