#pragma once

#include <optional>

#include <base/UUID.h>
#include <base/types.h>
#include <Common/logger_useful.h>
#include <Gluid/GluidSettings.h>
#include <Gluid/NamespaceMask.h>


namespace Gluid
{

/** Stores one Int32, two Int32 or one Int64 in a UUID-compatible identifier, optionally bound to a namespace.
  *
  * Decoding is checked in two steps:
  *  - the identifier must carry the version and variant markers (isGluid), whatever the namespace;
  *  - after removing the namespace mask, the tag must match (isLinked).
  * Every decoding method returns std::nullopt (or false) when either step fails. Callers can not tell
  * a random UUID from a Gluid of another namespace. No method throws for any input identifier.
  *
  * The codec keeps only its settings, so a single instance can be used from many threads.
  */
class GluidCodec
{
public:
    /// Throws BAD_ARGUMENTS for invalid settings.
    explicit GluidCodec(const GluidSettings & settings_ = {});

    UUID encode(Int32 value, NamespaceName namespace_name = std::nullopt) const;
    UUID encode(Int32 value1, Int32 value2, NamespaceName namespace_name = std::nullopt) const;
    UUID encode(Int64 value, NamespaceName namespace_name = std::nullopt) const;

    /// Only looks at the markers, independent of namespace and tag.
    static bool isGluid(const UUID & uuid);

    bool isLinked(const UUID & uuid, NamespaceName namespace_name = std::nullopt) const;

    std::optional<Int32> toInt32(const UUID & uuid, NamespaceName namespace_name = std::nullopt) const;
    std::optional<Int64> toInt64(const UUID & uuid, NamespaceName namespace_name = std::nullopt) const;
    /// The second value of a pair encoded with encode(value1, value2).
    std::optional<Int32> secondInt32(const UUID & uuid, NamespaceName namespace_name = std::nullopt) const;

    const GluidSettings & getSettings() const { return settings; }

private:
    UUID encodeLanes(UInt32 lower_lane, UInt32 upper_lane, NamespaceName namespace_name) const;

    /// Returns unmasked layout bytes if the identifier is a Gluid linked to the namespace.
    std::optional<GluidLayout::Bytes> tryUnmask(const UUID & uuid, NamespaceName namespace_name) const;

    const GluidSettings settings;
    LoggerPtr log;
};

/// The same operations with default settings.
UUID encode(Int32 value, NamespaceName namespace_name = std::nullopt);
UUID encode(Int32 value1, Int32 value2, NamespaceName namespace_name = std::nullopt);
UUID encode(Int64 value, NamespaceName namespace_name = std::nullopt);

bool isGluid(const UUID & uuid);
bool isLinked(const UUID & uuid, NamespaceName namespace_name = std::nullopt);

std::optional<Int32> toInt32(const UUID & uuid, NamespaceName namespace_name = std::nullopt);
std::optional<Int64> toInt64(const UUID & uuid, NamespaceName namespace_name = std::nullopt);
std::optional<Int32> secondInt32(const UUID & uuid, NamespaceName namespace_name = std::nullopt);

}
