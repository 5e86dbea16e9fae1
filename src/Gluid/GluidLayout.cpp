#include <Gluid/GluidLayout.h>

#include <Core/UUID.h>

#include <algorithm>


namespace Gluid::GluidLayout
{

void packLowerLane(UInt32 lane, Bytes & bytes)
{
    bytes[0] = static_cast<UInt8>(lane);
    bytes[1] = static_cast<UInt8>(lane >> 8);
    bytes[2] = static_cast<UInt8>(lane >> 16);
    bytes[3] = static_cast<UInt8>(lane >> 24);
}

void packUpperLane(UInt32 lane, Bytes & bytes)
{
    const UInt8 third = static_cast<UInt8>(lane >> 16);

    bytes[4] = static_cast<UInt8>(lane);
    bytes[5] = static_cast<UInt8>(lane >> 8);
    bytes[6] = static_cast<UInt8>(lane >> 24);
    bytes[VersionByte] = (Version & VersionMask) | static_cast<UInt8>((third & 0xF0) >> 4);
    bytes[VariantByte] = (Variant & VariantMask) | static_cast<UInt8>(third & 0x0F);
}

void writeTag(Bytes & bytes)
{
    std::copy(Tag.begin(), Tag.end(), bytes.begin() + TagOffset);
}

UInt32 unpackLowerLane(const Bytes & bytes)
{
    return static_cast<UInt32>(bytes[0])
        | (static_cast<UInt32>(bytes[1]) << 8)
        | (static_cast<UInt32>(bytes[2]) << 16)
        | (static_cast<UInt32>(bytes[3]) << 24);
}

UInt32 unpackUpperLane(const Bytes & bytes)
{
    const UInt8 third = static_cast<UInt8>(((bytes[VersionByte] & 0x0F) << 4) | (bytes[VariantByte] & 0x0F));

    return static_cast<UInt32>(bytes[4])
        | (static_cast<UInt32>(bytes[5]) << 8)
        | (static_cast<UInt32>(third) << 16)
        | (static_cast<UInt32>(bytes[6]) << 24);
}

bool hasMarkers(const Bytes & bytes)
{
    return (bytes[VersionByte] & VersionMask) == Version
        && (bytes[VariantByte] & VariantMask) == Variant;
}

bool hasTag(const Bytes & bytes)
{
    return std::equal(Tag.begin(), Tag.end(), bytes.begin() + TagOffset);
}

Bytes pack(UInt32 lower_lane, UInt32 upper_lane)
{
    Bytes bytes{};
    packLowerLane(lower_lane, bytes);
    packUpperLane(upper_lane, bytes);
    writeTag(bytes);
    return bytes;
}

Bytes swapByteOrder(const Bytes & bytes)
{
    Bytes res = bytes;
    std::reverse(res.begin(), res.begin() + 4);
    std::swap(res[4], res[5]);
    std::swap(res[6], res[7]);
    return res;
}

UUID toUUID(const Bytes & layout_bytes)
{
    return UUIDHelpers::fromBytes(swapByteOrder(layout_bytes));
}

Bytes fromUUID(const UUID & uuid)
{
    return swapByteOrder(UUIDHelpers::toBytes(uuid));
}

}
