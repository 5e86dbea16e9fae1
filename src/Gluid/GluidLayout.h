#pragma once

#include <array>

#include <base/UUID.h>
#include <base/types.h>


namespace Gluid
{

/** Placement of the two 32-bit lanes inside the 16 bytes of a Gluid.
  *
  * Byte indices are in layout order: the GUID byte array order, where the first three
  * fields are little-endian. Layout bytes are converted to RFC 4122 order only at the
  * boundary (toUUID / fromUUID), which keeps the text form of identifiers stable.
  *
  *  0..3   lower lane, little-endian
  *  4, 5   upper lane bytes 0 and 1
  *  6      upper lane byte 3
  *  7      version marker in the high nibble, high nibble of upper lane byte 2 in the low one
  *  8      variant marker in the high bits, low nibble of upper lane byte 2 in the low nibble
  *  9..11  tag, checked after the namespace mask is removed
  *  12..15 zero before masking
  */
namespace GluidLayout
{
    constexpr size_t BytesSize = 16;
    using Bytes = std::array<UInt8, BytesSize>;

    /// Version 1 is not defined for the variant below.
    constexpr UInt8 Version = 0x10;
    constexpr UInt8 VersionMask = 0xF0;
    constexpr size_t VersionByte = 7;

    /// Variant 0b111 is reserved by RFC 4122, so no conforming UUID carries it.
    constexpr UInt8 Variant = 0xE0;
    constexpr UInt8 VariantMask = 0xE0;
    constexpr size_t VariantByte = 8;

    constexpr size_t TagOffset = 9;
    constexpr std::array<UInt8, 3> Tag{0xCC, 0xCC, 0xCC};

    /// Number of namespace digest bytes that fit into the mask. See NamespaceMask.
    constexpr size_t MaxEntropy = 15;

    void packLowerLane(UInt32 lane, Bytes & bytes);
    /// Also writes the version and variant markers.
    void packUpperLane(UInt32 lane, Bytes & bytes);
    void writeTag(Bytes & bytes);

    UInt32 unpackLowerLane(const Bytes & bytes);
    UInt32 unpackUpperLane(const Bytes & bytes);

    bool hasMarkers(const Bytes & bytes);
    bool hasTag(const Bytes & bytes);

    /// Plain (unmasked) identifier for the two lanes.
    Bytes pack(UInt32 lower_lane, UInt32 upper_lane);

    /// Swaps between layout order and RFC 4122 order. The permutation is its own inverse.
    Bytes swapByteOrder(const Bytes & bytes);

    UUID toUUID(const Bytes & layout_bytes);
    Bytes fromUUID(const UUID & uuid);
}

}
