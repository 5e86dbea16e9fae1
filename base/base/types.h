#pragma once

#include <cstdint>
#include <string>

using UInt8 = uint8_t;
using UInt16 = uint16_t;
using UInt32 = uint32_t;
using UInt64 = uint64_t;

/// Enough for the 16 bytes of a UUID, no arithmetic beyond shifts and masks is done on it.
using UInt128 = unsigned __int128;

using Int8 = int8_t;
using Int16 = int16_t;
using Int32 = int32_t;
using Int64 = int64_t;

using String = std::string;
