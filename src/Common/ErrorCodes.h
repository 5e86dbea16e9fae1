#pragma once

#include <cstddef>
#include <string_view>
#include <base/types.h>

/** Numeric codes carried by Gluid::Exception.
  * See also Exception.cpp for incrementing part.
  */

namespace Gluid
{

namespace ErrorCodes
{
    /// ErrorCode identifier (index in array).
    using ErrorCode = int;
    using Value = size_t;

    /// Get name of error_code by identifier.
    /// Returns statically allocated string.
    std::string_view getName(ErrorCode error_code);
    /// Get error code value by name. Returns -1 for unknown names.
    ErrorCode getErrorCodeByName(std::string_view error_name);

    /// Get index just after last error_code identifier.
    ErrorCode end();

    /// Number of times an Exception with this code has been created since the program startup.
    Value getCount(ErrorCode error_code);

    /// Thread-safe.
    void increment(ErrorCode error_code);
}

}
