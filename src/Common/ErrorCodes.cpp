#include <Common/ErrorCodes.h>

#include <atomic>

/** Definitions of all error codes live here, declarations are made at the place of use:
  *     namespace ErrorCodes { extern const int BAD_ARGUMENTS; }
  * so adding a code does not recompile every user.
  */

#define APPLY_FOR_ERROR_CODES(M) \
    M(0, OK) \
    M(1, LOGICAL_ERROR) \
    M(2, BAD_ARGUMENTS) \
    M(3, CANNOT_PARSE_UUID) \
    M(4, OPENSSL_ERROR) \
\
    M(1000, POCO_EXCEPTION) \
    M(1001, STD_EXCEPTION) \
    M(1002, UNKNOWN_EXCEPTION) \
/* See END */

namespace Gluid
{
namespace ErrorCodes
{
#define M(VALUE, NAME) extern const ErrorCode NAME = VALUE;
    APPLY_FOR_ERROR_CODES(M)
#undef M

    constexpr ErrorCode END = 1002;
    std::atomic<Value> values[END + 1]{};

    struct ErrorCodesNames
    {
        std::string_view names[END + 1];
        ErrorCodesNames()
        {
#define M(VALUE, NAME) names[VALUE] = std::string_view(#NAME);
            APPLY_FOR_ERROR_CODES(M)
#undef M
        }
    } const error_codes_names;

    std::string_view getName(ErrorCode error_code)
    {
        if (error_code < 0 || error_code > END)
            return std::string_view();
        return error_codes_names.names[error_code];
    }

    ErrorCode getErrorCodeByName(std::string_view error_name)
    {
        for (ErrorCode code = 0; code <= END; ++code)
        {
            std::string_view name = error_codes_names.names[code];
            if (!name.empty() && name == error_name)
                return code;
        }
        return -1;
    }

    ErrorCode end() { return END + 1; }

    Value getCount(ErrorCode error_code)
    {
        if (error_code < 0 || error_code > END)
            return 0;
        return values[error_code].load(std::memory_order_relaxed);
    }

    void increment(ErrorCode error_code)
    {
        if (error_code < 0 || error_code > END)
        {
            /// For everything outside the range, use UNKNOWN_EXCEPTION.
            error_code = UNKNOWN_EXCEPTION;
        }

        values[error_code].fetch_add(1, std::memory_order_relaxed);
    }
}

}
