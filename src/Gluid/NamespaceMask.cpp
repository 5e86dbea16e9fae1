#include <Gluid/NamespaceMask.h>

#include <Common/Exception.h>
#include <Common/OpenSSLHelpers.h>

#include <algorithm>


namespace Gluid
{

namespace ErrorCodes
{
    extern const int BAD_ARGUMENTS;
}

NamespaceMask::NamespaceMask(std::string_view namespace_name, size_t entropy)
{
    if (entropy == 0 || entropy > GluidLayout::MaxEntropy)
        throw Exception(ErrorCodes::BAD_ARGUMENTS,
            "Namespace mask entropy must be between 1 and {}, got {}", GluidLayout::MaxEntropy, entropy);

    const SHA256Digest digest = encodeSHA256(namespace_name);

    std::array<UInt8, GluidLayout::MaxEntropy> window{};
    std::copy_n(digest.begin(), entropy, window.begin() + (GluidLayout::MaxEntropy - entropy));

    std::copy_n(window.begin(), 7, bytes.begin());
    bytes[GluidLayout::VersionByte] = window[7] & 0x0F;
    bytes[GluidLayout::VariantByte] = (window[7] & 0xF0) >> 4;
    std::copy_n(window.begin() + 8, 7, bytes.begin() + 9);
}

NamespaceMask NamespaceMask::create(NamespaceName namespace_name, size_t entropy)
{
    if (!namespace_name)
        return {};
    return NamespaceMask(*namespace_name, entropy);
}

void NamespaceMask::apply(Bytes & data) const
{
    for (size_t i = 0; i < data.size(); ++i)
        data[i] ^= bytes[i];
}

}
