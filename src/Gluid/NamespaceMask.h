#pragma once

#include <optional>
#include <string_view>

#include <Gluid/GluidLayout.h>


namespace Gluid
{

/// A namespace given to the codec. std::nullopt ("no namespace") and an empty string are different namespaces.
using NamespaceName = std::optional<std::string_view>;

/** XOR key that binds an identifier to a namespace.
  *
  * The key is taken from the SHA-256 digest of the namespace: `entropy` leading digest bytes
  * are placed at the tail of a 15-byte window, and the window is spread over 16 bytes so that
  * the nibbles holding the version and variant markers are always zero. Masking therefore
  * never changes whether an identifier is a Gluid.
  *
  * An entropy below the maximum leaves the leading layout bytes unmasked. With entropy 11 or
  * less the lower lane stays readable, so identifiers of one namespace sort by that value.
  *
  * Immutable after construction, can be shared between threads.
  */
class NamespaceMask
{
public:
    using Bytes = GluidLayout::Bytes;

    /// All zero: the identity mask used when no namespace is given.
    NamespaceMask() = default;

    /// Throws BAD_ARGUMENTS if entropy is not in [1, GluidLayout::MaxEntropy].
    explicit NamespaceMask(std::string_view namespace_name, size_t entropy = GluidLayout::MaxEntropy);

    static NamespaceMask create(NamespaceName namespace_name, size_t entropy = GluidLayout::MaxEntropy);

    /// XORs the mask over all 16 bytes. Applying it twice restores the input.
    void apply(Bytes & bytes) const;

    const Bytes & getBytes() const { return bytes; }

private:
    Bytes bytes{};
};

}
