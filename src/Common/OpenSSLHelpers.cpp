#include <Common/OpenSSLHelpers.h>

#include <Common/Exception.h>

#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>


namespace Gluid
{

namespace ErrorCodes
{
    extern const int OPENSSL_ERROR;
}

SHA256Digest encodeSHA256(std::string_view text)
{
    SHA256Digest digest;
    encodeSHA256(text.data(), text.size(), digest.data());
    return digest;
}

void encodeSHA256(const void * text, size_t size, unsigned char * out)
{
    /// A fresh context per call, so concurrent callers never share hashing state.
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx)
        throw Exception(ErrorCodes::OPENSSL_ERROR, "EVP_MD_CTX_new failed: {}", getOpenSSLErrors());

    if (!EVP_DigestInit(ctx.get(), EVP_sha256()))
        throw Exception(ErrorCodes::OPENSSL_ERROR, "EVP_DigestInit failed: {}", getOpenSSLErrors());

    if (!EVP_DigestUpdate(ctx.get(), text, size))
        throw Exception(ErrorCodes::OPENSSL_ERROR, "EVP_DigestUpdate failed: {}", getOpenSSLErrors());

    if (!EVP_DigestFinal(ctx.get(), out, nullptr))
        throw Exception(ErrorCodes::OPENSSL_ERROR, "EVP_DigestFinal failed: {}", getOpenSSLErrors());
}

String getOpenSSLErrors()
{
    String res;
    ERR_print_errors_cb([](const char * str, size_t len, void * ctx)
    {
        String & out = *reinterpret_cast<String*>(ctx);
        if (!out.empty())
            out += ", ";
        out.append(str, len);
        return 1;
    }, &res);
    return res;
}

}
