#include <libvanet/zkp/RsaUtil.h>
#include <libvanet/zkp/Errors.h>

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/rsa.h>

#include <algorithm>

namespace vanet {
namespace zkp {

namespace {

struct EvpPkeyCtxDeleter
{
    void
    operator()(EVP_PKEY_CTX* ctx) const
    {
        EVP_PKEY_CTX_free(ctx);
    }
};

struct EvpMdCtxDeleter
{
    void
    operator()(EVP_MD_CTX* ctx) const
    {
        EVP_MD_CTX_free(ctx);
    }
};

using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

void
require(bool ok, const char* operation)
{
    if (!ok)
        throw CryptoError(operation, RsaUtil::lastErrors());
}

EvpPkeyCtxPtr
keyContext(EVP_PKEY* key, const char* operation)
{
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new(key, nullptr));
    require(ctx != nullptr, operation);
    return ctx;
}

// Runs an EVP_PKEY_encrypt/decrypt style call twice: size query, then output.
template <typename Op>
std::vector<std::uint8_t>
runCipher(
    Op op,
    EVP_PKEY_CTX* ctx,
    const std::vector<std::uint8_t>& input,
    const char* operation)
{
    std::size_t length = 0;
    require(op(ctx, nullptr, &length, input.data(), input.size()) > 0, operation);
    std::vector<std::uint8_t> output(length);
    require(
        op(ctx, output.data(), &length, input.data(), input.size()) > 0,
        operation);
    output.resize(length);
    return output;
}

}  // namespace

std::string
RsaUtil::lastErrors()
{
    return opensslErrors();
}

EvpPkeyPtr
RsaUtil::generateKeyPair(std::size_t bits, unsigned long publicExponent)
{
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
    require(ctx != nullptr, "key generation");
    require(EVP_PKEY_keygen_init(ctx.get()) > 0, "key generation");
    require(
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), static_cast<int>(bits)) > 0,
        "key generation");

    BignumPtr e = makeBignum();
    require(BN_set_word(e.get(), publicExponent) == 1, "key generation");
    require(
        EVP_PKEY_CTX_set1_rsa_keygen_pubexp(ctx.get(), e.get()) > 0,
        "key generation");

    EVP_PKEY* raw = nullptr;
    require(EVP_PKEY_generate(ctx.get(), &raw) > 0, "key generation");
    return EvpPkeyPtr(raw);
}

BignumPtr
RsaUtil::modulusOf(const EVP_PKEY* key)
{
    BIGNUM* raw = nullptr;
    require(
        EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_N, &raw) > 0,
        "modulus export");
    return BignumPtr(raw);
}

BignumPtr
RsaUtil::publicExponentOf(const EVP_PKEY* key)
{
    BIGNUM* raw = nullptr;
    require(
        EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_E, &raw) > 0,
        "public exponent export");
    return BignumPtr(raw);
}

std::vector<std::uint8_t>
RsaUtil::signSha256(EVP_PKEY* key, const std::vector<std::uint8_t>& message)
{
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    require(ctx != nullptr, "signing");
    require(
        EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) > 0,
        "signing");

    std::size_t length = 0;
    require(
        EVP_DigestSign(ctx.get(), nullptr, &length, message.data(), message.size()) > 0,
        "signing");
    std::vector<std::uint8_t> signature(length);
    require(
        EVP_DigestSign(
            ctx.get(), signature.data(), &length, message.data(), message.size()) > 0,
        "signing");
    signature.resize(length);
    return signature;
}

bool
RsaUtil::verifySha256(
    EVP_PKEY* key,
    const std::vector<std::uint8_t>& message,
    const std::vector<std::uint8_t>& signature)
{
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    require(ctx != nullptr, "signature verification");
    require(
        EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) > 0,
        "signature verification");

    int const result = EVP_DigestVerify(
        ctx.get(), signature.data(), signature.size(), message.data(), message.size());
    if (result < 0)
        throw CryptoError("signature verification", lastErrors());
    // a mismatch leaves an error on the queue
    ERR_clear_error();
    return result == 1;
}

std::vector<std::uint8_t>
RsaUtil::encryptPkcs1(EVP_PKEY* key, const std::vector<std::uint8_t>& plaintext)
{
    auto ctx = keyContext(key, "encryption");
    require(EVP_PKEY_encrypt_init(ctx.get()) > 0, "encryption");
    require(
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) > 0,
        "encryption");
    return runCipher(EVP_PKEY_encrypt, ctx.get(), plaintext, "encryption");
}

std::vector<std::uint8_t>
RsaUtil::decryptPkcs1(EVP_PKEY* key, const std::vector<std::uint8_t>& cipherText)
{
    auto ctx = keyContext(key, "decryption");
    require(EVP_PKEY_decrypt_init(ctx.get()) > 0, "decryption");
    require(
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) > 0,
        "decryption");
    return runCipher(EVP_PKEY_decrypt, ctx.get(), cipherText, "decryption");
}

std::vector<std::uint8_t>
RsaUtil::decryptRaw(EVP_PKEY* key, const std::vector<std::uint8_t>& cipherText)
{
    auto ctx = keyContext(key, "decryption");
    require(EVP_PKEY_decrypt_init(ctx.get()) > 0, "decryption");
    require(
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_NO_PADDING) > 0,
        "decryption");
    auto block = runCipher(EVP_PKEY_decrypt, ctx.get(), cipherText, "decryption");

    // keep the leading zero bytes of the encoded block
    std::size_t const size = static_cast<std::size_t>(EVP_PKEY_get_size(key));
    if (block.size() < size)
        block.insert(block.begin(), size - block.size(), 0);
    return block;
}

PaddingSplit
RsaUtil::splitEncryptionPadding(const std::vector<std::uint8_t>& encoded)
{
    if (encoded.size() < 11 || encoded[0] != 0x00 || encoded[1] != 0x02)
        throw ConsistencyError("decrypted block does not start with 00 02");

    auto const separator = std::find(encoded.begin() + 2, encoded.end(), 0);
    if (separator == encoded.end())
        throw ConsistencyError("decrypted block has no padding separator");

    PaddingSplit split;
    split.randomness.assign(encoded.begin() + 2, separator);
    split.message.assign(separator + 1, encoded.end());
    if (split.randomness.size() < 8)
        throw ConsistencyError(
            "decrypted block has only " +
            std::to_string(split.randomness.size()) + " padding bytes");
    return split;
}

std::vector<std::uint8_t>
RsaUtil::extractRandomness(
    EVP_PKEY* key,
    const std::vector<std::uint8_t>& cipherText,
    const std::vector<std::uint8_t>& plaintext)
{
    auto split = splitEncryptionPadding(decryptRaw(key, cipherText));
    if (split.message != plaintext)
        throw ConsistencyError(
            "recovered plaintext differs from the encrypted message");
    return std::move(split.randomness);
}

}  // namespace zkp
}  // namespace vanet
