#include <libvanet/zkp/BigNum.h>
#include <libvanet/zkp/Errors.h>

#include <openssl/crypto.h>
#include <openssl/err.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace vanet {
namespace zkp {

std::string
opensslErrors()
{
    std::string result;
    unsigned long code;
    while ((code = ERR_get_error()) != 0)
    {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        if (!result.empty())
            result += "; ";
        result += buffer;
    }
    return result.empty() ? "unknown OpenSSL error" : result;
}

void
bnCheck(int ok, const char* operation)
{
    if (!ok)
        throw CryptoError(operation, opensslErrors());
}

BnCtxPtr
makeBnCtx()
{
    BnCtxPtr ctx(BN_CTX_new());
    bnCheck(ctx != nullptr, "BN_CTX_new");
    return ctx;
}

BignumPtr
makeBignum()
{
    BignumPtr bn(BN_new());
    bnCheck(bn != nullptr, "BN_new");
    return bn;
}

BignumPtr
copyBignum(const BIGNUM* bn)
{
    BignumPtr copy(BN_dup(bn));
    bnCheck(copy != nullptr, "BN_dup");
    return copy;
}

BignumPtr
bignumFromWord(std::uint64_t word)
{
    BignumPtr bn = makeBignum();
    bnCheck(BN_set_word(bn.get(), word), "BN_set_word");
    return bn;
}

BignumPtr
bignumFromBytes(const std::vector<std::uint8_t>& bytes)
{
    BignumPtr bn = makeBignum();
    bnCheck(
        BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), bn.get()) != nullptr,
        "BN_bin2bn");
    return bn;
}

std::vector<std::uint8_t>
bignumToBytes(const BIGNUM* bn, std::size_t length)
{
    if (static_cast<std::size_t>(BN_num_bytes(bn)) > length)
        throw std::invalid_argument(
            "integer does not fit in " + std::to_string(length) + " bytes");

    std::vector<std::uint8_t> bytes(length);
    bnCheck(
        BN_bn2binpad(bn, bytes.data(), static_cast<int>(length)) >= 0,
        "BN_bn2binpad");
    return bytes;
}

std::string
bignumToHex(const BIGNUM* bn, std::size_t digits)
{
    std::string hex;
    if (!BN_is_zero(bn))
    {
        char* raw = BN_bn2hex(bn);
        bnCheck(raw != nullptr, "BN_bn2hex");
        hex = raw;
        OPENSSL_free(raw);
    }

    // BN_bn2hex emits whole bytes, so a leading nibble may be zero
    auto const firstDigit = hex.find_first_not_of('0');
    hex = firstDigit == std::string::npos ? std::string{} : hex.substr(firstDigit);

    if (hex.size() > digits)
        throw std::invalid_argument(
            "integer does not fit in " + std::to_string(digits) +
            " hex digits");

    std::transform(hex.begin(), hex.end(), hex.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return std::string(digits - hex.size(), '0') + hex;
}

BignumPtr
bignumFromLimbs(const std::vector<std::uint64_t>& limbs, std::size_t limbBitwidth)
{
    BignumPtr result = makeBignum();
    BignumPtr limb = makeBignum();
    for (std::size_t i = limbs.size(); i-- > 0;)
    {
        bnCheck(
            BN_lshift(result.get(), result.get(), static_cast<int>(limbBitwidth)),
            "BN_lshift");
        bnCheck(BN_set_word(limb.get(), limbs[i]), "BN_set_word");
        bnCheck(BN_add(result.get(), result.get(), limb.get()), "BN_add");
    }
    return result;
}

std::vector<std::uint64_t>
bignumToLimbs(const BIGNUM* bn, std::size_t numLimbs, std::size_t limbBitwidth)
{
    if (limbBitwidth == 0 || limbBitwidth > 64)
        throw std::invalid_argument("limb bitwidth must be in [1, 64]");

    std::vector<std::uint64_t> limbs(numLimbs, 0);
    for (std::size_t i = 0; i < numLimbs; ++i)
    {
        for (std::size_t j = 0; j < limbBitwidth; ++j)
        {
            if (BN_is_bit_set(bn, static_cast<int>(i * limbBitwidth + j)))
                limbs[i] |= std::uint64_t(1) << j;
        }
    }
    return limbs;
}

}  // namespace zkp
}  // namespace vanet
