#ifndef VANET_ZKP_BIGNUM_H
#define VANET_ZKP_BIGNUM_H

#include <libff/algebra/fields/bigint.hpp>
#include <openssl/bn.h>

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace vanet {
namespace zkp {

struct BignumDeleter
{
    void
    operator()(BIGNUM* bn) const
    {
        BN_free(bn);
    }
};

using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

struct BnCtxDeleter
{
    void
    operator()(BN_CTX* ctx) const
    {
        BN_CTX_free(ctx);
    }
};

using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

/** Drain the OpenSSL error queue into one line. */
std::string
opensslErrors();

/** Throws CryptoError naming `operation` when an OpenSSL BN_* call fails. */
void
bnCheck(int ok, const char* operation);

BnCtxPtr
makeBnCtx();

BignumPtr
makeBignum();

BignumPtr
copyBignum(const BIGNUM* bn);

BignumPtr
bignumFromWord(std::uint64_t word);

/** Big-endian unsigned bytes to BIGNUM. */
BignumPtr
bignumFromBytes(const std::vector<std::uint8_t>& bytes);

/** Big-endian bytes, left-padded with zeros to `length`. Throws if wider. */
std::vector<std::uint8_t>
bignumToBytes(const BIGNUM* bn, std::size_t length);

/** Lower-case hex digits, left-padded with '0' to `digits`. Throws if wider. */
std::string
bignumToHex(const BIGNUM* bn, std::size_t digits);

/** Little-endian limbs of `limbBitwidth` bits (at most 64). */
BignumPtr
bignumFromLimbs(const std::vector<std::uint64_t>& limbs, std::size_t limbBitwidth);

/**
 * Split |bn| into `numLimbs` little-endian limbs of `limbBitwidth` bits.
 * Bits above numLimbs * limbBitwidth are dropped.
 */
std::vector<std::uint64_t>
bignumToLimbs(const BIGNUM* bn, std::size_t numLimbs, std::size_t limbBitwidth);

/**
 * Field element from a (possibly negative) integer, reduced modulo the
 * field characteristic.
 */
template <typename FieldT>
FieldT
bignumToField(const BIGNUM* bn)
{
    constexpr std::size_t numBytes = FieldT::num_limbs * sizeof(mp_limb_t);

    BignumPtr modulus = makeBignum();
    {
        std::vector<unsigned char> le(numBytes);
        std::memcpy(le.data(), FieldT::mod.data, numBytes);
        bnCheck(
            BN_lebin2bn(le.data(), static_cast<int>(le.size()), modulus.get()) != nullptr,
            "BN_lebin2bn");
    }

    BnCtxPtr ctx = makeBnCtx();
    BignumPtr reduced = makeBignum();
    // BN_nnmod yields a non-negative residue for negative inputs too
    bnCheck(BN_nnmod(reduced.get(), bn, modulus.get(), ctx.get()), "BN_nnmod");

    std::vector<unsigned char> le(numBytes);
    bnCheck(
        BN_bn2lebinpad(reduced.get(), le.data(), static_cast<int>(le.size())) >= 0,
        "BN_bn2lebinpad");

    libff::bigint<FieldT::num_limbs> value;
    std::memcpy(value.data, le.data(), numBytes);
    return FieldT(value);
}

/** Canonical integer representative of a field element. */
template <typename FieldT>
BignumPtr
fieldToBignum(const FieldT& element)
{
    constexpr std::size_t numBytes = FieldT::num_limbs * sizeof(mp_limb_t);

    auto const value = element.as_bigint();
    std::vector<unsigned char> le(numBytes);
    std::memcpy(le.data(), value.data, numBytes);

    BignumPtr result = makeBignum();
    bnCheck(
        BN_lebin2bn(le.data(), static_cast<int>(le.size()), result.get()) != nullptr,
        "BN_lebin2bn");
    return result;
}

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_BIGNUM_H
