#ifndef VANET_ZKP_RSA_UTIL_H
#define VANET_ZKP_RSA_UTIL_H

#include <libvanet/zkp/BigNum.h>

#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vanet {
namespace zkp {

struct EvpPkeyDeleter
{
    void
    operator()(EVP_PKEY* key) const
    {
        EVP_PKEY_free(key);
    }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

/**
 * @brief Result of splitting a raw PKCS#1 v1.5 encryption block
 */
struct PaddingSplit {
    std::vector<std::uint8_t> randomness;   // bytes between 00 02 and the 00 separator
    std::vector<std::uint8_t> message;      // bytes after the separator
};

/**
 * @brief Host-side RSA operations used to build witnesses
 *
 * Every OpenSSL failure is reported as CryptoError naming the operation.
 */
class RsaUtil {
public:
    /**
     * @brief Generate an RSA key pair
     *
     * @param bits Modulus length in bits
     * @param publicExponent e, 65537 unless a test needs another
     */
    static EvpPkeyPtr generateKeyPair(
        std::size_t bits,
        unsigned long publicExponent = 65537);

    /**
     * @brief Public modulus n of an RSA key
     */
    static BignumPtr modulusOf(const EVP_PKEY* key);

    /**
     * @brief Public exponent e of an RSA key
     */
    static BignumPtr publicExponentOf(const EVP_PKEY* key);

    /**
     * @brief SHA256withRSA (RSASSA-PKCS1-v1_5) signature
     *
     * @return Signature bytes, big-endian, as long as the modulus
     */
    static std::vector<std::uint8_t> signSha256(
        EVP_PKEY* key,
        const std::vector<std::uint8_t>& message);

    static bool verifySha256(
        EVP_PKEY* key,
        const std::vector<std::uint8_t>& message,
        const std::vector<std::uint8_t>& signature);

    /**
     * @brief RSAES-PKCS1-v1_5 encryption with fresh random padding
     */
    static std::vector<std::uint8_t> encryptPkcs1(
        EVP_PKEY* key,
        const std::vector<std::uint8_t>& plaintext);

    static std::vector<std::uint8_t> decryptPkcs1(
        EVP_PKEY* key,
        const std::vector<std::uint8_t>& cipherText);

    /**
     * @brief Textbook RSA decryption, padding left in place
     *
     * @return The full encoded block, one byte per modulus byte
     */
    static std::vector<std::uint8_t> decryptRaw(
        EVP_PKEY* key,
        const std::vector<std::uint8_t>& cipherText);

    /**
     * @brief Split 00 02 || randomness || 00 || message
     *
     * Throws ConsistencyError when the block is not laid out that way.
     */
    static PaddingSplit splitEncryptionPadding(
        const std::vector<std::uint8_t>& encoded);

    /**
     * @brief Recover the padding bytes OpenSSL chose for a ciphertext
     *
     * Decrypts without padding removal and splits the block. The recovered
     * message must equal `plaintext`, otherwise ConsistencyError.
     */
    static std::vector<std::uint8_t> extractRandomness(
        EVP_PKEY* key,
        const std::vector<std::uint8_t>& cipherText,
        const std::vector<std::uint8_t>& plaintext);

    /**
     * @brief Drain the OpenSSL error queue into one line
     */
    static std::string lastErrors();
};

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_RSA_UTIL_H
