#ifndef VANET_ZKP_WITNESS_SYNTHESIZER_H
#define VANET_ZKP_WITNESS_SYNTHESIZER_H

#include <libvanet/zkp/BigNum.h>
#include <libvanet/zkp/RsaUtil.h>
#include <libvanet/zkp/circuits/VanetCircuit.h>

#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <string>
#include <vector>

namespace vanet {
namespace zkp {

/**
 * One consistent set of values for every input of VanetCircuit, together
 * with the key material that produced it.
 */
struct VanetWitness
{
    std::vector<std::uint8_t> plaintext;
    std::vector<std::uint8_t> publicKeyHex;  // ASCII hex of vehicleModulus
    BignumPtr raModulus;
    BignumPtr signature;
    BignumPtr vehicleModulus;
    std::vector<std::uint8_t> randomness;

    EvpPkeyPtr authorityKey;
    EvpPkeyPtr vehicleKey;
    std::vector<std::uint8_t> cipherText;  // as returned by OpenSSL
};

/**
 * Derives a witness from real RSA operations:
 *
 *   1. authority and vehicle key pairs
 *   2. certificate = SHA256withRSA_authority(hex(vehicle modulus))
 *   3. cipher text = RSAES-PKCS1-v1_5_vehicle(plaintext)
 *   4. the padding randomness, recovered by decrypting without padding
 *      removal
 *
 * Key generation and encryption are randomized, so each call produces a
 * different witness. OpenSSL failures throw CryptoError; a decrypted block
 * that does not match the plaintext throws ConsistencyError.
 */
class WitnessSynthesizer
{
public:
    // Pseudonymous address followed by an NMEA position sentence
    static constexpr char const* kDefaultPlainText =
        "0xd91c747b4a76B8013Aa336Cbc52FD95a7a9BD3D9$GPRMC,092927.000,A,"
        "2235.9058,N,11400.0518,E,0.000,74.11,151216,,D*49";

    /** Throws ConfigurationError for an invalid configuration. */
    explicit WitnessSynthesizer(
        VanetCircuitConfig config,
        beast::Journal j = beast::Journal{beast::Journal::getNullSink()});

    /** Witness for the default message cut or repeated to plaintextLength. */
    VanetWitness
    synthesize() const;

    /** The message must be exactly plaintextLength bytes. */
    VanetWitness
    synthesize(const std::string& message) const;

    /**
     * Same, with caller-supplied key pairs. Both keys must have a
     * rsaKeyLength-bit modulus and public exponent 65537, otherwise
     * std::invalid_argument is thrown before anything is signed.
     */
    VanetWitness
    synthesize(
        const std::string& message,
        EvpPkeyPtr authorityKey,
        EvpPkeyPtr vehicleKey) const;

    /** kDefaultPlainText fitted to `length` bytes. */
    static std::string
    defaultMessage(std::size_t length);

private:
    static constexpr unsigned long kPublicExponent = 65537;

    VanetCircuitConfig config_;
    beast::Journal j_;

    void
    requireCircuitKey(const char* role, const EVP_PKEY* key) const;
};

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_WITNESS_SYNTHESIZER_H
