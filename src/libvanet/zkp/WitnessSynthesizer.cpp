#include <libvanet/zkp/WitnessSynthesizer.h>
#include <libvanet/zkp/Errors.h>

#include <xrpl/basics/Log.h>

#include <stdexcept>

namespace vanet {
namespace zkp {

WitnessSynthesizer::WitnessSynthesizer(
    VanetCircuitConfig config,
    beast::Journal j)
    : config_(std::move(config))
    , j_(j)
{
    config_.validate();
}

std::string
WitnessSynthesizer::defaultMessage(std::size_t length)
{
    std::string const base = kDefaultPlainText;
    std::string message;
    message.reserve(length);
    while (message.size() < length)
        message += base.substr(0, length - message.size());
    return message;
}

void
WitnessSynthesizer::requireCircuitKey(const char* role, const EVP_PKEY* key) const
{
    // The gadgets hard-wire e = 65537 and a full-width k-bit modulus
    auto const modulus = RsaUtil::modulusOf(key);
    auto const bits = static_cast<std::size_t>(BN_num_bits(modulus.get()));
    if (bits != config_.rsaKeyLength)
        throw std::invalid_argument(
            std::string(role) + " modulus has " + std::to_string(bits) +
            " bits, circuit expects " + std::to_string(config_.rsaKeyLength));

    auto const exponent = RsaUtil::publicExponentOf(key);
    if (!BN_is_word(exponent.get(), kPublicExponent))
        throw std::invalid_argument(
            std::string(role) + " key must use public exponent " +
            std::to_string(kPublicExponent));
}

VanetWitness
WitnessSynthesizer::synthesize() const
{
    return synthesize(defaultMessage(config_.plaintextLength));
}

VanetWitness
WitnessSynthesizer::synthesize(const std::string& message) const
{
    JLOG(j_.debug()) << "Generating " << config_.rsaKeyLength
                     << "-bit authority and vehicle key pairs";
    auto authorityKey = RsaUtil::generateKeyPair(config_.rsaKeyLength);
    auto vehicleKey = RsaUtil::generateKeyPair(config_.rsaKeyLength);
    return synthesize(message, std::move(authorityKey), std::move(vehicleKey));
}

VanetWitness
WitnessSynthesizer::synthesize(
    const std::string& message,
    EvpPkeyPtr authorityKey,
    EvpPkeyPtr vehicleKey) const
{
    if (message.size() != config_.plaintextLength)
        throw std::invalid_argument(
            "message has " + std::to_string(message.size()) +
            " bytes, circuit expects " +
            std::to_string(config_.plaintextLength));
    if (!authorityKey || !vehicleKey)
        throw std::invalid_argument("missing key pair");
    requireCircuitKey("authority", authorityKey.get());
    requireCircuitKey("vehicle", vehicleKey.get());

    VanetWitness witness;
    witness.plaintext.assign(message.begin(), message.end());
    witness.raModulus = RsaUtil::modulusOf(authorityKey.get());
    witness.vehicleModulus = RsaUtil::modulusOf(vehicleKey.get());

    // Certificate over the vehicle public key
    auto const hex =
        bignumToHex(witness.vehicleModulus.get(), config_.publicKeyHexLength());
    witness.publicKeyHex.assign(hex.begin(), hex.end());
    auto const signature =
        RsaUtil::signSha256(authorityKey.get(), witness.publicKeyHex);
    witness.signature = bignumFromBytes(signature);
    JLOG(j_.debug()) << "Signed " << witness.publicKeyHex.size()
                     << " public key bytes, signature "
                     << BN_num_bits(witness.signature.get()) << " bits";

    // Encryption, then recover the padding OpenSSL picked
    witness.cipherText =
        RsaUtil::encryptPkcs1(vehicleKey.get(), witness.plaintext);
    witness.randomness = RsaUtil::extractRandomness(
        vehicleKey.get(), witness.cipherText, witness.plaintext);
    if (witness.randomness.size() != config_.randomnessLength())
        throw ConsistencyError(
            "recovered " + std::to_string(witness.randomness.size()) +
            " padding bytes, circuit expects " +
            std::to_string(config_.randomnessLength()));
    JLOG(j_.debug()) << "Recovered " << witness.randomness.size()
                     << " randomness bytes from the cipher text";

    witness.authorityKey = std::move(authorityKey);
    witness.vehicleKey = std::move(vehicleKey);
    return witness;
}

}  // namespace zkp
}  // namespace vanet
