#ifndef VANET_ZKP_CIRCUITS_VANET_CIRCUIT_H
#define VANET_ZKP_CIRCUITS_VANET_CIRCUIT_H

#include <libvanet/zkp/Field.h>

#include <xrpl/beast/utility/Journal.h>

#include <libsnark/gadgetlib1/protoboard.hpp>
#include <libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp>

#include <openssl/bn.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vanet {
namespace zkp {

struct VanetWitness;

/**
 * Construction-time parameters of the statement.
 */
struct VanetCircuitConfig
{
    std::string circuitName = "vanet_rsa2048";
    std::size_t rsaKeyLength = 2048;    // bits
    std::size_t plaintextLength = 111;  // bytes

    // Cipher text bytes are grouped 30 to a public word.
    static constexpr std::size_t CIPHER_TEXT_WORD_BITWIDTH = 8;
    static constexpr std::size_t CIPHER_TEXT_WORDS_PER_PACKED = 30;

    /**
     * Throws ConfigurationError unless the key length is a multiple of the
     * limb width and at least 512 bits, and the plaintext leaves room for
     * PKCS#1 v1.5 padding.
     */
    void
    validate() const;

    std::size_t
    modulusLimbs() const;

    std::size_t
    publicKeyHexLength() const
    {
        return rsaKeyLength / 4;
    }

    std::size_t
    randomnessLength() const;

    std::size_t
    cipherTextLength() const
    {
        return rsaKeyLength / 8;
    }

    std::size_t
    cipherTextWords() const;
};

/**
 * Outcome of evaluating every constraint on the current assignment.
 * An unsatisfied system names the component owning the first failing
 * constraint.
 */
struct CircuitCheck
{
    bool satisfied = true;
    std::string component;
    std::size_t constraintIndex = 0;
};

/**
 * VANET certificate-and-encryption statement.
 *
 * PUBLIC INPUTS, in order:
 *   raModulus limbs, plaintext bytes, signature-valid flag,
 *   packed cipher text words
 *
 * PRIVATE INPUTS:
 *   vehicle public key as hex bytes, certificate signature,
 *   vehicle modulus, encryption randomness
 *
 * The prover shows that the certificate signature verifies under the
 * authority modulus against SHA-256(hex(vehicle modulus)), and that the
 * cipher text is the PKCS#1 v1.5 encryption of the plaintext under the
 * vehicle modulus with the given randomness.
 */
class VanetCircuit
{
public:
    /** Allocates all wires and gadgets. Throws ConfigurationError. */
    explicit VanetCircuit(
        VanetCircuitConfig config,
        beast::Journal j = beast::Journal{beast::Journal::getNullSink()});

    ~VanetCircuit();

    VanetCircuit(const VanetCircuit&) = delete;
    VanetCircuit&
    operator=(const VanetCircuit&) = delete;

    void
    generateConstraints();

    /**
     * Assign the witness and run every gadget's witness generator.
     * Throws std::invalid_argument when a value has the wrong length, and
     * std::logic_error when generateConstraints() has not run yet.
     */
    void
    generateWitness(const VanetWitness& witness);

    CircuitCheck
    check() const;

    bool
    isSatisfied() const;

    // Public outputs of the current assignment
    bool
    isSignatureValid() const;

    std::vector<FieldT>
    getCipherTextWords() const;

    /** Cipher text unpacked from the public words, big-endian. */
    std::vector<std::uint8_t>
    getCipherText() const;

    /** SHA-256 of the public key bytes as computed in the circuit. */
    std::vector<std::uint8_t>
    getPublicKeyDigest() const;

    /**
     * Primary input a verifier builds from public values alone.
     * The cipher text is big-endian, as produced by OpenSSL.
     */
    static libsnark::r1cs_primary_input<FieldT>
    makePrimaryInput(
        const VanetCircuitConfig& config,
        const BIGNUM* raModulus,
        const std::vector<std::uint8_t>& plaintext,
        bool signatureValid,
        const std::vector<std::uint8_t>& cipherText);

    const VanetCircuitConfig&
    getConfig() const;

    std::size_t
    getNumConstraints() const;

    // Circuit system accessors
    libsnark::r1cs_constraint_system<FieldT>
    getConstraintSystem() const;
    libsnark::r1cs_primary_input<FieldT>
    getPrimaryInput() const;
    libsnark::r1cs_auxiliary_input<FieldT>
    getAuxiliaryInput() const;
    std::shared_ptr<libsnark::protoboard<FieldT>>
    getProtoboard() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_CIRCUITS_VANET_CIRCUIT_H
