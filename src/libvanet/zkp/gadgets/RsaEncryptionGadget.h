#ifndef VANET_ZKP_GADGETS_RSA_ENCRYPTION_GADGET_H
#define VANET_ZKP_GADGETS_RSA_ENCRYPTION_GADGET_H

#include <libvanet/zkp/gadgets/BitwidthRestrictionGadget.h>
#include <libvanet/zkp/gadgets/LongElementModExpGadget.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace vanet {
namespace zkp {

/**
 * RSAES-PKCS1-v1_5 encryption with e = 65537.
 *
 * The encoded message 00 02 || randomness || 00 || plaintext is assembled
 * from 8-bit restricted bytes and raised to e modulo n. The ciphertext is
 * exposed as bytes, least significant byte first.
 *
 * The randomness is a witness, so callers that do not trust its source
 * must call checkRandomnessCompliance() to rule out zero bytes.
 */
template <typename FieldT>
class RsaEncryptionGadget : public libsnark::gadget<FieldT>
{
public:
    RsaEncryptionGadget(
        libsnark::protoboard<FieldT>& pb,
        const LongElement<FieldT>& modulus,
        const libsnark::pb_linear_combination_array<FieldT>& plaintext,
        const libsnark::pb_linear_combination_array<FieldT>& randomness,
        std::size_t rsaKeyBitLength,
        const std::string& annotation_prefix);

    /**
     * Number of padding bytes for a k-bit key and an m-byte message.
     * Throws std::invalid_argument when fewer than 8 would remain.
     */
    static std::size_t
    getExpectedRandomnessLength(std::size_t rsaKeyBitLength, std::size_t plaintextLength);

    void
    generate_r1cs_constraints();

    /** Adds r_i * inv_i = 1 for every randomness byte. */
    void
    checkRandomnessCompliance();

    /** Modulus, plaintext and randomness must carry their values. */
    void
    generate_r1cs_witness();

    const libsnark::pb_linear_combination_array<FieldT>&
    getOutputWires() const
    {
        return cipherText_;
    }

    /** Ciphertext from the current assignment, big-endian. */
    std::vector<std::uint8_t>
    cipherTextBytes() const;

private:
    libsnark::pb_linear_combination_array<FieldT> randomness_;
    std::unique_ptr<BitwidthRestrictionGadget<FieldT>> plaintextRange_;
    std::unique_ptr<BitwidthRestrictionGadget<FieldT>> randomnessRange_;

    LongElement<FieldT> encoded_;
    std::unique_ptr<LongElementModExpGadget<FieldT>> modExp_;
    libsnark::pb_linear_combination_array<FieldT> cipherText_;

    bool complianceChecked_ = false;
    libsnark::pb_variable_array<FieldT> randomnessInverse_;
};

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_GADGETS_RSA_ENCRYPTION_GADGET_H
