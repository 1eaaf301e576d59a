#ifndef VANET_ZKP_GADGETS_RSA_SIG_VERIFICATION_GADGET_H
#define VANET_ZKP_GADGETS_RSA_SIG_VERIFICATION_GADGET_H

#include <libvanet/zkp/gadgets/LongElementModExpGadget.h>

#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>

#include <array>
#include <memory>

namespace vanet {
namespace zkp {

/**
 * RSASSA-PKCS1-v1_5 verification with SHA-256 and e = 65537.
 *
 * Computes s^e mod n and compares it limb by limb with the encoded message
 *
 *   00 01 FF .. FF 00 || DigestInfo(SHA-256) || digest
 *
 * The output wire is 1 when every limb matches and 0 otherwise; a wrong
 * signature does not make the circuit unsatisfiable.
 *
 * The digest is given as 8 words of 32 bits, most significant first, as
 * produced by Sha256Gadget. Limbs of n and s must already be restricted.
 */
template <typename FieldT>
class RsaSigVerificationGadget : public libsnark::gadget<FieldT>
{
public:
    static constexpr std::array<std::uint8_t, 19> SHA256_DIGEST_INFO = {
        0x30, 0x31, 0x30, 0x0d, 0x06, 0x09, 0x60, 0x86, 0x48, 0x01,
        0x65, 0x03, 0x04, 0x02, 0x01, 0x05, 0x00, 0x04, 0x20};

    RsaSigVerificationGadget(
        libsnark::protoboard<FieldT>& pb,
        const LongElement<FieldT>& modulus,
        const libsnark::pb_linear_combination_array<FieldT>& digest,
        const LongElement<FieldT>& signature,
        std::size_t rsaKeyBitLength,
        const std::string& annotation_prefix);

    void
    generate_r1cs_constraints();

    /** Modulus, digest and signature must carry their values. */
    void
    generate_r1cs_witness();

    const libsnark::pb_variable<FieldT>&
    getOutputWire() const
    {
        return valid_;
    }

    /** s^e mod n, for diagnostics. */
    const LongElement<FieldT>&
    recoveredMessage() const
    {
        return modExp_->result();
    }

private:
    libsnark::pb_linear_combination_array<FieldT> expected_;
    libsnark::pb_variable_array<FieldT> limbEqual_;
    libsnark::pb_variable_array<FieldT> limbInverse_;
    libsnark::pb_variable<FieldT> valid_;

    std::unique_ptr<LongElementModExpGadget<FieldT>> modExp_;
    std::unique_ptr<libsnark::conjunction_gadget<FieldT>> allEqual_;

    libsnark::linear_combination<FieldT>
    difference(std::size_t limb) const;
};

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_GADGETS_RSA_SIG_VERIFICATION_GADGET_H
