#ifndef VANET_ZKP_GADGETS_LONG_ELEMENT_MOD_EXP_GADGET_H
#define VANET_ZKP_GADGETS_LONG_ELEMENT_MOD_EXP_GADGET_H

#include <libvanet/zkp/gadgets/LongElementModMulGadget.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace vanet {
namespace zkp {

/**
 * base^exponent mod n for a public exponent, by left-to-right
 * square-and-multiply. Only the last multiplication enforces a canonical
 * result; intermediate remainders just need to be congruent.
 */
template <typename FieldT>
class LongElementModExpGadget : public libsnark::gadget<FieldT>
{
public:
    static constexpr std::uint64_t DEFAULT_EXPONENT = 65537;

    LongElementModExpGadget(
        libsnark::protoboard<FieldT>& pb,
        const LongElement<FieldT>& base,
        const LongElement<FieldT>& modulus,
        std::uint64_t exponent,
        const std::string& annotation_prefix);

    void
    generate_r1cs_constraints();

    void
    generate_r1cs_witness();

    const LongElement<FieldT>&
    result() const
    {
        return steps_.back()->result();
    }

    const BitwidthRestrictionGadget<FieldT>&
    resultBits() const
    {
        return steps_.back()->resultBits();
    }

private:
    std::vector<std::unique_ptr<LongElementModMulGadget<FieldT>>> steps_;
};

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_GADGETS_LONG_ELEMENT_MOD_EXP_GADGET_H
