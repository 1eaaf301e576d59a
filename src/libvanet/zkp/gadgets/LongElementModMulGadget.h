#ifndef VANET_ZKP_GADGETS_LONG_ELEMENT_MOD_MUL_GADGET_H
#define VANET_ZKP_GADGETS_LONG_ELEMENT_MOD_MUL_GADGET_H

#include <libvanet/zkp/gadgets/BitwidthRestrictionGadget.h>
#include <libvanet/zkp/gadgets/LongElement.h>
#include <libvanet/zkp/gadgets/LongElementLessThanGadget.h>

#include <libsnark/gadgetlib1/gadget.hpp>

#include <memory>

namespace vanet {
namespace zkp {

/**
 * Modular multiplication over long elements: r = a * b mod n.
 *
 * The prover supplies a quotient q and remainder r and the gadget checks the
 * integer identity a * b = q * n + r. Writing every operand as a polynomial
 * in X with its limbs as coefficients, the identity holds at X = 2^w exactly
 * when
 *
 *   A(X) * B(X) = Q(X) * N(X) + R(X) + (2^w - X) * C(X)
 *
 * for some carry polynomial C. Both sides have degree D - 1, where D is the
 * number of product coefficients, so the identity is checked at the points
 * 0 .. D - 1. Carries are shifted by a fixed offset and range-checked, which
 * keeps all coefficients far below the field characteristic and turns the
 * polynomial identity into the integer one.
 *
 * Limbs of a, b and n must already be below 2^w; q and r are restricted here.
 * With canonicalResult the gadget also enforces r < n.
 */
template <typename FieldT>
class LongElementModMulGadget : public libsnark::gadget<FieldT>
{
public:
    LongElementModMulGadget(
        libsnark::protoboard<FieldT>& pb,
        const LongElement<FieldT>& a,
        const LongElement<FieldT>& b,
        const LongElement<FieldT>& modulus,
        bool canonicalResult,
        const std::string& annotation_prefix);

    void
    generate_r1cs_constraints();

    /** a, b and the modulus must carry their values. */
    void
    generate_r1cs_witness();

    const LongElement<FieldT>&
    result() const
    {
        return remainder_;
    }

    /** Bit decomposition of the result limbs. */
    const BitwidthRestrictionGadget<FieldT>&
    resultBits() const
    {
        return *remainderRange_;
    }

private:
    LongElement<FieldT> a_;
    LongElement<FieldT> b_;
    LongElement<FieldT> modulus_;
    bool canonicalResult_;

    std::size_t numCoefficients_;
    std::size_t carryBitwidth_;

    LongElement<FieldT> quotient_;
    LongElement<FieldT> remainder_;
    libsnark::pb_variable_array<FieldT> carries_;
    libsnark::pb_variable_array<FieldT> products_;

    std::unique_ptr<BitwidthRestrictionGadget<FieldT>> quotientRange_;
    std::unique_ptr<BitwidthRestrictionGadget<FieldT>> remainderRange_;
    std::unique_ptr<BitwidthRestrictionGadget<FieldT>> carryRange_;
    std::unique_ptr<LongElementLessThanGadget<FieldT>> remainderBelowModulus_;

    libsnark::linear_combination<FieldT>
    carriesAt(const FieldT& x) const;
};

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_GADGETS_LONG_ELEMENT_MOD_MUL_GADGET_H
