#ifndef VANET_ZKP_GADGETS_LONG_ELEMENT_H
#define VANET_ZKP_GADGETS_LONG_ELEMENT_H

#include <libvanet/zkp/BigNum.h>

#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace vanet {
namespace zkp {

/**
 * Integer wider than one field element, held as little-endian limbs of
 * CHUNK_BITWIDTH bits. Limbs are linear combinations so byte-packed values
 * and allocated witnesses share one representation.
 *
 * A LongElement does not constrain its limbs by itself; range checks are
 * added with BitwidthRestrictionGadget (restrictBitwidth) and comparisons
 * with LongElementLessThanGadget (assertLessThan).
 */
template <typename FieldT>
class LongElement
{
public:
    static constexpr std::size_t CHUNK_BITWIDTH = 64;

    LongElement() = default;

    explicit LongElement(libsnark::pb_linear_combination_array<FieldT> limbs);

    explicit LongElement(const libsnark::pb_variable_array<FieldT>& limbs);

    /** Number of limbs needed for `bitwidth` bits. */
    static std::size_t
    numLimbsFor(std::size_t bitwidth);

    /** Allocate fresh limb variables; primary inputs when allocated first. */
    static LongElement
    allocate(
        libsnark::protoboard<FieldT>& pb,
        std::size_t bitwidth,
        const std::string& annotation_prefix);

    /**
     * Pack little-endian byte linear combinations (each assumed < 2^8) into
     * limbs. The byte count must be a multiple of CHUNK_BITWIDTH / 8.
     */
    static LongElement
    fromBytes(
        libsnark::protoboard<FieldT>& pb,
        const std::vector<libsnark::linear_combination<FieldT>>& bytes);

    std::size_t
    size() const
    {
        return limbs_.size();
    }

    std::size_t
    bitwidth() const
    {
        return limbs_.size() * CHUNK_BITWIDTH;
    }

    const libsnark::pb_linear_combination<FieldT>&
    operator[](std::size_t i) const
    {
        return limbs_[i];
    }

    const libsnark::pb_linear_combination_array<FieldT>&
    limbs() const
    {
        return limbs_;
    }

    /** Treat the limbs as polynomial coefficients and evaluate at x. */
    libsnark::linear_combination<FieldT>
    evaluateAt(const FieldT& x) const;

    /** Same evaluation on the current assignment. */
    FieldT
    valueAt(const libsnark::protoboard<FieldT>& pb, const FieldT& x) const;

    void
    evaluate(libsnark::protoboard<FieldT>& pb) const;

    std::vector<std::uint64_t>
    limbValues(libsnark::protoboard<FieldT>& pb) const;

    BignumPtr
    value(libsnark::protoboard<FieldT>& pb) const;

    /** Assign `value` to the limb variables. Throws if a limb is not a variable. */
    void
    assign(libsnark::protoboard<FieldT>& pb, const BIGNUM* value) const;

private:
    libsnark::pb_linear_combination_array<FieldT> limbs_;
};

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_GADGETS_LONG_ELEMENT_H
