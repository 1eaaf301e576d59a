#ifndef VANET_ZKP_GADGETS_BITWIDTH_RESTRICTION_GADGET_H
#define VANET_ZKP_GADGETS_BITWIDTH_RESTRICTION_GADGET_H

#include <libvanet/zkp/gadgets/LongElement.h>

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>

#include <memory>
#include <vector>

namespace vanet {
namespace zkp {

/**
 * Restricts every element of an array to `bitwidth` bits by decomposing it
 * into boolean wires. The decomposition stays available to later gadgets
 * so the same value is never split twice.
 */
template <typename FieldT>
class BitwidthRestrictionGadget : public libsnark::gadget<FieldT>
{
public:
    BitwidthRestrictionGadget(
        libsnark::protoboard<FieldT>& pb,
        const libsnark::pb_linear_combination_array<FieldT>& elements,
        std::size_t bitwidth,
        const std::string& annotation_prefix);

    /** restrictBitwidth() for every limb of a long element. */
    BitwidthRestrictionGadget(
        libsnark::protoboard<FieldT>& pb,
        const LongElement<FieldT>& element,
        const std::string& annotation_prefix);

    void
    generate_r1cs_constraints();

    /** Elements must already carry their values. */
    void
    generate_r1cs_witness();

    std::size_t
    size() const
    {
        return elements_.size();
    }

    std::size_t
    bitwidth() const
    {
        return bitwidth_;
    }

    /** Bits of element i, least significant first. */
    const libsnark::pb_variable_array<FieldT>&
    bits(std::size_t i) const
    {
        return bits_[i];
    }

    /** All bits, element 0 first, least significant bit first. */
    libsnark::pb_variable_array<FieldT>
    littleEndianBits() const;

    /** All bits, element 0 first, most significant bit first. */
    libsnark::pb_variable_array<FieldT>
    bigEndianBits() const;

private:
    libsnark::pb_linear_combination_array<FieldT> elements_;
    std::size_t bitwidth_;
    std::vector<libsnark::pb_variable_array<FieldT>> bits_;
    std::vector<std::unique_ptr<libsnark::packing_gadget<FieldT>>> packers_;
};

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_GADGETS_BITWIDTH_RESTRICTION_GADGET_H
