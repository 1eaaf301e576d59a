#ifndef VANET_ZKP_GADGETS_LONG_ELEMENT_LESS_THAN_GADGET_H
#define VANET_ZKP_GADGETS_LONG_ELEMENT_LESS_THAN_GADGET_H

#include <libvanet/zkp/gadgets/LongElement.h>

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>

#include <memory>
#include <vector>

namespace vanet {
namespace zkp {

/**
 * Lexicographic comparison of two long elements with the same limb count.
 *
 * Every limb of both operands must already be below 2^CHUNK_BITWIDTH.
 * The limbs are compared with libsnark's comparison_gadget and folded from
 * the least significant limb upwards:
 *
 *   acc_0 = less_0
 *   acc_i = less_i + (lessOrEq_i - less_i) * acc_{i-1}
 *
 * so acc_{L-1} is 1 exactly when a < b.
 */
template <typename FieldT>
class LongElementLessThanGadget : public libsnark::gadget<FieldT>
{
public:
    LongElementLessThanGadget(
        libsnark::protoboard<FieldT>& pb,
        const LongElement<FieldT>& a,
        const LongElement<FieldT>& b,
        const std::string& annotation_prefix);

    /** With assertLess the comparison result is forced to 1. */
    void
    generate_r1cs_constraints(bool assertLess);

    void
    generate_r1cs_witness();

    const libsnark::pb_variable<FieldT>&
    result() const
    {
        return accumulated_[accumulated_.size() - 1];
    }

private:
    LongElement<FieldT> a_;
    LongElement<FieldT> b_;

    libsnark::pb_variable_array<FieldT> less_;
    libsnark::pb_variable_array<FieldT> lessOrEq_;
    libsnark::pb_variable_array<FieldT> accumulated_;
    std::vector<std::unique_ptr<libsnark::comparison_gadget<FieldT>>> comparators_;
};

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_GADGETS_LONG_ELEMENT_LESS_THAN_GADGET_H
