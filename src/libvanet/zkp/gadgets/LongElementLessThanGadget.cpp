#include <libvanet/zkp/gadgets/LongElementLessThanGadget.h>
#include <libvanet/zkp/Field.h>

#include <stdexcept>

namespace vanet {
namespace zkp {

template <typename FieldT>
LongElementLessThanGadget<FieldT>::LongElementLessThanGadget(
    libsnark::protoboard<FieldT>& pb,
    const LongElement<FieldT>& a,
    const LongElement<FieldT>& b,
    const std::string& annotation_prefix)
    : libsnark::gadget<FieldT>(pb, annotation_prefix)
    , a_(a)
    , b_(b)
{
    if (a_.size() != b_.size() || a_.size() == 0)
        throw std::invalid_argument(
            "long element comparison needs operands of equal, non-zero size");

    std::size_t const limbs = a_.size();
    less_.allocate(pb, limbs, annotation_prefix + "_less");
    lessOrEq_.allocate(pb, limbs, annotation_prefix + "_less_or_eq");
    // acc_0 is less_0 itself
    accumulated_.emplace_back(less_[0]);
    for (std::size_t i = 1; i < limbs; ++i)
    {
        libsnark::pb_variable<FieldT> acc;
        acc.allocate(pb, annotation_prefix + "_acc_" + std::to_string(i));
        accumulated_.emplace_back(acc);
    }

    comparators_.reserve(limbs);
    for (std::size_t i = 0; i < limbs; ++i)
    {
        comparators_.push_back(
            std::make_unique<libsnark::comparison_gadget<FieldT>>(
                pb,
                LongElement<FieldT>::CHUNK_BITWIDTH,
                a_[i],
                b_[i],
                less_[i],
                lessOrEq_[i],
                annotation_prefix + "_cmp_" + std::to_string(i)));
    }
}

template <typename FieldT>
void
LongElementLessThanGadget<FieldT>::generate_r1cs_constraints(bool assertLess)
{
    for (auto& comparator : comparators_)
        comparator->generate_r1cs_constraints();

    for (std::size_t i = 1; i < accumulated_.size(); ++i)
    {
        this->pb.add_r1cs_constraint(
            libsnark::r1cs_constraint<FieldT>(
                lessOrEq_[i] - less_[i],
                accumulated_[i - 1],
                accumulated_[i] - less_[i]),
            this->annotation_prefix + "_fold_" + std::to_string(i));
    }

    if (assertLess)
    {
        this->pb.add_r1cs_constraint(
            libsnark::r1cs_constraint<FieldT>(result(), 1, 1),
            this->annotation_prefix + "_assert_less");
    }
}

template <typename FieldT>
void
LongElementLessThanGadget<FieldT>::generate_r1cs_witness()
{
    for (auto& comparator : comparators_)
        comparator->generate_r1cs_witness();

    for (std::size_t i = 1; i < accumulated_.size(); ++i)
    {
        FieldT const less = this->pb.val(less_[i]);
        FieldT const eq = this->pb.val(lessOrEq_[i]) - less;
        this->pb.val(accumulated_[i]) =
            less + eq * this->pb.val(accumulated_[i - 1]);
    }
}

template class LongElementLessThanGadget<FieldT>;

}  // namespace zkp
}  // namespace vanet
