#include <libvanet/zkp/gadgets/BitwidthRestrictionGadget.h>
#include <libvanet/zkp/Field.h>

#include <stdexcept>

namespace vanet {
namespace zkp {

template <typename FieldT>
BitwidthRestrictionGadget<FieldT>::BitwidthRestrictionGadget(
    libsnark::protoboard<FieldT>& pb,
    const libsnark::pb_linear_combination_array<FieldT>& elements,
    std::size_t bitwidth,
    const std::string& annotation_prefix)
    : libsnark::gadget<FieldT>(pb, annotation_prefix)
    , elements_(elements)
    , bitwidth_(bitwidth)
{
    if (bitwidth_ == 0 || bitwidth_ >= FieldT::capacity())
        throw std::invalid_argument(
            "cannot restrict to " + std::to_string(bitwidth_) + " bits");

    bits_.resize(elements_.size());
    packers_.reserve(elements_.size());
    for (std::size_t i = 0; i < elements_.size(); ++i)
    {
        bits_[i].allocate(
            pb, bitwidth_, annotation_prefix + "_bits_" + std::to_string(i));
        packers_.push_back(std::make_unique<libsnark::packing_gadget<FieldT>>(
            pb,
            bits_[i],
            elements_[i],
            annotation_prefix + "_packer_" + std::to_string(i)));
    }
}

template <typename FieldT>
BitwidthRestrictionGadget<FieldT>::BitwidthRestrictionGadget(
    libsnark::protoboard<FieldT>& pb,
    const LongElement<FieldT>& element,
    const std::string& annotation_prefix)
    : BitwidthRestrictionGadget(
          pb,
          element.limbs(),
          LongElement<FieldT>::CHUNK_BITWIDTH,
          annotation_prefix)
{
}

template <typename FieldT>
void
BitwidthRestrictionGadget<FieldT>::generate_r1cs_constraints()
{
    for (auto& packer : packers_)
        packer->generate_r1cs_constraints(true);
}

template <typename FieldT>
void
BitwidthRestrictionGadget<FieldT>::generate_r1cs_witness()
{
    elements_.evaluate(this->pb);
    for (std::size_t i = 0; i < elements_.size(); ++i)
    {
        // Oversized values are truncated here and rejected by the packing
        // constraint instead of tripping an assertion.
        bits_[i].fill_with_bits_of_field_element(
            this->pb, this->pb.lc_val(elements_[i]));
    }
}

template <typename FieldT>
libsnark::pb_variable_array<FieldT>
BitwidthRestrictionGadget<FieldT>::littleEndianBits() const
{
    libsnark::pb_variable_array<FieldT> result;
    result.reserve(bits_.size() * bitwidth_);
    for (const auto& bits : bits_)
        result.insert(result.end(), bits.begin(), bits.end());
    return result;
}

template <typename FieldT>
libsnark::pb_variable_array<FieldT>
BitwidthRestrictionGadget<FieldT>::bigEndianBits() const
{
    libsnark::pb_variable_array<FieldT> result;
    result.reserve(bits_.size() * bitwidth_);
    for (const auto& bits : bits_)
        result.insert(result.end(), bits.rbegin(), bits.rend());
    return result;
}

template class BitwidthRestrictionGadget<FieldT>;

}  // namespace zkp
}  // namespace vanet
