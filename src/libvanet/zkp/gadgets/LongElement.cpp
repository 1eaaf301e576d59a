#include <libvanet/zkp/gadgets/LongElement.h>
#include <libvanet/zkp/Field.h>

#include <stdexcept>

namespace vanet {
namespace zkp {

namespace {

template <typename FieldT>
FieldT
termValue(const libsnark::protoboard<FieldT>& pb, const libsnark::linear_term<FieldT>& term)
{
    return term.coeff * pb.val(libsnark::pb_variable<FieldT>(term.index));
}

template <typename FieldT>
FieldT
limbValue(const libsnark::protoboard<FieldT>& pb, const libsnark::pb_linear_combination<FieldT>& limb)
{
    if (limb.is_variable)
        return pb.val(libsnark::pb_variable<FieldT>(limb.index));

    FieldT sum = FieldT::zero();
    for (const auto& term : limb.terms)
        sum += termValue(pb, term);
    return sum;
}

}  // namespace

template <typename FieldT>
LongElement<FieldT>::LongElement(libsnark::pb_linear_combination_array<FieldT> limbs)
    : limbs_(std::move(limbs))
{
}

template <typename FieldT>
LongElement<FieldT>::LongElement(const libsnark::pb_variable_array<FieldT>& limbs)
    : limbs_(limbs)
{
}

template <typename FieldT>
std::size_t
LongElement<FieldT>::numLimbsFor(std::size_t bitwidth)
{
    return (bitwidth + CHUNK_BITWIDTH - 1) / CHUNK_BITWIDTH;
}

template <typename FieldT>
LongElement<FieldT>
LongElement<FieldT>::allocate(
    libsnark::protoboard<FieldT>& pb,
    std::size_t bitwidth,
    const std::string& annotation_prefix)
{
    libsnark::pb_variable_array<FieldT> limbs;
    limbs.allocate(pb, numLimbsFor(bitwidth), annotation_prefix + "_limbs");
    return LongElement(limbs);
}

template <typename FieldT>
LongElement<FieldT>
LongElement<FieldT>::fromBytes(
    libsnark::protoboard<FieldT>& pb,
    const std::vector<libsnark::linear_combination<FieldT>>& bytes)
{
    constexpr std::size_t bytesPerLimb = CHUNK_BITWIDTH / 8;
    if (bytes.size() % bytesPerLimb != 0)
        throw std::invalid_argument(
            "byte count must be a multiple of " + std::to_string(bytesPerLimb));

    libsnark::pb_linear_combination_array<FieldT> limbs;
    for (std::size_t i = 0; i < bytes.size() / bytesPerLimb; ++i)
    {
        libsnark::linear_combination<FieldT> packed;
        FieldT weight = FieldT::one();
        for (std::size_t j = 0; j < bytesPerLimb; ++j)
        {
            packed = packed + bytes[i * bytesPerLimb + j] * weight;
            weight = weight * FieldT(256);
        }

        libsnark::pb_linear_combination<FieldT> limb;
        limb.assign(pb, packed);
        limbs.emplace_back(limb);
    }
    return LongElement(std::move(limbs));
}

template <typename FieldT>
libsnark::linear_combination<FieldT>
LongElement<FieldT>::evaluateAt(const FieldT& x) const
{
    libsnark::linear_combination<FieldT> result;
    FieldT power = FieldT::one();
    for (std::size_t i = 0; i < limbs_.size(); ++i)
    {
        result = result + limbs_[i] * power;
        power = power * x;
    }
    return result;
}

template <typename FieldT>
FieldT
LongElement<FieldT>::valueAt(const libsnark::protoboard<FieldT>& pb, const FieldT& x) const
{
    // Horner, from the most significant limb down
    FieldT result = FieldT::zero();
    for (std::size_t i = limbs_.size(); i-- > 0;)
        result = result * x + limbValue(pb, limbs_[i]);
    return result;
}

template <typename FieldT>
void
LongElement<FieldT>::evaluate(libsnark::protoboard<FieldT>& pb) const
{
    limbs_.evaluate(pb);
}

template <typename FieldT>
std::vector<std::uint64_t>
LongElement<FieldT>::limbValues(libsnark::protoboard<FieldT>& pb) const
{
    std::vector<std::uint64_t> values;
    values.reserve(limbs_.size());
    for (const auto& limb : limbs_)
        values.push_back(limbValue(pb, limb).as_ulong());
    return values;
}

template <typename FieldT>
BignumPtr
LongElement<FieldT>::value(libsnark::protoboard<FieldT>& pb) const
{
    return bignumFromLimbs(limbValues(pb), CHUNK_BITWIDTH);
}

template <typename FieldT>
void
LongElement<FieldT>::assign(libsnark::protoboard<FieldT>& pb, const BIGNUM* value) const
{
    auto const limbs = bignumToLimbs(value, limbs_.size(), CHUNK_BITWIDTH);
    for (std::size_t i = 0; i < limbs_.size(); ++i)
    {
        if (!limbs_[i].is_variable)
            throw std::logic_error("cannot assign a packed long element limb");
        pb.val(libsnark::pb_variable<FieldT>(limbs_[i].index)) =
            FieldT(static_cast<long>(limbs[i]), true);
    }
}

template class LongElement<FieldT>;

}  // namespace zkp
}  // namespace vanet
