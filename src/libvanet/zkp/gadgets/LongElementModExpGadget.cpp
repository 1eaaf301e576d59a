#include <libvanet/zkp/gadgets/LongElementModExpGadget.h>
#include <libvanet/zkp/Field.h>

#include <algorithm>
#include <stdexcept>

namespace vanet {
namespace zkp {

template <typename FieldT>
LongElementModExpGadget<FieldT>::LongElementModExpGadget(
    libsnark::protoboard<FieldT>& pb,
    const LongElement<FieldT>& base,
    const LongElement<FieldT>& modulus,
    std::uint64_t exponent,
    const std::string& annotation_prefix)
    : libsnark::gadget<FieldT>(pb, annotation_prefix)
{
    if (exponent < 2)
        throw std::invalid_argument("exponent must be at least 2");

    int topBit = 63;
    while (!((exponent >> topBit) & 1))
        --topBit;

    // one squaring per bit below the top, one multiplication per set bit
    std::vector<bool> multiplyAfter;
    for (int bit = topBit - 1; bit >= 0; --bit)
        multiplyAfter.push_back((exponent >> bit) & 1);
    std::size_t const total = multiplyAfter.size() +
        std::count(multiplyAfter.begin(), multiplyAfter.end(), true);

    LongElement<FieldT> current = base;
    auto step = [&](const LongElement<FieldT>& x, const LongElement<FieldT>& y) {
        bool const last = steps_.size() + 1 == total;
        steps_.push_back(std::make_unique<LongElementModMulGadget<FieldT>>(
            pb,
            x,
            y,
            modulus,
            last,
            annotation_prefix + "_step_" + std::to_string(steps_.size())));
        current = steps_.back()->result();
    };

    for (bool multiply : multiplyAfter)
    {
        step(current, current);
        if (multiply)
            step(current, base);
    }
}

template <typename FieldT>
void
LongElementModExpGadget<FieldT>::generate_r1cs_constraints()
{
    for (auto& step : steps_)
        step->generate_r1cs_constraints();
}

template <typename FieldT>
void
LongElementModExpGadget<FieldT>::generate_r1cs_witness()
{
    for (auto& step : steps_)
        step->generate_r1cs_witness();
}

template class LongElementModExpGadget<FieldT>;

}  // namespace zkp
}  // namespace vanet
