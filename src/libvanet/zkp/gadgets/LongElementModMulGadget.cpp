#include <libvanet/zkp/gadgets/LongElementModMulGadget.h>
#include <libvanet/zkp/Field.h>

#include <algorithm>
#include <stdexcept>

namespace vanet {
namespace zkp {

namespace {

std::size_t
ceilLog2(std::size_t n)
{
    std::size_t bits = 0;
    while ((std::size_t(1) << bits) < n)
        ++bits;
    return bits;
}

// Coefficient k of the product of two limb polynomials, as an integer.
BignumPtr
productCoefficient(
    const std::vector<std::uint64_t>& x,
    const std::vector<std::uint64_t>& y,
    std::size_t k,
    BN_CTX* ctx)
{
    BignumPtr sum = bignumFromWord(0);
    BignumPtr xi = makeBignum();
    BignumPtr yj = makeBignum();
    BignumPtr term = makeBignum();
    for (std::size_t i = 0; i < x.size() && i <= k; ++i)
    {
        std::size_t const j = k - i;
        if (j >= y.size())
            continue;
        bnCheck(BN_set_word(xi.get(), x[i]), "BN_set_word");
        bnCheck(BN_set_word(yj.get(), y[j]), "BN_set_word");
        bnCheck(BN_mul(term.get(), xi.get(), yj.get(), ctx), "BN_mul");
        bnCheck(BN_add(sum.get(), sum.get(), term.get()), "BN_add");
    }
    return sum;
}

}  // namespace

template <typename FieldT>
LongElementModMulGadget<FieldT>::LongElementModMulGadget(
    libsnark::protoboard<FieldT>& pb,
    const LongElement<FieldT>& a,
    const LongElement<FieldT>& b,
    const LongElement<FieldT>& modulus,
    bool canonicalResult,
    const std::string& annotation_prefix)
    : libsnark::gadget<FieldT>(pb, annotation_prefix)
    , a_(a)
    , b_(b)
    , modulus_(modulus)
    , canonicalResult_(canonicalResult)
{
    if (a_.size() == 0 || b_.size() == 0 || modulus_.size() == 0)
        throw std::invalid_argument(
            "modular multiplication needs non-empty operands");

    constexpr std::size_t w = LongElement<FieldT>::CHUNK_BITWIDTH;

    // q < 2^(w * (La + Lb)) / 2^(w * (L - 1)) when the top modulus limb is set
    std::size_t const quotientLimbs = a_.size() + b_.size() >= modulus_.size()
        ? a_.size() + b_.size() - modulus_.size() + 1
        : 1;
    numCoefficients_ = std::max(
        a_.size() + b_.size() - 1, quotientLimbs + modulus_.size() - 1);

    // |carry| < 2^(w + log M + 1), where M bounds the terms per coefficient
    std::size_t const maxTerms =
        std::max({a_.size(), b_.size(), modulus_.size()});
    carryBitwidth_ = w + ceilLog2(maxTerms) + 2;

    quotient_ = LongElement<FieldT>::allocate(
        pb, quotientLimbs * w, annotation_prefix + "_quotient");
    remainder_ = LongElement<FieldT>::allocate(
        pb, modulus_.bitwidth(), annotation_prefix + "_remainder");
    carries_.allocate(
        pb, numCoefficients_ - 1, annotation_prefix + "_carries");
    products_.allocate(pb, numCoefficients_, annotation_prefix + "_products");

    quotientRange_ = std::make_unique<BitwidthRestrictionGadget<FieldT>>(
        pb, quotient_, annotation_prefix + "_quotient_range");
    remainderRange_ = std::make_unique<BitwidthRestrictionGadget<FieldT>>(
        pb, remainder_, annotation_prefix + "_remainder_range");
    carryRange_ = std::make_unique<BitwidthRestrictionGadget<FieldT>>(
        pb,
        libsnark::pb_linear_combination_array<FieldT>(carries_),
        carryBitwidth_,
        annotation_prefix + "_carry_range");

    if (canonicalResult_)
    {
        remainderBelowModulus_ =
            std::make_unique<LongElementLessThanGadget<FieldT>>(
                pb, remainder_, modulus_, annotation_prefix + "_canonical");
    }
}

template <typename FieldT>
libsnark::linear_combination<FieldT>
LongElementModMulGadget<FieldT>::carriesAt(const FieldT& x) const
{
    // C(x) = sum (c'_k - offset) x^k
    FieldT const offset = FieldT(2) ^ (carryBitwidth_ - 1);

    libsnark::linear_combination<FieldT> result;
    FieldT power = FieldT::one();
    FieldT powerSum = FieldT::zero();
    for (std::size_t k = 0; k < carries_.size(); ++k)
    {
        result.add_term(carries_[k], power);
        powerSum += power;
        power *= x;
    }
    result.add_term(libsnark::pb_variable<FieldT>(0), -(offset * powerSum));
    return result;
}

template <typename FieldT>
void
LongElementModMulGadget<FieldT>::generate_r1cs_constraints()
{
    quotientRange_->generate_r1cs_constraints();
    remainderRange_->generate_r1cs_constraints();
    carryRange_->generate_r1cs_constraints();

    FieldT const base = FieldT(2) ^ LongElement<FieldT>::CHUNK_BITWIDTH;
    for (std::size_t i = 0; i < numCoefficients_; ++i)
    {
        FieldT const x(static_cast<long>(i));

        this->pb.add_r1cs_constraint(
            libsnark::r1cs_constraint<FieldT>(
                quotient_.evaluateAt(x),
                modulus_.evaluateAt(x),
                products_[i]),
            this->annotation_prefix + "_qn_" + std::to_string(i));

        this->pb.add_r1cs_constraint(
            libsnark::r1cs_constraint<FieldT>(
                a_.evaluateAt(x),
                b_.evaluateAt(x),
                products_[i] + remainder_.evaluateAt(x) +
                    carriesAt(x) * (base - x)),
            this->annotation_prefix + "_identity_" + std::to_string(i));
    }

    if (canonicalResult_)
        remainderBelowModulus_->generate_r1cs_constraints(true);
}

template <typename FieldT>
void
LongElementModMulGadget<FieldT>::generate_r1cs_witness()
{
    constexpr std::size_t w = LongElement<FieldT>::CHUNK_BITWIDTH;

    auto const aLimbs = a_.limbValues(this->pb);
    auto const bLimbs = b_.limbValues(this->pb);
    auto const nLimbs = modulus_.limbValues(this->pb);

    BignumPtr a = bignumFromLimbs(aLimbs, w);
    BignumPtr b = bignumFromLimbs(bLimbs, w);
    BignumPtr n = bignumFromLimbs(nLimbs, w);
    if (BN_is_zero(n.get()))
        throw std::invalid_argument("modulus is zero");

    BnCtxPtr ctx = makeBnCtx();
    BignumPtr product = makeBignum();
    bnCheck(BN_mul(product.get(), a.get(), b.get(), ctx.get()), "BN_mul");
    BignumPtr q = makeBignum();
    BignumPtr r = makeBignum();
    bnCheck(BN_div(q.get(), r.get(), product.get(), n.get(), ctx.get()), "BN_div");

    // A quotient wider than its limbs is truncated; the identity then fails
    quotient_.assign(this->pb, q.get());
    remainder_.assign(this->pb, r.get());
    auto const qLimbs = bignumToLimbs(q.get(), quotient_.size(), w);
    auto const rLimbs = bignumToLimbs(r.get(), remainder_.size(), w);

    BignumPtr offset = bignumFromWord(1);
    bnCheck(
        BN_lshift(offset.get(), offset.get(), static_cast<int>(carryBitwidth_ - 1)),
        "BN_lshift");

    BignumPtr carry = bignumFromWord(0);
    BignumPtr shifted = makeBignum();
    for (std::size_t k = 0; k < carries_.size(); ++k)
    {
        BignumPtr e = productCoefficient(aLimbs, bLimbs, k, ctx.get());
        BignumPtr qn = productCoefficient(qLimbs, nLimbs, k, ctx.get());
        bnCheck(BN_sub(e.get(), e.get(), qn.get()), "BN_sub");
        if (k < rLimbs.size())
        {
            BignumPtr rk = bignumFromWord(rLimbs[k]);
            bnCheck(BN_sub(e.get(), e.get(), rk.get()), "BN_sub");
        }
        bnCheck(BN_add(e.get(), e.get(), carry.get()), "BN_add");
        // exact for a consistent quotient and remainder
        bnCheck(BN_rshift(carry.get(), e.get(), static_cast<int>(w)), "BN_rshift");

        bnCheck(BN_add(shifted.get(), carry.get(), offset.get()), "BN_add");
        this->pb.val(carries_[k]) = bignumToField<FieldT>(shifted.get());
    }

    for (std::size_t i = 0; i < numCoefficients_; ++i)
    {
        FieldT const x(static_cast<long>(i));
        this->pb.val(products_[i]) =
            quotient_.valueAt(this->pb, x) * modulus_.valueAt(this->pb, x);
    }

    quotientRange_->generate_r1cs_witness();
    remainderRange_->generate_r1cs_witness();
    carryRange_->generate_r1cs_witness();

    if (canonicalResult_)
        remainderBelowModulus_->generate_r1cs_witness();
}

template class LongElementModMulGadget<FieldT>;

}  // namespace zkp
}  // namespace vanet
