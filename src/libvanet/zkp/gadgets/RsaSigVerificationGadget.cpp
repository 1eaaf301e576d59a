#include <libvanet/zkp/gadgets/RsaSigVerificationGadget.h>
#include <libvanet/zkp/Field.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace vanet {
namespace zkp {

namespace {

constexpr std::size_t digestBytes = 32;
constexpr std::size_t digestWords = 8;

}  // namespace

template <typename FieldT>
RsaSigVerificationGadget<FieldT>::RsaSigVerificationGadget(
    libsnark::protoboard<FieldT>& pb,
    const LongElement<FieldT>& modulus,
    const libsnark::pb_linear_combination_array<FieldT>& digest,
    const LongElement<FieldT>& signature,
    std::size_t rsaKeyBitLength,
    const std::string& annotation_prefix)
    : libsnark::gadget<FieldT>(pb, annotation_prefix)
{
    constexpr std::size_t w = LongElement<FieldT>::CHUNK_BITWIDTH;
    if (rsaKeyBitLength % w != 0 || rsaKeyBitLength < 512)
        throw std::invalid_argument(
            "unsupported RSA key length " + std::to_string(rsaKeyBitLength));
    std::size_t const limbs = rsaKeyBitLength / w;
    if (modulus.size() != limbs || signature.size() != limbs)
        throw std::invalid_argument(
            "modulus and signature must have " + std::to_string(limbs) +
            " limbs");
    if (digest.size() != digestWords)
        throw std::invalid_argument("SHA-256 digest must be 8 words");

    // Constant part of the encoded message, digest bytes left as zero
    std::size_t const length = rsaKeyBitLength / 8;
    std::size_t const padding =
        length - 3 - SHA256_DIGEST_INFO.size() - digestBytes;
    std::vector<std::uint8_t> em(length, 0);
    em[1] = 0x01;
    for (std::size_t i = 0; i < padding; ++i)
        em[2 + i] = 0xff;
    std::copy(
        SHA256_DIGEST_INFO.begin(),
        SHA256_DIGEST_INFO.end(),
        em.begin() + 3 + padding);

    FieldT const wordShift = FieldT(2) ^ 32;
    for (std::size_t i = 0; i < limbs; ++i)
    {
        std::uint64_t constant = 0;
        for (std::size_t j = w / 8; j-- > 0;)
            constant = (constant << 8) | em[length - 1 - (i * w / 8 + j)];

        libsnark::linear_combination<FieldT> lc;
        lc.add_term(
            libsnark::pb_variable<FieldT>(0),
            FieldT(static_cast<long>(constant), true));
        if (i < digestBytes * 8 / w)
        {
            // limb i holds digest words 6 - 2i (high) and 7 - 2i (low)
            lc = lc + digest[digestWords - 2 - 2 * i] * wordShift +
                digest[digestWords - 1 - 2 * i];
        }

        libsnark::pb_linear_combination<FieldT> limb;
        limb.assign(pb, lc);
        expected_.emplace_back(limb);
    }

    modExp_ = std::make_unique<LongElementModExpGadget<FieldT>>(
        pb,
        signature,
        modulus,
        LongElementModExpGadget<FieldT>::DEFAULT_EXPONENT,
        annotation_prefix + "_modexp");

    limbEqual_.allocate(pb, limbs, annotation_prefix + "_limb_equal");
    limbInverse_.allocate(pb, limbs, annotation_prefix + "_limb_inverse");
    valid_.allocate(pb, annotation_prefix + "_valid");
    allEqual_ = std::make_unique<libsnark::conjunction_gadget<FieldT>>(
        pb, limbEqual_, valid_, annotation_prefix + "_all_equal");
}

template <typename FieldT>
libsnark::linear_combination<FieldT>
RsaSigVerificationGadget<FieldT>::difference(std::size_t limb) const
{
    return modExp_->result()[limb] - expected_[limb];
}

template <typename FieldT>
void
RsaSigVerificationGadget<FieldT>::generate_r1cs_constraints()
{
    modExp_->generate_r1cs_constraints();

    // eq_i = 1 iff diff_i = 0
    for (std::size_t i = 0; i < expected_.size(); ++i)
    {
        this->pb.add_r1cs_constraint(
            libsnark::r1cs_constraint<FieldT>(
                difference(i), limbInverse_[i], 1 - limbEqual_[i]),
            this->annotation_prefix + "_inverse_" + std::to_string(i));
        this->pb.add_r1cs_constraint(
            libsnark::r1cs_constraint<FieldT>(
                difference(i), limbEqual_[i], 0),
            this->annotation_prefix + "_equal_" + std::to_string(i));
    }

    allEqual_->generate_r1cs_constraints();
}

template <typename FieldT>
void
RsaSigVerificationGadget<FieldT>::generate_r1cs_witness()
{
    modExp_->generate_r1cs_witness();
    expected_.evaluate(this->pb);

    auto const& recovered = modExp_->result();
    for (std::size_t i = 0; i < expected_.size(); ++i)
    {
        FieldT const diff =
            this->pb.lc_val(recovered[i]) - this->pb.lc_val(expected_[i]);
        if (diff.is_zero())
        {
            this->pb.val(limbEqual_[i]) = FieldT::one();
            this->pb.val(limbInverse_[i]) = FieldT::zero();
        }
        else
        {
            this->pb.val(limbEqual_[i]) = FieldT::zero();
            this->pb.val(limbInverse_[i]) = diff.inverse();
        }
    }

    allEqual_->generate_r1cs_witness();
}

template class RsaSigVerificationGadget<FieldT>;

}  // namespace zkp
}  // namespace vanet
