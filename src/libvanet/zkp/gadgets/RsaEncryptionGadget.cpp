#include <libvanet/zkp/gadgets/RsaEncryptionGadget.h>
#include <libvanet/zkp/Field.h>

#include <stdexcept>

namespace vanet {
namespace zkp {

namespace {

template <typename FieldT>
libsnark::linear_combination<FieldT>
constantByte(std::uint8_t value)
{
    libsnark::linear_combination<FieldT> lc;
    if (value != 0)
        lc.add_term(libsnark::pb_variable<FieldT>(0), FieldT(value));
    return lc;
}

}  // namespace

template <typename FieldT>
std::size_t
RsaEncryptionGadget<FieldT>::getExpectedRandomnessLength(
    std::size_t rsaKeyBitLength,
    std::size_t plaintextLength)
{
    std::size_t const length = rsaKeyBitLength / 8;
    if (length < 11 || plaintextLength > length - 11)
        throw std::invalid_argument(
            "plaintext of " + std::to_string(plaintextLength) +
            " bytes leaves no room for PKCS#1 v1.5 padding under a " +
            std::to_string(rsaKeyBitLength) + "-bit key");
    return length - 3 - plaintextLength;
}

template <typename FieldT>
RsaEncryptionGadget<FieldT>::RsaEncryptionGadget(
    libsnark::protoboard<FieldT>& pb,
    const LongElement<FieldT>& modulus,
    const libsnark::pb_linear_combination_array<FieldT>& plaintext,
    const libsnark::pb_linear_combination_array<FieldT>& randomness,
    std::size_t rsaKeyBitLength,
    const std::string& annotation_prefix)
    : libsnark::gadget<FieldT>(pb, annotation_prefix)
    , randomness_(randomness)
{
    constexpr std::size_t w = LongElement<FieldT>::CHUNK_BITWIDTH;
    if (rsaKeyBitLength % w != 0)
        throw std::invalid_argument(
            "RSA key length must be a multiple of " + std::to_string(w));
    if (modulus.size() != rsaKeyBitLength / w)
        throw std::invalid_argument(
            "modulus must have " + std::to_string(rsaKeyBitLength / w) +
            " limbs");

    std::size_t const expected =
        getExpectedRandomnessLength(rsaKeyBitLength, plaintext.size());
    if (randomness.size() != expected)
        throw std::invalid_argument(
            "expected " + std::to_string(expected) + " randomness bytes, got " +
            std::to_string(randomness.size()));

    plaintextRange_ = std::make_unique<BitwidthRestrictionGadget<FieldT>>(
        pb, plaintext, 8, annotation_prefix + "_plaintext_range");
    randomnessRange_ = std::make_unique<BitwidthRestrictionGadget<FieldT>>(
        pb, randomness, 8, annotation_prefix + "_randomness_range");

    // 00 02 || randomness || 00 || plaintext, stored little-endian
    std::vector<libsnark::linear_combination<FieldT>> bytes;
    bytes.reserve(rsaKeyBitLength / 8);
    for (std::size_t i = plaintext.size(); i-- > 0;)
        bytes.push_back(plaintext[i]);
    bytes.push_back(constantByte<FieldT>(0x00));
    for (std::size_t i = randomness.size(); i-- > 0;)
        bytes.push_back(randomness[i]);
    bytes.push_back(constantByte<FieldT>(0x02));
    bytes.push_back(constantByte<FieldT>(0x00));

    encoded_ = LongElement<FieldT>::fromBytes(pb, bytes);
    modExp_ = std::make_unique<LongElementModExpGadget<FieldT>>(
        pb,
        encoded_,
        modulus,
        LongElementModExpGadget<FieldT>::DEFAULT_EXPONENT,
        annotation_prefix + "_modexp");

    auto const bits = modExp_->resultBits().littleEndianBits();
    for (std::size_t j = 0; j < rsaKeyBitLength / 8; ++j)
    {
        libsnark::linear_combination<FieldT> lc;
        for (std::size_t b = 0; b < 8; ++b)
            lc.add_term(bits[8 * j + b], FieldT(1L << b));

        libsnark::pb_linear_combination<FieldT> byte;
        byte.assign(pb, lc);
        cipherText_.emplace_back(byte);
    }
}

template <typename FieldT>
void
RsaEncryptionGadget<FieldT>::generate_r1cs_constraints()
{
    plaintextRange_->generate_r1cs_constraints();
    randomnessRange_->generate_r1cs_constraints();
    modExp_->generate_r1cs_constraints();
}

template <typename FieldT>
void
RsaEncryptionGadget<FieldT>::checkRandomnessCompliance()
{
    if (complianceChecked_)
        return;
    complianceChecked_ = true;

    randomnessInverse_.allocate(
        this->pb,
        randomness_.size(),
        this->annotation_prefix + "_randomness_inverse");
    for (std::size_t i = 0; i < randomness_.size(); ++i)
    {
        this->pb.add_r1cs_constraint(
            libsnark::r1cs_constraint<FieldT>(
                randomness_[i], randomnessInverse_[i], 1),
            this->annotation_prefix + "_nonzero_" + std::to_string(i));
    }
}

template <typename FieldT>
void
RsaEncryptionGadget<FieldT>::generate_r1cs_witness()
{
    plaintextRange_->generate_r1cs_witness();
    randomnessRange_->generate_r1cs_witness();
    encoded_.evaluate(this->pb);
    modExp_->generate_r1cs_witness();
    cipherText_.evaluate(this->pb);

    if (!complianceChecked_)
        return;

    for (std::size_t i = 0; i < randomness_.size(); ++i)
    {
        FieldT const value = this->pb.lc_val(randomness_[i]);
        // zero has no inverse; the constraint stays unsatisfied
        this->pb.val(randomnessInverse_[i]) =
            value.is_zero() ? FieldT::zero() : value.inverse();
    }
}

template <typename FieldT>
std::vector<std::uint8_t>
RsaEncryptionGadget<FieldT>::cipherTextBytes() const
{
    std::vector<std::uint8_t> bytes(cipherText_.size());
    for (std::size_t j = 0; j < cipherText_.size(); ++j)
    {
        bytes[cipherText_.size() - 1 - j] = static_cast<std::uint8_t>(
            this->pb.lc_val(cipherText_[j]).as_ulong());
    }
    return bytes;
}

template class RsaEncryptionGadget<FieldT>;

}  // namespace zkp
}  // namespace vanet
