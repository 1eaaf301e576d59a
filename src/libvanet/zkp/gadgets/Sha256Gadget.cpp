#include <libvanet/zkp/gadgets/Sha256Gadget.h>
#include <libvanet/zkp/Field.h>

#include <stdexcept>

namespace vanet {
namespace zkp {

template <typename FieldT>
Sha256Gadget<FieldT>::Sha256Gadget(
    libsnark::protoboard<FieldT>& pb,
    const BitwidthRestrictionGadget<FieldT>& input,
    std::size_t totalLengthInBytes,
    bool binaryOutput,
    bool paddingRequired,
    const std::string& annotation_prefix)
    : libsnark::gadget<FieldT>(pb, annotation_prefix)
{
    std::size_t const messageBits = totalLengthInBytes * 8;
    if (input.size() * input.bitwidth() != messageBits)
        throw std::invalid_argument(
            "hash input holds " +
            std::to_string(input.size() * input.bitwidth()) +
            " bits, expected " + std::to_string(messageBits));
    if (!paddingRequired && messageBits % BLOCK_BITS != 0)
        throw std::invalid_argument(
            "unpadded hash input must be a multiple of 64 bytes");

    zero_.allocate(pb, annotation_prefix + "_zero");
    one_.allocate(pb, annotation_prefix + "_one");

    libsnark::pb_variable_array<FieldT> stream = input.bigEndianBits();
    if (paddingRequired)
    {
        std::size_t const paddedBits =
            ((messageBits + 1 + 64 + BLOCK_BITS - 1) / BLOCK_BITS) *
            BLOCK_BITS;
        stream.emplace_back(one_);
        while (stream.size() < paddedBits - 64)
            stream.emplace_back(zero_);
        for (std::size_t i = 64; i-- > 0;)
            stream.emplace_back(
                (static_cast<std::uint64_t>(messageBits) >> i) & 1 ? one_
                                                                    : zero_);
    }

    std::size_t const numBlocks = stream.size() / BLOCK_BITS;
    blocks_.resize(numBlocks);
    libsnark::pb_linear_combination_array<FieldT> state =
        libsnark::SHA256_default_IV<FieldT>(pb);
    for (std::size_t i = 0; i < numBlocks; ++i)
    {
        blocks_[i].insert(
            blocks_[i].end(),
            stream.begin() + i * BLOCK_BITS,
            stream.begin() + (i + 1) * BLOCK_BITS);

        states_.push_back(std::make_unique<libsnark::digest_variable<FieldT>>(
            pb, DIGEST_BITS, annotation_prefix + "_state_" + std::to_string(i)));
        compressions_.push_back(
            std::make_unique<libsnark::sha256_compression_function_gadget<FieldT>>(
                pb,
                state,
                blocks_[i],
                *states_.back(),
                annotation_prefix + "_compress_" + std::to_string(i)));
        state = libsnark::pb_linear_combination_array<FieldT>(
            states_.back()->bits);
    }

    libsnark::pb_variable_array<FieldT> const& digest = states_.back()->bits;
    if (binaryOutput)
    {
        output_ = libsnark::pb_linear_combination_array<FieldT>(digest);
        return;
    }

    for (std::size_t w = 0; w < DIGEST_BITS / WORD_BITS; ++w)
    {
        libsnark::linear_combination<FieldT> word;
        FieldT weight = FieldT::one();
        for (std::size_t b = WORD_BITS; b-- > 0;)
        {
            word.add_term(digest[w * WORD_BITS + b], weight);
            weight += weight;
        }
        libsnark::pb_linear_combination<FieldT> packed;
        packed.assign(pb, word);
        output_.emplace_back(packed);
    }
}

template <typename FieldT>
void
Sha256Gadget<FieldT>::generate_r1cs_constraints()
{
    this->pb.add_r1cs_constraint(
        libsnark::r1cs_constraint<FieldT>(1, zero_, 0),
        this->annotation_prefix + "_zero_is_zero");
    this->pb.add_r1cs_constraint(
        libsnark::r1cs_constraint<FieldT>(1, one_, 1),
        this->annotation_prefix + "_one_is_one");

    for (std::size_t i = 0; i < compressions_.size(); ++i)
    {
        states_[i]->generate_r1cs_constraints();
        compressions_[i]->generate_r1cs_constraints();
    }
}

template <typename FieldT>
void
Sha256Gadget<FieldT>::generate_r1cs_witness()
{
    this->pb.val(zero_) = FieldT::zero();
    this->pb.val(one_) = FieldT::one();

    for (auto& compression : compressions_)
        compression->generate_r1cs_witness();

    output_.evaluate(this->pb);
}

template <typename FieldT>
std::vector<std::uint8_t>
Sha256Gadget<FieldT>::digestBytes() const
{
    auto const bits = states_.back()->bits.get_bits(this->pb);
    std::vector<std::uint8_t> bytes(DIGEST_BITS / 8, 0);
    for (std::size_t i = 0; i < DIGEST_BITS; ++i)
    {
        if (bits[i])
            bytes[i / 8] |= static_cast<std::uint8_t>(0x80 >> (i % 8));
    }
    return bytes;
}

template class Sha256Gadget<FieldT>;

}  // namespace zkp
}  // namespace vanet
