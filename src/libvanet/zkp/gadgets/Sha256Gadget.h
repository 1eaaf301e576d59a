#ifndef VANET_ZKP_GADGETS_SHA256_GADGET_H
#define VANET_ZKP_GADGETS_SHA256_GADGET_H

#include <libvanet/zkp/gadgets/BitwidthRestrictionGadget.h>

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/gadgets/hashes/hash_io.hpp>
#include <libsnark/gadgetlib1/gadgets/hashes/sha256/sha256_components.hpp>
#include <libsnark/gadgetlib1/gadgets/hashes/sha256/sha256_gadget.hpp>

#include <memory>
#include <vector>

namespace vanet {
namespace zkp {

/**
 * SHA-256 inside the constraint system. The bits of an already restricted
 * input (most significant bit of each element first) are fed through
 * chained compression functions starting from the standard IV.
 *
 * With paddingRequired the standard SHA-256 padding is appended as constant
 * wires, otherwise the input must fill whole 64-byte blocks.
 */
template <typename FieldT>
class Sha256Gadget : public libsnark::gadget<FieldT>
{
public:
    static constexpr std::size_t BLOCK_BITS = 512;
    static constexpr std::size_t DIGEST_BITS = 256;
    static constexpr std::size_t WORD_BITS = 32;

    Sha256Gadget(
        libsnark::protoboard<FieldT>& pb,
        const BitwidthRestrictionGadget<FieldT>& input,
        std::size_t totalLengthInBytes,
        bool binaryOutput,
        bool paddingRequired,
        const std::string& annotation_prefix);

    void
    generate_r1cs_constraints();

    /** The input restriction must have produced its bits already. */
    void
    generate_r1cs_witness();

    std::size_t
    numBlocks() const
    {
        return compressions_.size();
    }

    /**
     * 256 digest bits (binaryOutput) or 8 big-endian 32-bit words, in
     * standard digest order.
     */
    const libsnark::pb_linear_combination_array<FieldT>&
    getOutputWires() const
    {
        return output_;
    }

    /** Digest bytes read from the current assignment. */
    std::vector<std::uint8_t>
    digestBytes() const;

private:
    libsnark::pb_variable<FieldT> zero_;
    libsnark::pb_variable<FieldT> one_;

    std::vector<libsnark::pb_variable_array<FieldT>> blocks_;
    std::vector<std::unique_ptr<libsnark::digest_variable<FieldT>>> states_;
    std::vector<std::unique_ptr<libsnark::sha256_compression_function_gadget<FieldT>>>
        compressions_;

    libsnark::pb_linear_combination_array<FieldT> output_;
};

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_GADGETS_SHA256_GADGET_H
