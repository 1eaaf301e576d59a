#ifndef VANET_ZKP_GADGETS_WORD_PACKING_H
#define VANET_ZKP_GADGETS_WORD_PACKING_H

#include <libsnark/gadgetlib1/pb_variable.hpp>

#include <cstdint>
#include <vector>

namespace vanet {
namespace zkp {

/**
 * Group consecutive words into wider ones, little-endian within a group:
 * larger[i] = sum_j words[i * perWord + j] * 2^(j * wordBitwidth).
 * The last group may be partial.
 */
template <typename FieldT>
std::vector<libsnark::linear_combination<FieldT>>
packWordsIntoLargerWords(
    const libsnark::pb_linear_combination_array<FieldT>& words,
    std::size_t wordBitwidth,
    std::size_t wordsPerLargerWord);

/** Inverse of packWordsIntoLargerWords on concrete values. */
template <typename FieldT>
std::vector<std::uint64_t>
unpackLargerWords(
    const std::vector<FieldT>& largerWords,
    std::size_t wordBitwidth,
    std::size_t wordsPerLargerWord,
    std::size_t numWords);

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_GADGETS_WORD_PACKING_H
