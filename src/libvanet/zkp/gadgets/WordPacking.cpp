#include <libvanet/zkp/gadgets/WordPacking.h>
#include <libvanet/zkp/Field.h>

#include <stdexcept>
#include <string>

namespace vanet {
namespace zkp {

namespace {

template <typename FieldT>
void
checkLayout(std::size_t wordBitwidth, std::size_t wordsPerLargerWord)
{
    if (wordBitwidth == 0 || wordBitwidth > 64 || wordsPerLargerWord == 0)
        throw std::invalid_argument("invalid word packing layout");
    if (wordBitwidth * wordsPerLargerWord > FieldT::capacity())
        throw std::invalid_argument(
            std::to_string(wordsPerLargerWord) + " words of " +
            std::to_string(wordBitwidth) + " bits exceed the field capacity");
}

}  // namespace

template <typename FieldT>
std::vector<libsnark::linear_combination<FieldT>>
packWordsIntoLargerWords(
    const libsnark::pb_linear_combination_array<FieldT>& words,
    std::size_t wordBitwidth,
    std::size_t wordsPerLargerWord)
{
    checkLayout<FieldT>(wordBitwidth, wordsPerLargerWord);

    std::size_t const numLarger =
        (words.size() + wordsPerLargerWord - 1) / wordsPerLargerWord;
    FieldT const shift = FieldT(2) ^ wordBitwidth;

    std::vector<libsnark::linear_combination<FieldT>> result(numLarger);
    for (std::size_t i = 0; i < numLarger; ++i)
    {
        FieldT weight = FieldT::one();
        for (std::size_t j = i * wordsPerLargerWord;
             j < (i + 1) * wordsPerLargerWord && j < words.size();
             ++j)
        {
            result[i] = result[i] + words[j] * weight;
            weight *= shift;
        }
    }
    return result;
}

template <typename FieldT>
std::vector<std::uint64_t>
unpackLargerWords(
    const std::vector<FieldT>& largerWords,
    std::size_t wordBitwidth,
    std::size_t wordsPerLargerWord,
    std::size_t numWords)
{
    checkLayout<FieldT>(wordBitwidth, wordsPerLargerWord);
    if (largerWords.size() * wordsPerLargerWord < numWords)
        throw std::invalid_argument("not enough packed words");

    std::vector<std::uint64_t> words(numWords, 0);
    for (std::size_t j = 0; j < numWords; ++j)
    {
        auto const bits = largerWords[j / wordsPerLargerWord].as_bigint();
        std::size_t const first = (j % wordsPerLargerWord) * wordBitwidth;
        for (std::size_t b = 0; b < wordBitwidth; ++b)
        {
            if (bits.test_bit(first + b))
                words[j] |= std::uint64_t(1) << b;
        }
    }
    return words;
}

template std::vector<libsnark::linear_combination<FieldT>>
packWordsIntoLargerWords<FieldT>(
    const libsnark::pb_linear_combination_array<FieldT>&,
    std::size_t,
    std::size_t);

template std::vector<std::uint64_t>
unpackLargerWords<FieldT>(
    const std::vector<FieldT>&,
    std::size_t,
    std::size_t,
    std::size_t);

}  // namespace zkp
}  // namespace vanet
