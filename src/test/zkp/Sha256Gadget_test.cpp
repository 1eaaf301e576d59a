#include <xrpl/beast/unit_test.h>

#include <libvanet/zkp/Field.h>
#include <libvanet/zkp/gadgets/BitwidthRestrictionGadget.h>
#include <libvanet/zkp/gadgets/Sha256Gadget.h>

#include <openssl/evp.h>

#include <memory>
#include <string>
#include <vector>

namespace vanet {
namespace zkp {

class Sha256Gadget_test : public beast::unit_test::suite
{
private:
    std::vector<std::uint8_t>
    opensslSha256(const std::vector<std::uint8_t>& data)
    {
        std::vector<std::uint8_t> md(32);
        unsigned int size = 0;
        if (EVP_Digest(
                data.data(),
                data.size(),
                md.data(),
                &size,
                EVP_sha256(),
                nullptr) != 1)
            fail("EVP_Digest failed");
        return md;
    }

    struct Harness
    {
        libsnark::protoboard<FieldT> pb;
        libsnark::pb_variable_array<FieldT> bytes;
        std::unique_ptr<BitwidthRestrictionGadget<FieldT>> restriction;
        std::unique_ptr<Sha256Gadget<FieldT>> sha;

        Harness(std::size_t length, bool binaryOutput, bool padding)
        {
            bytes.allocate(pb, length, "input");
            restriction = std::make_unique<BitwidthRestrictionGadget<FieldT>>(
                pb,
                libsnark::pb_linear_combination_array<FieldT>(bytes),
                8,
                "input_range");
            sha = std::make_unique<Sha256Gadget<FieldT>>(
                pb, *restriction, length, binaryOutput, padding, "sha");
            restriction->generate_r1cs_constraints();
            sha->generate_r1cs_constraints();
        }

        void
        hash(const std::vector<std::uint8_t>& data)
        {
            for (std::size_t i = 0; i < data.size(); ++i)
                pb.val(bytes[i]) = FieldT(data[i]);
            restriction->generate_r1cs_witness();
            sha->generate_r1cs_witness();
        }
    };

public:
    void
    run() override
    {
        initCurveParameters();

        testShortMessage();
        testMultiBlockMessage();
        testOutputWords();
        testBinaryOutput();
        testUnpaddedInput();
    }

    void
    testShortMessage()
    {
        testcase("Short Message");

        std::vector<std::uint8_t> data{'a', 'b', 'c'};
        Harness h(data.size(), false, true);
        BEAST_EXPECT(h.sha->numBlocks() == 1);
        h.hash(data);

        BEAST_EXPECT(h.pb.is_satisfied());
        BEAST_EXPECT(h.sha->digestBytes() == opensslSha256(data));
    }

    void
    testMultiBlockMessage()
    {
        testcase("Multi-Block Message");

        // 130 bytes need three blocks once padded
        std::vector<std::uint8_t> data(130);
        for (std::size_t i = 0; i < data.size(); ++i)
            data[i] = static_cast<std::uint8_t>(i * 7 + 3);

        Harness h(data.size(), false, true);
        BEAST_EXPECT(h.sha->numBlocks() == 3);
        h.hash(data);

        BEAST_EXPECT(h.pb.is_satisfied());
        BEAST_EXPECT(h.sha->digestBytes() == opensslSha256(data));

        // 55 bytes still fit one block, 56 do not
        BEAST_EXPECT(Harness(55, false, true).sha->numBlocks() == 1);
        BEAST_EXPECT(Harness(56, false, true).sha->numBlocks() == 2);
    }

    void
    testOutputWords()
    {
        testcase("Output Words");

        std::string const text = "0123456789abcdef";
        std::vector<std::uint8_t> data(text.begin(), text.end());
        Harness h(data.size(), false, true);
        h.hash(data);

        auto const expected = opensslSha256(data);
        auto const& words = h.sha->getOutputWires();
        BEAST_EXPECT(words.size() == 8);

        bool match = true;
        for (std::size_t w = 0; w < words.size(); ++w)
        {
            std::uint64_t value = 0;
            for (std::size_t j = 0; j < 4; ++j)
                value = (value << 8) | expected[w * 4 + j];
            match = match && h.pb.lc_val(words[w]) == FieldT(value, true);
        }
        BEAST_EXPECT(match);
    }

    void
    testBinaryOutput()
    {
        testcase("Binary Output");

        std::vector<std::uint8_t> data{'v', 'a', 'n', 'e', 't'};
        Harness h(data.size(), true, true);
        h.hash(data);

        auto const expected = opensslSha256(data);
        auto const& bits = h.sha->getOutputWires();
        BEAST_EXPECT(bits.size() == 256);

        bool match = true;
        for (std::size_t i = 0; i < bits.size(); ++i)
        {
            bool const bit = (expected[i / 8] >> (7 - i % 8)) & 1;
            match = match && h.pb.lc_val(bits[i]) == (bit ? FieldT::one() : FieldT::zero());
        }
        BEAST_EXPECT(match);
        BEAST_EXPECT(h.pb.is_satisfied());
    }

    void
    testUnpaddedInput()
    {
        testcase("Unpadded Input");

        Harness h(64, false, false);
        BEAST_EXPECT(h.sha->numBlocks() == 1);
        h.hash(std::vector<std::uint8_t>(64, 0x5a));
        BEAST_EXPECT(h.pb.is_satisfied());

        try
        {
            Harness bad(65, false, false);
            fail("partial block accepted without padding");
        }
        catch (std::invalid_argument const&)
        {
            pass();
        }
    }
};

BEAST_DEFINE_TESTSUITE(Sha256Gadget, zkp, vanet);

}  // namespace zkp
}  // namespace vanet
