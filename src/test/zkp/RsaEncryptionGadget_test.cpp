#include <xrpl/beast/unit_test.h>

#include <libvanet/zkp/Field.h>
#include <libvanet/zkp/RsaUtil.h>
#include <libvanet/zkp/gadgets/RsaEncryptionGadget.h>

#include <memory>
#include <string>
#include <vector>

namespace vanet {
namespace zkp {

class RsaEncryptionGadget_test : public beast::unit_test::suite
{
private:
    static constexpr std::size_t keyBits = 512;

    struct Harness
    {
        libsnark::protoboard<FieldT> pb;
        LongElement<FieldT> modulus;
        libsnark::pb_variable_array<FieldT> plaintext;
        libsnark::pb_variable_array<FieldT> randomness;
        std::unique_ptr<RsaEncryptionGadget<FieldT>> gadget;

        Harness(std::size_t plaintextLength, std::size_t randomnessLength, bool compliance)
        {
            modulus = LongElement<FieldT>::allocate(pb, keyBits, "n");
            plaintext.allocate(pb, plaintextLength, "plaintext");
            randomness.allocate(pb, randomnessLength, "randomness");
            gadget = std::make_unique<RsaEncryptionGadget<FieldT>>(
                pb,
                modulus,
                libsnark::pb_linear_combination_array<FieldT>(plaintext),
                libsnark::pb_linear_combination_array<FieldT>(randomness),
                keyBits,
                "enc");
            gadget->generate_r1cs_constraints();
            if (compliance)
                gadget->checkRandomnessCompliance();
        }

        void
        encrypt(
            const BIGNUM* n,
            const std::vector<std::uint8_t>& message,
            const std::vector<std::uint8_t>& padding)
        {
            modulus.assign(pb, n);
            for (std::size_t i = 0; i < message.size(); ++i)
                pb.val(plaintext[i]) = FieldT(message[i]);
            for (std::size_t i = 0; i < padding.size(); ++i)
                pb.val(randomness[i]) = FieldT(padding[i]);
            gadget->generate_r1cs_witness();
        }
    };

    template <class F>
    bool
    throwsInvalidArgument(F&& f)
    {
        try
        {
            f();
        }
        catch (std::invalid_argument const&)
        {
            return true;
        }
        return false;
    }

public:
    void
    run() override
    {
        initCurveParameters();

        testMatchesHostEncryption();
        testZeroRandomness();
        testLengths();
    }

    void
    testMatchesHostEncryption()
    {
        testcase("Matches Host Encryption");

        auto key = RsaUtil::generateKeyPair(keyBits);
        auto const n = RsaUtil::modulusOf(key.get());
        std::string const text = "lat=48.1371;lon=11.5";
        std::vector<std::uint8_t> const message(text.begin(), text.end());

        auto const cipherText = RsaUtil::encryptPkcs1(key.get(), message);
        auto const padding =
            RsaUtil::extractRandomness(key.get(), cipherText, message);
        BEAST_EXPECT(
            padding.size() ==
            RsaEncryptionGadget<FieldT>::getExpectedRandomnessLength(
                keyBits, message.size()));

        Harness h(message.size(), padding.size(), true);
        h.encrypt(n.get(), message, padding);

        BEAST_EXPECT(h.gadget->getOutputWires().size() == keyBits / 8);
        BEAST_EXPECT(h.gadget->cipherTextBytes() == cipherText);
        BEAST_EXPECT(h.pb.is_satisfied());

        // Calling it twice adds nothing
        auto const before = h.pb.num_constraints();
        h.gadget->checkRandomnessCompliance();
        BEAST_EXPECT(h.pb.num_constraints() == before);
    }

    void
    testZeroRandomness()
    {
        testcase("Zero Randomness Byte");

        auto key = RsaUtil::generateKeyPair(keyBits);
        auto const n = RsaUtil::modulusOf(key.get());
        std::vector<std::uint8_t> const message(16, 'x');
        auto const length =
            RsaEncryptionGadget<FieldT>::getExpectedRandomnessLength(
                keyBits, message.size());
        std::vector<std::uint8_t> padding(length, 0x11);
        padding[5] = 0x00;

        Harness checked(message.size(), length, true);
        checked.encrypt(n.get(), message, padding);
        BEAST_EXPECT(!checked.pb.is_satisfied());

        // Without the compliance check the encoding alone is accepted
        Harness unchecked(message.size(), length, false);
        unchecked.encrypt(n.get(), message, padding);
        BEAST_EXPECT(unchecked.pb.is_satisfied());

        padding[5] = 0x01;
        Harness fixed(message.size(), length, true);
        fixed.encrypt(n.get(), message, padding);
        BEAST_EXPECT(fixed.pb.is_satisfied());
    }

    void
    testLengths()
    {
        testcase("Lengths");

        BEAST_EXPECT(
            RsaEncryptionGadget<FieldT>::getExpectedRandomnessLength(2048, 111) == 142);
        BEAST_EXPECT(
            RsaEncryptionGadget<FieldT>::getExpectedRandomnessLength(512, 53) == 8);
        BEAST_EXPECT(throwsInvalidArgument([] {
            RsaEncryptionGadget<FieldT>::getExpectedRandomnessLength(512, 54);
        }));

        // randomness one byte short
        BEAST_EXPECT(throwsInvalidArgument([] { Harness h(20, 40, false); }));
        BEAST_EXPECT(throwsInvalidArgument([] { Harness h(54, 7, false); }));
    }
};

BEAST_DEFINE_TESTSUITE(RsaEncryptionGadget, zkp, vanet);

}  // namespace zkp
}  // namespace vanet
