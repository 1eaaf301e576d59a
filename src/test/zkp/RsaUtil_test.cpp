#include <xrpl/beast/unit_test.h>

#include <libvanet/zkp/BigNum.h>
#include <libvanet/zkp/Errors.h>
#include <libvanet/zkp/RsaUtil.h>

#include <algorithm>
#include <string>
#include <vector>

namespace vanet {
namespace zkp {

class RsaUtil_test : public beast::unit_test::suite
{
private:
    static std::vector<std::uint8_t>
    bytesOf(std::string const& s)
    {
        return std::vector<std::uint8_t>(s.begin(), s.end());
    }

    template <class F>
    bool
    throwsConsistencyError(F&& f)
    {
        try
        {
            f();
        }
        catch (ConsistencyError const&)
        {
            return true;
        }
        return false;
    }

public:
    void
    run() override
    {
        testSignVerify();
        testEncryptDecrypt();
        testExtractRandomness();
        testMalformedPadding();
        testBignumHelpers();
        testBignumErrors();
        testPublicExponent();
    }

    void
    testSignVerify()
    {
        testcase("Sign And Verify");

        auto key = RsaUtil::generateKeyPair(1024);
        auto const modulus = RsaUtil::modulusOf(key.get());
        BEAST_EXPECT(BN_num_bits(modulus.get()) == 1024);

        auto const message = bytesOf("vehicle public key");
        auto signature = RsaUtil::signSha256(key.get(), message);
        BEAST_EXPECT(signature.size() == 128);
        BEAST_EXPECT(RsaUtil::verifySha256(key.get(), message, signature));

        signature[10] ^= 0x01;
        BEAST_EXPECT(!RsaUtil::verifySha256(key.get(), message, signature));

        auto other = RsaUtil::generateKeyPair(1024);
        auto const good = RsaUtil::signSha256(key.get(), message);
        BEAST_EXPECT(!RsaUtil::verifySha256(other.get(), message, good));
    }

    void
    testEncryptDecrypt()
    {
        testcase("Encrypt And Decrypt");

        auto key = RsaUtil::generateKeyPair(1024);
        auto const message = bytesOf("speed=42;lane=3");
        auto const cipherText = RsaUtil::encryptPkcs1(key.get(), message);
        BEAST_EXPECT(cipherText.size() == 128);
        BEAST_EXPECT(RsaUtil::decryptPkcs1(key.get(), cipherText) == message);

        // Two encryptions use different padding
        BEAST_EXPECT(RsaUtil::encryptPkcs1(key.get(), message) != cipherText);

        auto const raw = RsaUtil::decryptRaw(key.get(), cipherText);
        BEAST_EXPECT(raw.size() == 128);
        BEAST_EXPECT(raw[0] == 0x00 && raw[1] == 0x02);

        auto const split = RsaUtil::splitEncryptionPadding(raw);
        BEAST_EXPECT(split.message == message);
        BEAST_EXPECT(split.randomness.size() == 128 - 3 - message.size());
    }

    void
    testExtractRandomness()
    {
        testcase("Extract Randomness");

        auto key = RsaUtil::generateKeyPair(1024);
        auto const message = bytesOf("hello");
        auto const cipherText = RsaUtil::encryptPkcs1(key.get(), message);

        auto const randomness =
            RsaUtil::extractRandomness(key.get(), cipherText, message);
        BEAST_EXPECT(randomness.size() == 128 - 3 - message.size());
        BEAST_EXPECT(
            std::find(randomness.begin(), randomness.end(), 0) ==
            randomness.end());

        BEAST_EXPECT(throwsConsistencyError([&] {
            RsaUtil::extractRandomness(key.get(), cipherText, bytesOf("hellO"));
        }));
    }

    void
    testMalformedPadding()
    {
        testcase("Malformed Padding");

        std::vector<std::uint8_t> block(64, 0xab);
        block[0] = 0x00;
        block[1] = 0x02;
        block[40] = 0x00;
        auto const split = RsaUtil::splitEncryptionPadding(block);
        BEAST_EXPECT(split.randomness.size() == 38);
        BEAST_EXPECT(split.message.size() == 23);

        auto wrongType = block;
        wrongType[1] = 0x01;
        BEAST_EXPECT(throwsConsistencyError(
            [&] { RsaUtil::splitEncryptionPadding(wrongType); }));

        auto noSeparator = block;
        noSeparator[40] = 0xab;
        BEAST_EXPECT(throwsConsistencyError(
            [&] { RsaUtil::splitEncryptionPadding(noSeparator); }));

        auto shortPadding = block;
        shortPadding[6] = 0x00;
        BEAST_EXPECT(throwsConsistencyError(
            [&] { RsaUtil::splitEncryptionPadding(shortPadding); }));

        BEAST_EXPECT(throwsConsistencyError([&] {
            RsaUtil::splitEncryptionPadding(std::vector<std::uint8_t>{0, 2, 1});
        }));
    }

    void
    testBignumHelpers()
    {
        testcase("Bignum Helpers");

        auto const n = bignumFromWord(0xabc);
        BEAST_EXPECT(bignumToHex(n.get(), 6) == "000abc");
        BEAST_EXPECT(bignumToHex(n.get(), 3) == "abc");

        auto const bytes = bignumToBytes(n.get(), 4);
        BEAST_EXPECT((bytes == std::vector<std::uint8_t>{0, 0, 0x0a, 0xbc}));

        try
        {
            bignumToHex(n.get(), 2);
            fail("hex narrower than the value accepted");
        }
        catch (std::exception const&)
        {
            pass();
        }

        std::vector<std::uint64_t> const limbs{0xffffffffffffffffULL, 0x1ULL, 0ULL};
        auto const wide = bignumFromLimbs(limbs, 64);
        BEAST_EXPECT(BN_num_bits(wide.get()) == 65);
        BEAST_EXPECT(bignumToLimbs(wide.get(), 3, 64) == limbs);
    }

    void
    testBignumErrors()
    {
        testcase("Bignum Errors");

        // 2 has no inverse mod 4; OpenSSL reports it on the error queue
        auto const two = bignumFromWord(2);
        auto const four = bignumFromWord(4);
        auto inverse = makeBignum();
        auto ctx = makeBnCtx();
        try
        {
            bnCheck(
                BN_mod_inverse(inverse.get(), two.get(), four.get(), ctx.get()) !=
                    nullptr,
                "BN_mod_inverse");
            fail("missing inverse accepted");
        }
        catch (CryptoError const& e)
        {
            BEAST_EXPECT(e.operation() == "BN_mod_inverse");
            BEAST_EXPECT(
                std::string(e.what()).find("unknown OpenSSL error") ==
                std::string::npos);
        }

        // the queue was drained by the first failure
        try
        {
            bnCheck(0, "BN_set_word");
            fail("failed call accepted");
        }
        catch (CryptoError const& e)
        {
            BEAST_EXPECT(e.operation() == "BN_set_word");
            BEAST_EXPECT(
                std::string(e.what()) ==
                "BN_set_word failed: unknown OpenSSL error");
        }

        bnCheck(1, "BN_add");
        pass();
    }

    void
    testPublicExponent()
    {
        testcase("Public Exponent");

        auto key = RsaUtil::generateKeyPair(512);
        BEAST_EXPECT(BN_is_word(RsaUtil::publicExponentOf(key.get()).get(), 65537));

        auto small = RsaUtil::generateKeyPair(512, 3);
        BEAST_EXPECT(BN_is_word(RsaUtil::publicExponentOf(small.get()).get(), 3));
        BEAST_EXPECT(BN_num_bits(RsaUtil::modulusOf(small.get()).get()) == 512);
    }
};

BEAST_DEFINE_TESTSUITE(RsaUtil, zkp, vanet);

}  // namespace zkp
}  // namespace vanet
