#include <xrpl/beast/unit_test.h>

#include <libvanet/zkp/BigNum.h>
#include <libvanet/zkp/Field.h>
#include <libvanet/zkp/gadgets/BitwidthRestrictionGadget.h>
#include <libvanet/zkp/gadgets/LongElement.h>
#include <libvanet/zkp/gadgets/LongElementLessThanGadget.h>
#include <libvanet/zkp/gadgets/LongElementModExpGadget.h>
#include <libvanet/zkp/gadgets/LongElementModMulGadget.h>
#include <libvanet/zkp/gadgets/WordPacking.h>

#include <openssl/bn.h>

#include <utility>

namespace vanet {
namespace zkp {

class LongElement_test : public beast::unit_test::suite
{
private:
    BnCtxPtr ctx_ = makeBnCtx();

    // Random odd modulus with its top bit set
    BignumPtr
    randomModulus(int bits)
    {
        BignumPtr n = makeBignum();
        bnCheck(BN_rand(n.get(), bits, BN_RAND_TOP_ONE, BN_RAND_BOTTOM_ODD), "BN_rand");
        return n;
    }

    BignumPtr
    randomBelow(const BIGNUM* bound)
    {
        BignumPtr x = makeBignum();
        bnCheck(BN_rand_range(x.get(), bound), "BN_rand_range");
        return x;
    }

    bool
    equal(const BIGNUM* a, const BIGNUM* b)
    {
        return BN_cmp(a, b) == 0;
    }

public:
    void
    run() override
    {
        initCurveParameters();

        testLimbRoundTrip();
        testFromBytes();
        testBitwidthRestriction();
        testLessThan();
        testModMul();
        testModMulUnbalanced();
        testModMulRejectsWrongRemainder();
        testModExp();
        testWordPacking();
    }

    void
    testLimbRoundTrip()
    {
        testcase("Limb Round Trip");

        libsnark::protoboard<FieldT> pb;
        auto x = LongElement<FieldT>::allocate(pb, 200, "x");
        BEAST_EXPECT(x.size() == 4);
        BEAST_EXPECT(x.bitwidth() == 256);

        auto value = randomModulus(200);
        x.assign(pb, value.get());
        BEAST_EXPECT(equal(x.value(pb).get(), value.get()));

        auto limbs = bignumToLimbs(value.get(), 4, 64);
        BEAST_EXPECT(x.limbValues(pb) == limbs);
    }

    void
    testFromBytes()
    {
        testcase("Pack Bytes Into Limbs");

        libsnark::protoboard<FieldT> pb;
        std::vector<libsnark::linear_combination<FieldT>> bytes;
        std::vector<std::uint8_t> bigEndian(16);
        for (std::size_t i = 0; i < 16; ++i)
        {
            bigEndian[15 - i] = static_cast<std::uint8_t>(0xf0 + i);
            libsnark::linear_combination<FieldT> lc;
            lc.add_term(libsnark::pb_variable<FieldT>(0), FieldT(0xf0 + i));
            bytes.push_back(lc);
        }

        auto x = LongElement<FieldT>::fromBytes(pb, bytes);
        BEAST_EXPECT(x.size() == 2);
        x.evaluate(pb);
        auto expected = bignumFromBytes(bigEndian);
        BEAST_EXPECT(equal(x.value(pb).get(), expected.get()));

        bytes.pop_back();
        try
        {
            LongElement<FieldT>::fromBytes(pb, bytes);
            fail("partial limb accepted");
        }
        catch (std::invalid_argument const&)
        {
            pass();
        }
    }

    void
    testBitwidthRestriction()
    {
        testcase("Bitwidth Restriction");

        libsnark::protoboard<FieldT> pb;
        libsnark::pb_variable_array<FieldT> bytes;
        bytes.allocate(pb, 3, "bytes");
        BitwidthRestrictionGadget<FieldT> restriction(
            pb, libsnark::pb_linear_combination_array<FieldT>(bytes), 8, "restrict");
        restriction.generate_r1cs_constraints();

        pb.val(bytes[0]) = FieldT(0x80);
        pb.val(bytes[1]) = FieldT(0x01);
        pb.val(bytes[2]) = FieldT(0xff);
        restriction.generate_r1cs_witness();
        BEAST_EXPECT(pb.is_satisfied());

        // MSB-first stream starts with the top bit of 0x80
        auto bits = restriction.bigEndianBits().get_bits(pb);
        BEAST_EXPECT(bits.size() == 24);
        BEAST_EXPECT(bits[0] && !bits[1] && !bits[7]);
        BEAST_EXPECT(!bits[8] && bits[15]);

        pb.val(bytes[1]) = FieldT(256);
        restriction.generate_r1cs_witness();
        BEAST_EXPECT(!pb.is_satisfied());
    }

    void
    testLessThan()
    {
        testcase("Less Than");

        auto check = [&](const BIGNUM* a, const BIGNUM* b, bool assertLess) {
            libsnark::protoboard<FieldT> pb;
            auto x = LongElement<FieldT>::allocate(pb, 256, "a");
            auto y = LongElement<FieldT>::allocate(pb, 256, "b");
            LongElementLessThanGadget<FieldT> less(pb, x, y, "less");
            less.generate_r1cs_constraints(assertLess);
            x.assign(pb, a);
            y.assign(pb, b);
            less.generate_r1cs_witness();
            return std::make_pair(
                pb.val(less.result()) == FieldT::one(), pb.is_satisfied());
        };

        auto big = randomModulus(256);
        auto small = randomBelow(big.get());
        auto same = copyBignum(big.get());

        // differ only in the lowest limb
        auto nearly = copyBignum(big.get());
        bnCheck(BN_sub_word(nearly.get(), 1), "BN_sub_word");

        BEAST_EXPECT(check(small.get(), big.get(), false).first);
        BEAST_EXPECT(!check(big.get(), small.get(), false).first);
        BEAST_EXPECT(!check(big.get(), same.get(), false).first);
        BEAST_EXPECT(check(nearly.get(), big.get(), false).first);
        BEAST_EXPECT(!check(big.get(), nearly.get(), false).first);

        BEAST_EXPECT(check(small.get(), big.get(), true).second);
        BEAST_EXPECT(!check(big.get(), same.get(), true).second);
        BEAST_EXPECT(!check(big.get(), small.get(), true).second);
    }

    void
    testModMul()
    {
        testcase("Modular Multiplication");

        for (int round = 0; round < 3; ++round)
        {
            libsnark::protoboard<FieldT> pb;
            auto n = LongElement<FieldT>::allocate(pb, 512, "n");
            auto a = LongElement<FieldT>::allocate(pb, 512, "a");
            auto b = LongElement<FieldT>::allocate(pb, 512, "b");
            LongElementModMulGadget<FieldT> mul(pb, a, b, n, true, "mul");
            mul.generate_r1cs_constraints();

            auto modulus = randomModulus(512);
            auto x = randomBelow(modulus.get());
            auto y = randomBelow(modulus.get());
            n.assign(pb, modulus.get());
            a.assign(pb, x.get());
            b.assign(pb, y.get());
            mul.generate_r1cs_witness();

            auto expected = makeBignum();
            bnCheck(
                BN_mod_mul(expected.get(), x.get(), y.get(), modulus.get(), ctx_.get()),
                "BN_mod_mul");
            BEAST_EXPECT(equal(mul.result().value(pb).get(), expected.get()));
            BEAST_EXPECT(pb.is_satisfied());
        }
    }

    void
    testModMulUnbalanced()
    {
        testcase("Modular Multiplication With Wide Operands");

        libsnark::protoboard<FieldT> pb;
        auto n = LongElement<FieldT>::allocate(pb, 128, "n");
        auto a = LongElement<FieldT>::allocate(pb, 256, "a");
        auto b = LongElement<FieldT>::allocate(pb, 192, "b");
        LongElementModMulGadget<FieldT> mul(pb, a, b, n, true, "mul");
        mul.generate_r1cs_constraints();

        auto modulus = randomModulus(128);
        auto x = randomModulus(256);
        auto y = randomModulus(192);
        n.assign(pb, modulus.get());
        a.assign(pb, x.get());
        b.assign(pb, y.get());
        mul.generate_r1cs_witness();

        auto expected = makeBignum();
        bnCheck(
            BN_mod_mul(expected.get(), x.get(), y.get(), modulus.get(), ctx_.get()),
            "BN_mod_mul");
        BEAST_EXPECT(equal(mul.result().value(pb).get(), expected.get()));
        BEAST_EXPECT(pb.is_satisfied());
    }

    void
    testModMulRejectsWrongRemainder()
    {
        testcase("Modular Multiplication Rejects Wrong Remainder");

        libsnark::protoboard<FieldT> pb;
        auto n = LongElement<FieldT>::allocate(pb, 256, "n");
        auto a = LongElement<FieldT>::allocate(pb, 256, "a");
        auto b = LongElement<FieldT>::allocate(pb, 256, "b");
        LongElementModMulGadget<FieldT> mul(pb, a, b, n, true, "mul");
        mul.generate_r1cs_constraints();

        auto modulus = randomModulus(256);
        auto x = randomBelow(modulus.get());
        auto y = randomBelow(modulus.get());
        n.assign(pb, modulus.get());
        a.assign(pb, x.get());
        b.assign(pb, y.get());
        mul.generate_r1cs_witness();
        BEAST_EXPECT(pb.is_satisfied());

        // r + n is congruent but not canonical
        auto shifted = makeBignum();
        bnCheck(BN_add(shifted.get(), mul.result().value(pb).get(), modulus.get()), "BN_add");
        if (BN_num_bits(shifted.get()) <= 256)
        {
            mul.result().assign(pb, shifted.get());
            BEAST_EXPECT(!pb.is_satisfied());
        }

        mul.generate_r1cs_witness();
        auto const& r = mul.result();
        pb.val(libsnark::pb_variable<FieldT>(r[0].index)) += FieldT::one();
        BEAST_EXPECT(!pb.is_satisfied());
    }

    void
    testModExp()
    {
        testcase("Modular Exponentiation");

        libsnark::protoboard<FieldT> pb;
        auto n = LongElement<FieldT>::allocate(pb, 512, "n");
        auto base = LongElement<FieldT>::allocate(pb, 512, "base");
        LongElementModExpGadget<FieldT> exp(
            pb, base, n, LongElementModExpGadget<FieldT>::DEFAULT_EXPONENT, "exp");
        exp.generate_r1cs_constraints();

        auto modulus = randomModulus(512);
        auto x = randomBelow(modulus.get());
        n.assign(pb, modulus.get());
        base.assign(pb, x.get());
        exp.generate_r1cs_witness();

        auto e = bignumFromWord(65537);
        auto expected = makeBignum();
        bnCheck(
            BN_mod_exp(expected.get(), x.get(), e.get(), modulus.get(), ctx_.get()),
            "BN_mod_exp");
        BEAST_EXPECT(equal(exp.result().value(pb).get(), expected.get()));
        BEAST_EXPECT(pb.is_satisfied());

        // a small exponent with several set bits
        libsnark::protoboard<FieldT> pb2;
        auto n2 = LongElement<FieldT>::allocate(pb2, 128, "n");
        auto base2 = LongElement<FieldT>::allocate(pb2, 128, "base");
        LongElementModExpGadget<FieldT> exp2(pb2, base2, n2, 11, "exp");
        exp2.generate_r1cs_constraints();
        auto modulus2 = randomModulus(128);
        auto x2 = randomBelow(modulus2.get());
        n2.assign(pb2, modulus2.get());
        base2.assign(pb2, x2.get());
        exp2.generate_r1cs_witness();

        auto e2 = bignumFromWord(11);
        bnCheck(
            BN_mod_exp(expected.get(), x2.get(), e2.get(), modulus2.get(), ctx_.get()),
            "BN_mod_exp");
        BEAST_EXPECT(equal(exp2.result().value(pb2).get(), expected.get()));
        BEAST_EXPECT(pb2.is_satisfied());
    }

    void
    testWordPacking()
    {
        testcase("Word Packing");

        libsnark::protoboard<FieldT> pb;
        libsnark::pb_variable_array<FieldT> bytes;
        bytes.allocate(pb, 65, "bytes");
        for (std::size_t i = 0; i < bytes.size(); ++i)
            pb.val(bytes[i]) = FieldT(static_cast<long>((i * 37 + 11) % 256));

        auto packed = packWordsIntoLargerWords<FieldT>(
            libsnark::pb_linear_combination_array<FieldT>(bytes), 8, 30);
        BEAST_EXPECT(packed.size() == 3);

        std::vector<FieldT> values;
        for (auto const& lc : packed)
            values.push_back(lc.evaluate(pb.full_variable_assignment()));

        // first word: byte 0 lowest
        FieldT expected = FieldT::zero();
        for (std::size_t i = 30; i-- > 0;)
            expected = expected * FieldT(256) + pb.val(bytes[i]);
        BEAST_EXPECT(values[0] == expected);

        auto words = unpackLargerWords<FieldT>(values, 8, 30, 65);
        bool same = true;
        for (std::size_t i = 0; i < 65; ++i)
            same = same && words[i] == (i * 37 + 11) % 256;
        BEAST_EXPECT(same);
    }
};

BEAST_DEFINE_TESTSUITE(LongElement, zkp, vanet);

}  // namespace zkp
}  // namespace vanet
