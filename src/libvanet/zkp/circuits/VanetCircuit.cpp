#include <libvanet/zkp/circuits/VanetCircuit.h>
#include <libvanet/zkp/Errors.h>
#include <libvanet/zkp/WitnessSynthesizer.h>
#include <libvanet/zkp/gadgets/BitwidthRestrictionGadget.h>
#include <libvanet/zkp/gadgets/LongElement.h>
#include <libvanet/zkp/gadgets/LongElementLessThanGadget.h>
#include <libvanet/zkp/gadgets/RsaEncryptionGadget.h>
#include <libvanet/zkp/gadgets/RsaSigVerificationGadget.h>
#include <libvanet/zkp/gadgets/Sha256Gadget.h>
#include <libvanet/zkp/gadgets/WordPacking.h>

#include <xrpl/basics/Log.h>

#include <algorithm>
#include <stdexcept>

namespace vanet {
namespace zkp {

using libsnark::pb_linear_combination;
using libsnark::pb_linear_combination_array;
using libsnark::pb_variable;
using libsnark::pb_variable_array;

//------------------------------------------------------------------------------

void
VanetCircuitConfig::validate() const
{
    constexpr std::size_t w = LongElement<FieldT>::CHUNK_BITWIDTH;
    if (rsaKeyLength == 0 || rsaKeyLength % w != 0)
        throw ConfigurationError(
            "RSA key length " + std::to_string(rsaKeyLength) +
            " is not a multiple of " + std::to_string(w));
    if (rsaKeyLength < 512)
        throw ConfigurationError(
            "RSA key length " + std::to_string(rsaKeyLength) +
            " is below 512 bits");
    if (plaintextLength == 0)
        throw ConfigurationError("plaintext length must be positive");
    if (plaintextLength > rsaKeyLength / 8 - 11)
        throw ConfigurationError(
            "plaintext of " + std::to_string(plaintextLength) +
            " bytes exceeds the PKCS#1 v1.5 limit of " +
            std::to_string(rsaKeyLength / 8 - 11) + " bytes");
}

std::size_t
VanetCircuitConfig::modulusLimbs() const
{
    return LongElement<FieldT>::numLimbsFor(rsaKeyLength);
}

std::size_t
VanetCircuitConfig::randomnessLength() const
{
    return RsaEncryptionGadget<FieldT>::getExpectedRandomnessLength(
        rsaKeyLength, plaintextLength);
}

std::size_t
VanetCircuitConfig::cipherTextWords() const
{
    return (cipherTextLength() + CIPHER_TEXT_WORDS_PER_PACKED - 1) /
        CIPHER_TEXT_WORDS_PER_PACKED;
}

//------------------------------------------------------------------------------

class VanetCircuit::Impl
{
public:
    VanetCircuitConfig config_;
    beast::Journal j_;
    std::shared_ptr<libsnark::protoboard<FieldT>> pb_;

    // ===== PUBLIC INPUTS (PRIMARY) =====
    LongElement<FieldT> raModulus_;
    pb_variable_array<FieldT> plaintext_;
    pb_variable<FieldT> signatureValid_;
    pb_variable_array<FieldT> cipherTextWords_;

    // ===== PRIVATE INPUTS (AUXILIARY) =====
    pb_variable_array<FieldT> publicKeyHex_;
    LongElement<FieldT> signature_;
    LongElement<FieldT> vehicleModulus_;
    pb_variable_array<FieldT> randomness_;

    // ===== GADGETS =====
    std::unique_ptr<BitwidthRestrictionGadget<FieldT>> publicKeyBytes_;
    std::unique_ptr<Sha256Gadget<FieldT>> publicKeyHash_;
    std::unique_ptr<BitwidthRestrictionGadget<FieldT>> signatureRange_;
    std::unique_ptr<LongElementLessThanGadget<FieldT>> signatureBelowModulus_;
    std::unique_ptr<RsaSigVerificationGadget<FieldT>> signatureVerification_;
    std::unique_ptr<BitwidthRestrictionGadget<FieldT>> vehicleModulusRange_;
    std::unique_ptr<RsaEncryptionGadget<FieldT>> encryption_;
    pb_linear_combination_array<FieldT> packedCipherText_;

    struct ComponentRange
    {
        std::string name;
        std::size_t begin;
        std::size_t end;
    };
    std::vector<ComponentRange> components_;
    bool constraintsGenerated_ = false;

    Impl(VanetCircuitConfig config, beast::Journal j)
        : config_(std::move(config))
        , j_(j)
    {
        config_.validate();
        initCurveParameters();
        pb_ = std::make_shared<libsnark::protoboard<FieldT>>();

        std::size_t const keyBits = config_.rsaKeyLength;

        // Public inputs are allocated first so they form the primary input
        raModulus_ = LongElement<FieldT>::allocate(*pb_, keyBits, "ra_modulus");
        plaintext_.allocate(*pb_, config_.plaintextLength, "plaintext");
        signatureValid_.allocate(*pb_, "signature_valid");
        cipherTextWords_.allocate(
            *pb_, config_.cipherTextWords(), "cipher_text_words");
        pb_->set_input_sizes(
            raModulus_.size() + plaintext_.size() + 1 +
            cipherTextWords_.size());

        publicKeyHex_.allocate(
            *pb_, config_.publicKeyHexLength(), "public_key_hex");
        signature_ = LongElement<FieldT>::allocate(*pb_, keyBits, "signature");
        vehicleModulus_ =
            LongElement<FieldT>::allocate(*pb_, keyBits, "vehicle_modulus");
        randomness_.allocate(*pb_, config_.randomnessLength(), "randomness");

        // Certificate: hash of the hex public key, signed by the authority
        publicKeyBytes_ = std::make_unique<BitwidthRestrictionGadget<FieldT>>(
            *pb_,
            pb_linear_combination_array<FieldT>(publicKeyHex_),
            8,
            "public_key_bytes");
        publicKeyHash_ = std::make_unique<Sha256Gadget<FieldT>>(
            *pb_,
            *publicKeyBytes_,
            publicKeyHex_.size(),
            false,
            true,
            "public_key_hash");
        signatureRange_ = std::make_unique<BitwidthRestrictionGadget<FieldT>>(
            *pb_, signature_, "signature_range");
        signatureBelowModulus_ =
            std::make_unique<LongElementLessThanGadget<FieldT>>(
                *pb_, signature_, raModulus_, "signature_below_ra_modulus");
        signatureVerification_ =
            std::make_unique<RsaSigVerificationGadget<FieldT>>(
                *pb_,
                raModulus_,
                publicKeyHash_->getOutputWires(),
                signature_,
                keyBits,
                "signature_verification");

        // Encryption of the plaintext under the vehicle key
        vehicleModulusRange_ =
            std::make_unique<BitwidthRestrictionGadget<FieldT>>(
                *pb_, vehicleModulus_, "vehicle_modulus_range");
        encryption_ = std::make_unique<RsaEncryptionGadget<FieldT>>(
            *pb_,
            vehicleModulus_,
            pb_linear_combination_array<FieldT>(plaintext_),
            pb_linear_combination_array<FieldT>(randomness_),
            keyBits,
            "encryption");

        for (auto const& word : packWordsIntoLargerWords<FieldT>(
                 encryption_->getOutputWires(),
                 VanetCircuitConfig::CIPHER_TEXT_WORD_BITWIDTH,
                 VanetCircuitConfig::CIPHER_TEXT_WORDS_PER_PACKED))
        {
            pb_linear_combination<FieldT> packed;
            packed.assign(*pb_, word);
            packedCipherText_.emplace_back(packed);
        }

        JLOG(j_.debug()) << config_.circuitName << ": allocated "
                         << pb_->num_inputs() << " public and "
                         << pb_->num_variables() - pb_->num_inputs()
                         << " private variables";
    }

    template <typename F>
    void
    component(const std::string& name, F&& addConstraints)
    {
        std::size_t const begin = pb_->num_constraints();
        addConstraints();
        components_.push_back({name, begin, pb_->num_constraints()});
        JLOG(j_.debug()) << config_.circuitName << ": " << name << " adds "
                         << pb_->num_constraints() - begin << " constraints";
    }

    void
    generateConstraints()
    {
        if (constraintsGenerated_)
            return;
        constraintsGenerated_ = true;

        component("public_key_bytes", [&] {
            publicKeyBytes_->generate_r1cs_constraints();
        });
        component("public_key_hash", [&] {
            publicKeyHash_->generate_r1cs_constraints();
        });
        component("signature_range", [&] {
            signatureRange_->generate_r1cs_constraints();
        });
        component("signature_below_ra_modulus", [&] {
            signatureBelowModulus_->generate_r1cs_constraints(true);
        });
        component("signature_verification", [&] {
            signatureVerification_->generate_r1cs_constraints();
        });
        component("vehicle_modulus_range", [&] {
            vehicleModulusRange_->generate_r1cs_constraints();
        });
        component("encryption", [&] {
            encryption_->generate_r1cs_constraints();
        });
        component("randomness_compliance", [&] {
            encryption_->checkRandomnessCompliance();
        });
        component("outputs", [&] {
            pb_->add_r1cs_constraint(
                libsnark::r1cs_constraint<FieldT>(
                    1,
                    signatureValid_,
                    signatureVerification_->getOutputWire()),
                "signature_valid_output");
            for (std::size_t i = 0; i < cipherTextWords_.size(); ++i)
            {
                pb_->add_r1cs_constraint(
                    libsnark::r1cs_constraint<FieldT>(
                        1, cipherTextWords_[i], packedCipherText_[i]),
                    "cipher_text_output_" + std::to_string(i));
            }
        });

        JLOG(j_.info()) << config_.circuitName << ": "
                        << pb_->num_constraints() << " constraints";
    }

    void
    generateWitness(const VanetWitness& witness)
    {
        if (!constraintsGenerated_)
            throw std::logic_error(
                "generateConstraints() must run before generateWitness()");

        std::size_t const keyBits = config_.rsaKeyLength;
        auto requireLength = [](const char* what,
                                std::size_t actual,
                                std::size_t expected) {
            if (actual != expected)
                throw std::invalid_argument(
                    std::string(what) + " has length " +
                    std::to_string(actual) + ", expected " +
                    std::to_string(expected));
        };
        auto requireInteger = [keyBits](const char* what, const BIGNUM* value) {
            if (value == nullptr)
                throw std::invalid_argument(std::string(what) + " is missing");
            if (BN_is_negative(value) ||
                static_cast<std::size_t>(BN_num_bits(value)) > keyBits)
                throw std::invalid_argument(
                    std::string(what) + " does not fit in " +
                    std::to_string(keyBits) + " bits");
        };

        requireLength(
            "plaintext", witness.plaintext.size(), config_.plaintextLength);
        requireLength(
            "public key hex",
            witness.publicKeyHex.size(),
            config_.publicKeyHexLength());
        requireLength(
            "randomness",
            witness.randomness.size(),
            config_.randomnessLength());
        requireInteger("authority modulus", witness.raModulus.get());
        requireInteger("signature", witness.signature.get());
        requireInteger("vehicle modulus", witness.vehicleModulus.get());

        raModulus_.assign(*pb_, witness.raModulus.get());
        for (std::size_t i = 0; i < plaintext_.size(); ++i)
            pb_->val(plaintext_[i]) = FieldT(witness.plaintext[i]);
        for (std::size_t i = 0; i < publicKeyHex_.size(); ++i)
            pb_->val(publicKeyHex_[i]) = FieldT(witness.publicKeyHex[i]);
        signature_.assign(*pb_, witness.signature.get());
        vehicleModulus_.assign(*pb_, witness.vehicleModulus.get());
        for (std::size_t i = 0; i < randomness_.size(); ++i)
            pb_->val(randomness_[i]) = FieldT(witness.randomness[i]);

        publicKeyBytes_->generate_r1cs_witness();
        publicKeyHash_->generate_r1cs_witness();
        signatureRange_->generate_r1cs_witness();
        signatureBelowModulus_->generate_r1cs_witness();
        signatureVerification_->generate_r1cs_witness();
        vehicleModulusRange_->generate_r1cs_witness();
        encryption_->generate_r1cs_witness();

        pb_->val(signatureValid_) =
            pb_->val(signatureVerification_->getOutputWire());
        packedCipherText_.evaluate(*pb_);
        for (std::size_t i = 0; i < cipherTextWords_.size(); ++i)
            pb_->val(cipherTextWords_[i]) = pb_->lc_val(packedCipherText_[i]);

        JLOG(j_.debug()) << config_.circuitName << ": witness assigned, "
                         << "signature valid = "
                         << (pb_->val(signatureValid_) == FieldT::one());
    }

    CircuitCheck
    check() const
    {
        CircuitCheck result;
        auto const cs = pb_->get_constraint_system();
        auto const assignment = pb_->full_variable_assignment();
        for (std::size_t i = 0; i < cs.constraints.size(); ++i)
        {
            auto const& c = cs.constraints[i];
            if (c.a.evaluate(assignment) * c.b.evaluate(assignment) ==
                c.c.evaluate(assignment))
                continue;

            result.satisfied = false;
            result.constraintIndex = i;
            result.component = "unattributed";
            for (auto const& range : components_)
            {
                if (i >= range.begin && i < range.end)
                {
                    result.component = range.name;
                    break;
                }
            }
            JLOG(j_.warn()) << config_.circuitName << ": constraint " << i
                            << " in " << result.component
                            << " is not satisfied";
            break;
        }
        return result;
    }
};

//------------------------------------------------------------------------------

VanetCircuit::VanetCircuit(VanetCircuitConfig config, beast::Journal j)
    : impl_(std::make_unique<Impl>(std::move(config), j))
{
}

VanetCircuit::~VanetCircuit() = default;

void
VanetCircuit::generateConstraints()
{
    impl_->generateConstraints();
}

void
VanetCircuit::generateWitness(const VanetWitness& witness)
{
    impl_->generateWitness(witness);
}

CircuitCheck
VanetCircuit::check() const
{
    return impl_->check();
}

bool
VanetCircuit::isSatisfied() const
{
    return impl_->pb_->is_satisfied();
}

bool
VanetCircuit::isSignatureValid() const
{
    return impl_->pb_->val(impl_->signatureValid_) == FieldT::one();
}

std::vector<FieldT>
VanetCircuit::getCipherTextWords() const
{
    return impl_->cipherTextWords_.get_vals(*impl_->pb_);
}

std::vector<std::uint8_t>
VanetCircuit::getCipherText() const
{
    auto const& config = impl_->config_;
    auto const littleEndian = unpackLargerWords<FieldT>(
        getCipherTextWords(),
        VanetCircuitConfig::CIPHER_TEXT_WORD_BITWIDTH,
        VanetCircuitConfig::CIPHER_TEXT_WORDS_PER_PACKED,
        config.cipherTextLength());

    std::vector<std::uint8_t> bytes(littleEndian.rbegin(), littleEndian.rend());
    return bytes;
}

std::vector<std::uint8_t>
VanetCircuit::getPublicKeyDigest() const
{
    return impl_->publicKeyHash_->digestBytes();
}

libsnark::r1cs_primary_input<FieldT>
VanetCircuit::makePrimaryInput(
    const VanetCircuitConfig& config,
    const BIGNUM* raModulus,
    const std::vector<std::uint8_t>& plaintext,
    bool signatureValid,
    const std::vector<std::uint8_t>& cipherText)
{
    config.validate();
    initCurveParameters();
    if (plaintext.size() != config.plaintextLength ||
        cipherText.size() != config.cipherTextLength())
        throw std::invalid_argument("public values do not match the circuit");

    libsnark::r1cs_primary_input<FieldT> input;
    for (auto limb : bignumToLimbs(
             raModulus,
             config.modulusLimbs(),
             LongElement<FieldT>::CHUNK_BITWIDTH))
        input.push_back(FieldT(static_cast<long>(limb), true));
    for (auto byte : plaintext)
        input.push_back(FieldT(byte));
    input.push_back(signatureValid ? FieldT::one() : FieldT::zero());

    FieldT const byteShift = FieldT(256);
    for (std::size_t w = 0; w < config.cipherTextWords(); ++w)
    {
        FieldT word = FieldT::zero();
        FieldT weight = FieldT::one();
        for (std::size_t j = w * VanetCircuitConfig::CIPHER_TEXT_WORDS_PER_PACKED;
             j < (w + 1) * VanetCircuitConfig::CIPHER_TEXT_WORDS_PER_PACKED &&
             j < cipherText.size();
             ++j)
        {
            // j counts from the least significant byte
            word += FieldT(cipherText[cipherText.size() - 1 - j]) * weight;
            weight *= byteShift;
        }
        input.push_back(word);
    }
    return input;
}

const VanetCircuitConfig&
VanetCircuit::getConfig() const
{
    return impl_->config_;
}

std::size_t
VanetCircuit::getNumConstraints() const
{
    return impl_->pb_->num_constraints();
}

libsnark::r1cs_constraint_system<FieldT>
VanetCircuit::getConstraintSystem() const
{
    return impl_->pb_->get_constraint_system();
}

libsnark::r1cs_primary_input<FieldT>
VanetCircuit::getPrimaryInput() const
{
    return impl_->pb_->primary_input();
}

libsnark::r1cs_auxiliary_input<FieldT>
VanetCircuit::getAuxiliaryInput() const
{
    return impl_->pb_->auxiliary_input();
}

std::shared_ptr<libsnark::protoboard<FieldT>>
VanetCircuit::getProtoboard() const
{
    return impl_->pb_;
}

}  // namespace zkp
}  // namespace vanet
