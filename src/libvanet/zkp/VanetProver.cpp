#include <libvanet/zkp/VanetProver.h>

#include <xrpl/basics/Log.h>

#include <libff/common/profiling.hpp>

#include <fstream>
#include <sstream>

namespace vanet {
namespace zkp {

VanetProver::VanetProver(beast::Journal j) : j_(j)
{
    initCurveParameters();
}

void VanetProver::quietProfiling() const
{
    // libff prints progress to stdout unless inhibited
    libff::inhibit_profiling_info = !j_.trace().active();
    libff::inhibit_profiling_counters = !j_.trace().active();
}

bool VanetProver::generateKeys(const VanetCircuit& circuit)
{
    try {
        quietProfiling();
        auto cs = circuit.getConstraintSystem();
        if (cs.num_constraints() == 0) {
            JLOG(j_.error()) << "Circuit has no constraints; generate them first";
            return false;
        }

        JLOG(j_.info()) << "Running key generator for " << cs.num_constraints()
                        << " constraints";
        auto keypair = libsnark::r1cs_gg_ppzksnark_generator<DefaultCurve>(cs);

        provingKey_ = std::make_shared<libsnark::r1cs_gg_ppzksnark_proving_key<DefaultCurve>>(std::move(keypair.pk));
        verificationKey_ = std::make_shared<libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>>(std::move(keypair.vk));

        JLOG(j_.info()) << "Keys generated";
        return true;
    } catch (const std::exception& e) {
        JLOG(j_.error()) << "Error generating keys: " << e.what();
        return false;
    }
}

bool VanetProver::saveKeys(const std::string& basePath) const
{
    if (!hasKeys()) {
        JLOG(j_.error()) << "No keys to save";
        return false;
    }

    try {
        std::ofstream pk_file(basePath + "_pk", std::ios::binary);
        std::ofstream vk_file(basePath + "_vk", std::ios::binary);
        if (!pk_file || !vk_file) {
            JLOG(j_.error()) << "Cannot open key files at " << basePath;
            return false;
        }

        pk_file << *provingKey_;
        vk_file << *verificationKey_;
        if (!pk_file || !vk_file) {
            JLOG(j_.error()) << "Writing keys to " << basePath << " failed";
            return false;
        }

        JLOG(j_.debug()) << "Saved keys to " << basePath;
        return true;
    } catch (const std::exception& e) {
        JLOG(j_.error()) << "Error saving keys: " << e.what();
        return false;
    }
}

bool VanetProver::loadKeys(const std::string& basePath, const VanetCircuit& circuit)
{
    try {
        std::ifstream pk_file(basePath + "_pk", std::ios::binary);
        std::ifstream vk_file(basePath + "_vk", std::ios::binary);
        if (!pk_file.good() || !vk_file.good()) {
            JLOG(j_.debug()) << "No existing keys at " << basePath;
            return false;
        }

        auto pk = std::make_shared<libsnark::r1cs_gg_ppzksnark_proving_key<DefaultCurve>>();
        auto vk = std::make_shared<libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>>();
        pk_file >> *pk;
        vk_file >> *vk;

        auto const expected = circuit.getNumConstraints();
        if (pk->constraint_system.num_constraints() != expected) {
            JLOG(j_.warn()) << "Key constraint count ("
                            << pk->constraint_system.num_constraints()
                            << ") does not match circuit (" << expected << ")";
            return false;
        }

        provingKey_ = std::move(pk);
        verificationKey_ = std::move(vk);
        JLOG(j_.debug()) << "Loaded keys with " << expected << " constraints";
        return true;
    } catch (const std::exception& e) {
        JLOG(j_.error()) << "Error loading keys: " << e.what();
        return false;
    }
}

bool VanetProver::hasKeys() const
{
    return provingKey_ && verificationKey_;
}

ProofData VanetProver::prove(const VanetCircuit& circuit) const
{
    try {
        if (!provingKey_) {
            JLOG(j_.error()) << "Proving key not available";
            return {};
        }

        auto const check = circuit.check();
        if (!check.satisfied) {
            JLOG(j_.error()) << "Refusing to prove: constraint "
                             << check.constraintIndex << " in "
                             << check.component << " is not satisfied";
            return {};
        }

        quietProfiling();
        auto primary_input = circuit.getPrimaryInput();
        auto proof = libsnark::r1cs_gg_ppzksnark_prover<DefaultCurve>(
            *provingKey_, primary_input, circuit.getAuxiliaryInput());

        JLOG(j_.info()) << "Proof generated";
        return ProofData{serializeProof(proof), std::move(primary_input)};
    } catch (const std::exception& e) {
        JLOG(j_.error()) << "Error creating proof: " << e.what();
        return {};
    }
}

bool VanetProver::verify(const ProofData& proofData) const
{
    return verify(proofData.proof, proofData.primaryInput);
}

bool VanetProver::verify(
    const std::vector<unsigned char>& proof,
    const libsnark::r1cs_primary_input<FieldT>& primaryInput) const
{
    try {
        if (!verificationKey_) {
            JLOG(j_.error()) << "Verification key not available";
            return false;
        }
        if (proof.empty()) {
            JLOG(j_.debug()) << "Empty proof";
            return false;
        }

        quietProfiling();
        bool const result = libsnark::r1cs_gg_ppzksnark_verifier_strong_IC<DefaultCurve>(
            *verificationKey_, primaryInput, deserializeProof(proof));

        JLOG(j_.debug()) << "Verification result: " << (result ? "PASS" : "FAIL");
        return result;
    } catch (const std::exception& e) {
        JLOG(j_.error()) << "Error verifying proof: " << e.what();
        return false;
    }
}

std::vector<unsigned char> VanetProver::serializeProof(
    const libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>& proof)
{
    std::ostringstream oss;
    oss << proof;

    std::string str = oss.str();
    return std::vector<unsigned char>(str.begin(), str.end());
}

libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve> VanetProver::deserializeProof(
    const std::vector<unsigned char>& proofData)
{
    std::string str(proofData.begin(), proofData.end());
    std::istringstream iss(str);

    libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve> proof;
    iss >> proof;

    return proof;
}

} // namespace zkp
} // namespace vanet
