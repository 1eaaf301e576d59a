#ifndef VANET_ZKP_VANET_PROVER_H
#define VANET_ZKP_VANET_PROVER_H

#include <libvanet/zkp/Field.h>
#include <libvanet/zkp/circuits/VanetCircuit.h>

#include <xrpl/beast/utility/Journal.h>

#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <memory>
#include <string>
#include <vector>

namespace vanet {
namespace zkp {

// Structure to hold proof + public inputs
struct ProofData {
    std::vector<unsigned char> proof;
    libsnark::r1cs_primary_input<FieldT> primaryInput;

    bool empty() const { return proof.empty(); }
};

/**
 * Groth16 (r1cs_gg_ppzksnark) keys and proofs for a VanetCircuit.
 *
 * Failures are logged and reported as false or an empty ProofData.
 */
class VanetProver {
public:
    explicit VanetProver(
        beast::Journal j = beast::Journal{beast::Journal::getNullSink()});

    // Key management; the circuit's constraints must be generated
    bool generateKeys(const VanetCircuit& circuit);
    bool saveKeys(const std::string& basePath) const;
    /** Fails when the stored keys were made for a different circuit. */
    bool loadKeys(const std::string& basePath, const VanetCircuit& circuit);
    bool hasKeys() const;

    /** Proof for the circuit's current (satisfying) assignment. */
    ProofData prove(const VanetCircuit& circuit) const;

    bool verify(const ProofData& proofData) const;
    bool verify(
        const std::vector<unsigned char>& proof,
        const libsnark::r1cs_primary_input<FieldT>& primaryInput) const;

private:
    beast::Journal j_;
    std::shared_ptr<libsnark::r1cs_gg_ppzksnark_proving_key<DefaultCurve>> provingKey_;
    std::shared_ptr<libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>> verificationKey_;

    void quietProfiling() const;

    static std::vector<unsigned char> serializeProof(
        const libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>& proof);
    static libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve> deserializeProof(
        const std::vector<unsigned char>& proofData);
};

} // namespace zkp
} // namespace vanet

#endif // VANET_ZKP_VANET_PROVER_H
