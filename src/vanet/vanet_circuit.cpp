#include <libvanet/zkp/BigNum.h>
#include <libvanet/zkp/Errors.h>
#include <libvanet/zkp/RsaUtil.h>
#include <libvanet/zkp/VanetProver.h>
#include <libvanet/zkp/WitnessSynthesizer.h>
#include <libvanet/zkp/circuits/VanetCircuit.h>

#include <xrpl/basics/Log.h>

#include <iostream>
#include <string>

namespace {

int
usage(const char* program)
{
    std::cerr << "usage: " << program
              << " [keyBits] [plaintextBytes] [--prove <keyBasePath>]\n";
    return 2;
}

// Builds the statement, evaluates it on a fresh witness and optionally
// proves and verifies it.
int
run(vanet::zkp::VanetCircuitConfig const& config,
    std::string const& keyBasePath,
    ripple::Logs& logs)
{
    using namespace vanet::zkp;

    auto const j = logs.journal("VanetCircuit");

    VanetCircuit circuit(config, j);
    circuit.generateConstraints();
    std::cout << config.circuitName << ": " << circuit.getNumConstraints()
              << " constraints\n";

    WitnessSynthesizer synthesizer(config, logs.journal("WitnessSynthesizer"));
    auto const witness = synthesizer.synthesize();
    std::cout << "PlainText: "
              << std::string(witness.plaintext.begin(), witness.plaintext.end())
              << "\n";

    circuit.generateWitness(witness);
    auto const check = circuit.check();

    std::cout << "Is Signature valid? " << (circuit.isSignatureValid() ? 1 : 0)
              << "\n";
    std::cout << "Output cipher text:";
    for (auto const& word : circuit.getCipherTextWords())
    {
        std::cout << ' ' << bignumToHex(fieldToBignum(word).get(), 60);
    }
    std::cout << "\n";

    auto const decrypted =
        RsaUtil::decryptPkcs1(witness.vehicleKey.get(), circuit.getCipherText());
    std::cout << "Cipher text decrypts to the plaintext: "
              << (decrypted == witness.plaintext ? "yes" : "no") << "\n";

    if (!check.satisfied)
    {
        std::cout << "Constraint system NOT satisfied: constraint "
                  << check.constraintIndex << " in " << check.component
                  << "\n";
        return 1;
    }
    std::cout << "Constraint system satisfied\n";

    if (keyBasePath.empty())
        return 0;

    VanetProver prover(logs.journal("VanetProver"));
    if (!prover.loadKeys(keyBasePath, circuit))
    {
        if (!prover.generateKeys(circuit) || !prover.saveKeys(keyBasePath))
            return 1;
    }

    auto const proof = prover.prove(circuit);
    if (proof.empty())
        return 1;

    auto const publicInput = VanetCircuit::makePrimaryInput(
        config,
        witness.raModulus.get(),
        witness.plaintext,
        circuit.isSignatureValid(),
        witness.cipherText);
    bool const verified = prover.verify(proof.proof, publicInput);
    std::cout << "Proof: " << proof.proof.size() << " bytes, verification "
              << (verified ? "PASS" : "FAIL") << "\n";
    return verified ? 0 : 1;
}

}  // namespace

int
main(int argc, char** argv)
{
    using namespace vanet::zkp;

    VanetCircuitConfig config;
    std::string keyBasePath;

    try
    {
        int positional = 0;
        for (int i = 1; i < argc; ++i)
        {
            std::string const arg = argv[i];
            if (arg == "--prove")
            {
                if (i + 1 >= argc)
                    return usage(argv[0]);
                keyBasePath = argv[++i];
            }
            else if (positional == 0)
            {
                config.rsaKeyLength = std::stoul(arg);
                ++positional;
            }
            else if (positional == 1)
            {
                config.plaintextLength = std::stoul(arg);
                ++positional;
            }
            else
            {
                return usage(argv[0]);
            }
        }
    }
    catch (std::logic_error const&)
    {
        return usage(argv[0]);
    }
    config.circuitName = "vanet_rsa" + std::to_string(config.rsaKeyLength);

    ripple::Logs logs(beast::severities::kInfo);

    try
    {
        return run(config, keyBasePath, logs);
    }
    catch (ConfigurationError const& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    }
    catch (CryptoError const& e)
    {
        std::cerr << "Cryptography error during " << e.operation() << ": "
                  << e.what() << "\n";
        return 3;
    }
    catch (ConsistencyError const& e)
    {
        std::cerr << "Consistency error: " << e.what() << "\n";
        return 4;
    }
    catch (std::exception const& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
