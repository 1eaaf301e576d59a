#ifndef VANET_ZKP_ERRORS_H
#define VANET_ZKP_ERRORS_H

#include <stdexcept>
#include <string>
#include <utility>

namespace vanet {
namespace zkp {

// Invalid key / plaintext length combination. Raised while the circuit is
// being composed, before any witness work.
class ConfigurationError : public std::invalid_argument
{
public:
    explicit ConfigurationError(std::string const& what)
        : std::invalid_argument(what)
    {
    }
};

// Failure inside the host cryptography library during witness synthesis.
class CryptoError : public std::runtime_error
{
public:
    CryptoError(std::string operation, std::string const& detail)
        : std::runtime_error(operation + " failed: " + detail)
        , operation_(std::move(operation))
    {
    }

    std::string const&
    operation() const
    {
        return operation_;
    }

private:
    std::string operation_;
};

// The host library's PKCS#1 v1.5 layout disagrees with what the encryption
// gadget expects. Never retried.
class ConsistencyError : public std::logic_error
{
public:
    explicit ConsistencyError(std::string const& what)
        : std::logic_error(what)
    {
    }
};

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_ERRORS_H
