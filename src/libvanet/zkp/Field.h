#ifndef VANET_ZKP_FIELD_H
#define VANET_ZKP_FIELD_H

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

namespace vanet {
namespace zkp {

using DefaultCurve = libff::alt_bn128_pp;
using FieldT = libff::Fr<DefaultCurve>;

/**
 * Initialize elliptic curve parameters for proofs.
 * Uses alt_bn128 curve which provides ~128 bits of security.
 *
 * MUST be called before creating any circuit or gadget.
 * Idempotent.
 */
void initCurveParameters();

}  // namespace zkp
}  // namespace vanet

#endif  // VANET_ZKP_FIELD_H
