#include <libvanet/zkp/Field.h>

namespace vanet {
namespace zkp {

void initCurveParameters() {
    static bool initialized = false;
    if (!initialized) {
        DefaultCurve::init_public_params();
        initialized = true;
    }
}

}  // namespace zkp
}  // namespace vanet
