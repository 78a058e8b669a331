#include "benefactor/verifier.hpp"

namespace benefactor {
namespace verification {

bool AlwaysAcceptNonEmpty::verify(const ProofData& proof, const Address& claimant) const noexcept {
    if (proof.is_empty() || claimant.is_zero()) {
        return false;
    }
    return true;
}

std::shared_ptr<ProofVerifier> make_verifier(const std::string& name) {
    if (name.empty() || name == "always-accept-non-empty" || name == "mock") {
        return std::make_shared<AlwaysAcceptNonEmpty>();
    }
    return nullptr;
}

} // namespace verification
} // namespace benefactor
