#pragma once

#include <memory>
#include "benefactor/types.hpp"

namespace benefactor {
namespace verification {

/**
 * @brief Proof-of-payment verifier
 *
 * Implementations must never throw on malformed input: an empty or
 * all-zero proof, or a zero claimant, yields false. Callers treat every
 * false uniformly as a failed verification.
 */
class ProofVerifier {
public:
    virtual ~ProofVerifier() = default;
    virtual bool verify(const ProofData& proof, const Address& claimant) const noexcept = 0;
    virtual const char* name() const noexcept = 0;
};

/**
 * @brief Accepts any non-empty proof from a non-zero claimant
 *
 * Stand-in until a succinct proof check is wired in.
 */
class AlwaysAcceptNonEmpty : public ProofVerifier {
public:
    bool verify(const ProofData& proof, const Address& claimant) const noexcept override;
    const char* name() const noexcept override { return "always-accept-non-empty"; }
};

std::shared_ptr<ProofVerifier> make_verifier(const std::string& name);

} // namespace verification
} // namespace benefactor
