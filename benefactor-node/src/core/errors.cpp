#include "benefactor/errors.hpp"

namespace benefactor {

const char* error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidAmount: return "InvalidAmount";
        case ErrorCode::TransferFailed: return "TransferFailed";
        case ErrorCode::ProofVerificationFailed: return "ProofVerificationFailed";
        case ErrorCode::TokenNotFound: return "TokenNotFound";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::InvalidAddress: return "InvalidAddress";
        case ErrorCode::StorageFailure: return "StorageFailure";
    }
    return "Unknown";
}

} // namespace benefactor
