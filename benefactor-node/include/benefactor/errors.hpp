#pragma once

#include <string>
#include <utility>

namespace benefactor {

/**
 * @brief Failure taxonomy surfaced to callers
 *
 * None of these are retried internally. A failed call leaves ledger,
 * roster and registry exactly as they were before the call.
 */
enum class ErrorCode : int {
    Ok = 0,
    InvalidAmount = 1,            // amount == 0
    TransferFailed = 2,           // payment rail declined
    ProofVerificationFailed = 3,  // verifier returned false
    TokenNotFound = 4,            // unminted / out-of-range token id
    Unauthorized = 5,             // non-administrator on an admin action
    InvalidAddress = 6,           // zero / unparsable address
    StorageFailure = 7            // state commit rejected by the database
};

const char* error_name(ErrorCode code);

/**
 * @brief Outcome of an operation without a return value
 */
struct Status {
    ErrorCode code{ErrorCode::Ok};
    std::string error;

    bool ok() const { return code == ErrorCode::Ok; }

    static Status success() { return Status{}; }
    static Status failure(ErrorCode code, std::string message) {
        return Status{code, std::move(message)};
    }
};

/**
 * @brief Value or typed failure
 */
template <typename T>
struct Result {
    T value{};
    ErrorCode code{ErrorCode::Ok};
    std::string error;

    bool ok() const { return code == ErrorCode::Ok; }
    Status status() const { return Status{code, error}; }

    static Result success(T value) {
        Result r;
        r.value = std::move(value);
        return r;
    }
    static Result failure(ErrorCode code, std::string message) {
        Result r;
        r.code = code;
        r.error = std::move(message);
        return r;
    }
};

} // namespace benefactor
