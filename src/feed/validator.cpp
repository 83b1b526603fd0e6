// QUORUMFEED - Answer Validator Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/validator.h"

namespace quorumfeed {
namespace feed {

OutOfGasError::OutOfGasError(uint64_t limit, uint64_t requested)
    : std::runtime_error("out of gas: requested " + std::to_string(requested) +
                         " with limit " + std::to_string(limit)) {}

void GasMeter::Consume(uint64_t amount) {
    if (amount > limit_ - used_) {
        uint64_t requested = used_ + amount < used_ ? UINT64_MAX : used_ + amount;
        used_ = limit_;
        throw OutOfGasError(limit_, requested);
    }
    used_ += amount;
}

ValidatorOutcome GuardedValidatorCall(AnswerValidator& validator,
                                      RoundId prevRoundId, Price prevAnswer,
                                      RoundId roundId, Price answer,
                                      uint64_t gasLimit) noexcept {
    ValidatorOutcome outcome;
    GasMeter gas(gasLimit);

    try {
        if (!validator.Validate(prevRoundId, prevAnswer, roundId, answer, gas)) {
            outcome.ok = false;
            outcome.reason = "answer rejected";
        }
    } catch (const OutOfGasError& e) {
        outcome.ok = false;
        outcome.reason = e.what();
    } catch (const std::exception& e) {
        outcome.ok = false;
        outcome.reason = std::string("validator threw: ") + e.what();
    } catch (...) {
        outcome.ok = false;
        outcome.reason = "validator threw a non-standard exception";
    }

    return outcome;
}

} // namespace feed
} // namespace quorumfeed
