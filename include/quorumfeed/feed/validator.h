// QUORUMFEED - Answer Validator
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Optional external consistency check run after each new answer. The call is
// metered by a GasMeter and its outcome never affects the submission.

#ifndef QUORUMFEED_FEED_VALIDATOR_H
#define QUORUMFEED_FEED_VALIDATOR_H

#include "quorumfeed/core/types.h"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace quorumfeed {
namespace feed {

/// Execution budget granted to one validator call
constexpr uint64_t VALIDATOR_GAS_LIMIT = 100000;

// ============================================================================
// Gas Metering
// ============================================================================

/// Thrown by GasMeter::Consume once the budget is exhausted
class OutOfGasError : public std::runtime_error {
public:
    OutOfGasError(uint64_t limit, uint64_t requested);
};

/**
 * Counts work done by a validator against a fixed limit.
 */
class GasMeter {
public:
    explicit GasMeter(uint64_t limit = VALIDATOR_GAS_LIMIT) : limit_(limit) {}

    /**
     * Charge amount units.
     * @throws OutOfGasError if the charge would exceed the limit; the meter
     *         is left exhausted
     */
    void Consume(uint64_t amount);

    uint64_t Used() const { return used_; }
    uint64_t Remaining() const { return limit_ - used_; }
    uint64_t Limit() const { return limit_; }

private:
    uint64_t limit_;
    uint64_t used_{0};
};

// ============================================================================
// Validator Interface
// ============================================================================

class AnswerValidator {
public:
    virtual ~AnswerValidator() = default;

    /**
     * Judge a new answer against the previous one.
     * @return false to flag the answer as suspicious
     */
    virtual bool Validate(RoundId prevRoundId, Price prevAnswer,
                          RoundId roundId, Price answer, GasMeter& gas) = 0;
};

/// Outcome of a guarded validator call
struct ValidatorOutcome {
    bool ok{true};
    std::string reason;
};

/**
 * Run validator with a fresh GasMeter of gasLimit. A false verdict, an
 * OutOfGasError or any thrown value is turned into ok = false with a
 * reason; nothing escapes.
 */
ValidatorOutcome GuardedValidatorCall(AnswerValidator& validator,
                                      RoundId prevRoundId, Price prevAnswer,
                                      RoundId roundId, Price answer,
                                      uint64_t gasLimit = VALIDATOR_GAS_LIMIT) noexcept;

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_VALIDATOR_H
