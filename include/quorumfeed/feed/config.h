// QUORUMFEED - Feed Configuration
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#ifndef QUORUMFEED_FEED_CONFIG_H
#define QUORUMFEED_FEED_CONFIG_H

#include "quorumfeed/core/types.h"

#include <string>

namespace quorumfeed {

namespace util {
class ConfigManager;
}

namespace feed {

/// Default pair description
constexpr const char* DEFAULT_DESCRIPTION = "DTO / USD";

/// Default fee per oracle signature
constexpr Amount DEFAULT_PAYMENT_AMOUNT = 10;

/// Default submitter share, per mille of each payment
constexpr int64_t DEFAULT_REWARD_RATE_X10 = 100;

/// Contract identity derived from a description: last 20 bytes of its Keccak-256
Address DeriveContractAddress(const std::string& description);

/**
 * Parameters of one aggregator instance.
 */
struct FeedConfig {
    /// Fee paid per verified signature
    Amount paymentAmount{DEFAULT_PAYMENT_AMOUNT};

    /// Per-mille of each payment reserved for the submitter (0..1000)
    int64_t rewardRateX10{DEFAULT_REWARD_RATE_X10};

    /// Pair description, part of every signed report
    std::string description{DEFAULT_DESCRIPTION};

    /// Identity of this aggregator, part of every signed report
    Address contractAddress{DeriveContractAddress(DEFAULT_DESCRIPTION)};

    /// Quorum threshold (1..100)
    uint32_t minThresholdPercent{66};

    /// Gas budget of one validator call
    uint64_t validatorGasLimit{100000};

    /**
     * Read the feed keys from a parsed configuration. Missing keys keep
     * their defaults; contractaddress defaults to one derived from the
     * description.
     * @throws FeedError InvalidConfig for unparsable or out-of-range values
     */
    static FeedConfig Load(const util::ConfigManager& config);

    /// @throws FeedError InvalidConfig if any field is out of range
    void Validate() const;
};

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_CONFIG_H
