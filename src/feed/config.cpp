// QUORUMFEED - Feed Configuration Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/config.h"
#include "quorumfeed/crypto/keccak256.h"
#include "quorumfeed/feed/errors.h"
#include "quorumfeed/feed/funds_ledger.h"
#include "quorumfeed/util/config.h"
#include "quorumfeed/util/logging.h"

#include <stdexcept>

namespace quorumfeed {
namespace feed {

namespace {

int64_t ReadInt(const util::ConfigManager& config, const char* key, int64_t defaultValue) {
    if (!config.HasKey(key)) {
        return defaultValue;
    }
    auto value = config.TryGetInt(key);
    if (!value) {
        throw FeedError(FeedErrorCode::InvalidConfig,
                        std::string(key) + " is not an integer: " + config.GetString(key, ""));
    }
    return *value;
}

} // anonymous namespace

Address DeriveContractAddress(const std::string& description) {
    Hash256 digest = Keccak256Hash(description);
    return Address(digest.data() + 12, 20);
}

FeedConfig FeedConfig::Load(const util::ConfigManager& config) {
    using util::ConfigKeys::CONTRACT_ADDRESS;

    FeedConfig result;
    result.paymentAmount = ReadInt(config, util::ConfigKeys::PAYMENT_AMOUNT,
                                   DEFAULT_PAYMENT_AMOUNT);
    result.rewardRateX10 = ReadInt(config, util::ConfigKeys::REWARD_RATE_X10,
                                   DEFAULT_REWARD_RATE_X10);
    result.description = config.GetString(util::ConfigKeys::DESCRIPTION, DEFAULT_DESCRIPTION);

    int64_t threshold = ReadInt(config, util::ConfigKeys::MIN_THRESHOLD_PERCENT, 66);
    if (threshold < 1 || threshold > 100) {
        throw FeedError(FeedErrorCode::InvalidConfig,
                        "minthresholdpercent out of range: " + std::to_string(threshold));
    }
    result.minThresholdPercent = static_cast<uint32_t>(threshold);

    int64_t gasLimit = ReadInt(config, util::ConfigKeys::VALIDATOR_GAS_LIMIT, 100000);
    if (gasLimit <= 0) {
        throw FeedError(FeedErrorCode::InvalidConfig,
                        "validatorgaslimit must be positive: " + std::to_string(gasLimit));
    }
    result.validatorGasLimit = static_cast<uint64_t>(gasLimit);

    if (config.HasKey(CONTRACT_ADDRESS)) {
        std::string hex = config.GetString(CONTRACT_ADDRESS, "");
        try {
            result.contractAddress = Address::FromHex(hex);
        } catch (const std::invalid_argument&) {
            throw FeedError(FeedErrorCode::InvalidConfig,
                            "contractaddress is not a 20-byte hex address: " + hex);
        }
    } else {
        result.contractAddress = DeriveContractAddress(result.description);
    }

    result.Validate();

    LOG_DEBUG(util::LogCategory::CONFIG) << "Feed '" << result.description
        << "' at " << result.contractAddress.ToString()
        << ": payment " << result.paymentAmount
        << ", reward rate " << result.rewardRateX10 << "/1000"
        << ", threshold " << result.minThresholdPercent << "%";

    return result;
}

void FeedConfig::Validate() const {
    if (paymentAmount <= 0) {
        throw FeedError(FeedErrorCode::InvalidConfig,
                        "paymentamount must be positive: " + std::to_string(paymentAmount));
    }
    if (rewardRateX10 < 0 || rewardRateX10 > REWARD_RATE_DENOMINATOR) {
        throw FeedError(FeedErrorCode::InvalidConfig,
                        "rewardratex10 out of range: " + std::to_string(rewardRateX10));
    }
    if (description.empty()) {
        throw FeedError(FeedErrorCode::InvalidConfig, "description is empty");
    }
    if (minThresholdPercent < 1 || minThresholdPercent > 100) {
        throw FeedError(FeedErrorCode::InvalidConfig,
                        "minthresholdpercent out of range: " +
                        std::to_string(minThresholdPercent));
    }
    if (validatorGasLimit == 0) {
        throw FeedError(FeedErrorCode::InvalidConfig, "validatorgaslimit is zero");
    }
}

} // namespace feed
} // namespace quorumfeed
