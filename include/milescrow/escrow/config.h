// MILESCROW - Escrow Instance Configuration
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#ifndef MILESCROW_ESCROW_CONFIG_H
#define MILESCROW_ESCROW_CONFIG_H

#include <milescrow/core/types.h>
#include <milescrow/escrow/status.h>

#include <string>

namespace milescrow {

namespace util {
class ConfigManager;
}

namespace escrow {

/// Config file section holding escrow parameters
constexpr const char* ESCROW_CONFIG_SECTION = "escrow";

/**
 * Per-instance parameters of a milestone escrow.
 */
struct EscrowConfig {
    /// Share of the total supply a side must strictly exceed (1..99)
    uint32_t thresholdPercentage{77};

    /// Maximum number of simultaneously accepted recipients
    uint32_t maxRecipients{1};

    /// Capability identifying participants (voters)
    CapabilityId participantCapability{1};

    /// Capability issued to accepted recipients
    CapabilityId executorCapability{2};

    /// Ledger pool backing this escrow
    PoolId poolId{1};

    /// Recipients register on behalf of a profile anchor
    bool useRegistryAnchor{false};

    /**
     * Load from the [escrow] section. Missing keys keep their defaults.
     *
     * @return Validation error naming the first malformed key
     */
    static Status FromConfig(const util::ConfigManager& config, EscrowConfig& out);

    /// Check value ranges
    Status Validate() const;

    std::string ToString() const;
};

} // namespace escrow
} // namespace milescrow

#endif // MILESCROW_ESCROW_CONFIG_H
