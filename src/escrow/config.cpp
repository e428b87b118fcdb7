// MILESCROW - Escrow Instance Configuration Implementation
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include <milescrow/escrow/config.h>
#include <milescrow/util/config.h>
#include <milescrow/util/logging.h>

#include <limits>
#include <sstream>

namespace milescrow {
namespace escrow {

namespace {

// Read an optional unsigned key, failing if present but malformed
Status ReadUInt(const util::ConfigManager& config, const std::string& key,
                uint64_t maxValue, uint64_t& out) {
    if (!config.HasKey(key, ESCROW_CONFIG_SECTION)) {
        return Status::Ok();
    }
    auto value = config.TryGetUInt(key, ESCROW_CONFIG_SECTION);
    if (!value || *value > maxValue) {
        return Status::Validation("invalid value for " + key);
    }
    out = *value;
    return Status::Ok();
}

} // namespace

Status EscrowConfig::FromConfig(const util::ConfigManager& config, EscrowConfig& out) {
    EscrowConfig result;

    for (const auto& key : config.UnknownKeys(ESCROW_CONFIG_SECTION,
                                              {"threshold_percentage", "max_recipients",
                                               "participant_capability", "executor_capability",
                                               "pool_id", "use_registry_anchor"})) {
        LOG_WARN(util::LogCategory::CONFIG) << "Ignoring unknown key [escrow] " << key;
    }

    uint64_t threshold = result.thresholdPercentage;
    uint64_t maxRecipients = result.maxRecipients;
    constexpr uint64_t u32max = std::numeric_limits<uint32_t>::max();

    Status s = ReadUInt(config, "threshold_percentage", u32max, threshold);
    if (s.ok()) s = ReadUInt(config, "max_recipients", u32max, maxRecipients);
    if (s.ok()) {
        s = ReadUInt(config, "participant_capability", std::numeric_limits<uint64_t>::max(),
                     result.participantCapability);
    }
    if (s.ok()) {
        s = ReadUInt(config, "executor_capability", std::numeric_limits<uint64_t>::max(),
                     result.executorCapability);
    }
    if (s.ok()) {
        s = ReadUInt(config, "pool_id", std::numeric_limits<uint64_t>::max(), result.poolId);
    }
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::CONFIG) << s.ToString();
        return s;
    }

    if (config.HasKey("use_registry_anchor", ESCROW_CONFIG_SECTION)) {
        auto anchor = config.TryGetBool("use_registry_anchor", ESCROW_CONFIG_SECTION);
        if (!anchor) {
            LOG_ERROR(util::LogCategory::CONFIG) << "invalid value for use_registry_anchor";
            return Status::Validation("invalid value for use_registry_anchor");
        }
        result.useRegistryAnchor = *anchor;
    }

    result.thresholdPercentage = static_cast<uint32_t>(threshold);
    result.maxRecipients = static_cast<uint32_t>(maxRecipients);

    s = result.Validate();
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::CONFIG) << s.ToString();
        return s;
    }

    out = result;
    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded " << out.ToString();
    return Status::Ok();
}

Status EscrowConfig::Validate() const {
    // Crossing is strict, so at 100% no side could ever win a round
    if (thresholdPercentage == 0 || thresholdPercentage > 99) {
        return Status::Validation("threshold_percentage must be in 1..99");
    }
    if (maxRecipients == 0) {
        return Status::Validation("max_recipients must be at least 1");
    }
    if (participantCapability == executorCapability) {
        return Status::Validation("participant and executor capabilities must differ");
    }
    return Status::Ok();
}

std::string EscrowConfig::ToString() const {
    std::ostringstream ss;
    ss << "EscrowConfig(threshold=" << thresholdPercentage << "%"
       << ", maxRecipients=" << maxRecipients
       << ", participantCap=" << participantCapability
       << ", executorCap=" << executorCapability
       << ", pool=" << poolId
       << ", anchors=" << (useRegistryAnchor ? "yes" : "no") << ")";
    return ss.str();
}

} // namespace escrow
} // namespace milescrow
