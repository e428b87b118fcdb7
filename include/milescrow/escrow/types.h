// MILESCROW - Escrow Types
// Copyright (c) 2024 MILESCROW Developers
// MIT License
//
// Value types shared by the escrow workflows: statuses, recipients,
// milestones and the strategy state machine.

#ifndef MILESCROW_ESCROW_TYPES_H
#define MILESCROW_ESCROW_TYPES_H

#include <milescrow/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace milescrow {
namespace escrow {

// ============================================================================
// Status Enums
// ============================================================================

/**
 * Review status shared by recipients, milestone plans and milestones.
 *
 * Which transitions are legal depends on the entity; see the
 * IsValid*Transition functions below.
 */
enum class EscrowStatus : uint8_t {
    None = 0,
    Pending,
    Accepted,
    Rejected,
    Appealed,
    InReview,
    Canceled
};

/// Convert status to string
const char* EscrowStatusToString(EscrowStatus status);

/// Parse status from string
std::optional<EscrowStatus> ParseEscrowStatus(const std::string& str);

/// True for the two values a reviewer may vote with
inline bool IsReviewDecision(EscrowStatus status) {
    return status == EscrowStatus::Accepted || status == EscrowStatus::Rejected;
}

/// Recipient record transitions (Rejected means the record is removed)
bool IsValidRecipientTransition(EscrowStatus from, EscrowStatus to);

/// Milestone plan review transitions
bool IsValidPlanReviewTransition(EscrowStatus from, EscrowStatus to);

/// Individual milestone transitions (Accepted is final)
bool IsValidMilestoneTransition(EscrowStatus from, EscrowStatus to);

/// Lifecycle of the whole escrow instance
enum class StrategyState : uint8_t {
    None = 0,
    Active,
    Executed,
    Rejected
};

const char* StrategyStateToString(StrategyState state);

// ============================================================================
// Records
// ============================================================================

/// Off-chain document reference
struct Metadata {
    uint64_t protocol{0};
    std::string pointer;

    bool operator==(const Metadata& other) const {
        return protocol == other.protocol && pointer == other.pointer;
    }
    bool operator!=(const Metadata& other) const { return !(*this == other); }
};

/**
 * One tranche of a recipient's grant.
 */
struct Milestone {
    /// Share of the grant, PRECISION == 100%
    uint64_t amountPercentage{0};

    /// Plan description, replaced by the evidence on submission
    Metadata metadata;

    EscrowStatus status{EscrowStatus::None};

    std::string ToString() const;
};

/**
 * A party proposed to receive the grant.
 */
struct Recipient {
    /// Identity the recipient is known by (caller or registry anchor)
    Address recipientId;

    /// Address that receives payouts and the executor capability
    Address recipientAddress;

    bool useRegistryAnchor{false};

    /// Grant requested at registration (0 = everything unallocated)
    Amount requestedGrant{0};

    /// Grant fixed when the recipient was accepted
    Amount grantAmount{0};

    Metadata metadata;

    EscrowStatus recipientStatus{EscrowStatus::None};

    EscrowStatus milestonesReviewStatus{EscrowStatus::None};

    /// Index of the next milestone due for payout
    size_t nextMilestone{0};

    std::string ToString() const;
};

/**
 * Registration payload supplied by a prospective recipient.
 */
struct RecipientRegistration {
    Address recipientAddress;

    /// Profile anchor to act for (required when anchors are enabled)
    std::optional<Address> registryAnchor;

    Amount requestedGrant{0};

    Metadata metadata;
};

// ============================================================================
// Utility Functions
// ============================================================================

/// Sum of milestone percentages; nullopt on overflow
std::optional<uint64_t> SumPercentages(const std::vector<Milestone>& milestones);

/// Content digest of a milestone plan (percentages and metadata, in order)
Hash256 CalculatePlanHash(const std::vector<Milestone>& milestones);

/// Payout for one milestone: grant * percentage / PRECISION
Amount CalculateMilestonePayout(Amount grantAmount, uint64_t percentage);

/// Format a fixed-point fraction as a percentage string ("77.5%")
std::string FormatPercentage(uint64_t fraction);

} // namespace escrow
} // namespace milescrow

#endif // MILESCROW_ESCROW_TYPES_H
