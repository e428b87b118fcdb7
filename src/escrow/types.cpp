// MILESCROW - Escrow Types Implementation
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include <milescrow/escrow/types.h>
#include <milescrow/crypto/sha256.h>

#include <iomanip>
#include <sstream>

namespace milescrow {
namespace escrow {

// ============================================================================
// String Conversion Functions
// ============================================================================

const char* EscrowStatusToString(EscrowStatus status) {
    switch (status) {
        case EscrowStatus::None: return "None";
        case EscrowStatus::Pending: return "Pending";
        case EscrowStatus::Accepted: return "Accepted";
        case EscrowStatus::Rejected: return "Rejected";
        case EscrowStatus::Appealed: return "Appealed";
        case EscrowStatus::InReview: return "InReview";
        case EscrowStatus::Canceled: return "Canceled";
        default: return "Unknown";
    }
}

std::optional<EscrowStatus> ParseEscrowStatus(const std::string& str) {
    if (str == "None" || str == "none") return EscrowStatus::None;
    if (str == "Pending" || str == "pending") return EscrowStatus::Pending;
    if (str == "Accepted" || str == "accepted") return EscrowStatus::Accepted;
    if (str == "Rejected" || str == "rejected") return EscrowStatus::Rejected;
    if (str == "Appealed" || str == "appealed") return EscrowStatus::Appealed;
    if (str == "InReview" || str == "inreview") return EscrowStatus::InReview;
    if (str == "Canceled" || str == "canceled") return EscrowStatus::Canceled;
    return std::nullopt;
}

const char* StrategyStateToString(StrategyState state) {
    switch (state) {
        case StrategyState::None: return "None";
        case StrategyState::Active: return "Active";
        case StrategyState::Executed: return "Executed";
        case StrategyState::Rejected: return "Rejected";
        default: return "Unknown";
    }
}

// ============================================================================
// Transition Tables
// ============================================================================

bool IsValidRecipientTransition(EscrowStatus from, EscrowStatus to) {
    switch (from) {
        case EscrowStatus::None:
            return to == EscrowStatus::Pending;
        case EscrowStatus::Pending:
            return to == EscrowStatus::Pending ||
                   to == EscrowStatus::Accepted ||
                   to == EscrowStatus::Rejected;
        case EscrowStatus::Accepted:
            return to == EscrowStatus::Rejected;
        default:
            return false;
    }
}

bool IsValidPlanReviewTransition(EscrowStatus from, EscrowStatus to) {
    switch (from) {
        case EscrowStatus::None:
            return to == EscrowStatus::Pending;
        case EscrowStatus::Pending:
            return to == EscrowStatus::Pending || to == EscrowStatus::Accepted;
        default:
            return false;
    }
}

bool IsValidMilestoneTransition(EscrowStatus from, EscrowStatus to) {
    switch (from) {
        case EscrowStatus::None:
        case EscrowStatus::Rejected:
            return to == EscrowStatus::Pending;
        case EscrowStatus::Pending:
            return to == EscrowStatus::Pending ||
                   to == EscrowStatus::Accepted ||
                   to == EscrowStatus::Rejected;
        default:
            return false;
    }
}

// ============================================================================
// Records
// ============================================================================

std::string Milestone::ToString() const {
    std::ostringstream ss;
    ss << "Milestone(" << FormatPercentage(amountPercentage)
       << ", " << EscrowStatusToString(status);
    if (!metadata.pointer.empty()) {
        ss << ", " << metadata.pointer;
    }
    ss << ")";
    return ss.str();
}

std::string Recipient::ToString() const {
    std::ostringstream ss;
    ss << "Recipient(" << ShortAddress(recipientId)
       << ", status=" << EscrowStatusToString(recipientStatus)
       << ", plan=" << EscrowStatusToString(milestonesReviewStatus)
       << ", grant=" << grantAmount
       << ", next=" << nextMilestone << ")";
    return ss.str();
}

// ============================================================================
// Utility Functions
// ============================================================================

std::optional<uint64_t> SumPercentages(const std::vector<Milestone>& milestones) {
    uint64_t total = 0;
    for (const auto& m : milestones) {
        if (m.amountPercentage > UINT64_MAX - total) {
            return std::nullopt;
        }
        total += m.amountPercentage;
    }
    return total;
}

Hash256 CalculatePlanHash(const std::vector<Milestone>& milestones) {
    SHA256 hasher;
    hasher.WriteUInt64(milestones.size());
    for (const auto& m : milestones) {
        hasher.WriteUInt64(m.amountPercentage);
        hasher.WriteUInt64(m.metadata.protocol);
        hasher.WriteUInt64(m.metadata.pointer.size());
        hasher.Write(m.metadata.pointer);
    }
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);
    return Hash256(out, sizeof(out));
}

Amount CalculateMilestonePayout(Amount grantAmount, uint64_t percentage) {
    if (grantAmount <= 0) return 0;
    return static_cast<Amount>(
        MulDiv(static_cast<uint64_t>(grantAmount), percentage, PRECISION));
}

std::string FormatPercentage(uint64_t fraction) {
    // Hundredths of a percent
    uint64_t scaled = MulDiv(fraction, 10000, PRECISION);
    std::ostringstream ss;
    ss << scaled / 100;
    uint64_t frac = scaled % 100;
    if (frac > 0) {
        ss << "." << std::setfill('0') << std::setw(2) << frac;
        std::string s = ss.str();
        s.erase(s.find_last_not_of('0') + 1);
        return s + "%";
    }
    return ss.str() + "%";
}

} // namespace escrow
} // namespace milescrow
