// MILESCROW - Escrow Events Implementation
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include <milescrow/escrow/events.h>

#include <sstream>

namespace milescrow {
namespace escrow {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::RecipientStatusChanged: return "RecipientStatusChanged";
        case EventType::MilestoneSubmitted: return "MilestoneSubmitted";
        case EventType::SubmittedMilestoneReviewed: return "SubmittedMilestoneReviewed";
        case EventType::MilestoneStatusChanged: return "MilestoneStatusChanged";
        case EventType::MilestonesOffered: return "MilestonesOffered";
        case EventType::MilestonesReviewed: return "MilestonesReviewed";
        case EventType::MilestonesReset: return "MilestonesReset";
        case EventType::MilestonePaid: return "MilestonePaid";
        case EventType::ProjectRejected: return "ProjectRejected";
        case EventType::ProjectRejectDeclined: return "ProjectRejectDeclined";
        case EventType::StrategyExecuted: return "StrategyExecuted";
        default: return "Unknown";
    }
}

std::string EscrowEvent::ToString() const {
    std::ostringstream ss;
    ss << EventTypeToString(type) << "(recipient=" << ShortAddress(recipientId);

    switch (type) {
        case EventType::MilestoneSubmitted:
        case EventType::MilestoneStatusChanged:
        case EventType::SubmittedMilestoneReviewed:
            ss << ", index=" << milestoneIndex
               << ", status=" << EscrowStatusToString(status);
            break;
        case EventType::MilestonePaid:
            ss << ", index=" << milestoneIndex << ", amount=" << amount;
            break;
        case EventType::MilestonesOffered:
            ss << ", count=" << count << ", plan=" << planHash.ToHex().substr(0, 16);
            break;
        case EventType::ProjectRejected:
            ss << ", refunded=" << amount;
            break;
        default:
            ss << ", status=" << EscrowStatusToString(status);
            break;
    }

    ss << ")";
    return ss.str();
}

} // namespace escrow
} // namespace milescrow
