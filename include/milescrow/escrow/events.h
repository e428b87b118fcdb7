// MILESCROW - Escrow Events
// Copyright (c) 2024 MILESCROW Developers
// MIT License
//
// Notifications emitted by the escrow after an operation commits.

#ifndef MILESCROW_ESCROW_EVENTS_H
#define MILESCROW_ESCROW_EVENTS_H

#include <milescrow/core/types.h>
#include <milescrow/escrow/types.h>

#include <functional>
#include <string>

namespace milescrow {
namespace escrow {

enum class EventType : uint8_t {
    RecipientStatusChanged,
    MilestoneSubmitted,
    SubmittedMilestoneReviewed,
    MilestoneStatusChanged,
    MilestonesOffered,
    MilestonesReviewed,
    MilestonesReset,
    MilestonePaid,
    ProjectRejected,
    ProjectRejectDeclined,
    StrategyExecuted
};

const char* EventTypeToString(EventType type);

/**
 * A single escrow notification.
 *
 * Fields not meaningful for a given type are left at their defaults.
 */
struct EscrowEvent {
    EventType type{EventType::RecipientStatusChanged};

    /// Recipient the event concerns
    Address recipientId;

    /// Caller whose action produced the event (voter or submitter)
    Address actor;

    /// Milestone index for milestone events
    size_t milestoneIndex{0};

    /// New or voted status
    EscrowStatus status{EscrowStatus::None};

    /// Value moved (MilestonePaid, ProjectRejected)
    Amount amount{0};

    /// Number of milestones offered
    size_t count{0};

    /// Digest of an offered plan
    Hash256 planHash;

    /// Evidence of a submitted milestone
    Metadata metadata;

    std::string ToString() const;
};

using EventCallback = std::function<void(const EscrowEvent&)>;

} // namespace escrow
} // namespace milescrow

#endif // MILESCROW_ESCROW_EVENTS_H
