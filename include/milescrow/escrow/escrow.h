// MILESCROW - Weighted-Vote Milestone Escrow
// Copyright (c) 2024 MILESCROW Developers
// MIT License
//
// One escrow instance per funded project. Participants vote with weights
// derived from their contributions to accept a recipient, lock in its
// milestone plan, release each milestone payout, or abort the project
// with a pro-rata refund.

#ifndef MILESCROW_ESCROW_ESCROW_H
#define MILESCROW_ESCROW_ESCROW_H

#include <milescrow/core/types.h>
#include <milescrow/escrow/collaborators.h>
#include <milescrow/escrow/config.h>
#include <milescrow/escrow/events.h>
#include <milescrow/escrow/status.h>
#include <milescrow/escrow/types.h>
#include <milescrow/escrow/vote_tally.h>
#include <milescrow/escrow/voting_power.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace milescrow {
namespace escrow {

/**
 * Milestone escrow context.
 *
 * Every mutating operation is a transaction: internal state is changed
 * first, capability grants and ledger transfers are issued last, and a
 * failure before any value has moved restores the previous state and
 * drops the events the operation produced. If the ledger fails after
 * some transfers of a batch went through, the commit stands and every
 * unsent transfer is recorded as owed to its account until
 * RetryOwedTransfers delivers it. Events reach the callback only after
 * the outermost operation commits.
 *
 * Calls from other threads are serialized. A collaborator may call back
 * into the escrow on the same thread (for example from a transfer hook)
 * and observes the already committed state.
 */
class MilestoneEscrow {
public:
    MilestoneEscrow(const EscrowConfig& config,
                    std::shared_ptr<AuthorizationOracle> oracle,
                    std::shared_ptr<PoolLedger> ledger,
                    std::shared_ptr<ProfileDirectory> profiles = nullptr);
    ~MilestoneEscrow();

    MilestoneEscrow(const MilestoneEscrow&) = delete;
    MilestoneEscrow& operator=(const MilestoneEscrow&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * Fix the participant weights and activate the escrow.
     *
     * @param contributions Amount contributed per participant
     * @return State if already initialized, Ledger if the pool is unknown
     */
    Status Initialize(const std::map<Address, Amount>& contributions);

    // ========================================================================
    // Recipients
    // ========================================================================

    /// Register (or update) a pending recipient
    Status RegisterRecipient(const Address& caller, const RecipientRegistration& registration);

    /// Vote to accept or reject a registered recipient
    Status ReviewRecipient(const Address& caller, const Address& recipientId,
                           EscrowStatus status);

    // ========================================================================
    // Milestone Plan
    // ========================================================================

    /**
     * Propose a milestone plan for an accepted recipient.
     *
     * Replaces any plan still under review. A participant proposer's
     * weight counts as an accept vote.
     */
    Status OfferMilestones(const Address& caller, const Address& recipientId,
                           const std::vector<Milestone>& milestones);

    /// Vote on the plan under review; acceptance requires percentages summing to 100%
    Status ReviewOfferedMilestones(const Address& caller, const Address& recipientId,
                                   EscrowStatus status);

    // ========================================================================
    // Milestone Submission
    // ========================================================================

    /// Submit evidence that a milestone is complete
    Status SubmitMilestone(const Address& caller, const Address& recipientId,
                           size_t index, const Metadata& evidence);

    /// Vote on a submitted milestone; acceptance releases due payouts in order
    Status ReviewSubmittedMilestone(const Address& caller, const Address& recipientId,
                                    size_t index, EscrowStatus status);

    // ========================================================================
    // Project Abort
    // ========================================================================

    /// Vote to abort the project (Accepted) or keep it running (Rejected)
    Status RejectProject(const Address& caller, EscrowStatus status);

    // ========================================================================
    // Owed Transfers
    // ========================================================================

    /**
     * Reissue every transfer left owed by an interrupted payout or refund.
     *
     * Allowed in any strategy state. Each owed amount is paid at most once;
     * whatever the ledger still refuses stays owed.
     *
     * @return State if nothing is owed, Ledger if a transfer failed
     */
    Status RetryOwedTransfers();

    /// Value committed to an account but not yet transferred
    Amount GetOwedAmount(const Address& account) const;

    /// Sum of all owed transfers
    Amount GetTotalOwed() const;

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<Recipient> GetRecipient(const Address& recipientId) const;

    /// None for unknown recipients
    EscrowStatus GetRecipientStatus(const Address& recipientId) const;

    /// Binding milestone list (empty until a plan is accepted)
    std::vector<Milestone> GetMilestones(const Address& recipientId) const;

    /// Plan currently under review (empty if none)
    std::vector<Milestone> GetOfferedMilestones(const Address& recipientId) const;

    EscrowStatus GetMilestoneStatus(const Address& recipientId, size_t index) const;

    StrategyState GetStrategyState() const;

    /// Pool value not yet paid out or refunded
    Amount GetPoolAmount() const;

    /// Grant value promised to accepted recipients and not yet paid
    Amount GetAllocatedGrants() const;

    bool IsPoolActive() const;

    size_t GetAcceptedRecipientCount() const;

    /// Weight a side must strictly exceed
    uint64_t GetThreshold() const;

    uint64_t GetVotingPower(const Address& participant) const;

    bool HasVotedOnRecipient(const Address& voter, const Address& recipientId) const;
    bool HasVotedOnOffer(const Address& voter, const Address& recipientId) const;
    bool HasVotedOnMilestone(const Address& voter, const Address& recipientId,
                             size_t index) const;
    bool HasVotedOnAbort(const Address& voter) const;

    const EscrowConfig& GetConfig() const { return config_; }

    // ========================================================================
    // Callbacks
    // ========================================================================

    void SetEventCallback(EventCallback callback);

private:
    /// Per-recipient record with its plan and vote rounds
    struct RecipientEntry {
        Recipient record;
        VoteTally reviewTally;

        std::vector<Milestone> milestones;
        std::vector<Milestone> offered;
        bool offerInFlight{false};
        VoteTally offerTally;

        std::map<size_t, VoteTally> milestoneTallies;

        /// Value already paid to this recipient
        Amount paid{0};

        /// Accepted milestone payouts reserved against custody, not yet paid
        Amount reserved{0};
    };

    /// Everything a failed operation must restore
    struct State {
        StrategyState strategy{StrategyState::None};
        VotingPowerRegistry registry;
        uint64_t threshold{0};
        AssetId asset{0};
        Amount poolAmount{0};
        Amount allocatedGrants{0};
        bool poolActive{false};
        std::map<Address, RecipientEntry> recipients;
        VoteTally abortTally;

        /// Transfers committed but refused by the ledger, per account
        std::map<Address, Amount> owed;
    };

    struct PendingTransfer {
        Address to;
        Amount amount{0};
    };

    /// External calls queued by an operation, issued after commit
    struct Effects {
        std::vector<std::pair<CapabilityId, Address>> grants;
        std::vector<std::pair<CapabilityId, Address>> revocations;
        std::vector<PendingTransfer> transfers;
    };

    using Operation = std::function<Status(Effects&)>;

    /// Run an operation as a transaction (see class comment)
    Status Execute(const char* name, const Operation& operation);

    Status CheckTransferCoverage(const Effects& effects) const;
    Status ApplyCapabilityChanges(const Effects& effects);
    void DeliverEvents();
    void Emit(EscrowEvent event);

    // Operation bodies
    Status DoInitialize(const std::map<Address, Amount>& contributions);
    Status DoRegisterRecipient(const Address& caller, const RecipientRegistration& registration);
    Status DoReviewRecipient(const Address& caller, const Address& recipientId,
                             EscrowStatus status, Effects& effects);
    Status DoOfferMilestones(const Address& caller, const Address& recipientId,
                             const std::vector<Milestone>& milestones);
    Status DoReviewOfferedMilestones(const Address& caller, const Address& recipientId,
                                     EscrowStatus status);
    Status DoSubmitMilestone(const Address& caller, const Address& recipientId,
                             size_t index, const Metadata& evidence, Effects& effects);
    Status DoReviewSubmittedMilestone(const Address& caller, const Address& recipientId,
                                      size_t index, EscrowStatus status, Effects& effects);
    Status DoRejectProject(const Address& caller, EscrowStatus status, Effects& effects);
    Status DoRetryOwedTransfers(Effects& effects);

    // Shared checks
    Status RequireActive() const;
    Status CheckParticipant(const Address& caller) const;
    Status CheckRecipientOrParticipant(const Address& caller, const RecipientEntry& entry) const;
    Status CastWeightedVote(VoteTally& tally, const Address& voter, bool support,
                            const char* subject);
    RecipientEntry* FindEntry(const Address& recipientId);
    const RecipientEntry* FindEntry(const Address& recipientId) const;

    // Vote resolution
    Status ResolveOfferVote(RecipientEntry& entry);
    Status ResolveMilestoneVote(RecipientEntry& entry, size_t index, Effects& effects);

    /**
     * Reserve an accepted milestone's payout against ledger custody.
     *
     * Custody already owed or reserved for other payouts is unavailable.
     *
     * @return Capacity if the payout cannot be covered
     */
    Status Allocate(RecipientEntry& entry, size_t index);

    /// Pay accepted milestones in order starting at the next-due pointer
    void Distribute(RecipientEntry& entry, Effects& effects);

    Amount TotalOwed() const;
    Amount TotalReserved() const;

    /// True when every accepted recipient has a locked plan paid in full
    bool AllPlansComplete() const;

    EscrowConfig config_;
    std::shared_ptr<AuthorizationOracle> oracle_;
    std::shared_ptr<PoolLedger> ledger_;
    std::shared_ptr<ProfileDirectory> profiles_;

    mutable std::recursive_mutex mutex_;
    State state_;
    int depth_{0};
    std::vector<EscrowEvent> pendingEvents_;
    EventCallback eventCallback_;
};

} // namespace escrow
} // namespace milescrow

#endif // MILESCROW_ESCROW_ESCROW_H
