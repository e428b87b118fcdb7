// MILESCROW - Recipient Lifecycle Tests
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include "escrow_fixture.h"

#include <milescrow/util/logging.h>

namespace milescrow {
namespace escrow {
namespace test {

class RecipientTest : public EscrowTestBase {};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(RecipientTest, InitializeActivatesEscrow) {
    InitializeDefault();
    EXPECT_EQ(escrow_->GetStrategyState(), StrategyState::Active);
    EXPECT_TRUE(escrow_->IsPoolActive());
    EXPECT_EQ(escrow_->GetPoolAmount(), kPoolBalance);
    EXPECT_EQ(escrow_->GetThreshold(), 770000000000000000ULL);
    EXPECT_EQ(escrow_->GetVotingPower(p1_), PRECISION / 10 * 4);
    EXPECT_EQ(escrow_->GetVotingPower(outsider_), 0u);
}

TEST_F(RecipientTest, InitializeTwiceFails) {
    InitializeDefault();
    EXPECT_TRUE(escrow_->Initialize({{p1_, 1}}).IsState());
    EXPECT_EQ(escrow_->GetVotingPower(p1_), PRECISION / 10 * 4);
}

TEST_F(RecipientTest, InitializeUnknownPool) {
    config_.poolId = kPool + 1;
    CreateEscrow();
    EXPECT_TRUE(escrow_->Initialize({{p1_, 1}}).IsLedger());
    EXPECT_EQ(escrow_->GetStrategyState(), StrategyState::None);
}

TEST_F(RecipientTest, InitializeInvalidInputs) {
    CreateEscrow();
    EXPECT_TRUE(escrow_->Initialize({}).IsValidation());

    config_.thresholdPercentage = 0;
    CreateEscrow();
    EXPECT_TRUE(escrow_->Initialize({{p1_, 1}}).IsValidation());
    EXPECT_EQ(escrow_->GetStrategyState(), StrategyState::None);
}

TEST_F(RecipientTest, OperationsRequireActiveStrategy) {
    CreateEscrow();
    EXPECT_TRUE(RegisterRecipient().IsState());
    EXPECT_TRUE(escrow_->RejectProject(p1_, EscrowStatus::Accepted).IsState());
}

// ============================================================================
// Registration
// ============================================================================

TEST_F(RecipientTest, RegisterCreatesPendingRecord) {
    InitializeDefault();
    ASSERT_TRUE(RegisterRecipient(1000).ok());

    auto r = escrow_->GetRecipient(recipient_);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->recipientStatus, EscrowStatus::Pending);
    EXPECT_EQ(r->recipientAddress, recipient_);
    EXPECT_EQ(r->requestedGrant, 1000);
    EXPECT_EQ(r->metadata.pointer, "ipfs://proposal");

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].type, EventType::RecipientStatusChanged);
    EXPECT_EQ(events_[0].status, EscrowStatus::Pending);
}

TEST_F(RecipientTest, RegisterValidatesPayload) {
    InitializeDefault();
    RecipientRegistration reg;
    EXPECT_TRUE(escrow_->RegisterRecipient(recipient_, reg).IsValidation());

    reg.recipientAddress = recipient_;
    reg.requestedGrant = -1;
    EXPECT_TRUE(escrow_->RegisterRecipient(recipient_, reg).IsValidation());
    EXPECT_FALSE(escrow_->GetRecipient(recipient_).has_value());
    EXPECT_TRUE(events_.empty());
}

TEST_F(RecipientTest, ReRegistrationResetsVotes) {
    InitializeDefault();
    ASSERT_TRUE(RegisterRecipient(100).ok());
    ASSERT_TRUE(escrow_->ReviewRecipient(p1_, recipient_, EscrowStatus::Accepted).ok());
    EXPECT_TRUE(escrow_->HasVotedOnRecipient(p1_, recipient_));

    ASSERT_TRUE(RegisterRecipient(200).ok());
    EXPECT_FALSE(escrow_->HasVotedOnRecipient(p1_, recipient_));
    EXPECT_EQ(escrow_->GetRecipient(recipient_)->requestedGrant, 200);
}

TEST_F(RecipientTest, RegisterAcceptedRecipientFails) {
    InitializeDefault();
    AcceptRecipient();
    Status s = RegisterRecipient();
    EXPECT_TRUE(s.IsState());
    EXPECT_NE(s.message().find("Accepted"), std::string::npos);

    // Acceptance is not repeatable either
    EXPECT_TRUE(escrow_->ReviewRecipient(p1_, recipient_, EscrowStatus::Accepted).IsState());
    EXPECT_FALSE(escrow_->HasVotedOnRecipient(p1_, recipient_));
}

// ============================================================================
// Review Voting
// ============================================================================

TEST_F(RecipientTest, FortyThirtyThirtyAcceptsExactlyOnce) {
    InitializeDefault();
    ASSERT_TRUE(RegisterRecipient().ok());

    ASSERT_TRUE(escrow_->ReviewRecipient(p1_, recipient_, EscrowStatus::Accepted).ok());
    ASSERT_TRUE(escrow_->ReviewRecipient(p2_, recipient_, EscrowStatus::Accepted).ok());
    EXPECT_EQ(escrow_->GetRecipientStatus(recipient_), EscrowStatus::Pending);

    ASSERT_TRUE(escrow_->ReviewRecipient(p3_, recipient_, EscrowStatus::Accepted).ok());
    EXPECT_EQ(escrow_->GetRecipientStatus(recipient_), EscrowStatus::Accepted);
    EXPECT_EQ(CountEvents(EventType::RecipientStatusChanged), 2u);

    // Tally was reset by the crossing; late accept votes are refused
    EXPECT_FALSE(escrow_->HasVotedOnRecipient(p3_, recipient_));
    EXPECT_TRUE(escrow_->ReviewRecipient(p1_, recipient_, EscrowStatus::Accepted).IsState());
    EXPECT_EQ(CountEvents(EventType::RecipientStatusChanged), 2u);
}

TEST_F(RecipientTest, AcceptanceFixesGrantAndIssuesCapability) {
    InitializeDefault();
    AcceptRecipient();

    auto r = escrow_->GetRecipient(recipient_);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->grantAmount, kPoolBalance);
    EXPECT_EQ(escrow_->GetAllocatedGrants(), kPoolBalance);
    EXPECT_EQ(escrow_->GetAcceptedRecipientCount(), 1u);
    EXPECT_TRUE(oracle_->HasCapability(recipient_, config_.executorCapability));
}

TEST_F(RecipientTest, RequestedGrantIsHonored) {
    InitializeDefault();
    ASSERT_TRUE(RegisterRecipient(250000).ok());
    for (const auto& p : {p1_, p2_, p3_}) {
        ASSERT_TRUE(escrow_->ReviewRecipient(p, recipient_, EscrowStatus::Accepted).ok());
    }
    EXPECT_EQ(escrow_->GetRecipient(recipient_)->grantAmount, 250000);
    EXPECT_EQ(escrow_->GetAllocatedGrants(), 250000);
}

TEST_F(RecipientTest, DuplicateVoteRefused) {
    InitializeDefault();
    ASSERT_TRUE(RegisterRecipient().ok());
    ASSERT_TRUE(escrow_->ReviewRecipient(p1_, recipient_, EscrowStatus::Accepted).ok());
    EXPECT_TRUE(escrow_->ReviewRecipient(p1_, recipient_, EscrowStatus::Accepted).IsDuplicateVote());
    EXPECT_TRUE(escrow_->ReviewRecipient(p1_, recipient_, EscrowStatus::Rejected).IsDuplicateVote());
}

TEST_F(RecipientTest, NonParticipantRefused) {
    InitializeDefault();
    ASSERT_TRUE(RegisterRecipient().ok());
    EXPECT_TRUE(escrow_->ReviewRecipient(outsider_, recipient_,
                                         EscrowStatus::Accepted).IsAuthorization());

    // Holding the capability without contributing is not enough
    oracle_->GrantCapability(config_.participantCapability, outsider_);
    EXPECT_TRUE(escrow_->ReviewRecipient(outsider_, recipient_,
                                         EscrowStatus::Accepted).IsAuthorization());

    // Contributing after losing the capability is not enough either
    oracle_->SetCapabilityStatus(config_.participantCapability, p1_, false);
    EXPECT_TRUE(escrow_->ReviewRecipient(p1_, recipient_,
                                         EscrowStatus::Accepted).IsAuthorization());
}

TEST_F(RecipientTest, InvalidDecisionRefused) {
    InitializeDefault();
    ASSERT_TRUE(RegisterRecipient().ok());
    EXPECT_TRUE(escrow_->ReviewRecipient(p1_, recipient_, EscrowStatus::Pending).IsValidation());
    EXPECT_TRUE(escrow_->ReviewRecipient(p1_, recipient_, EscrowStatus::Appealed).IsValidation());
    EXPECT_FALSE(escrow_->HasVotedOnRecipient(p1_, recipient_));
}

TEST_F(RecipientTest, UnregisteredRecipientRefused) {
    InitializeDefault();
    EXPECT_TRUE(escrow_->ReviewRecipient(p1_, recipient_, EscrowStatus::Accepted).IsState());
}

TEST_F(RecipientTest, RejectionDeletesRecord) {
    InitializeDefault();
    ASSERT_TRUE(RegisterRecipient().ok());
    for (const auto& p : {p1_, p2_, p3_}) {
        ASSERT_TRUE(escrow_->ReviewRecipient(p, recipient_, EscrowStatus::Rejected).ok());
    }
    EXPECT_FALSE(escrow_->GetRecipient(recipient_).has_value());
    EXPECT_EQ(escrow_->GetRecipientStatus(recipient_), EscrowStatus::None);
    EXPECT_EQ(events_.back().status, EscrowStatus::Rejected);

    // A rejected recipient may register again
    EXPECT_TRUE(RegisterRecipient().ok());
}

TEST_F(RecipientTest, RejectingAcceptedRecipientRevokesCapability) {
    InitializeDefault();
    AcceptRecipient();
    ASSERT_TRUE(oracle_->HasCapability(recipient_, config_.executorCapability));

    for (const auto& p : {p1_, p2_, p3_}) {
        ASSERT_TRUE(escrow_->ReviewRecipient(p, recipient_, EscrowStatus::Rejected).ok());
    }
    EXPECT_FALSE(escrow_->GetRecipient(recipient_).has_value());
    EXPECT_FALSE(oracle_->HasCapability(recipient_, config_.executorCapability));
    EXPECT_EQ(escrow_->GetAllocatedGrants(), 0);
    EXPECT_EQ(escrow_->GetAcceptedRecipientCount(), 0u);
}

// ============================================================================
// Capacity
// ============================================================================

TEST_F(RecipientTest, MaxRecipientsEnforced) {
    InitializeDefault();
    ASSERT_TRUE(RegisterRecipient(1000).ok());
    for (const auto& p : {p1_, p2_, p3_}) {
        ASSERT_TRUE(escrow_->ReviewRecipient(p, recipient_, EscrowStatus::Accepted).ok());
    }

    RecipientRegistration reg;
    reg.recipientAddress = outsider_;
    reg.requestedGrant = 1000;
    ASSERT_TRUE(escrow_->RegisterRecipient(outsider_, reg).ok());
    EXPECT_TRUE(escrow_->ReviewRecipient(p1_, outsider_, EscrowStatus::Accepted).IsCapacity());

    // Rejecting the extra candidate is still possible
    EXPECT_TRUE(escrow_->ReviewRecipient(p1_, outsider_, EscrowStatus::Rejected).ok());
}

TEST_F(RecipientTest, GrantBeyondPoolRollsBackVote) {
    InitializeDefault();
    ASSERT_TRUE(RegisterRecipient(kPoolBalance + 1).ok());
    ASSERT_TRUE(escrow_->ReviewRecipient(p1_, recipient_, EscrowStatus::Accepted).ok());
    ASSERT_TRUE(escrow_->ReviewRecipient(p2_, recipient_, EscrowStatus::Accepted).ok());

    events_.clear();
    EXPECT_TRUE(escrow_->ReviewRecipient(p3_, recipient_, EscrowStatus::Accepted).IsCapacity());
    EXPECT_EQ(escrow_->GetRecipientStatus(recipient_), EscrowStatus::Pending);
    EXPECT_FALSE(escrow_->HasVotedOnRecipient(p3_, recipient_));
    EXPECT_TRUE(escrow_->HasVotedOnRecipient(p2_, recipient_));
    EXPECT_EQ(escrow_->GetAllocatedGrants(), 0);
    EXPECT_TRUE(events_.empty());
}

TEST_F(RecipientTest, SecondRecipientSharesUnallocatedPool) {
    config_.maxRecipients = 2;
    InitializeDefault();
    ASSERT_TRUE(RegisterRecipient(600000).ok());
    for (const auto& p : {p1_, p2_, p3_}) {
        ASSERT_TRUE(escrow_->ReviewRecipient(p, recipient_, EscrowStatus::Accepted).ok());
    }

    RecipientRegistration reg;
    reg.recipientAddress = outsider_;
    ASSERT_TRUE(escrow_->RegisterRecipient(outsider_, reg).ok());
    for (const auto& p : {p1_, p2_, p3_}) {
        ASSERT_TRUE(escrow_->ReviewRecipient(p, outsider_, EscrowStatus::Accepted).ok());
    }

    EXPECT_EQ(escrow_->GetRecipient(outsider_)->grantAmount, 400000);
    EXPECT_EQ(escrow_->GetAllocatedGrants(), kPoolBalance);
    EXPECT_EQ(escrow_->GetAcceptedRecipientCount(), 2u);
}

// ============================================================================
// Atomicity
// ============================================================================

TEST_F(RecipientTest, OracleRefusalRollsBack) {
    InitializeDefault();
    ASSERT_TRUE(RegisterRecipient().ok());
    ASSERT_TRUE(escrow_->ReviewRecipient(p1_, recipient_, EscrowStatus::Accepted).ok());
    ASSERT_TRUE(escrow_->ReviewRecipient(p2_, recipient_, EscrowStatus::Accepted).ok());

    oracle_->SetRefuseGrants(true);
    events_.clear();

    EXPECT_TRUE(escrow_->ReviewRecipient(p3_, recipient_, EscrowStatus::Accepted).IsLedger());
    EXPECT_EQ(escrow_->GetRecipientStatus(recipient_), EscrowStatus::Pending);
    EXPECT_FALSE(escrow_->HasVotedOnRecipient(p3_, recipient_));
    EXPECT_EQ(escrow_->GetAllocatedGrants(), 0);
    EXPECT_TRUE(events_.empty());

    oracle_->SetRefuseGrants(false);
    EXPECT_TRUE(escrow_->ReviewRecipient(p3_, recipient_, EscrowStatus::Accepted).ok());
    EXPECT_EQ(escrow_->GetRecipientStatus(recipient_), EscrowStatus::Accepted);
}

TEST_F(RecipientTest, RefusedOperationIsLogged) {
    InitializeDefault();

    std::vector<util::LogEntry> warnings;
    auto sink = std::make_shared<util::CallbackSink>(
        [&warnings](const util::LogEntry& e) { warnings.push_back(e); }, util::LogLevel::Warn);
    util::Logger::Instance().AddSink(sink);

    EXPECT_TRUE(escrow_->ReviewRecipient(outsider_, recipient_,
                                         EscrowStatus::Accepted).IsAuthorization());
    util::Logger::Instance().RemoveSink(sink);

    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].category, util::LogCategory::ESCROW);
    EXPECT_NE(warnings[0].message.find("ReviewRecipient"), std::string::npos);
}

// ============================================================================
// Registry Anchors
// ============================================================================

class AnchoredRecipientTest : public EscrowTestBase {
protected:
    void SetUp() override {
        EscrowTestBase::SetUp();
        config_.useRegistryAnchor = true;

        anchor_ = CreateTestAddress(0x40);
        member_ = CreateTestAddress(0x41);
        Profile profile;
        profile.id = Hash256::FromHex(std::string(62, '0') + "aa");
        profile.owner = recipient_;
        profiles_->AddProfile(anchor_, profile);
        profiles_->AddMember(profile.id, member_);

        InitializeDefault();
    }

    RecipientRegistration AnchoredRegistration() {
        RecipientRegistration reg;
        reg.recipientAddress = recipient_;
        reg.registryAnchor = anchor_;
        return reg;
    }

    Address anchor_;
    Address member_;
};

TEST_F(AnchoredRecipientTest, OwnerRegistersUnderAnchor) {
    ASSERT_TRUE(escrow_->RegisterRecipient(recipient_, AnchoredRegistration()).ok());
    auto r = escrow_->GetRecipient(anchor_);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->useRegistryAnchor);
    EXPECT_EQ(r->recipientId, anchor_);
    EXPECT_FALSE(escrow_->GetRecipient(recipient_).has_value());
}

TEST_F(AnchoredRecipientTest, MemberMayRegister) {
    EXPECT_TRUE(escrow_->RegisterRecipient(member_, AnchoredRegistration()).ok());
}

TEST_F(AnchoredRecipientTest, StrangerRefused) {
    EXPECT_TRUE(escrow_->RegisterRecipient(outsider_, AnchoredRegistration()).IsAuthorization());
}

TEST_F(AnchoredRecipientTest, AnchorRequiredAndKnown) {
    RecipientRegistration reg = AnchoredRegistration();
    reg.registryAnchor.reset();
    EXPECT_TRUE(escrow_->RegisterRecipient(recipient_, reg).IsValidation());

    reg.registryAnchor = CreateTestAddress(0x50);
    EXPECT_TRUE(escrow_->RegisterRecipient(recipient_, reg).IsValidation());
}

TEST_F(AnchoredRecipientTest, ProfileMemberActsForRecipient) {
    ASSERT_TRUE(escrow_->RegisterRecipient(recipient_, AnchoredRegistration()).ok());
    for (const auto& p : {p1_, p2_, p3_}) {
        ASSERT_TRUE(escrow_->ReviewRecipient(p, anchor_, EscrowStatus::Accepted).ok());
    }
    EXPECT_TRUE(oracle_->HasCapability(recipient_, config_.executorCapability));

    std::vector<Milestone> plan = {CreateTestMilestone(PRECISION)};
    EXPECT_TRUE(escrow_->OfferMilestones(member_, anchor_, plan).ok());
    EXPECT_TRUE(escrow_->OfferMilestones(outsider_, anchor_, plan).IsAuthorization());
}

} // namespace test
} // namespace escrow
} // namespace milescrow
