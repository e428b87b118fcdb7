// MILESCROW - Voting Power Registry
// Copyright (c) 2024 MILESCROW Developers
// MIT License
//
// Converts pooled contributions into normalized voting weights.

#ifndef MILESCROW_ESCROW_VOTING_POWER_H
#define MILESCROW_ESCROW_VOTING_POWER_H

#include <milescrow/core/types.h>
#include <milescrow/escrow/status.h>

#include <map>

namespace milescrow {
namespace escrow {

/**
 * Normalize contributions into weights summing to exactly PRECISION.
 *
 * Each weight is floor(amount * PRECISION / total). The rounding remainder
 * is added to the largest contributor; among equal largest contributions
 * the lowest address receives it.
 *
 * @param contributions Contributed amount per participant
 * @param weights Output weights (cleared first)
 * @return Validation error for an empty map, a negative amount or a zero total
 */
Status NormalizeContributions(const std::map<Address, Amount>& contributions,
                              std::map<Address, uint64_t>& weights);

/**
 * Immutable table of participant weights.
 */
class VotingPowerRegistry {
public:
    VotingPowerRegistry() = default;

    /// Build a registry from raw contributions
    static Status Create(const std::map<Address, Amount>& contributions,
                         VotingPowerRegistry& out);

    /// Weight of a participant (0 for non-participants)
    uint64_t GetWeight(const Address& participant) const;

    /// Sum of all weights (PRECISION once created)
    uint64_t GetTotalSupply() const { return totalSupply_; }

    bool IsParticipant(const Address& participant) const;

    size_t GetParticipantCount() const { return weights_.size(); }

    const std::map<Address, uint64_t>& GetWeights() const { return weights_; }

    /// Participant holding the largest weight (lowest address on ties)
    Address GetLargestParticipant() const;

private:
    std::map<Address, uint64_t> weights_;
    uint64_t totalSupply_{0};
};

} // namespace escrow
} // namespace milescrow

#endif // MILESCROW_ESCROW_VOTING_POWER_H
