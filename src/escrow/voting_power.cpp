// MILESCROW - Voting Power Registry Implementation
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include <milescrow/escrow/voting_power.h>
#include <milescrow/util/logging.h>

namespace milescrow {
namespace escrow {

Status NormalizeContributions(const std::map<Address, Amount>& contributions,
                              std::map<Address, uint64_t>& weights) {
    weights.clear();

    if (contributions.empty()) {
        return Status::Validation("no contributions");
    }

    uint64_t total = 0;
    for (const auto& [participant, amount] : contributions) {
        if (amount < 0) {
            return Status::Validation("negative contribution from " + ShortAddress(participant));
        }
        if (static_cast<uint64_t>(amount) > UINT64_MAX - total) {
            return Status::Validation("contribution total overflows");
        }
        total += static_cast<uint64_t>(amount);
    }
    if (total == 0) {
        return Status::Validation("total contribution is zero");
    }

    uint64_t assigned = 0;
    const Address* largest = nullptr;
    Amount largestAmount = -1;

    // std::map iterates in ascending address order, so a strict comparison
    // leaves the lowest address as the holder of a tied maximum.
    for (const auto& [participant, amount] : contributions) {
        uint64_t weight = MulDiv(static_cast<uint64_t>(amount), PRECISION, total);
        weights[participant] = weight;
        assigned += weight;
        if (amount > largestAmount) {
            largestAmount = amount;
            largest = &participant;
        }
    }

    weights[*largest] += PRECISION - assigned;
    return Status::Ok();
}

Status VotingPowerRegistry::Create(const std::map<Address, Amount>& contributions,
                                   VotingPowerRegistry& out) {
    std::map<Address, uint64_t> weights;
    Status status = NormalizeContributions(contributions, weights);
    if (!status.ok()) {
        return status;
    }

    out.weights_ = std::move(weights);
    out.totalSupply_ = PRECISION;

    LOG_DEBUG(util::LogCategory::VOTE) << "Voting power registry created with "
                                       << out.weights_.size() << " participants";
    return Status::Ok();
}

uint64_t VotingPowerRegistry::GetWeight(const Address& participant) const {
    auto it = weights_.find(participant);
    return it != weights_.end() ? it->second : 0;
}

bool VotingPowerRegistry::IsParticipant(const Address& participant) const {
    return weights_.find(participant) != weights_.end();
}

Address VotingPowerRegistry::GetLargestParticipant() const {
    Address best;
    uint64_t bestWeight = 0;
    bool found = false;
    for (const auto& [participant, weight] : weights_) {
        if (!found || weight > bestWeight) {
            best = participant;
            bestWeight = weight;
            found = true;
        }
    }
    return best;
}

} // namespace escrow
} // namespace milescrow
