// MILESCROW - Escrow Operation Status
// Copyright (c) 2024 MILESCROW Developers
// MIT License
//
// Result type returned by every mutating escrow operation.

#ifndef MILESCROW_ESCROW_STATUS_H
#define MILESCROW_ESCROW_STATUS_H

#include <string>

namespace milescrow {
namespace escrow {

/**
 * Status returned by escrow operations.
 *
 * A non-OK status means the operation was rolled back in full.
 */
class Status {
public:
    enum Code {
        OK = 0,
        AUTHORIZATION_ERROR = 1,   // Caller lacks the required capability
        STATE_ERROR = 2,           // Operation illegal in the current state
        CAPACITY_ERROR = 3,        // Recipient limit or pool balance exceeded
        DUPLICATE_VOTE = 4,        // Voter already voted in this round
        VALIDATION_ERROR = 5,      // Malformed argument or plan
        LEDGER_ERROR = 6,          // Collaborator reported failure
    };

private:
    Code code_;
    std::string message_;

public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status Authorization(const std::string& msg = "") { return Status(AUTHORIZATION_ERROR, msg); }
    static Status State(const std::string& msg = "") { return Status(STATE_ERROR, msg); }
    static Status Capacity(const std::string& msg = "") { return Status(CAPACITY_ERROR, msg); }
    static Status DuplicateVote(const std::string& msg = "") { return Status(DUPLICATE_VOTE, msg); }
    static Status Validation(const std::string& msg = "") { return Status(VALIDATION_ERROR, msg); }
    static Status Ledger(const std::string& msg = "") { return Status(LEDGER_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsAuthorization() const { return code_ == AUTHORIZATION_ERROR; }
    bool IsState() const { return code_ == STATE_ERROR; }
    bool IsCapacity() const { return code_ == CAPACITY_ERROR; }
    bool IsDuplicateVote() const { return code_ == DUPLICATE_VOTE; }
    bool IsValidation() const { return code_ == VALIDATION_ERROR; }
    bool IsLedger() const { return code_ == LEDGER_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const {
        if (ok()) return "OK";
        std::string result;
        switch (code_) {
            case AUTHORIZATION_ERROR: result = "AuthorizationError: "; break;
            case STATE_ERROR: result = "StateError: "; break;
            case CAPACITY_ERROR: result = "CapacityError: "; break;
            case DUPLICATE_VOTE: result = "DuplicateVoteError: "; break;
            case VALIDATION_ERROR: result = "ValidationError: "; break;
            case LEDGER_ERROR: result = "LedgerError: "; break;
            default: result = "Unknown: "; break;
        }
        return result + message_;
    }
};

} // namespace escrow
} // namespace milescrow

#endif // MILESCROW_ESCROW_STATUS_H
