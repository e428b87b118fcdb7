// MILESCROW - Core Types
// Copyright (c) 2024 MILESCROW Developers
// MIT License
//
// Amounts, ledger handles, fixed-point arithmetic and the fixed-width
// byte identifiers (account addresses, SHA-256 digests) the escrow is
// keyed by.

#ifndef MILESCROW_CORE_TYPES_H
#define MILESCROW_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

namespace milescrow {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;

/// Amount in the pooled asset's smallest unit
using Amount = int64_t;

/// Capability (role) identifier issued by the authorization oracle
using CapabilityId = uint64_t;

/// Pool identifier on the ledger
using PoolId = uint64_t;

/// Asset handle on the ledger
using AssetId = uint64_t;

/// Fixed-point scale for weights and percentages (1.0 == PRECISION)
constexpr uint64_t PRECISION = 1000000000000000000ULL;

/**
 * Compute floor(a * b / d) without intermediate overflow.
 * Returns 0 when d is 0.
 */
inline uint64_t MulDiv(uint64_t a, uint64_t b, uint64_t d) {
    if (d == 0) return 0;
    unsigned __int128 product = static_cast<unsigned __int128>(a) * b;
    return static_cast<uint64_t>(product / d);
}

// ============================================================================
// Fixed-Width Identifiers
// ============================================================================

namespace detail {

/// Lowercase hex of the bytes in storage order
std::string BytesToHex(const Byte* data, size_t len);

/// Parse exactly len bytes of hex, optional "0x" prefix; false on bad input
bool HexToBytes(const std::string& hex, Byte* out, size_t len);

} // namespace detail

/**
 * N raw bytes compared and printed in storage order.
 *
 * The null value (all zeros) means "unset" wherever an identifier is optional.
 */
template<size_t N>
class FixedBytes {
public:
    static constexpr size_t SIZE = N;

    FixedBytes() noexcept { data_.fill(0); }

    explicit FixedBytes(const std::array<Byte, N>& data) noexcept : data_(data) {}

    /// Copies min(len, N) bytes and zero-fills the rest
    FixedBytes(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < N ? len : N);
        }
    }

    bool IsNull() const noexcept {
        for (Byte b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    constexpr size_t size() const noexcept { return N; }
    const Byte* data() const noexcept { return data_.data(); }
    Byte operator[](size_t idx) const { return data_[idx]; }

    bool operator==(const FixedBytes& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const FixedBytes& other) const noexcept { return data_ != other.data_; }
    bool operator<(const FixedBytes& other) const noexcept { return data_ < other.data_; }

    std::string ToHex() const { return detail::BytesToHex(data_.data(), N); }

protected:
    std::array<Byte, N> data_;
};

/// SHA-256 digest
class Hash256 : public FixedBytes<32> {
public:
    using FixedBytes<32>::FixedBytes;

    static std::optional<Hash256> ParseHex(const std::string& hex);

    /// Throws std::invalid_argument on malformed input
    static Hash256 FromHex(const std::string& hex);
};

/// Account identity (participants, recipients, profile anchors)
class Address : public FixedBytes<20> {
public:
    using FixedBytes<20>::FixedBytes;

    static std::optional<Address> ParseHex(const std::string& hex);

    /// Throws std::invalid_argument on malformed input
    static Address FromHex(const std::string& hex);
};

/// "0x" and the first four bytes, for messages and logs
std::string ShortAddress(const Address& addr);

} // namespace milescrow

#endif // MILESCROW_CORE_TYPES_H
