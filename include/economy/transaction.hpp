#pragma once

/**
 * Transaction - immutable audit record of one balance mutation
 *
 * Key Invariant (MUST ALWAYS HOLD):
 *   balance_after == previous balance + amount
 *
 * TransactionRing keeps the most recent N records, evicting oldest first.
 */

#include "../types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace econ {
namespace economy {

enum class TransactionType : uint8_t {
    Earn = 0,
    Spend,
    Exchange, // Credit leg of a currency exchange
    Refund    // Compensating credit after a failed exchange or purchase
};

inline const char* transaction_type_to_string(TransactionType type) {
    switch (type) {
    case TransactionType::Earn:
        return "earn";
    case TransactionType::Spend:
        return "spend";
    case TransactionType::Exchange:
        return "exchange";
    case TransactionType::Refund:
        return "refund";
    }
    return "unknown";
}

inline TransactionType transaction_type_from_string(const std::string& s) {
    if (s == "earn")
        return TransactionType::Earn;
    if (s == "spend")
        return TransactionType::Spend;
    if (s == "exchange")
        return TransactionType::Exchange;
    if (s == "refund")
        return TransactionType::Refund;
    throw SnapshotError("unknown transaction type: " + s);
}

struct Transaction {
    Sequence sequence = 0;
    TransactionType type = TransactionType::Earn;
    PlayerId player;
    CurrencyId currency;
    Amount amount = 0; // signed delta actually applied
    std::string tag;   // source (credits) or reason (debits)
    Timestamp timestamp = 0;
    Amount balance_after = 0;

    bool is_inflow() const { return amount > 0; }
    bool is_outflow() const { return amount < 0; }
};

class TransactionRing {
public:
    explicit TransactionRing(size_t capacity = 100) : capacity_(capacity > 0 ? capacity : 1) {
        slots_.reserve(capacity_);
    }

    void push(const Transaction& tx) {
        if (slots_.size() < capacity_) {
            slots_.push_back(tx);
        } else {
            slots_[head_] = tx;
            head_ = (head_ + 1) % capacity_;
        }
        ++total_appended_;
    }

    size_t size() const { return slots_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return slots_.empty(); }
    uint64_t total_appended() const { return total_appended_; }

    // i = 0 is the oldest retained entry
    const Transaction& at(size_t i) const { return slots_[(head_ + i) % slots_.size()]; }

    const Transaction& newest() const { return at(slots_.size() - 1); }

    // Oldest first
    std::vector<Transaction> snapshot() const {
        std::vector<Transaction> out;
        out.reserve(slots_.size());
        for (size_t i = 0; i < slots_.size(); ++i) {
            out.push_back(at(i));
        }
        return out;
    }

    // Last n entries, oldest first
    std::vector<Transaction> recent(size_t n) const {
        size_t count = n < slots_.size() ? n : slots_.size();
        std::vector<Transaction> out;
        out.reserve(count);
        for (size_t i = slots_.size() - count; i < slots_.size(); ++i) {
            out.push_back(at(i));
        }
        return out;
    }

    void clear() {
        slots_.clear();
        head_ = 0;
    }

private:
    size_t capacity_;
    size_t head_ = 0; // index of oldest once full
    uint64_t total_appended_ = 0;
    std::vector<Transaction> slots_;
};

} // namespace economy
} // namespace econ
