#ifndef CPSWAP_EVENTS_HPP
#define CPSWAP_EVENTS_HPP

#include <mutex>
#include <optional>
#include <ostream>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace cpswap {

// =============================================================================
// Domain Events
// =============================================================================

struct PoolCreated {
    AccountId pool;
    AssetId asset_a;
    AssetId asset_b;
    uint64_t fee_numerator;
    uint64_t fee_denominator;
    double fee;  // display only
};

struct LiquidityAdded {
    AccountId pool;
    AccountId user;
    uint64_t amount_a;
    uint64_t amount_b;
    uint64_t lp_minted;
    uint64_t reserve_a;  // post-transaction
    uint64_t reserve_b;
};

struct SwapExecuted {
    AccountId pool;
    AccountId user;
    AssetId asset_in;
    AssetId asset_out;
    uint64_t amount_in;
    uint64_t amount_out;
    uint64_t fee;
};

struct LiquidityRemoved {
    AccountId pool;
    AccountId user;
    uint64_t amount_a;
    uint64_t amount_b;
    uint64_t lp_burned;
    uint64_t reserve_a;  // post-transaction
    uint64_t reserve_b;
};

using Event = std::variant<PoolCreated, LiquidityAdded, SwapExecuted, LiquidityRemoved>;

const char* event_name(const Event& event);

nlohmann::json to_json(const Event& event);

// =============================================================================
// Event Sinks
// =============================================================================

class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void emit(const Event& event) = 0;
};

// Discards everything
class NullEventSink : public IEventSink {
public:
    void emit(const Event&) override {}
};

// Keeps events in emission order
class MemoryEventSink : public IEventSink {
public:
    void emit(const Event& event) override;

    std::vector<Event> events() const;
    size_t size() const;
    void clear();

    // Last event of type T, if any
    template <typename T>
    std::optional<T> last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (auto* e = std::get_if<T>(&*it)) return *e;
        }
        return std::nullopt;
    }

private:
    std::vector<Event> events_;
    mutable std::mutex mutex_;
};

// One JSON object per line
class JsonLinesEventSink : public IEventSink {
public:
    explicit JsonLinesEventSink(std::ostream& out) : out_(out) {}
    void emit(const Event& event) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace cpswap

#endif // CPSWAP_EVENTS_HPP
