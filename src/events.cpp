// =============================================================================
// events.cpp - Event serialization and sinks
// =============================================================================

#include "cpswap/events.hpp"
#include <nlohmann/json.hpp>

namespace cpswap {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

const char* event_name(const Event& event) {
    return std::visit(overloaded{
        [](const PoolCreated&) { return "PoolCreated"; },
        [](const LiquidityAdded&) { return "LiquidityAdded"; },
        [](const SwapExecuted&) { return "SwapExecuted"; },
        [](const LiquidityRemoved&) { return "LiquidityRemoved"; },
    }, event);
}

nlohmann::json to_json(const Event& event) {
    nlohmann::json j = std::visit(overloaded{
        [](const PoolCreated& e) {
            return nlohmann::json{
                {"pool", to_hex(e.pool)},
                {"asset_a", to_hex(e.asset_a)},
                {"asset_b", to_hex(e.asset_b)},
                {"fee_numerator", e.fee_numerator},
                {"fee_denominator", e.fee_denominator},
                {"fee", e.fee},
            };
        },
        [](const LiquidityAdded& e) {
            return nlohmann::json{
                {"pool", to_hex(e.pool)},
                {"user", to_hex(e.user)},
                {"amount_a", e.amount_a},
                {"amount_b", e.amount_b},
                {"lp_minted", e.lp_minted},
                {"reserve_a", e.reserve_a},
                {"reserve_b", e.reserve_b},
            };
        },
        [](const SwapExecuted& e) {
            return nlohmann::json{
                {"pool", to_hex(e.pool)},
                {"user", to_hex(e.user)},
                {"asset_in", to_hex(e.asset_in)},
                {"asset_out", to_hex(e.asset_out)},
                {"amount_in", e.amount_in},
                {"amount_out", e.amount_out},
                {"fee", e.fee},
            };
        },
        [](const LiquidityRemoved& e) {
            return nlohmann::json{
                {"pool", to_hex(e.pool)},
                {"user", to_hex(e.user)},
                {"amount_a", e.amount_a},
                {"amount_b", e.amount_b},
                {"lp_burned", e.lp_burned},
                {"reserve_a", e.reserve_a},
                {"reserve_b", e.reserve_b},
            };
        },
    }, event);
    j["event"] = event_name(event);
    return j;
}

// =============================================================================
// MemoryEventSink
// =============================================================================

void MemoryEventSink::emit(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<Event> MemoryEventSink::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

size_t MemoryEventSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void MemoryEventSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

// =============================================================================
// JsonLinesEventSink
// =============================================================================

void JsonLinesEventSink::emit(const Event& event) {
    std::string line = to_json(event).dump();
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
}

} // namespace cpswap
