#pragma once
#include <chrono>
#include <optional>

#include "cmd_state.hpp"
#include "execution_result.hpp"

namespace agentshell {
namespace core {

/**
 * @brief Decides when a poll loop gives up on the command in flight.
 *
 * Two independent budgets: silence (no snapshot change) and an absolute
 * ceiling measured from the start of the poll loop. The ceiling wins when
 * both have elapsed, so a command that trickles output forever still ends.
 */
class TimeoutPolicy {
public:
    using clock = std::chrono::steady_clock;

    TimeoutPolicy(double silenceSec, double hardSec)
        : silence_(to_duration_(silenceSec)), hard_(to_duration_(hardSec)) {}

    std::optional<CommandStatus> evaluate(const CmdState& S, clock::time_point now) const {
        if (now - S.tStart >= hard_) return CommandStatus::HardTimeout;
        if (now - S.tLastChange >= silence_) return CommandStatus::NoOutputTimeout;
        return std::nullopt;
    }

    clock::duration silence() const noexcept { return silence_; }
    clock::duration hard() const noexcept { return hard_; }

private:
    static clock::duration to_duration_(double sec) {
        return std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>(sec));
    }

    clock::duration silence_;
    clock::duration hard_;
};
}} // namespace agentshell::core
