#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace agentshell {
namespace core {

    /**
     * @brief Bookkeeping for the command currently in flight.
     *
     * Survives across execute() calls while the command keeps running so a
     * continuation poll only returns output the caller has not seen yet.
     */
    struct CmdState {
        using clock = std::chrono::steady_clock;

        std::string       command{};     ///< Command text as sent (label for observations)
        std::string       lastText{};    ///< Last decoded snapshot seen by the poll loop
        uint64_t          consumed{};    ///< Stream offset up to which output was returned to the caller
        clock::time_point tStart{};      ///< Start of the current poll loop
        clock::time_point tLastChange{}; ///< Last time the snapshot changed

        void begin_poll(clock::time_point now) {
            tStart = now;
            tLastChange = now;
        }

        // Record a snapshot; true when it differs from the previous one.
        bool observe(const std::string& snapshot, clock::time_point now) {
            if (snapshot == lastText) return false;
            lastText = snapshot;
            tLastChange = now;
            return true;
        }
    };
}} // namespace agentshell::core
