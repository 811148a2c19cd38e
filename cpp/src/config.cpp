#include "config.hpp"
#include "execution_result.hpp"

#include <stdexcept>
#include <string>

namespace agentshell {
namespace core {

void Config::validate() const {
    auto positive = [](double v, const char* name) {
        if (!(v > 0.0)) {
            throw std::invalid_argument(std::string(name) + " must be positive, got " + std::to_string(v));
        }
    };
    auto non_negative = [](double v, const char* name) {
        if (v < 0.0) {
            throw std::invalid_argument(std::string(name) + " must not be negative, got " + std::to_string(v));
        }
    };

    positive(noOutputTimeoutSeconds, "noOutputTimeoutSeconds");
    positive(hardTimeoutSeconds, "hardTimeoutSeconds");
    positive(pollIntervalSeconds, "pollIntervalSeconds");
    positive(setupWaitSeconds, "setupWaitSeconds");
    positive(readerJoinTimeoutSeconds, "readerJoinTimeoutSeconds");
    non_negative(terminateGraceSeconds, "terminateGraceSeconds");
    non_negative(screenClearDelaySeconds, "screenClearDelaySeconds");

    if (historyLimit == 0) throw std::invalid_argument("historyLimit must be at least 1");
    if (maxOutputChars == 0) throw std::invalid_argument("maxOutputChars must be at least 1");
    if (shellPath.empty()) throw std::invalid_argument("shellPath must not be empty");
}

const char* to_string(CommandStatus status) noexcept {
    switch (status) {
        case CommandStatus::Completed:       return "COMPLETED";
        case CommandStatus::Running:         return "RUNNING";
        case CommandStatus::NoOutputTimeout: return "NO_OUTPUT_TIMEOUT";
        case CommandStatus::HardTimeout:     return "HARD_TIMEOUT";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace agentshell
