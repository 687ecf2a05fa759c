#ifndef IFS_DOWNLOAD_DOWNLOAD_STATE_HPP
#define IFS_DOWNLOAD_DOWNLOAD_STATE_HPP

#include <atomic>
#include <ostream>
#include <string>

namespace ifs {
namespace download {

/**
 * DownloadState tracks the lifecycle of one download request.
 * Transitions are validated; the current state may be changed from any thread.
 */
class DownloadState {
public:
    /**
     * Download states:
     * RESOLVING  - Pinning the requested version
     * STREAMING  - Emitting chunks of the pinned image
     * COMPLETED  - Final chunk consumed, no error emitted
     * FAILED     - Terminal error emitted or pending
     * CANCELLED  - Consumer went away, nothing more is emitted
     */
    enum class State {
        RESOLVING,
        STREAMING,
        COMPLETED,
        FAILED,
        CANCELLED
    };

    DownloadState() : current_state_(State::RESOLVING) {}

    State get_state() const { return current_state_.load(); }

    bool is_terminal() const {
        return is_terminal(current_state_.load());
    }

    static bool is_terminal(State state) {
        return state == State::COMPLETED ||
               state == State::FAILED ||
               state == State::CANCELLED;
    }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        State current = current_state_.load();
        do {
            if (!is_valid_transition(current, new_state)) {
                return false;
            }
        } while (!current_state_.compare_exchange_weak(current, new_state));
        return true;
    }

    // Check if a transition is valid
    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::RESOLVING:
                return to == State::STREAMING ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::STREAMING:
                return to == State::COMPLETED ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::COMPLETED:
            case State::FAILED:
            case State::CANCELLED:
                return false;
        }
        return false;
    }

    // Convert state to string for logging
    static std::string state_to_string(State state) {
        switch (state) {
            case State::RESOLVING: return "RESOLVING";
            case State::STREAMING: return "STREAMING";
            case State::COMPLETED: return "COMPLETED";
            case State::FAILED:    return "FAILED";
            case State::CANCELLED: return "CANCELLED";
            default:               return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_.load());
    }

private:
    std::atomic<State> current_state_;
};

// Stream operator for DownloadState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const DownloadState::State& state) {
    os << DownloadState::state_to_string(state);
    return os;
}

} // namespace download
} // namespace ifs

#endif // IFS_DOWNLOAD_DOWNLOAD_STATE_HPP
