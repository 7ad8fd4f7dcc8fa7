#ifndef PEERDROP_SESSION_STATE_HPP
#define PEERDROP_SESSION_STATE_HPP

#include <ostream>
#include <string>

namespace peerdrop {
namespace session {

/**
 * SessionState tracks the handshake lifecycle of one peer session.
 * Implements a state machine that enforces valid state transitions and prevents invalid ones.
 */
class SessionState {
public:
    /**
     * Session states:
     * IDLE               - Created, no handshake step taken yet
     * OFFER_CREATED      - Offerer has produced its offer and public key
     * ANSWER_PENDING     - Answerer is keyed and producing its answer
     * KEYED_AWAITING_OPEN- Both descriptions applied, waiting for the channel
     * OPEN               - Channel open, transfers allowed
     * CLOSED             - Torn down; terminal
     */
    enum class State {
        IDLE,
        OFFER_CREATED,
        ANSWER_PENDING,
        KEYED_AWAITING_OPEN,
        OPEN,
        CLOSED
    };

    SessionState() : current_state_(State::IDLE) {}

    State get_state() const { return current_state_; }

    bool is_terminal() const {
        return current_state_ == State::CLOSED;
    }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::IDLE:
                return to == State::OFFER_CREATED ||
                       to == State::ANSWER_PENDING ||
                       to == State::CLOSED;

            case State::OFFER_CREATED:
                return to == State::KEYED_AWAITING_OPEN ||
                       to == State::CLOSED;

            case State::ANSWER_PENDING:
                return to == State::KEYED_AWAITING_OPEN ||
                       to == State::CLOSED;

            case State::KEYED_AWAITING_OPEN:
                return to == State::OPEN ||
                       to == State::CLOSED;

            case State::OPEN:
                return to == State::CLOSED;

            case State::CLOSED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::IDLE:                return "IDLE";
            case State::OFFER_CREATED:       return "OFFER_CREATED";
            case State::ANSWER_PENDING:      return "ANSWER_PENDING";
            case State::KEYED_AWAITING_OPEN: return "KEYED_AWAITING_OPEN";
            case State::OPEN:                return "OPEN";
            case State::CLOSED:              return "CLOSED";
            default:                         return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operator for SessionState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const SessionState::State& state) {
    os << SessionState::state_to_string(state);
    return os;
}

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_SESSION_STATE_HPP
