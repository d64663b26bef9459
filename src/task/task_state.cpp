#include "./task_state.hpp"

const char *task_state_name(task_state_t state) {
    switch (state) {
        case task_state_t::queued:
            return "queued";
        case task_state_t::authenticating:
            return "authenticating";
        case task_state_t::initializing:
            return "initializing";
        case task_state_t::transferring:
            return "transferring";
        case task_state_t::polling:
            return "polling";
        case task_state_t::completed:
            return "completed";
        case task_state_t::failed:
            return "failed";
        case task_state_t::cancelled:
            return "cancelled";
    }
    return "unknown";
}

bool task_state_is_terminal(task_state_t state) {
    return state == task_state_t::completed || state == task_state_t::failed || state == task_state_t::cancelled;
}

bool TaskStateTrack::advance(task_state_t next) {
    if (task_state_is_terminal(current)) {
        return false;
    }
    switch (next) {
        case task_state_t::cancelled:
            break;
        case task_state_t::failed:
            if (current == task_state_t::queued) {
                return false;
            }
            break;
        case task_state_t::completed:
            // init may report the file as already stored
            if (current != task_state_t::initializing && current != task_state_t::transferring && current != task_state_t::polling) {
                return false;
            }
            break;
        default:
            if (static_cast<int>(next) <= static_cast<int>(current)) {
                return false;
            }
            break;
    }
    current = next;
    return true;
}

task_state_t TaskStateTrack::get() const {
    return current;
}
