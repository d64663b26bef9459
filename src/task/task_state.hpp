#pragma once

enum class task_state_t {
    queued = 0,
    authenticating = 1,
    initializing = 2,
    transferring = 3,
    polling = 4,
    completed = 5,
    failed = 6,
    cancelled = 7
};

const char *task_state_name(task_state_t state);

bool task_state_is_terminal(task_state_t state);

// State of one upload attempt. Moves only forward through
// queued -> authenticating -> initializing -> transferring -> polling -> completed,
// optional steps may be skipped. cancelled is reachable from any non-terminal
// state, failed from authenticating onwards.
class TaskStateTrack {
  public:
    TaskStateTrack() = default;

    // false (and no change) if the transition would go backwards
    bool advance(task_state_t next);

    task_state_t get() const;

  private:
    task_state_t current = task_state_t::queued;
};
