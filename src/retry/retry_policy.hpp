#pragma once

#include <chrono>

#include "../errors/upload_error.hpp"

#define RETRY_MAX_RETRIES_DEFAULT 3
#define RETRY_BACKOFF_INITIAL_DEFAULT 2
#define RETRY_BACKOFF_MAX_DEFAULT 60

enum class retry_decision_t {
    retry_immediately = 0,
    retry_with_refresh = 1,
    retry_with_backoff = 2,
    fail = 3
};

// attempt is the 1-based number of the attempt that produced error.
// refresh_used tells whether the task already had its one reactive refresh.
retry_decision_t retry_decide(const upload_error_t &error, unsigned int attempt, unsigned int max_retries, bool refresh_used);

// delay before retry pass number pass (1-based), doubling from initial up to max
std::chrono::milliseconds retry_backoff_delay(unsigned int pass, std::chrono::milliseconds initial, std::chrono::milliseconds max);

const char *retry_decision_name(retry_decision_t decision);
