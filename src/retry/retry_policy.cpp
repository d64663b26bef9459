#include "./retry_policy.hpp"

retry_decision_t retry_decide(const upload_error_t &error, unsigned int attempt, unsigned int max_retries, bool refresh_used) {
    switch (error.kind) {
        case error_kind_t::validation:
        case error_kind_t::client:
        case error_kind_t::cancelled:
            return retry_decision_t::fail;
        case error_kind_t::authentication:
            return refresh_used ? retry_decision_t::fail : retry_decision_t::retry_with_refresh;
        case error_kind_t::network:
        case error_kind_t::server:
            return attempt <= max_retries ? retry_decision_t::retry_with_backoff : retry_decision_t::fail;
        case error_kind_t::timeout:
            return attempt <= max_retries ? retry_decision_t::retry_immediately : retry_decision_t::fail;
    }
    return retry_decision_t::fail;
}

std::chrono::milliseconds retry_backoff_delay(unsigned int pass, std::chrono::milliseconds initial, std::chrono::milliseconds max) {
    if (pass == 0 || initial.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    auto delay = initial;
    for (unsigned int i = 1; i < pass && delay < max; i++) {
        delay *= 2;
    }
    return delay < max ? delay : max;
}

const char *retry_decision_name(retry_decision_t decision) {
    switch (decision) {
        case retry_decision_t::retry_immediately:
            return "retry immediately";
        case retry_decision_t::retry_with_refresh:
            return "retry with refresh";
        case retry_decision_t::retry_with_backoff:
            return "retry with backoff";
        case retry_decision_t::fail:
            return "fail";
    }
    return "unknown";
}
