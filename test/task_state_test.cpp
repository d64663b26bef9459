#include <gtest/gtest.h>

#include "../src/task/task_state.hpp"

TEST(task_state_test, full_path) {
    TaskStateTrack track;
    EXPECT_EQ(track.get(), task_state_t::queued);
    EXPECT_TRUE(track.advance(task_state_t::authenticating));
    EXPECT_TRUE(track.advance(task_state_t::initializing));
    EXPECT_TRUE(track.advance(task_state_t::transferring));
    EXPECT_TRUE(track.advance(task_state_t::polling));
    EXPECT_TRUE(track.advance(task_state_t::completed));
    EXPECT_EQ(track.get(), task_state_t::completed);
    EXPECT_TRUE(task_state_is_terminal(track.get()));
}

TEST(task_state_test, optional_steps_can_be_skipped) {
    TaskStateTrack track;
    EXPECT_TRUE(track.advance(task_state_t::authenticating));
    EXPECT_TRUE(track.advance(task_state_t::transferring));
    EXPECT_TRUE(track.advance(task_state_t::completed));

    // deduplicated files complete right after init
    TaskStateTrack dedupe;
    EXPECT_TRUE(dedupe.advance(task_state_t::initializing));
    EXPECT_TRUE(dedupe.advance(task_state_t::completed));
}

TEST(task_state_test, never_goes_backwards) {
    TaskStateTrack track;
    EXPECT_TRUE(track.advance(task_state_t::transferring));
    EXPECT_FALSE(track.advance(task_state_t::initializing));
    EXPECT_FALSE(track.advance(task_state_t::transferring));
    EXPECT_EQ(track.get(), task_state_t::transferring);
}

TEST(task_state_test, terminal_states) {
    TaskStateTrack queued;
    EXPECT_FALSE(queued.advance(task_state_t::completed));
    EXPECT_FALSE(queued.advance(task_state_t::failed));
    EXPECT_TRUE(queued.advance(task_state_t::cancelled));
    EXPECT_FALSE(queued.advance(task_state_t::authenticating));

    TaskStateTrack failed;
    EXPECT_TRUE(failed.advance(task_state_t::authenticating));
    EXPECT_TRUE(failed.advance(task_state_t::failed));
    EXPECT_FALSE(failed.advance(task_state_t::cancelled));
    EXPECT_EQ(failed.get(), task_state_t::failed);
}

TEST(task_state_test, names) {
    EXPECT_STREQ(task_state_name(task_state_t::queued), "queued");
    EXPECT_STREQ(task_state_name(task_state_t::polling), "polling");
    EXPECT_STREQ(task_state_name(task_state_t::cancelled), "cancelled");
    EXPECT_FALSE(task_state_is_terminal(task_state_t::polling));
}
