#include <gtest/gtest.h>

#include "fake_term_info.hpp"
#include "statusview/errors.hpp"
#include "statusview/line_renderer.hpp"

#include <cstdlib>
#include <ctime>
#include <sstream>

using namespace statusview;

namespace {

Progress narrowProgress(std::int64_t current, std::int64_t total) {
    Progress progress;
    progress.current = current;
    progress.total = total;
    progress.win_size = 100;
    return progress;
}

} // namespace

class LineRenderer : public ::testing::Test {
protected:
    void SetUp() override {
        const char* tz = std::getenv("TZ");
        had_tz_ = tz != nullptr;
        if (had_tz_) {
            saved_tz_ = tz;
        }
        setenv("TZ", "UTC", 1);
        tzset();
    }

    void TearDown() override {
        if (had_tz_) {
            setenv("TZ", saved_tz_.c_str(), 1);
        } else {
            unsetenv("TZ");
        }
        tzset();
    }

    std::ostringstream out;
    FakeTermInfo terminal;

private:
    bool had_tz_{false};
    std::string saved_tz_;
};

TEST_F(LineRenderer, authentication_error_ignores_message_text) {
    Message message;
    message.status = "Downloading";
    message.progress = narrowProgress(50, 100);
    message.error = MessageError{401, "token expired"};

    try {
        displayMessage(message, out, &terminal);
        FAIL() << "expected AuthenticationRequired";
    } catch (const AuthenticationRequired& ex) {
        EXPECT_STREQ(ex.what(), "authentication is required");
        EXPECT_EQ(ex.code(), 401);
    }
    EXPECT_EQ(out.str(), "");
}

TEST_F(LineRenderer, other_errors_surface_their_message) {
    Message message;
    message.error = MessageError{500, "manifest unknown"};

    try {
        displayMessage(message, out, nullptr);
        FAIL() << "expected MessageFailure";
    } catch (const MessageFailure& ex) {
        EXPECT_STREQ(ex.what(), "manifest unknown");
        EXPECT_EQ(ex.code(), 500);
    }
    EXPECT_EQ(out.str(), "");
}

TEST_F(LineRenderer, plain_status_ends_with_newline) {
    Message message;
    message.status = "Pulling from library/busybox";
    displayMessage(message, out, nullptr);
    EXPECT_EQ(out.str(), "Pulling from library/busybox\n");
}

TEST_F(LineRenderer, status_keeps_newline_on_terminal) {
    Message message;
    message.status = "Digest: sha256:abc";
    displayMessage(message, out, &terminal);
    EXPECT_EQ(out.str(), "Digest: sha256:abc\n");
}

TEST_F(LineRenderer, stream_text_is_written_verbatim) {
    Message message;
    message.stream = "Step 1/2 : FROM busybox\n";
    message.status = "ignored";
    displayMessage(message, out, nullptr);
    EXPECT_EQ(out.str(), "Step 1/2 : FROM busybox\n");
}

TEST_F(LineRenderer, progress_is_suppressed_off_terminal) {
    Message message;
    message.id = "abc";
    message.status = "Downloading";
    message.progress = narrowProgress(50, 100);
    displayMessage(message, out, nullptr);
    EXPECT_EQ(out.str(), "");
}

TEST_F(LineRenderer, empty_progress_renders_status_off_terminal) {
    Message message;
    message.id = "abc";
    message.status = "Waiting";
    message.progress = narrowProgress(0, 0);
    displayMessage(message, out, nullptr);
    EXPECT_EQ(out.str(), "abc: Waiting\n");
}

TEST_F(LineRenderer, terminal_progress_overwrites_in_place) {
    Message message;
    message.id = "abc";
    message.status = "Downloading";
    message.progress = narrowProgress(50, 100);
    displayMessage(message, out, &terminal);
    EXPECT_EQ(out.str(), "<el1><el>\rabc: Downloading      50B/100B\r");
}

TEST_F(LineRenderer, prefixes_timestamp_id_and_source) {
    Message message;
    message.time = 1500000000;
    message.id = "f2a91732366c";
    message.from = "busybox:latest";
    message.status = "create";
    displayMessage(message, out, nullptr);
    EXPECT_EQ(out.str(), "2017-07-14T02:40:00.000000000Z f2a91732366c: (from busybox:latest) create\n");
}

TEST_F(LineRenderer, nanosecond_timestamp_is_preferred) {
    Message message;
    message.time = 1;
    message.time_nano = 1500000000000000042;
    message.status = "start";
    displayMessage(message, out, nullptr);
    EXPECT_EQ(out.str(), "2017-07-14T02:40:00.000000042Z start\n");
}

TEST_F(LineRenderer, timestamp_beyond_calendar_range_still_renders) {
    Message message;
    message.time = 9000000000000000000;
    message.status = "start";
    displayMessage(message, out, nullptr);
    EXPECT_EQ(out.str(), "285198648531-04-21T16:00:00.000000000Z start\n");
}

TEST_F(LineRenderer, legacy_progress_text) {
    Message message;
    message.id = "abc";
    message.status = "Extracting";
    message.progress_message = "[=====>     ] 5B/10B";

    displayMessage(message, out, nullptr);
    EXPECT_EQ(out.str(), "abc: Extracting [=====>     ] 5B/10B\n");

    out.str("");
    displayMessage(message, out, &terminal);
    EXPECT_EQ(out.str(), "abc: Extracting [=====>     ] 5B/10B");
}

TEST_F(LineRenderer, structured_progress_wins_over_legacy_text) {
    Message message;
    message.status = "Downloading";
    message.progress = narrowProgress(50, 100);
    message.progress_message = "legacy";
    displayMessage(message, out, &terminal);
    EXPECT_EQ(out.str(), "<el1><el>\rDownloading      50B/100B\r");
}

TEST_F(LineRenderer, failed_write_throws) {
    Message message;
    message.status = "Pulling";
    out.setstate(std::ios::badbit);
    EXPECT_THROW(displayMessage(message, out, nullptr), WriteError);
}
