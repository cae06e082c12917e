/**
 * @file test_smtp_client.cpp
 * @brief Unit tests for the SMTP dialogue and host walking
 *
 * A scripted channel replays server lines and records client commands.
 */

#include <gtest/gtest.h>
#include <everify/verification/smtp_client.h>
#include <exception/exceptions.h>

#include <deque>
#include <map>

using namespace everify::verification;

// ============================================================================
// Scripted channel
// ============================================================================

class ScriptedChannel : public ILineChannel {
public:
    std::deque<std::string> serverLines;
    std::vector<std::string> sent;

    explicit ScriptedChannel(std::deque<std::string> lines) : serverLines(std::move(lines)) {}

    void sendLine(const std::string& line) override { sent.push_back(line); }

    std::string readLine() override {
        if (serverLines.empty()) {
            throw common::SmtpException("read timed out");
        }
        std::string line = serverLines.front();
        serverLines.pop_front();
        return line;
    }
};

namespace {

std::deque<std::string> conversation(const std::string& rcptReply) {
    return {
        "220 mx.example.com ESMTP ready",
        "250-mx.example.com greets example.com",
        "250-PIPELINING",
        "250 8BITMIME",
        "250 2.1.0 Ok",
        rcptReply,
    };
}

} // anonymous namespace

// ============================================================================
// Reply parsing
// ============================================================================

TEST(SmtpSessionTest, MultiLineReply) {
    ScriptedChannel channel({"250-first", "250-second", "250 last"});
    SmtpSession session(channel);

    SmtpReply reply = session.readReply();
    EXPECT_EQ(reply.code, 250);
    ASSERT_EQ(reply.lines.size(), 3u);
    EXPECT_EQ(reply.text(), "first second last");
    EXPECT_TRUE(reply.isPositive());
}

TEST(SmtpSessionTest, MalformedReplyThrows) {
    ScriptedChannel channel({"hello"});
    SmtpSession session(channel);
    EXPECT_THROW(session.readReply(), common::SmtpException);
}

TEST(SmtpSessionTest, BareCode) {
    ScriptedChannel channel({"354"});
    SmtpSession session(channel);
    EXPECT_EQ(session.readReply().code, 354);
}

// ============================================================================
// RCPT mapping
// ============================================================================

TEST(SmtpProberTest, ClassifyRcptReply) {
    EXPECT_EQ(SmtpProber::classifyRcptReply(250), SmtpProbeStatus::ACCEPTED);
    EXPECT_EQ(SmtpProber::classifyRcptReply(251), SmtpProbeStatus::ACCEPTED);
    EXPECT_EQ(SmtpProber::classifyRcptReply(550), SmtpProbeStatus::REJECTED);
    EXPECT_EQ(SmtpProber::classifyRcptReply(551), SmtpProbeStatus::REJECTED);
    EXPECT_EQ(SmtpProber::classifyRcptReply(553), SmtpProbeStatus::REJECTED);
    EXPECT_EQ(SmtpProber::classifyRcptReply(552), SmtpProbeStatus::UNKNOWN);
    EXPECT_EQ(SmtpProber::classifyRcptReply(450), SmtpProbeStatus::UNKNOWN);
    EXPECT_EQ(SmtpProber::classifyRcptReply(0), SmtpProbeStatus::UNKNOWN);
}

// ============================================================================
// Dialogue
// ============================================================================

TEST(SmtpProberTest, Dialogue_Accepted) {
    ScriptedChannel channel(conversation("250 2.1.5 Ok"));
    SmtpProbeOptions options;

    auto outcome = SmtpProber::runDialogue(channel, "john@example.com", options);

    EXPECT_EQ(outcome.status, SmtpProbeStatus::ACCEPTED);
    EXPECT_EQ(outcome.replyCode, 250);
    ASSERT_EQ(channel.sent.size(), 4u);
    EXPECT_EQ(channel.sent[0], "EHLO example.com");
    EXPECT_EQ(channel.sent[1], "MAIL FROM:<verify@example.com>");
    EXPECT_EQ(channel.sent[2], "RCPT TO:<john@example.com>");
    EXPECT_EQ(channel.sent[3], "QUIT");
}

TEST(SmtpProberTest, Dialogue_Rejected) {
    ScriptedChannel channel(conversation("550 5.1.1 User unknown"));
    auto outcome = SmtpProber::runDialogue(channel, "nobody@example.com", SmtpProbeOptions{});

    EXPECT_EQ(outcome.status, SmtpProbeStatus::REJECTED);
    EXPECT_EQ(outcome.replyCode, 550);
    EXPECT_NE(outcome.message.find("User unknown"), std::string::npos);
}

TEST(SmtpProberTest, Dialogue_CustomHeloAndSender) {
    ScriptedChannel channel(conversation("250 Ok"));
    SmtpProbeOptions options;
    options.heloDomain = "probe.test";
    options.mailFrom = "bounce@probe.test";

    SmtpProber::runDialogue(channel, "a@example.com", options);
    EXPECT_EQ(channel.sent[0], "EHLO probe.test");
    EXPECT_EQ(channel.sent[1], "MAIL FROM:<bounce@probe.test>");
}

TEST(SmtpProberTest, Dialogue_FallsBackToHelo) {
    ScriptedChannel channel({
        "220 old.example.com",
        "502 Command not implemented",
        "250 old.example.com",
        "250 Ok",
        "250 Ok",
    });

    auto outcome = SmtpProber::runDialogue(channel, "a@example.com", SmtpProbeOptions{});
    EXPECT_EQ(outcome.status, SmtpProbeStatus::ACCEPTED);
    EXPECT_EQ(channel.sent[0], "EHLO example.com");
    EXPECT_EQ(channel.sent[1], "HELO example.com");
}

TEST(SmtpProberTest, Dialogue_GreetingRefused) {
    ScriptedChannel channel({"554 No SMTP service here"});
    auto outcome = SmtpProber::runDialogue(channel, "a@example.com", SmtpProbeOptions{});

    EXPECT_EQ(outcome.status, SmtpProbeStatus::UNKNOWN);
    EXPECT_TRUE(channel.sent.empty());
}

TEST(SmtpProberTest, Dialogue_TimeoutIsUnknown) {
    ScriptedChannel channel({"220 ready"});   // server goes silent after greeting
    auto outcome = SmtpProber::runDialogue(channel, "a@example.com", SmtpProbeOptions{});

    EXPECT_EQ(outcome.status, SmtpProbeStatus::UNKNOWN);
    EXPECT_NE(outcome.message.find("timed out"), std::string::npos);
}

// ============================================================================
// Host walking and retry
// ============================================================================

class SmtpProberHostTest : public ::testing::Test {
protected:
    std::map<std::string, std::deque<std::deque<std::string>>> scripts_;
    std::vector<std::string> connects_;

    SmtpProber::ChannelFactory factory() {
        return [this](const std::string& host, const SmtpProbeOptions&) -> std::unique_ptr<ILineChannel> {
            connects_.push_back(host);
            auto& queue = scripts_[host];
            if (queue.empty()) {
                throw common::SmtpException(host + ": connection refused");
            }
            auto lines = queue.front();
            queue.pop_front();
            return std::make_unique<ScriptedChannel>(lines);
        };
    }
};

TEST_F(SmtpProberHostTest, FirstDefinitiveHostWins) {
    scripts_["mx1"].push_back(conversation("550 no such user"));

    SmtpProber prober(SmtpProbeOptions{}, factory());
    auto outcome = prober.probe("a@example.com", {"mx1", "mx2"});

    EXPECT_EQ(outcome.status, SmtpProbeStatus::REJECTED);
    EXPECT_EQ(outcome.host, "mx1");
    EXPECT_EQ(connects_.size(), 1u);
}

TEST_F(SmtpProberHostTest, UnreachableHostFallsThrough) {
    scripts_["mx2"].push_back(conversation("250 ok"));

    SmtpProber prober(SmtpProbeOptions{}, factory());
    auto outcome = prober.probe("a@example.com", {"mx1", "mx2"});

    EXPECT_EQ(outcome.status, SmtpProbeStatus::ACCEPTED);
    EXPECT_EQ(outcome.host, "mx2");
}

TEST_F(SmtpProberHostTest, TransientReplyRetriedOnce) {
    scripts_["mx1"].push_back(conversation("451 greylisted, try later"));
    scripts_["mx1"].push_back(conversation("250 ok"));

    SmtpProber prober(SmtpProbeOptions{}, factory());
    auto outcome = prober.probe("a@example.com", {"mx1"});

    EXPECT_EQ(outcome.status, SmtpProbeStatus::ACCEPTED);
    EXPECT_EQ(connects_.size(), 2u);
}

TEST_F(SmtpProberHostTest, NoRetryWhenDisabled) {
    scripts_["mx1"].push_back(conversation("451 greylisted"));
    scripts_["mx1"].push_back(conversation("250 ok"));

    SmtpProbeOptions options;
    options.retryTransient = false;
    options.maxHosts = 1;
    SmtpProber prober(options, factory());
    auto outcome = prober.probe("a@example.com", {"mx1"});

    EXPECT_EQ(outcome.status, SmtpProbeStatus::UNKNOWN);
    EXPECT_EQ(outcome.replyCode, 451);
    EXPECT_EQ(connects_.size(), 1u);
}

TEST_F(SmtpProberHostTest, AtMostMaxHostsTried) {
    SmtpProbeOptions options;
    options.maxHosts = 3;
    SmtpProber prober(options, factory());

    auto outcome = prober.probe("a@example.com", {"mx1", "mx2", "mx3", "mx4"});
    EXPECT_EQ(outcome.status, SmtpProbeStatus::UNKNOWN);
    ASSERT_EQ(connects_.size(), 3u);
    EXPECT_EQ(connects_.back(), "mx3");
}

TEST_F(SmtpProberHostTest, NoHosts) {
    SmtpProber prober(SmtpProbeOptions{}, factory());
    auto outcome = prober.probe("a@example.com", {});
    EXPECT_EQ(outcome.status, SmtpProbeStatus::UNKNOWN);
    EXPECT_TRUE(connects_.empty());
}
