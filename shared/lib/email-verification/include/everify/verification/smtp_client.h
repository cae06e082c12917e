/**
 * @file smtp_client.h
 * @brief SMTP mailbox probing (RFC 5321 dialogue up to RCPT TO)
 *
 * The dialogue runs over ILineChannel so it can be driven by a real TCP
 * socket or by a scripted channel in tests.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "types.h"
#include "providers.h"

namespace everify::verification {

/**
 * @brief CRLF line transport
 *
 * Implementations throw common::SmtpException on timeout or I/O failure.
 */
class ILineChannel {
public:
    virtual ~ILineChannel() = default;

    /// @brief Send one line; CRLF is appended
    virtual void sendLine(const std::string& line) = 0;

    /// @brief Read one line without its line terminator
    virtual std::string readLine() = 0;
};

/**
 * @brief TCP line channel with connect and I/O timeouts
 */
class SocketLineChannel : public ILineChannel {
public:
    /**
     * @brief Connect to host:port, trying every resolved address
     * @throws common::SmtpException when no address accepts the connection
     */
    static std::unique_ptr<SocketLineChannel> connect(
        const std::string& host, int port, int connectTimeoutSec, int ioTimeoutSec);

    ~SocketLineChannel() override;

    SocketLineChannel(const SocketLineChannel&) = delete;
    SocketLineChannel& operator=(const SocketLineChannel&) = delete;

    void sendLine(const std::string& line) override;
    std::string readLine() override;

private:
    SocketLineChannel(int fd, int ioTimeoutSec) : fd_(fd), ioTimeoutMs_(ioTimeoutSec * 1000) {}

    int fd_;
    int ioTimeoutMs_;
    std::string buffer_;
};

/// @brief Parsed (possibly multi-line) SMTP reply
struct SmtpReply {
    int code = 0;
    std::vector<std::string> lines;

    bool isPositive() const { return code >= 200 && code < 300; }
    bool isTransient() const { return code >= 400 && code < 500; }
    std::string text() const;
};

/**
 * @brief Command/reply exchange over a line channel
 */
class SmtpSession {
public:
    explicit SmtpSession(ILineChannel& channel) : channel_(channel) {}

    /**
     * @brief Read a reply, following "NNN-" continuation lines
     * @throws common::SmtpException on malformed reply or transport failure
     */
    SmtpReply readReply();

    /// @brief Send a command and read its reply
    SmtpReply command(const std::string& line);

private:
    ILineChannel& channel_;
};

struct SmtpProbeOptions {
    int port = 25;
    int connectTimeoutSec = 6;
    int ioTimeoutSec = 8;
    std::string heloDomain = "example.com";
    std::string mailFrom = "verify@example.com";
    int maxHosts = 3;             ///< MX hosts tried until a definitive answer
    bool retryTransient = true;   ///< Retry once on the same host after 4xx
};

/**
 * @brief SMTP prober
 *
 * Usage:
 * @code
 *   SmtpProber prober(options);
 *   SmtpProbeOutcome outcome = prober.probe("john@example.com", mx.hosts);
 * @endcode
 */
class SmtpProber : public ISmtpProber {
public:
    using ChannelFactory = std::function<std::unique_ptr<ILineChannel>(
        const std::string& host, const SmtpProbeOptions& options)>;

    /**
     * @param options Dialogue settings
     * @param factory Channel factory; defaults to SocketLineChannel::connect
     */
    explicit SmtpProber(SmtpProbeOptions options, ChannelFactory factory = nullptr);

    SmtpProbeOutcome probe(const std::string& email, const std::vector<std::string>& mxHosts) override;

    /// @brief Probe a single host, including the transient retry
    SmtpProbeOutcome probeHost(const std::string& email, const std::string& host);

    /**
     * @brief Run greeting, EHLO/HELO, MAIL FROM, RCPT TO and QUIT on a channel
     *
     * Never throws; transport failures produce UNKNOWN.
     */
    static SmtpProbeOutcome runDialogue(
        ILineChannel& channel,
        const std::string& email,
        const SmtpProbeOptions& options);

    /// @brief Map a RCPT TO reply code to a probe status
    static SmtpProbeStatus classifyRcptReply(int code);

    const SmtpProbeOptions& options() const { return options_; }

private:
    SmtpProbeOptions options_;
    ChannelFactory factory_;
};

} // namespace everify::verification
