/**
 * @file smtp_client.cpp
 * @brief SMTP mailbox probing implementation
 */

#include "everify/verification/smtp_client.h"
#include "exception/exceptions.h"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <spdlog/spdlog.h>

namespace everify::verification {

using common::SmtpException;

namespace {

constexpr size_t MAX_LINE_LENGTH = 4096;
constexpr int MAX_REPLY_LINES = 100;

bool waitFor(int fd, short events, int timeoutMs) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;

    int rc;
    do {
        rc = poll(&pfd, 1, timeoutMs);
    } while (rc < 0 && errno == EINTR);

    return rc > 0;
}

int connectWithTimeout(const struct addrinfo* ai, int timeoutMs, std::string& error) {
    int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
        error = std::strerror(errno);
        return -1;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
        return fd;
    }
    if (errno != EINPROGRESS) {
        error = std::strerror(errno);
        close(fd);
        return -1;
    }

    if (!waitFor(fd, POLLOUT, timeoutMs)) {
        error = "connect timed out";
        close(fd);
        return -1;
    }

    int soError = 0;
    socklen_t len = sizeof(soError);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0) {
        error = std::strerror(soError ? soError : errno);
        close(fd);
        return -1;
    }
    return fd;
}

} // anonymous namespace

// ============================================================================
// SocketLineChannel
// ============================================================================

std::unique_ptr<SocketLineChannel> SocketLineChannel::connect(
    const std::string& host, int port, int connectTimeoutSec, int ioTimeoutSec)
{
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string portStr = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
    if (rc != 0) {
        throw SmtpException(host + ": " + gai_strerror(rc));
    }

    std::string lastError = "no address";
    int fd = -1;
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = connectWithTimeout(ai, connectTimeoutSec * 1000, lastError);
        if (fd >= 0) {
            break;
        }
    }
    freeaddrinfo(res);

    if (fd < 0) {
        throw SmtpException(host + ":" + portStr + ": " + lastError);
    }

    spdlog::trace("[SmtpClient] Connected to {}:{}", host, port);
    return std::unique_ptr<SocketLineChannel>(new SocketLineChannel(fd, ioTimeoutSec));
}

SocketLineChannel::~SocketLineChannel() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

void SocketLineChannel::sendLine(const std::string& line) {
    std::string data = line + "\r\n";
    size_t sent = 0;

    while (sent < data.size()) {
        if (!waitFor(fd_, POLLOUT, ioTimeoutMs_)) {
            throw SmtpException("send timed out");
        }
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            throw SmtpException(std::string("send failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

std::string SocketLineChannel::readLine() {
    while (true) {
        size_t nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        if (buffer_.size() > MAX_LINE_LENGTH) {
            throw SmtpException("reply line too long");
        }

        if (!waitFor(fd_, POLLIN, ioTimeoutMs_)) {
            throw SmtpException("read timed out");
        }

        char chunk[1024];
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n == 0) {
            throw SmtpException("connection closed by server");
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            throw SmtpException(std::string("recv failed: ") + std::strerror(errno));
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

// ============================================================================
// SmtpReply / SmtpSession
// ============================================================================

std::string SmtpReply::text() const {
    std::string result;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) result += " ";
        result += lines[i];
    }
    return result;
}

SmtpReply SmtpSession::readReply() {
    SmtpReply reply;

    for (int n = 0; n < MAX_REPLY_LINES; n++) {
        std::string line = channel_.readLine();
        if (line.size() < 3 ||
            !std::isdigit(static_cast<unsigned char>(line[0])) ||
            !std::isdigit(static_cast<unsigned char>(line[1])) ||
            !std::isdigit(static_cast<unsigned char>(line[2]))) {
            throw SmtpException("malformed reply: " + line);
        }

        int code = std::stoi(line.substr(0, 3));
        if (reply.code != 0 && code != reply.code) {
            throw SmtpException("inconsistent multi-line reply codes");
        }
        reply.code = code;
        reply.lines.push_back(line.size() > 4 ? line.substr(4) : "");

        if (line.size() < 4 || line[3] != '-') {
            return reply;
        }
    }
    throw SmtpException("reply has too many lines");
}

SmtpReply SmtpSession::command(const std::string& line) {
    channel_.sendLine(line);
    return readReply();
}

// ============================================================================
// SmtpProber
// ============================================================================

SmtpProber::SmtpProber(SmtpProbeOptions options, ChannelFactory factory)
    : options_(std::move(options))
    , factory_(std::move(factory))
{
    if (!factory_) {
        factory_ = [](const std::string& host, const SmtpProbeOptions& opts) -> std::unique_ptr<ILineChannel> {
            return SocketLineChannel::connect(host, opts.port, opts.connectTimeoutSec, opts.ioTimeoutSec);
        };
    }
    if (options_.maxHosts < 1) {
        options_.maxHosts = 1;
    }
}

SmtpProbeStatus SmtpProber::classifyRcptReply(int code) {
    if (code >= 200 && code < 300) {
        return SmtpProbeStatus::ACCEPTED;
    }
    if (code == 550 || code == 551 || code == 553) {
        return SmtpProbeStatus::REJECTED;
    }
    return SmtpProbeStatus::UNKNOWN;
}

SmtpProbeOutcome SmtpProber::runDialogue(
    ILineChannel& channel,
    const std::string& email,
    const SmtpProbeOptions& options)
{
    SmtpProbeOutcome outcome;
    SmtpSession session(channel);

    try {
        SmtpReply greeting = session.readReply();
        if (greeting.code != 220) {
            outcome.message = "greeting refused: " + std::to_string(greeting.code) + " " + greeting.text();
            return outcome;
        }

        SmtpReply hello = session.command("EHLO " + options.heloDomain);
        if (!hello.isPositive()) {
            hello = session.command("HELO " + options.heloDomain);
        }
        if (!hello.isPositive()) {
            outcome.message = "HELO refused: " + std::to_string(hello.code);
            return outcome;
        }

        SmtpReply mailFrom = session.command("MAIL FROM:<" + options.mailFrom + ">");
        if (!mailFrom.isPositive()) {
            outcome.replyCode = mailFrom.code;
            outcome.message = "MAIL FROM refused: " + std::to_string(mailFrom.code) + " " + mailFrom.text();
            return outcome;
        }

        SmtpReply rcpt = session.command("RCPT TO:<" + email + ">");
        outcome.replyCode = rcpt.code;
        outcome.status = classifyRcptReply(rcpt.code);
        outcome.message = std::to_string(rcpt.code) + " " + rcpt.text();
    } catch (const SmtpException& e) {
        outcome.status = SmtpProbeStatus::UNKNOWN;
        outcome.message = e.what();
        return outcome;
    }

    try {
        channel.sendLine("QUIT");
    } catch (const SmtpException& e) {
        spdlog::trace("[SmtpClient] QUIT failed: {}", e.what());
    }
    return outcome;
}

SmtpProbeOutcome SmtpProber::probeHost(const std::string& email, const std::string& host) {
    SmtpProbeOutcome outcome;
    int attempts = options_.retryTransient ? 2 : 1;

    for (int attempt = 1; attempt <= attempts; attempt++) {
        try {
            std::unique_ptr<ILineChannel> channel = factory_(host, options_);
            outcome = runDialogue(*channel, email, options_);
        } catch (const SmtpException& e) {
            outcome = SmtpProbeOutcome{};
            outcome.message = e.what();
            spdlog::debug("[SmtpClient] {} unreachable: {}", host, e.what());
            break;
        }

        bool transient = outcome.replyCode >= 400 && outcome.replyCode < 500;
        if (!transient) {
            break;
        }
        spdlog::debug("[SmtpClient] {} answered {} for {} (attempt {}/{})",
                      host, outcome.replyCode, email, attempt, attempts);
    }

    outcome.host = host;
    return outcome;
}

SmtpProbeOutcome SmtpProber::probe(const std::string& email, const std::vector<std::string>& mxHosts) {
    SmtpProbeOutcome outcome;
    outcome.message = "no MX hosts";

    size_t limit = std::min(mxHosts.size(), static_cast<size_t>(options_.maxHosts));
    for (size_t i = 0; i < limit; i++) {
        outcome = probeHost(email, mxHosts[i]);
        if (outcome.status != SmtpProbeStatus::UNKNOWN) {
            break;
        }
    }

    spdlog::debug("[SmtpClient] {} -> {} ({})", email,
                  smtpProbeStatusToString(outcome.status), outcome.message);
    return outcome;
}

} // namespace everify::verification
