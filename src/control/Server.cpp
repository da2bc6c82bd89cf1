#include "control/Server.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fmt/core.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

using namespace fa::control;

namespace {

constexpr int kBacklog = 16;
constexpr size_t kMaxDrainBytes = 64 * 1024;
constexpr timeval kReadTimeout{5, 0};

sockaddr_in loopbackAddress(const std::string& host, const uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
        throw std::invalid_argument(fmt::format("Invalid control host '{}'", host));
    return addr;
}

std::string errnoText(const std::string_view what) { return fmt::format("{}: {}", what, std::strerror(errno)); }

bool writen(const int fd, const void* buf, size_t n) {
    auto* p = static_cast<const unsigned char*>(buf);
    while (n) {
        const ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        p += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}

// Reads until a newline, EOF or `limit` bytes.
std::string readLine(const int fd, const size_t limit) {
    std::string line;
    char buf[kMaxCommandBytes];
    while (line.size() < limit && line.find('\n') == std::string::npos) {
        const ssize_t r = ::recv(fd, buf, std::min(sizeof(buf), limit - line.size()), 0);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) break;
        line.append(buf, static_cast<size_t>(r));
    }
    return line;
}

}

namespace fa::control {

std::string stripLineEnd(std::string line) {
    if (const auto nl = line.find('\n'); nl != std::string::npos) line.resize(nl);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
    return line;
}

}

Server::Server(const runtime::Context& ctx, Handler handler)
    : AsyncService("ControlServer", ctx.log->control()),
      handler_(std::move(handler)),
      host_(ctx.conf().daemon.control_host),
      port_(ctx.conf().daemon.control_port) {
    if (!handler_) throw std::invalid_argument("control server requires a command handler");
}

Server::~Server() {
    shutdown();
    closeListener();
}

void Server::openListener() {
    const auto addr = loopbackAddress(host_, port_);

    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) throw std::runtime_error(errnoText("socket()"));

    constexpr int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        const auto err = errnoText(fmt::format("bind({}:{})", host_, port_));
        ::close(fd);
        throw std::runtime_error(err);
    }
    if (::listen(fd, kBacklog) != 0) {
        const auto err = errnoText("listen()");
        ::close(fd);
        throw std::runtime_error(err);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) port_ = ntohs(bound.sin_port);

    {
        std::scoped_lock lock(listenMutex_);
        listenFd_ = fd;
    }
    log_->info("[ControlServer] Listening on {}:{}", host_, port_);
}

int Server::listenFd() const {
    std::scoped_lock lock(listenMutex_);
    return listenFd_;
}

void Server::closeListener() {
    std::scoped_lock lock(listenMutex_);
    if (listenFd_ >= 0) ::close(listenFd_);
    listenFd_ = -1;
}

void Server::start() {
    if (isRunning()) return;
    if (listenFd() < 0) openListener();
    AsyncService::start();
}

void Server::onStop() {
    // Wakes accept(); the worker closes the descriptor on its way out.
    std::scoped_lock lock(listenMutex_);
    if (listenFd_ >= 0) ::shutdown(listenFd_, SHUT_RDWR);
}

void Server::runLoop() {
    // Only this thread closes the listener while it runs.
    const int fd = listenFd();
    while (!interruptFlag_.load(std::memory_order_acquire)) {
        const int cfd = ::accept4(fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (cfd < 0) {
            if (interruptFlag_.load(std::memory_order_acquire)) break;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            log_->error("[ControlServer] {}", errnoText("accept()"));
            break;
        }

        serve(cfd);
        ::close(cfd);
    }
    closeListener();
}

void Server::serve(const int cfd) {
    ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &kReadTimeout, sizeof(kReadTimeout));

    const auto command = stripLineEnd(readLine(cfd, kMaxCommandBytes));
    log_->debug("[ControlServer] Command '{}'", command);

    std::string reply;
    try {
        reply = handler_(command);
    } catch (const std::exception& e) {
        log_->error("[ControlServer] Command '{}' failed: {}", command, e.what());
        reply = e.what();
    }

    reply.push_back('\n');
    if (!writen(cfd, reply.data(), reply.size())) {
        log_->warn("[ControlServer] {}", errnoText("Unable to send reply"));
        return;
    }

    // Unread input would turn close() into a reset and the peer could lose the reply.
    ::shutdown(cfd, SHUT_WR);
    char sink[256];
    for (size_t drained = 0; drained < kMaxDrainBytes;) {
        const ssize_t r = ::recv(cfd, sink, sizeof(sink), 0);
        if (r <= 0) break;
        drained += static_cast<size_t>(r);
    }
}

Client::Client(std::string host, const uint16_t port) : host_(std::move(host)), port_(port) {}

std::string Client::send(const std::string_view command) const {
    const auto addr = loopbackAddress(host_, port_);

    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) throw std::runtime_error(errnoText("socket()"));

    struct Closer {
        int fd;
        ~Closer() { ::close(fd); }
    } closer{fd};

    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        if (errno == ECONNREFUSED) throw NotRunning(fmt::format("nothing listening on {}:{}", host_, port_));
        throw std::runtime_error(errnoText(fmt::format("connect({}:{})", host_, port_)));
    }

    const auto line = fmt::format("{}\n", command);
    if (!writen(fd, line.data(), line.size())) throw std::runtime_error(errnoText("send()"));
    ::shutdown(fd, SHUT_WR);

    std::string reply;
    char buf[256];
    for (;;) {
        const ssize_t r = ::recv(fd, buf, sizeof(buf), 0);
        if (r < 0 && errno == EINTR) continue;
        if (r < 0) throw std::runtime_error(errnoText("recv()"));
        if (r == 0) break;
        reply.append(buf, static_cast<size_t>(r));
    }
    return stripLineEnd(std::move(reply));
}
