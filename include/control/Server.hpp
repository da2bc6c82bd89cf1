#pragma once

#include "concurrency/AsyncService.hpp"
#include "runtime/Context.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fa::control {

// Longest command line read from a connection.
inline constexpr size_t kMaxCommandBytes = 128;

// Line-oriented loopback TCP control socket: one command in, one reply out, close.
class Server final : public concurrency::AsyncService {
public:
    using Handler = std::function<std::string(const std::string& command)>;

    Server(const runtime::Context& ctx, Handler handler);
    ~Server() override;

    // Binds and listens before the accept thread starts, so address errors throw here.
    void start() override;

    [[nodiscard]] const std::string& host() const noexcept { return host_; }

    // The bound port; differs from the configured one when that was 0.
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

protected:
    void runLoop() override;
    void onStop() override;

private:
    Handler handler_;
    std::string host_;
    uint16_t port_;
    // Guards listenFd_ so onStop() never shuts down a descriptor number closeListener() released.
    mutable std::mutex listenMutex_;
    int listenFd_ = -1;

    [[nodiscard]] int listenFd() const;

    void openListener();
    void closeListener();
    void serve(int cfd);
};

// Sends one command to a running daemon and returns its reply line.
class Client {
public:
    Client(std::string host, uint16_t port);

    // Throws NotRunning when nothing is listening, std::runtime_error on other failures.
    [[nodiscard]] std::string send(std::string_view command) const;

private:
    std::string host_;
    uint16_t port_;
};

struct NotRunning : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Drops a trailing "\r\n" / "\n".
std::string stripLineEnd(std::string line);

}
