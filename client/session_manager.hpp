#pragma once

// ============================================================
// session_manager.hpp -- Connect, version gate, login
// ============================================================

#include "../common/platform.hpp"
#include "remote_service.hpp"
#include <chrono>
#include <memory>
#include <string>

// Upper bound for --timeout, one day.
static constexpr int MAX_TIMEOUT_S = 24 * 60 * 60;

struct SessionParams {
    std::string host{"localhost"};
    u16         port{7587};
    std::string user{"root"};
    std::string passwd{"foo"};
    int         timeout_s{90};
    int         max_retries{10};
    std::chrono::milliseconds retry_delay{1000};
};

// One live, authenticated connection. Used by a single workflow.
struct Session {
    SessionParams                  params;
    std::shared_ptr<RemoteService> remote;
    std::string                    server_version;
};

class SessionManager {
public:
    explicit SessionManager(std::shared_ptr<RemoteService> remote)
        : remote_(std::move(remote)) {}

    // Opens the transport with up to max_retries attempts (NetworkError only),
    // then checks the service version and logs in. A version mismatch throws
    // VersionMismatchError before any login is attempted.
    std::unique_ptr<Session> connect(const SessionParams& params);

private:
    void open_with_retry(const SessionParams& params);

    std::shared_ptr<RemoteService> remote_;
};
