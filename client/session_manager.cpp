// ============================================================
// session_manager.cpp
// ============================================================

#include "session_manager.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <thread>

void SessionManager::open_with_retry(const SessionParams& params) {
    int attempts = std::max(1, params.max_retries);
    for (int i = 1;; ++i) {
        try {
            remote_->open(params.host, params.port, params.timeout_s);
            return;
        } catch (const NetworkError& e) {
            if (i >= attempts) {
                LOG_ERROR("Connection to " + params.host + ":" + std::to_string(params.port) +
                          " failed after " + std::to_string(i) + " attempts");
                throw;
            }
            LOG_WARN("Connect attempt " + std::to_string(i) + "/" + std::to_string(attempts) +
                     " failed: " + e.what());
            std::this_thread::sleep_for(params.retry_delay);
        }
    }
}

std::unique_ptr<Session> SessionManager::connect(const SessionParams& params) {
    open_with_retry(params);

    std::string version = remote_->get_version();
    if (version != PBREMOTE_PROTOCOL_VERSION) {
        remote_->close();
        throw VersionMismatchError(PBREMOTE_PROTOCOL_VERSION, version);
    }

    remote_->login(params.user, params.passwd);
    LOG_DEBUG("Logged in to " + params.host + " as " + params.user +
              " (service " + version + ")");

    auto session = std::make_unique<Session>();
    session->params         = params;
    session->remote         = remote_;
    session->server_version = version;
    return session;
}
