// ============================================================
// status_stream.cpp
// ============================================================

#include "status_stream.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <thread>

StatusStream::StatusStream(RemoteService& remote, std::string project,
                           std::chrono::milliseconds poll_interval)
    : remote_(remote)
    , project_(std::move(project))
    , poll_interval_(poll_interval)
{
}

bool StatusStream::next(std::string& msg) {
    while (!finished_) {
        std::string reply;
        try {
            reply = remote_.get_project_busy(project_);
        } catch (const NetworkError& e) {
            LOG_WARN(std::string("Busy poll of ") + project_ + " failed, retrying: " + e.what());
            std::this_thread::sleep_for(poll_interval_);
            continue;
        }

        if (reply == PROJECT_FINISH_SENTINEL) {
            finished_ = true;
            break;
        }
        if (reply.empty()) {
            std::this_thread::sleep_for(poll_interval_);
            continue;
        }
        msg = std::move(reply);
        return true;
    }
    return false;
}

std::string StatusStream::final_status() {
    return remote_.get_project_status(project_);
}
