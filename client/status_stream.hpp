#pragma once

// ============================================================
// status_stream.hpp -- Busy-state poll as a pull sequence
// ============================================================

#include "remote_service.hpp"
#include <chrono>
#include <string>

class StatusStream {
public:
    StatusStream(RemoteService& remote, std::string project,
                 std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    // Blocks until the next progress message (true) or the finish sentinel
    // (false, and false on every later call). NetworkError is logged and the
    // poll repeated; empty replies are never returned.
    bool next(std::string& msg);

    bool finished() const { return finished_; }

    // Authoritative project status, queried after the stream has ended.
    std::string final_status();

private:
    RemoteService&            remote_;
    std::string               project_;
    std::chrono::milliseconds poll_interval_;
    bool                      finished_{false};
};
