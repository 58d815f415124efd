#pragma once

// ============================================================
// errors.hpp -- Error taxonomy for the build-control client
// ============================================================

#include "platform.hpp"
#include <stdexcept>
#include <string>

enum class ErrorKind : u8 {
    NONE = 0,
    USAGE,
    NETWORK,           // transient: connect/poll/download retry
    PROTOCOL,          // malformed reply or chunk checksum mismatch
    VERSION_MISMATCH,  // never retried
    REMOTE_REJECTED,   // project busy during acknowledged upload
    REMOTE_ERROR,      // service answered MT_ERROR_MSG
    BUILD_FAILED,      // busy ended but final status != build_done
    TRANSFER,          // download retry budget exhausted
    LOCAL_EXEC,        // local collaborator returned nonzero
    INTERNAL,
};

inline const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:             return "none";
        case ErrorKind::USAGE:            return "usage";
        case ErrorKind::NETWORK:          return "network";
        case ErrorKind::PROTOCOL:         return "protocol";
        case ErrorKind::VERSION_MISMATCH: return "version-mismatch";
        case ErrorKind::REMOTE_REJECTED:  return "remote-rejected";
        case ErrorKind::REMOTE_ERROR:     return "remote-error";
        case ErrorKind::BUILD_FAILED:     return "build-failed";
        case ErrorKind::TRANSFER:         return "transfer";
        case ErrorKind::LOCAL_EXEC:       return "local-exec";
        case ErrorKind::INTERNAL:         return "internal";
    }
    return "?";
}

class ControlError : public std::runtime_error {
public:
    ControlError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class NetworkError : public ControlError {
public:
    explicit NetworkError(const std::string& msg)
        : ControlError(ErrorKind::NETWORK, msg) {}
};

class ProtocolError : public ControlError {
public:
    explicit ProtocolError(const std::string& msg)
        : ControlError(ErrorKind::PROTOCOL, msg) {}
};

class VersionMismatchError : public ControlError {
public:
    VersionMismatchError(const std::string& client_version,
                         const std::string& server_version)
        : ControlError(ErrorKind::VERSION_MISMATCH,
                       "Client: " + client_version + " Server: " + server_version)
        , client_version_(client_version)
        , server_version_(server_version) {}

    const std::string& client_version() const { return client_version_; }
    const std::string& server_version() const { return server_version_; }

private:
    std::string client_version_;
    std::string server_version_;
};

class RemoteRejectedError : public ControlError {
public:
    explicit RemoteRejectedError(const std::string& msg)
        : ControlError(ErrorKind::REMOTE_REJECTED, msg) {}
};

class RemoteError : public ControlError {
public:
    explicit RemoteError(const std::string& msg)
        : ControlError(ErrorKind::REMOTE_ERROR, msg) {}
};

class BuildFailedError : public ControlError {
public:
    explicit BuildFailedError(const std::string& status)
        : ControlError(ErrorKind::BUILD_FAILED,
                       "Project build was not successful, current status: " + status)
        , status_(status) {}

    const std::string& status() const { return status_; }

private:
    std::string status_;
};

class TransferError : public ControlError {
public:
    explicit TransferError(const std::string& msg)
        : ControlError(ErrorKind::TRANSFER, msg) {}
};

class LocalCommandError : public ControlError {
public:
    LocalCommandError(const std::string& cmd, int exit_code, const std::string& output)
        : ControlError(ErrorKind::LOCAL_EXEC,
                       "command failed (rc=" + std::to_string(exit_code) + "): " + cmd)
        , exit_code_(exit_code)
        , output_(output) {}

    int exit_code() const { return exit_code_; }
    const std::string& output() const { return output_; }

private:
    int exit_code_;
    std::string output_;
};

// Map any exception to its ErrorKind; foreign exceptions are INTERNAL.
inline ErrorKind classify(const std::exception& e) {
    if (auto* ce = dynamic_cast<const ControlError*>(&e)) return ce->kind();
    return ErrorKind::INTERNAL;
}

inline bool is_transient(ErrorKind k) {
    return k == ErrorKind::NETWORK || k == ErrorKind::PROTOCOL;
}
