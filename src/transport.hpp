#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>

namespace tether {

struct ReadResult {
    enum class Status { Ok, EndOfStream, DecodeError };

    Status status = Status::EndOfStream;
    nlohmann::json document; // valid when status == Ok
    std::string line;        // raw text, kept for DecodeError diagnostics
    std::string error;       // parser message for DecodeError

    bool ok() const { return status == Status::Ok; }
};

// Duplex, line-framed JSON stream: one document per line each way.
class Transport {
public:
    virtual ~Transport() = default;

    // Serialize, append '\n', write and flush. False if the peer is gone.
    virtual bool write_line(const nlohmann::json& document) = 0;

    // Block until one full line (or end of stream) and decode it.
    // Never throws on malformed input.
    virtual ReadResult read_line() = 0;

    // Diagnostic text the peer wrote out-of-band (stderr). May be empty.
    virtual std::string drain_stderr() { return {}; }
};

// Transport over the stdio pipes of a child process it spawns and owns.
class ProcessTransport : public Transport {
public:
    explicit ProcessTransport(std::chrono::milliseconds stop_grace = std::chrono::seconds(5));
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    // Launch argv[0] (PATH lookup) with stdin/stdout/stderr piped.
    // Returns false with *err set if the process cannot be spawned.
    bool start(const std::vector<std::string>& argv, std::string* err = nullptr);

    // SIGTERM, wait up to the grace period, then SIGKILL. Idempotent.
    void stop();

    bool running() const { return pid_ > 0; }
    pid_t pid() const { return pid_; }

    bool write_line(const nlohmann::json& document) override;
    ReadResult read_line() override;
    std::string drain_stderr() override;

private:
    void close_fds();

    std::chrono::milliseconds stop_grace_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::string read_buffer_;
    std::string stderr_buffer_;
    bool stdout_eof_ = false;
};

} // namespace tether
