// Value types produced by the transfer engine.
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace skiff {

using Seconds = std::chrono::duration<double>;

// Snapshot of transfer metrics at one instant. Produced after every
// non-empty chunk and handed to the observer; the engine keeps none.
struct ProgressSample {
    std::uint64_t bytesTransferred = 0;
    std::uint64_t totalBytes = 0; // 0 = unknown
    double speedKbps = 0.0;       // KiB/s
    Seconds eta{0.0};
    Seconds elapsed{0.0};
};

// speed = (bytes/1024)/elapsed, estTotal = (total/1024)/speed,
// eta = max(0, estTotal - elapsed). Zero divisors yield 0.
ProgressSample computeProgress(std::uint64_t bytesTransferred,
                               std::uint64_t totalBytes,
                               Seconds elapsed);

// Terminal result of one transfer. Exactly one per call.
struct TransferOutcome {
    enum class Kind { Success, Cancelled, TimedOut, ConnectionFailed, IoFailed, Unhandled };

    Kind kind = Kind::Unhandled;
    std::string detail;

    bool ok() const { return kind == Kind::Success; }

    static TransferOutcome success() { return {Kind::Success, {}}; }
    static TransferOutcome cancelled() { return {Kind::Cancelled, "cancelled by user"}; }
    static TransferOutcome timedOut(std::string d) { return {Kind::TimedOut, std::move(d)}; }
    static TransferOutcome connectionFailed(std::string d) { return {Kind::ConnectionFailed, std::move(d)}; }
    static TransferOutcome ioFailed(std::string d) { return {Kind::IoFailed, std::move(d)}; }
    static TransferOutcome unhandled(std::string d) { return {Kind::Unhandled, std::move(d)}; }
};

const char* outcomeKindName(TransferOutcome::Kind kind);

// Human sentence for an outcome (presentation boundary).
std::string describeOutcome(const TransferOutcome& outcome);

// Observer must be cheap and must not block: it runs inline with the copy loop.
using ProgressCallback = std::function<void(const ProgressSample&)>;
using CompletionCallback = std::function<void()>;

struct TransferOptions {
    std::size_t chunkSize = 8 * 1024;
    std::chrono::milliseconds stallTimeout{30000};
    std::chrono::milliseconds stallBackoff{200};
    std::chrono::milliseconds operationTimeout{30000};
};

} // namespace skiff
