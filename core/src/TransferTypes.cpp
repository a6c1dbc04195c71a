#include "skiff/TransferTypes.hpp"
#include <algorithm>

namespace skiff {

ProgressSample computeProgress(std::uint64_t bytesTransferred,
                               std::uint64_t totalBytes,
                               Seconds elapsed) {
    static constexpr double KIB = 1024.0;
    ProgressSample s;
    s.bytesTransferred = bytesTransferred;
    s.totalBytes = totalBytes;
    const double elapsedSec = std::max(0.0, elapsed.count());
    s.elapsed = Seconds(elapsedSec);
    if (elapsedSec > 0.0) s.speedKbps = (double(bytesTransferred) / KIB) / elapsedSec;
    double estimatedTotalSec = 0.0;
    if (s.speedKbps > 0.0) estimatedTotalSec = (double(totalBytes) / KIB) / s.speedKbps;
    // No speed means no estimate, not "done"
    s.eta = s.speedKbps > 0.0 ? Seconds(std::max(0.0, estimatedTotalSec - elapsedSec)) : Seconds(0.0);
    return s;
}

const char* outcomeKindName(TransferOutcome::Kind kind) {
    switch (kind) {
    case TransferOutcome::Kind::Success:
        return "Success";
    case TransferOutcome::Kind::Cancelled:
        return "Cancelled";
    case TransferOutcome::Kind::TimedOut:
        return "TimedOut";
    case TransferOutcome::Kind::ConnectionFailed:
        return "ConnectionFailed";
    case TransferOutcome::Kind::IoFailed:
        return "IoFailed";
    case TransferOutcome::Kind::Unhandled:
        return "Unhandled";
    }
    return "Unknown";
}

std::string describeOutcome(const TransferOutcome& outcome) {
    switch (outcome.kind) {
    case TransferOutcome::Kind::Success:
        return "Transfer completed.";
    case TransferOutcome::Kind::Cancelled:
        return "Transfer cancelled by user.";
    case TransferOutcome::Kind::TimedOut:
        return "Transfer timed out: " + outcome.detail + ".";
    case TransferOutcome::Kind::ConnectionFailed:
        return "Connection failed: " + outcome.detail;
    case TransferOutcome::Kind::IoFailed:
        return "Transfer failed: " + outcome.detail;
    case TransferOutcome::Kind::Unhandled:
        return "Unexpected error: " + outcome.detail;
    }
    return outcome.detail;
}

} // namespace skiff
