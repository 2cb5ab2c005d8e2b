#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:                return "None";
    case ErrorKind::AuthenticationError: return "AuthenticationError";
    case ErrorKind::ConnectionLost:      return "ConnectionLost";
    case ErrorKind::IOError:             return "IOError";
    case ErrorKind::SizeMismatch:        return "SizeMismatch";
    case ErrorKind::ChecksumMismatch:    return "ChecksumMismatch";
    case ErrorKind::Timeout:             return "Timeout";
    case ErrorKind::Cancelled:           return "Cancelled";
    case ErrorKind::LocalSourceMissing:  return "LocalSourceMissing";
    case ErrorKind::InvalidDestination:  return "InvalidDestination";
    }
    return "Unknown";
}

const char* transfer_status_name(TransferStatus status) {
    switch (status) {
    case TransferStatus::Pending:  return "Pending";
    case TransferStatus::InFlight: return "InFlight";
    case TransferStatus::Success:  return "Success";
    case TransferStatus::Failed:   return "Failed";
    case TransferStatus::Skipped:  return "Skipped";
    }
    return "Unknown";
}

const char* run_status_name(RunStatus status) {
    switch (status) {
    case RunStatus::Success:        return "Success";
    case RunStatus::PartialFailure: return "PartialFailure";
    case RunStatus::Failed:         return "Failed";
    }
    return "Unknown";
}

size_t RunReport::count(TransferStatus status) const {
    size_t n = 0;
    for (const auto& r : results) {
        if (r.status == status) n++;
    }
    return n;
}

uint64_t RunReport::total_bytes() const {
    uint64_t total = 0;
    for (const auto& r : results) {
        if (r.ok()) total += r.bytes_transferred;
    }
    return total;
}
