/*
 * ferry/src/downloader/transfer_error.cpp
 *
 * Classification and user-facing text for TransferError.
 */

#include <ferry/downloader/transfer_error.hpp>
#include <ferry/downloader/types.hpp>

#include <spdlog/fmt/fmt.h>

#include <string>
#include <utility>

namespace ferry::downloader {

namespace {

TransferError make(TransferErrorKind kind, std::string detail = {}) {
    TransferError e;
    e.kind = kind;
    e.detail = std::move(detail);
    return e;
}

} // namespace

const char* kindName(TransferErrorKind kind) noexcept {
    switch (kind) {
        case TransferErrorKind::InsufficientStorage:
            return "insufficient_storage";
        case TransferErrorKind::NetworkUnavailable:
            return "network_unavailable";
        case TransferErrorKind::InvalidUrl:
            return "invalid_url";
        case TransferErrorKind::FileMoveFailed:
            return "file_move_failed";
        case TransferErrorKind::ResumeTokenCorrupted:
            return "resume_token_corrupted";
        case TransferErrorKind::ServerError:
            return "server_error";
        case TransferErrorKind::Timeout:
            return "timeout";
        case TransferErrorKind::Cancelled:
            return "cancelled";
        case TransferErrorKind::TaskNotFound:
            return "task_not_found";
        case TransferErrorKind::MaxRetriesExceeded:
            return "max_retries_exceeded";
        case TransferErrorKind::AlreadyDownloading:
            return "already_downloading";
        case TransferErrorKind::ConnectionLost:
            return "connection_lost";
        case TransferErrorKind::CertificateError:
            return "certificate_error";
        case TransferErrorKind::ServerNotFound:
            return "server_not_found";
        case TransferErrorKind::Unknown:
            return "unknown";
    }
    return "unknown";
}

TransferError TransferError::insufficientStorage(std::uint64_t required, std::uint64_t available) {
    auto e = make(TransferErrorKind::InsufficientStorage);
    e.requiredBytes = required;
    e.availableBytes = available;
    return e;
}

TransferError TransferError::networkUnavailable() {
    return make(TransferErrorKind::NetworkUnavailable);
}

TransferError TransferError::invalidUrl(std::string url) {
    return make(TransferErrorKind::InvalidUrl, std::move(url));
}

TransferError TransferError::fileMoveFailed(std::string reason) {
    return make(TransferErrorKind::FileMoveFailed, std::move(reason));
}

TransferError TransferError::resumeTokenCorrupted() {
    return make(TransferErrorKind::ResumeTokenCorrupted);
}

TransferError TransferError::serverError(int statusCode) {
    auto e = make(TransferErrorKind::ServerError);
    e.statusCode = statusCode;
    return e;
}

TransferError TransferError::timeout() {
    return make(TransferErrorKind::Timeout);
}

TransferError TransferError::cancelled() {
    return make(TransferErrorKind::Cancelled);
}

TransferError TransferError::taskNotFound(std::string taskId) {
    return make(TransferErrorKind::TaskNotFound, std::move(taskId));
}

TransferError TransferError::maxRetriesExceeded(int attempts) {
    auto e = make(TransferErrorKind::MaxRetriesExceeded);
    e.attempts = attempts;
    return e;
}

TransferError TransferError::alreadyDownloading() {
    return make(TransferErrorKind::AlreadyDownloading);
}

TransferError TransferError::connectionLost() {
    return make(TransferErrorKind::ConnectionLost);
}

TransferError TransferError::certificateError() {
    return make(TransferErrorKind::CertificateError);
}

TransferError TransferError::serverNotFound() {
    return make(TransferErrorKind::ServerNotFound);
}

TransferError TransferError::unknown(std::string message) {
    return make(TransferErrorKind::Unknown, std::move(message));
}

TransferError TransferError::fromHttpStatus(int statusCode) {
    if (statusCode >= 400) {
        return serverError(statusCode);
    }
    return unknown(fmt::format("Unexpected HTTP status {}", statusCode));
}

bool TransferError::isRetryable() const noexcept {
    switch (kind) {
        case TransferErrorKind::NetworkUnavailable:
        case TransferErrorKind::FileMoveFailed:
        case TransferErrorKind::ResumeTokenCorrupted:
        case TransferErrorKind::Timeout:
        case TransferErrorKind::ConnectionLost:
        case TransferErrorKind::ServerNotFound:
        case TransferErrorKind::Unknown:
            return true;
        case TransferErrorKind::ServerError:
            return statusCode >= 500;
        case TransferErrorKind::InsufficientStorage:
        case TransferErrorKind::InvalidUrl:
        case TransferErrorKind::Cancelled:
        case TransferErrorKind::TaskNotFound:
        case TransferErrorKind::MaxRetriesExceeded:
        case TransferErrorKind::AlreadyDownloading:
        case TransferErrorKind::CertificateError:
            return false;
    }
    return false;
}

bool TransferError::shouldAutoPause() const noexcept {
    return kind == TransferErrorKind::NetworkUnavailable ||
           kind == TransferErrorKind::ConnectionLost;
}

std::string TransferError::message() const {
    switch (kind) {
        case TransferErrorKind::InsufficientStorage:
            return fmt::format("Insufficient storage space. Required: {}, Available: {}",
                               formatByteCount(requiredBytes), formatByteCount(availableBytes));
        case TransferErrorKind::NetworkUnavailable:
            return "No network connection available";
        case TransferErrorKind::InvalidUrl:
            return fmt::format("Invalid download URL: {}", detail);
        case TransferErrorKind::FileMoveFailed:
            return fmt::format("Failed to save downloaded file: {}", detail);
        case TransferErrorKind::ResumeTokenCorrupted:
            return "Resume data is corrupted and cannot be used";
        case TransferErrorKind::ServerError:
            if (!detail.empty())
                return fmt::format("Server error (HTTP {}): {}", statusCode, detail);
            return fmt::format("Server error (HTTP {})", statusCode);
        case TransferErrorKind::Timeout:
            return "Download request timed out";
        case TransferErrorKind::Cancelled:
            return "Download was cancelled";
        case TransferErrorKind::TaskNotFound:
            return fmt::format("Download task not found: {}", detail);
        case TransferErrorKind::MaxRetriesExceeded:
            return fmt::format("Download failed after {} attempts", attempts);
        case TransferErrorKind::AlreadyDownloading:
            return "Download is already in progress";
        case TransferErrorKind::ConnectionLost:
            return "Network connection was lost";
        case TransferErrorKind::CertificateError:
            return "SSL certificate verification failed";
        case TransferErrorKind::ServerNotFound:
            return "Server not found";
        case TransferErrorKind::Unknown:
            return detail.empty() ? std::string{"Unknown download error"} : detail;
    }
    return detail;
}

std::string TransferError::recoverySuggestion() const {
    switch (kind) {
        case TransferErrorKind::InsufficientStorage:
            return "Free up disk space, then try again.";
        case TransferErrorKind::NetworkUnavailable:
        case TransferErrorKind::Timeout:
            return "Check your network connection and try again.";
        case TransferErrorKind::InvalidUrl:
            return "The download URL is invalid. Please report this issue.";
        case TransferErrorKind::FileMoveFailed:
            return "Restart the application and download again.";
        case TransferErrorKind::ResumeTokenCorrupted:
            return "The download will restart from the beginning.";
        case TransferErrorKind::ServerError:
            if (statusCode >= 500)
                return "The server is experiencing issues. Please try again later.";
            if (statusCode == 404)
                return "The file is no longer available. Please check for updates.";
            return "Please try again later or contact support.";
        case TransferErrorKind::Cancelled:
            return "You can restart the download at any time.";
        case TransferErrorKind::TaskNotFound:
            return "The download may have been removed. Try adding it again.";
        case TransferErrorKind::MaxRetriesExceeded:
            return "Check your network connection and try again later.";
        case TransferErrorKind::AlreadyDownloading:
            return "Wait for the current download to complete.";
        case TransferErrorKind::ConnectionLost:
            return "Check your network connection, then resume the download.";
        case TransferErrorKind::CertificateError:
            return "Ensure the system date and time are correct, then try again.";
        case TransferErrorKind::ServerNotFound:
            return "Check your network connection or try again later.";
        case TransferErrorKind::Unknown:
            return "Please try again. If the problem persists, restart the application.";
    }
    return {};
}

} // namespace ferry::downloader
