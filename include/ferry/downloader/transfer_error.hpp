#pragma once

/*
 * Ferry Downloader - Transfer error taxonomy
 *
 * Every failure reported by the transfer backend or raised while admitting or
 * finalizing a task is expressed as a TransferError. The kind decides whether
 * the engine retries it and whether it should pause the task instead.
 */

#include <cstdint>
#include <string>

namespace ferry::downloader {

enum class TransferErrorKind {
    InsufficientStorage,
    NetworkUnavailable,
    InvalidUrl,
    FileMoveFailed,
    ResumeTokenCorrupted,
    ServerError,
    Timeout,
    Cancelled,
    TaskNotFound,
    MaxRetriesExceeded,
    AlreadyDownloading,
    ConnectionLost,
    CertificateError,
    ServerNotFound,
    Unknown
};

const char* kindName(TransferErrorKind kind) noexcept;

struct TransferError {
    TransferErrorKind kind{TransferErrorKind::Unknown};
    std::string detail;             // reason / url / task id / free text, depending on kind
    int statusCode{0};              // ServerError
    std::uint64_t requiredBytes{0}; // InsufficientStorage
    std::uint64_t availableBytes{0};
    int attempts{0}; // MaxRetriesExceeded

    static TransferError insufficientStorage(std::uint64_t required, std::uint64_t available);
    static TransferError networkUnavailable();
    static TransferError invalidUrl(std::string url);
    static TransferError fileMoveFailed(std::string reason);
    static TransferError resumeTokenCorrupted();
    static TransferError serverError(int statusCode);
    static TransferError timeout();
    static TransferError cancelled();
    static TransferError taskNotFound(std::string taskId);
    static TransferError maxRetriesExceeded(int attempts);
    static TransferError alreadyDownloading();
    static TransferError connectionLost();
    static TransferError certificateError();
    static TransferError serverNotFound();
    static TransferError unknown(std::string message);

    /// Maps an HTTP status to ServerError, or Unknown for non-error statuses.
    static TransferError fromHttpStatus(int statusCode);

    [[nodiscard]] bool isRetryable() const noexcept;
    [[nodiscard]] bool shouldAutoPause() const noexcept;
    [[nodiscard]] std::string message() const;
    [[nodiscard]] std::string recoverySuggestion() const;

    bool operator==(const TransferError&) const = default;
};

} // namespace ferry::downloader
