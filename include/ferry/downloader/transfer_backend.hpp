#pragma once

/*
 * Ferry Downloader - Platform transfer mechanism abstraction
 *
 * The OS-level background transfer service is consumed, not reimplemented.
 * An adapter for it implements ITransferBackend; tests use an in-memory fake.
 */

#include <ferry/downloader/resume_token_store.hpp>
#include <ferry/downloader/transfer_error.hpp>
#include <ferry/downloader/types.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ferry::downloader {

/// Backend-assigned identifier of one running transfer.
using JobHandle = std::uint64_t;

struct PendingJob {
    JobHandle handle{0};
    std::string url;
};

/**
 * Callbacks raised by a backend for its jobs. May be invoked from any thread,
 * but never while the backend holds its own locks and never from inside an
 * ITransferBackend call.
 */
class ITransferEvents {
public:
    virtual ~ITransferEvents() = default;

    /// expected < 0 means the server did not report a length.
    virtual void onProgress(JobHandle job, std::int64_t written, std::int64_t expected) = 0;
    /// The payload is complete at a temporary location owned by the receiver from now on.
    virtual void onFinished(JobHandle job, const std::filesystem::path& location) = 0;
    virtual void onFailed(JobHandle job, const TransferError& error,
                          std::optional<ResumeToken> token) = 0;
    virtual void onResumedAtOffset(JobHandle job, std::int64_t offset, std::int64_t expected) = 0;
};

class ITransferBackend {
public:
    virtual ~ITransferBackend() = default;

    /**
     * The backend keeps only a weak reference and must lock it before every
     * dispatch, so a destroyed receiver is never called.
     */
    virtual void setEventSink(std::weak_ptr<ITransferEvents> sink) = 0;

    virtual Expected<JobHandle> startTransfer(const std::string& url) = 0;
    virtual Expected<JobHandle> resumeTransfer(const ResumeToken& token) = 0;

    /// Cancels the job, returning a resume token when the transfer can be continued.
    /// No event is raised for a job cancelled this way.
    virtual std::optional<ResumeToken> cancel(JobHandle job) = 0;
    virtual void cancelAll() = 0;

    /// Jobs still owned by the platform service, e.g. after a process relaunch.
    [[nodiscard]] virtual std::vector<PendingJob> pendingJobs() const = 0;
};

} // namespace ferry::downloader
