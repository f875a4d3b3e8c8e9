#ifndef DOWNLOADER_HPP
#define DOWNLOADER_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace Rootstock {

class RunContext;

/**
 * @brief Receives (message, fraction) pairs. Fractions are already mapped
 *        into the caller's progress sub-range.
 */
using ProgressCallback = std::function<void(const std::string&, double)>;

/**
 * @brief Observes each attempt: (1-based index, candidate count, url).
 */
using AttemptCallback = std::function<void(size_t, size_t, const std::string&)>;

/**
 * @brief Download tuning. Defaults match what mirrors of rootfs tarballs
 *        need: generous read timeout, bounded connect timeout.
 */
struct DownloadOptions
{
    long connectTimeoutSeconds = 30;
    long readTimeoutSeconds    = 120;
    size_t bufferSize          = 65536;
    double progressStart       = 0.0;
    double progressEnd         = 1.0;
    std::string userAgent      = "Rootstock/1.0";
};

/**
 * @brief Outcome of a successful fallback download.
 */
struct DownloadResult
{
    std::string url;            // the candidate that succeeded
    size_t sourceIndex   = 0;   // 0-based index of that candidate
    size_t failedAttempts = 0;
    size_t bytes          = 0;
};

/**
 * @class Downloader
 * @brief Fetches a file from an ordered list of mirror URLs with libcurl,
 *        falling back to the next candidate on any failure.
 */
class Downloader
{
public:
    /**
     * @brief Downloads the first candidate that succeeds into `destPath`.
     *
     * Candidates are tried strictly in order. Any failure (connect or read
     * timeout, non-2xx status, read or write error) deletes the partial
     * destination file and advances to the next one. Redirects are
     * followed.
     *
     * @param urls      Ordered candidate URLs (http, https or file).
     * @param destPath  Destination file; its parent is created if missing.
     * @param options   Timeouts, buffer size and progress sub-range.
     * @param progress  Optional progress observer.
     * @param onAttempt Optional observer called before each attempt.
     * @param context   Optional run context checked for cancellation
     *                  between attempts and after every buffer flush.
     * @return Which candidate succeeded and how many failed before it.
     * @throws SetupError DownloadFailed when every candidate failed,
     *         Cancelled when the context was cancelled. No partial file
     *         is left behind in either case.
     */
    static DownloadResult downloadWithFallback(const std::vector<std::string>& urls,
                                               const std::string& destPath,
                                               const DownloadOptions& options = {},
                                               const ProgressCallback& progress = nullptr,
                                               const AttemptCallback& onAttempt = nullptr,
                                               RunContext* context = nullptr);

    /**
     * @brief Downloads a single URL into `destPath`.
     *
     * @return An empty string on success, otherwise the failure reason.
     *         The destination is removed on failure.
     */
    static std::string downloadOne(const std::string& url,
                                   const std::string& destPath,
                                   const DownloadOptions& options,
                                   const ProgressCallback& progress,
                                   RunContext* context,
                                   size_t* bytesWritten = nullptr);
};

} // namespace Rootstock

#endif // DOWNLOADER_HPP
