#include "downloader.hpp"
#include "errors.hpp"
#include "run_context.hpp"
#include "utils.hpp"

#include <algorithm>
#include <curl/curl.h>         // Libcurl for downloading
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

namespace Rootstock {

    namespace {

        std::once_flag curlInitFlag;

        void ensureCurlInitialized()
        {
            std::call_once(curlInitFlag, [] {
                curl_global_init(CURL_GLOBAL_DEFAULT);
            });
        }

        /**
         * -------------------------------------------------------------------
         * TransferState
         *
         * Everything the libcurl callbacks need for one attempt.
         * -------------------------------------------------------------------
         */
        struct TransferState
        {
            std::ofstream*          out      = nullptr;
            CURL*                   curl     = nullptr;
            const ProgressCallback* progress = nullptr;
            const DownloadOptions*  options  = nullptr;
            RunContext*             context  = nullptr;
            size_t                  written  = 0;
            bool                    writeFailed = false;
            bool                    cancelled   = false;
        };

        void reportProgress(TransferState& state)
        {
            if (!state.progress || !*state.progress) {
                return;
            }

            curl_off_t total = -1;
            if (curl_easy_getinfo(state.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &total) != CURLE_OK ||
                total <= 0) {
                return; // Unknown size: no fraction to report
            }

            double ratio = static_cast<double>(state.written) / static_cast<double>(total);
            ratio = std::min(ratio, 1.0);
            double fraction = state.options->progressStart +
                              ratio * (state.options->progressEnd - state.options->progressStart);

            std::ostringstream message;
            message << "Downloading... " << (state.written / 1048576) << " MB";
            (*state.progress)(message.str(), fraction);
        }

        /**
         * -------------------------------------------------------------------
         * WriteCallback
         *
         * cURL write callback: appends one buffer to the destination file,
         * reports progress, then checks for cancellation.
         * -------------------------------------------------------------------
         */
        size_t WriteCallback(void* ptr, size_t size, size_t nmemb, void* userdata)
        {
            TransferState* state = static_cast<TransferState*>(userdata);
            size_t totalSize = size * nmemb;

            state->out->write(static_cast<char*>(ptr), static_cast<std::streamsize>(totalSize));
            if (!state->out->good()) {
                state->writeFailed = true;
                return 0; // Signal error to cURL
            }
            state->written += totalSize;

            reportProgress(*state);

            if (state->context && state->context->isCancelled()) {
                state->cancelled = true;
                return 0;
            }
            return totalSize;
        }

        /**
         * -------------------------------------------------------------------
         * XferInfoCallback
         *
         * Lets a stalled transfer notice cancellation between writes.
         * -------------------------------------------------------------------
         */
        int XferInfoCallback(void* userdata,
                             curl_off_t /*totalToDownload*/,
                             curl_off_t /*nowDownloaded*/,
                             curl_off_t /*totalToUpload*/,
                             curl_off_t /*nowUploaded*/)
        {
            TransferState* state = static_cast<TransferState*>(userdata);
            if (state->context && state->context->isCancelled()) {
                state->cancelled = true;
                return 1; // abort the transfer
            }
            return 0;
        }

        void removePartial(const std::string& path)
        {
            std::error_code ec;
            fs::remove(path, ec);
            if (ec) {
                log_warning("Could not remove partial download " + path + ": " + ec.message());
            }
        }

    } // end anonymous namespace

    std::string Downloader::downloadOne(const std::string& url,
                                        const std::string& destPath,
                                        const DownloadOptions& options,
                                        const ProgressCallback& progress,
                                        RunContext* context,
                                        size_t* bytesWritten)
    {
        ensureCurlInitialized();

        fs::path parentDir = fs::path(destPath).parent_path();
        if (!parentDir.empty() && !fs::exists(parentDir)) {
            std::error_code ec;
            fs::create_directories(parentDir, ec);
            if (ec) {
                return "cannot create directory " + parentDir.string() + ": " + ec.message();
            }
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return "failed to initialize curl";
        }

        std::ofstream outFile(destPath, std::ios::binary | std::ios::trunc);
        if (!outFile) {
            curl_easy_cleanup(curl);
            return "failed to open file for writing: " + destPath;
        }

        TransferState state;
        state.out      = &outFile;
        state.curl     = curl;
        state.progress = &progress;
        state.options  = &options;
        state.context  = context;

        // Configure cURL
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(options.bufferSize));
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, XferInfoCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options.connectTimeoutSeconds);
        // A transfer idle for the read timeout counts as dead
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, options.readTimeoutSeconds);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        long responseCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &responseCode);
        curl_easy_cleanup(curl);
        outFile.close();

        std::string failure;
        if (state.cancelled) {
            failure = "cancelled";
        } else if (state.writeFailed || outFile.fail()) {
            failure = "write error on " + destPath;
        } else if (res != CURLE_OK) {
            failure = curl_easy_strerror(res);
        } else if (responseCode != 0 && (responseCode < 200 || responseCode >= 300)) {
            // file:// transfers report 0
            failure = "server responded with code " + std::to_string(responseCode);
        }

        if (!failure.empty()) {
            removePartial(destPath);
            return failure;
        }

        if (bytesWritten) {
            *bytesWritten = state.written;
        }
        return "";
    }

    DownloadResult Downloader::downloadWithFallback(const std::vector<std::string>& urls,
                                                    const std::string& destPath,
                                                    const DownloadOptions& options,
                                                    const ProgressCallback& progress,
                                                    const AttemptCallback& onAttempt,
                                                    RunContext* context)
    {
        if (urls.empty()) {
            throw SetupError(ErrorKind::DownloadFailed, "No download sources configured");
        }

        DownloadResult result;
        std::string lastError;

        for (size_t i = 0; i < urls.size(); ++i) {
            if (context && context->isCancelled()) {
                removePartial(destPath);
                throw SetupError(ErrorKind::Cancelled, "Cancelled");
            }

            const std::string& url = urls[i];
            if (onAttempt) {
                onAttempt(i + 1, urls.size(), url);
            }
            log_debug("Downloading " + url + " -> " + destPath);

            size_t bytes = 0;
            std::string failure = downloadOne(url, destPath, options, progress, context, &bytes);
            if (failure.empty()) {
                result.url = url;
                result.sourceIndex = i;
                result.bytes = bytes;
                return result;
            }

            if (context && context->isCancelled()) {
                removePartial(destPath);
                throw SetupError(ErrorKind::Cancelled, "Cancelled");
            }

            log_warning("Source " + std::to_string(i + 1) + "/" + std::to_string(urls.size()) +
                        " failed (" + url + "): " + failure);
            result.failedAttempts++;
            lastError = failure;
        }

        removePartial(destPath);
        throw SetupError(ErrorKind::DownloadFailed,
                         "Failed to download from all " + std::to_string(urls.size()) +
                         " sources. Last error: " + lastError);
    }

} // namespace Rootstock
