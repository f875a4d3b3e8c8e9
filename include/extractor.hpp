#ifndef EXTRACTOR_HPP
#define EXTRACTOR_HPP

#include <cstddef>
#include <string>

struct archive;

namespace Rootstock {

/**
 * @brief Counters describing what an extraction produced.
 */
struct ExtractStats
{
    size_t files       = 0;
    size_t directories = 0;
    size_t symlinks    = 0;
    size_t hardlinks   = 0;
    size_t skipped     = 0; // unsupported kinds and non-fatal per-entry failures
    size_t rejected    = 0; // entries resolving outside the destination
};

/**
 * @class Extractor
 * @brief Unpacks gzip-compressed tar archives (rootfs tarballs) into a
 *        destination directory without ever writing outside of it.
 *
 * Regular files, directories, symbolic links and hard links are written
 * through libarchive's disk writer. Files whose stored mode has any execute
 * bit become 0755, other files 0644; ownership is not restored. Device
 * nodes, FIFOs and sockets are skipped. Only stream-level errors (corrupt
 * compression framing, truncated headers or data) are fatal; whatever was
 * extracted up to that point stays on disk.
 */
class Extractor
{
public:
    /**
     * @brief Extracts the archive stored at `archivePath`.
     *
     * @param archivePath Path to the .tar.gz file.
     * @param destDir     Destination directory, created if missing.
     * @return Counters for the extracted entries.
     * @throws SetupError (ExtractionFailed) on stream-level errors.
     */
    static ExtractStats extractTarGz(const std::string& archivePath,
                                     const std::string& destDir);

    /**
     * @brief Extracts an archive held in memory.
     *
     * @param data    Pointer to the compressed archive bytes.
     * @param size    Number of bytes at `data`.
     * @param destDir Destination directory, created if missing.
     * @throws SetupError (ExtractionFailed) on stream-level errors.
     */
    static ExtractStats extractTarGz(const void* data, size_t size,
                                     const std::string& destDir);

private:
    static ExtractStats extractEntries(struct archive* reader,
                                       const std::string& destDir);
};

} // namespace Rootstock

#endif // EXTRACTOR_HPP
