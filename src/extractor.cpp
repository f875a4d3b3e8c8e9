#include "extractor.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <archive.h>           // Libarchive for extraction
#include <archive_entry.h>     // Libarchive entry handling
#include <filesystem>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace Rootstock {

    namespace {

        using ArchiveReader = std::unique_ptr<struct archive, int (*)(struct archive*)>;
        using ArchiveWriter = std::unique_ptr<struct archive, int (*)(struct archive*)>;

        // Read block size handed to libarchive.
        constexpr size_t kReadBlockSize = 65536;

        std::string archiveError(struct archive* a)
        {
            const char* message = archive_error_string(a);
            return message ? message : "unknown archive error";
        }

        ArchiveReader openReader()
        {
            ArchiveReader reader(archive_read_new(), archive_read_free);
            if (!reader) {
                throw SetupError(ErrorKind::ExtractionFailed, "archive_read_new failed");
            }
            archive_read_support_filter_all(reader.get());
            archive_read_support_format_tar(reader.get());
            archive_read_support_format_gnutar(reader.get());
            return reader;
        }

        /**
         * -------------------------------------------------------------------
         * normalizeEntryName
         *
         * Strips leading "./" and "/" prefixes and trailing slashes. Returns
         * an empty string for entries naming the archive root.
         * -------------------------------------------------------------------
         */
        std::string normalizeEntryName(const char* raw)
        {
            std::string name = raw ? raw : "";
            bool changed = true;
            while (changed) {
                changed = false;
                if (name.rfind("./", 0) == 0) {
                    name.erase(0, 2);
                    changed = true;
                }
                while (!name.empty() && name[0] == '/') {
                    name.erase(0, 1);
                    changed = true;
                }
            }
            while (!name.empty() && name.back() == '/') {
                name.pop_back();
            }
            if (name == ".") {
                return "";
            }
            return name;
        }

        /**
         * -------------------------------------------------------------------
         * resolvesInside
         *
         * Resolves `target` the way the kernel would once it exists and
         * checks that it stays under `canonicalDest`. For symlinks only the
         * parent is resolved: the link itself is not created yet, and an old
         * link at the same path is about to be replaced.
         * -------------------------------------------------------------------
         */
        bool resolvesInside(const fs::path& canonicalDest,
                            const fs::path& target,
                            bool resolveParentOnly)
        {
            std::error_code ec;
            fs::path resolved;
            if (resolveParentOnly) {
                resolved = fs::weakly_canonical(target.parent_path(), ec);
                if (!ec) {
                    resolved /= target.filename();
                }
            } else {
                resolved = fs::weakly_canonical(target, ec);
            }
            if (ec) {
                return false;
            }
            return isWithin(canonicalDest, resolved);
        }

        ArchiveWriter openDiskWriter()
        {
            ArchiveWriter disk(archive_write_disk_new(), archive_write_free);
            if (!disk) {
                throw SetupError(ErrorKind::ExtractionFailed, "archive_write_disk_new failed");
            }
            // Ownership and stored modes are not restored; only the execute bit
            // is carried over.
            archive_write_disk_set_options(disk.get(),
                                           ARCHIVE_EXTRACT_SECURE_SYMLINKS |
                                           ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                           ARCHIVE_EXTRACT_UNLINK);
            archive_write_disk_set_standard_lookup(disk.get());
            return disk;
        }

        void skipData(struct archive* a, const std::string& name)
        {
            if (archive_read_data_skip(a) < ARCHIVE_WARN) {
                throw SetupError(ErrorKind::ExtractionFailed,
                                 "Corrupt archive while skipping " + name + ": " + archiveError(a));
            }
        }

        /**
         * -------------------------------------------------------------------
         * copyData
         *
         * Copies the current entry's data blocks from the reader to the disk
         * writer. Read errors are fatal; a write error only loses this entry,
         * but the rest of its data is still drained to keep the stream in sync.
         * -------------------------------------------------------------------
         */
        bool copyData(struct archive* reader, struct archive* disk, const std::string& name)
        {
            const void* buff = nullptr;
            size_t size = 0;
            la_int64_t offset = 0;
            bool writeOk = true;

            while (true) {
                int r = archive_read_data_block(reader, &buff, &size, &offset);
                if (r == ARCHIVE_EOF) {
                    return writeOk;
                }
                if (r == ARCHIVE_RETRY) {
                    continue;
                }
                if (r < ARCHIVE_WARN) {
                    throw SetupError(ErrorKind::ExtractionFailed,
                                     "Corrupt archive data in " + name + ": " + archiveError(reader));
                }
                if (writeOk && archive_write_data_block(disk, buff, size, offset) < ARCHIVE_OK) {
                    log_warning("Write error while extracting " + name + ": " + archiveError(disk));
                    writeOk = false;
                }
            }
        }

    } // end anonymous namespace

    ExtractStats Extractor::extractTarGz(const std::string& archivePath,
                                         const std::string& destDir)
    {
        ArchiveReader reader = openReader();
        if (archive_read_open_filename(reader.get(), archivePath.c_str(), kReadBlockSize) != ARCHIVE_OK) {
            throw SetupError(ErrorKind::ExtractionFailed,
                             "Error opening archive '" + archivePath + "': " + archiveError(reader.get()));
        }
        return extractEntries(reader.get(), destDir);
    }

    ExtractStats Extractor::extractTarGz(const void* data, size_t size,
                                         const std::string& destDir)
    {
        ArchiveReader reader = openReader();
        if (archive_read_open_memory(reader.get(), data, size) != ARCHIVE_OK) {
            throw SetupError(ErrorKind::ExtractionFailed,
                             "Error opening in-memory archive: " + archiveError(reader.get()));
        }
        return extractEntries(reader.get(), destDir);
    }

    ExtractStats Extractor::extractEntries(struct archive* a, const std::string& destDir)
    {
        ExtractStats stats;

        std::error_code ec;
        fs::create_directories(destDir, ec);
        if (ec) {
            throw SetupError(ErrorKind::IoError,
                             "Cannot create destination " + destDir + ": " + ec.message());
        }
        fs::path canonicalDest = fs::weakly_canonical(fs::path(destDir), ec);
        if (ec) {
            throw SetupError(ErrorKind::IoError,
                             "Cannot resolve destination " + destDir + ": " + ec.message());
        }

        ArchiveWriter disk = openDiskWriter();

        struct archive_entry* entry = nullptr;
        while (true) {
            int r = archive_read_next_header(a, &entry);
            if (r == ARCHIVE_EOF) {
                break;
            }
            if (r == ARCHIVE_RETRY) {
                continue;
            }
            if (r < ARCHIVE_WARN) {
                throw SetupError(ErrorKind::ExtractionFailed,
                                 "Error reading archive header: " + archiveError(a));
            }
            if (r == ARCHIVE_WARN) {
                log_debug("Archive warning: " + archiveError(a));
            }

            const char* rawName = archive_entry_pathname(entry);
            std::string name = normalizeEntryName(rawName);
            if (name.empty()) {
                skipData(a, rawName ? rawName : "");
                continue;
            }

            fs::path target = canonicalDest / name;
            const char* hardlink = archive_entry_hardlink(entry);
            mode_t type = archive_entry_filetype(entry);
            bool isSymlink = (hardlink == nullptr && type == AE_IFLNK);

            // Path traversal defense: nothing is written before this check.
            if (!resolvesInside(canonicalDest, target, isSymlink)) {
                log_warning("Skipping archive entry outside destination: " + name);
                stats.rejected++;
                skipData(a, name);
                continue;
            }

            if (hardlink != nullptr) {
                std::string linkName = normalizeEntryName(hardlink);
                fs::path source = canonicalDest / linkName;
                if (linkName.empty() || !resolvesInside(canonicalDest, source, false)) {
                    log_debug("Skipping hard link with unusable target: " + name + " -> " + linkName);
                    stats.skipped++;
                    skipData(a, name);
                    continue;
                }
                archive_entry_set_hardlink(entry, source.c_str());
            }
            else if (type == AE_IFLNK) {
                const char* linkTarget = archive_entry_symlink(entry);
                if (linkTarget == nullptr || *linkTarget == '\0') {
                    stats.skipped++;
                    skipData(a, name);
                    continue;
                }
            }
            else if (type == AE_IFDIR || type == AE_IFREG) {
                bool executable = type == AE_IFDIR || (archive_entry_perm(entry) & 0111) != 0;
                archive_entry_set_perm(entry, executable ? 0755 : 0644);
            }
            else {
                // Device nodes, FIFOs and sockets cannot be created unprivileged
                log_debug("Skipping unsupported archive entry: " + name);
                stats.skipped++;
                skipData(a, name);
                continue;
            }

            archive_entry_set_pathname(entry, target.c_str());

            r = archive_write_header(disk.get(), entry);
            if (r < ARCHIVE_WARN) {
                // Non-fatal: some storage refuses links, and a file that cannot
                // be created only loses this entry
                log_debug("Cannot extract " + name + ": " + archiveError(disk.get()));
                stats.skipped++;
                skipData(a, name);
                continue;
            }
            if (r == ARCHIVE_WARN) {
                log_debug("Warning extracting " + name + ": " + archiveError(disk.get()));
            }

            bool written = true;
            if (type == AE_IFREG && archive_entry_size(entry) > 0) {
                written = copyData(a, disk.get(), name);
            }
            if (archive_write_finish_entry(disk.get()) < ARCHIVE_WARN) {
                log_warning("Cannot finish " + target.string() + ": " + archiveError(disk.get()));
                written = false;
            }
            if (!written) {
                stats.skipped++;
                continue;
            }

            if (hardlink != nullptr) {
                stats.hardlinks++;
            } else if (type == AE_IFDIR) {
                stats.directories++;
            } else if (type == AE_IFLNK) {
                stats.symlinks++;
            } else {
                stats.files++;
            }
        }

        if (archive_write_close(disk.get()) != ARCHIVE_OK) {
            log_warning("Finishing extraction into " + destDir + ": " + archiveError(disk.get()));
        }

        log_debug("Extracted " + std::to_string(stats.files) + " files, " +
                  std::to_string(stats.directories) + " directories, " +
                  std::to_string(stats.symlinks) + " symlinks into " + destDir);
        return stats;
    }

} // namespace Rootstock
