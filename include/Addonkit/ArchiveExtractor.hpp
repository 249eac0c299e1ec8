// =================================================================
// include/Addonkit/ArchiveExtractor.hpp
// =================================================================
// Streaming extraction of .tar.gz downloads: zlib inflates the body
// and a tar reader writes entries below a destination directory as
// the bytes arrive.

#pragma once

#include "Addonkit/Downloader.hpp"
#include <zlib.h>
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

namespace Addonkit {

/**
 * @brief Incremental gzip decompressor
 */
class GzipDecoder {
public:
    using Output = std::function<void(const char*, size_t)>;

    explicit GzipDecoder(Output output);
    ~GzipDecoder();

    GzipDecoder(const GzipDecoder&) = delete;
    GzipDecoder& operator=(const GzipDecoder&) = delete;

    /**
     * @brief Inflates a chunk and passes decompressed bytes to the output.
     *        Input after the end of the gzip member is ignored.
     * @throws ArchiveError on corrupt data.
     */
    void feed(const char* data, size_t size);

    /**
     * @throws ArchiveError if the gzip stream ended early.
     */
    void finish();

private:
    z_stream m_stream{};
    bool m_ended = false;
    Output m_output;
    std::vector<char> m_buffer;
};

/**
 * @brief Incremental reader for ustar archives
 *
 * Regular files and directories are created below the destination. GNU long
 * names and pax "path" records are honored; links and other entry types are
 * skipped. Entries that would land outside the destination are rejected.
 */
class TarExtractor {
public:
    explicit TarExtractor(std::filesystem::path destination);

    /**
     * @throws ArchiveError on malformed headers or unsafe entry names.
     */
    void feed(const char* data, size_t size);

    /**
     * @throws ArchiveError if the archive stops inside an entry.
     */
    void finish();

    size_t entriesExtracted() const { return m_entries; }

    /**
     * @brief Maps an entry name to a path below the destination.
     * @throws ArchiveError for absolute names or names containing "..".
     */
    std::filesystem::path resolveEntry(const std::string& name) const;

private:
    enum class State { Header, Data, Padding, Done };

    void processHeader();
    void consumeData(const char* data, size_t size);
    void endEntry();
    uint64_t readNumber(size_t offset, size_t length) const;
    std::string readString(size_t offset, size_t length) const;
    void applyPaxRecords(const std::string& records);

    std::filesystem::path m_destination;
    State m_state = State::Header;
    std::array<char, 512> m_block{};
    size_t m_block_fill = 0;
    uint64_t m_remaining = 0;
    uint64_t m_padding = 0;
    char m_entry_type = '0';
    std::string m_entry_name;
    std::string m_meta_buffer;
    std::string m_pending_path;
    std::ofstream m_file;
    int m_zero_blocks = 0;
    size_t m_entries = 0;
};

/**
 * @brief Download sink that extracts a .tar.gz body into a directory
 */
class TarGzSink : public DownloadSink {
public:
    explicit TarGzSink(const std::filesystem::path& destination);

    void write(const char* data, size_t size) override;
    void finish() override;

    size_t entriesExtracted() const { return m_tar.entriesExtracted(); }

private:
    TarExtractor m_tar;
    GzipDecoder m_gzip;
};

} // namespace Addonkit
