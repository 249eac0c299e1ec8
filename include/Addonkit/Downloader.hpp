// =================================================================
// include/Addonkit/Downloader.hpp
// =================================================================
// Defines the HTTPS download of release files and the sinks a
// response body is streamed into.

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>

namespace Addonkit {

/**
 * @brief Consumer of a response body. Implementations own whatever they
 *        write to and release it on destruction, whether or not finish()
 *        was reached.
 */
class DownloadSink {
public:
    virtual ~DownloadSink() = default;

    virtual void write(const char* data, size_t size) = 0;

    /**
     * @brief Called once after the last chunk of a successful response.
     */
    virtual void finish() = 0;
};

/**
 * @brief Writes the body verbatim to a file.
 */
class FileSink : public DownloadSink {
public:
    explicit FileSink(const std::filesystem::path& file_path);

    void write(const char* data, size_t size) override;
    void finish() override;

    size_t bytesWritten() const { return m_bytes_written; }

private:
    std::filesystem::path m_path;
    std::ofstream m_file;
    size_t m_bytes_written = 0;
};

class Downloader {
public:
    /**
     * @param base_url Release directory URL, e.g.
     *        https://nodejs.org/dist/v18.17.0
     */
    explicit Downloader(std::string base_url);

    /**
     * @brief GETs base_url/relative_path and streams the body into the sink.
     *
     * A single attempt is made. Transport failures and non-200 responses
     * throw DownloadError; errors raised by the sink propagate unchanged.
     */
    void fetch(const std::string& relative_path, DownloadSink& sink) const;

    std::string urlFor(const std::string& relative_path) const;

    /**
     * @brief Splits "scheme://host[:port]/path" into origin and path.
     * @throws DownloadError if the URL has no scheme.
     */
    static void splitUrl(const std::string& url, std::string& origin, std::string& path);

private:
    std::string m_base_url;
};

} // namespace Addonkit
