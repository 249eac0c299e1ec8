// =================================================================
// src/Addonkit/Downloader.cpp
// =================================================================
// Implementation for downloads over HTTP(S) with cpp-httplib.

#include "Addonkit/Downloader.hpp"
#include "Addonkit/Errors.hpp"
#include "Addonkit/Logger.hpp"
#include "httplib.h"
#include <exception>

namespace Addonkit {

FileSink::FileSink(const std::filesystem::path& file_path)
    : m_path(file_path), m_file(file_path, std::ios::binary | std::ios::trunc) {
    if (!m_file) {
        throw DownloadError("Cannot open " + file_path.string() + " for writing");
    }
}

void FileSink::write(const char* data, size_t size) {
    m_file.write(data, static_cast<std::streamsize>(size));
    if (!m_file) {
        throw DownloadError("Failed to write " + m_path.string());
    }
    m_bytes_written += size;
}

void FileSink::finish() {
    m_file.close();
    if (!m_file) {
        throw DownloadError("Failed to close " + m_path.string());
    }
}

Downloader::Downloader(std::string base_url) : m_base_url(std::move(base_url)) {}

std::string Downloader::urlFor(const std::string& relative_path) const {
    return m_base_url + "/" + relative_path;
}

void Downloader::splitUrl(const std::string& url, std::string& origin, std::string& path) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw DownloadError("Not an absolute URL: " + url);
    }
    size_t path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        origin = url;
        path = "/";
    } else {
        origin = url.substr(0, path_start);
        path = url.substr(path_start);
    }
}

void Downloader::fetch(const std::string& relative_path, DownloadSink& sink) const {
    const std::string url = urlFor(relative_path);
    std::string origin, path;
    splitUrl(url, origin, path);

    LOG_INFO("Download", "Fetching " + url);

    httplib::Client client(origin);
    client.set_follow_location(true);
    client.set_connection_timeout(30);
    client.set_read_timeout(300);

    int status = 0;
    size_t received = 0;
    std::exception_ptr sink_error;

    auto result = client.Get(
        path,
        [&](const httplib::Response& response) {
            status = response.status;
            return response.status == 200;
        },
        [&](const char* data, size_t length) {
            try {
                sink.write(data, length);
                received += length;
                return true;
            } catch (...) {
                // Carried out of httplib's callback and rethrown below.
                sink_error = std::current_exception();
                return false;
            }
        });

    if (sink_error) {
        std::rethrow_exception(sink_error);
    }
    if (status != 0 && status != 200) {
        throw DownloadError("GET " + url + " returned HTTP status " + std::to_string(status));
    }
    if (!result) {
        throw DownloadError(httplib::to_string(result.error()) + " (" + url + ")");
    }

    sink.finish();
    LOG_DEBUG("Download", "Received " + std::to_string(received) + " bytes from " + url);
}

} // namespace Addonkit
