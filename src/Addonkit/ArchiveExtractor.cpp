// =================================================================
// src/Addonkit/ArchiveExtractor.cpp
// =================================================================
// Implementation for gzip decompression and tar extraction.

#include "Addonkit/ArchiveExtractor.hpp"
#include "Addonkit/Errors.hpp"
#include "Addonkit/Logger.hpp"
#include <algorithm>
#include <climits>

namespace fs = std::filesystem;

namespace Addonkit {

namespace {

constexpr size_t kBlockSize = 512;
constexpr size_t kInflateChunk = 64 * 1024;
constexpr size_t kMaxMetaSize = 1024 * 1024;

// ustar header field offsets
constexpr size_t kNameOffset = 0;
constexpr size_t kNameLength = 100;
constexpr size_t kSizeOffset = 124;
constexpr size_t kSizeLength = 12;
constexpr size_t kChecksumOffset = 148;
constexpr size_t kChecksumLength = 8;
constexpr size_t kTypeOffset = 156;
constexpr size_t kMagicOffset = 257;
constexpr size_t kPrefixOffset = 345;
constexpr size_t kPrefixLength = 155;

} // namespace

GzipDecoder::GzipDecoder(Output output) : m_output(std::move(output)), m_buffer(kInflateChunk) {
    // 16 + MAX_WBITS: expect a gzip wrapper rather than raw zlib.
    if (inflateInit2(&m_stream, 16 + MAX_WBITS) != Z_OK) {
        throw ArchiveError("Failed to initialize gzip decoder");
    }
}

GzipDecoder::~GzipDecoder() {
    inflateEnd(&m_stream);
}

void GzipDecoder::feed(const char* data, size_t size) {
    while (size > 0 && !m_ended) {
        uInt chunk = static_cast<uInt>(std::min<size_t>(size, UINT_MAX));
        m_stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
        m_stream.avail_in = chunk;

        while (m_stream.avail_in > 0 && !m_ended) {
            m_stream.next_out = reinterpret_cast<Bytef*>(m_buffer.data());
            m_stream.avail_out = static_cast<uInt>(m_buffer.size());

            int rc = inflate(&m_stream, Z_NO_FLUSH);
            if (rc == Z_STREAM_END) {
                m_ended = true;
            } else if (rc != Z_OK && rc != Z_BUF_ERROR) {
                throw ArchiveError(std::string("Corrupt gzip stream: ") +
                                   (m_stream.msg ? m_stream.msg : "inflate error " + std::to_string(rc)));
            }

            size_t produced = m_buffer.size() - m_stream.avail_out;
            if (produced > 0) {
                m_output(m_buffer.data(), produced);
            } else if (rc == Z_BUF_ERROR) {
                break;
            }
        }

        data += chunk;
        size -= chunk;
    }
}

void GzipDecoder::finish() {
    if (!m_ended) {
        throw ArchiveError("Unexpected end of gzip stream");
    }
}

TarExtractor::TarExtractor(fs::path destination) : m_destination(std::move(destination)) {}

void TarExtractor::feed(const char* data, size_t size) {
    while (size > 0 && m_state != State::Done) {
        switch (m_state) {
            case State::Header: {
                size_t take = std::min(kBlockSize - m_block_fill, size);
                std::copy(data, data + take, m_block.begin() + m_block_fill);
                m_block_fill += take;
                data += take;
                size -= take;
                if (m_block_fill == kBlockSize) {
                    m_block_fill = 0;
                    processHeader();
                }
                break;
            }
            case State::Data: {
                size_t take = static_cast<size_t>(std::min<uint64_t>(m_remaining, size));
                consumeData(data, take);
                m_remaining -= take;
                data += take;
                size -= take;
                if (m_remaining == 0) {
                    endEntry();
                    m_state = m_padding > 0 ? State::Padding : State::Header;
                }
                break;
            }
            case State::Padding: {
                size_t take = static_cast<size_t>(std::min<uint64_t>(m_padding, size));
                m_padding -= take;
                data += take;
                size -= take;
                if (m_padding == 0) {
                    m_state = State::Header;
                }
                break;
            }
            case State::Done:
                break;
        }
    }
}

void TarExtractor::finish() {
    if (m_state == State::Data || m_state == State::Padding || m_block_fill != 0) {
        throw ArchiveError("Archive is truncated inside '" + m_entry_name + "'");
    }
    LOG_DEBUG("Archive", "Extracted " + std::to_string(m_entries) + " entries into " + m_destination.string());
}

fs::path TarExtractor::resolveEntry(const std::string& name) const {
    fs::path relative = fs::path(name).lexically_normal();
    if (name.empty() || relative.has_root_name() || relative.has_root_directory()) {
        throw ArchiveError("Refusing to extract entry with absolute or empty name: '" + name + "'");
    }
    for (const auto& part : relative) {
        if (part == "..") {
            throw ArchiveError("Refusing to extract entry outside the destination: '" + name + "'");
        }
    }
    return m_destination / relative;
}

void TarExtractor::processHeader() {
    bool all_zero = std::all_of(m_block.begin(), m_block.end(), [](char c) { return c == '\0'; });
    if (all_zero) {
        if (++m_zero_blocks >= 2) {
            m_state = State::Done;
        }
        return;
    }
    m_zero_blocks = 0;

    uint64_t stored_checksum = readNumber(kChecksumOffset, kChecksumLength);
    uint64_t checksum = 0;
    for (size_t i = 0; i < kBlockSize; i++) {
        bool in_field = i >= kChecksumOffset && i < kChecksumOffset + kChecksumLength;
        checksum += in_field ? static_cast<unsigned char>(' ') : static_cast<unsigned char>(m_block[i]);
    }
    if (checksum != stored_checksum) {
        throw ArchiveError("Tar header checksum mismatch");
    }

    std::string name = readString(kNameOffset, kNameLength);
    if (readString(kMagicOffset, 5) == "ustar") {
        std::string prefix = readString(kPrefixOffset, kPrefixLength);
        if (!prefix.empty()) {
            name = prefix + "/" + name;
        }
    }

    m_entry_type = m_block[kTypeOffset];
    m_remaining = readNumber(kSizeOffset, kSizeLength);
    m_padding = (kBlockSize - m_remaining % kBlockSize) % kBlockSize;

    bool is_meta = m_entry_type == 'x' || m_entry_type == 'L' || m_entry_type == 'g';
    if (!is_meta && !m_pending_path.empty()) {
        name = m_pending_path;
        m_pending_path.clear();
    }
    m_entry_name = name;

    switch (m_entry_type) {
        case 'x':
        case 'L':
            if (m_remaining > kMaxMetaSize) {
                throw ArchiveError("Oversized extended header for '" + name + "'");
            }
            m_meta_buffer.clear();
            break;
        case '0':
        case '\0':
        case '7': {
            fs::path target = resolveEntry(name);
            fs::create_directories(target.parent_path());
            m_file.open(target, std::ios::binary | std::ios::trunc);
            if (!m_file) {
                throw ArchiveError("Cannot create " + target.string());
            }
            break;
        }
        case '5':
            fs::create_directories(resolveEntry(name));
            break;
        default:
            LOG_DEBUG("Archive", "Skipping entry '" + name + "' of type '" + std::string(1, m_entry_type) + "'");
            break;
    }

    if (m_remaining == 0) {
        endEntry();
        m_state = State::Header;
    } else {
        m_state = State::Data;
    }
}

void TarExtractor::consumeData(const char* data, size_t size) {
    switch (m_entry_type) {
        case 'x':
        case 'L':
            m_meta_buffer.append(data, size);
            break;
        case '0':
        case '\0':
        case '7':
            m_file.write(data, static_cast<std::streamsize>(size));
            if (!m_file) {
                throw ArchiveError("Failed to write '" + m_entry_name + "'");
            }
            break;
        default:
            break;
    }
}

void TarExtractor::endEntry() {
    switch (m_entry_type) {
        case 'x':
            applyPaxRecords(m_meta_buffer);
            break;
        case 'L':
            m_pending_path = m_meta_buffer.substr(0, m_meta_buffer.find('\0'));
            break;
        case '0':
        case '\0':
        case '7':
            m_file.close();
            if (!m_file) {
                throw ArchiveError("Failed to write '" + m_entry_name + "'");
            }
            m_file.clear();
            m_entries++;
            break;
        case '5':
            m_entries++;
            break;
        default:
            break;
    }
}

// Records look like "<length> <key>=<value>\n", length counting the whole record.
void TarExtractor::applyPaxRecords(const std::string& records) {
    size_t pos = 0;
    while (pos < records.size()) {
        size_t space = records.find(' ', pos);
        if (space == std::string::npos) {
            break;
        }
        size_t length = 0;
        try {
            length = std::stoul(records.substr(pos, space - pos));
        } catch (const std::logic_error&) {
            throw ArchiveError("Malformed pax header");
        }
        if (length == 0 || pos + length > records.size() || space + 1 >= pos + length) {
            throw ArchiveError("Malformed pax header");
        }

        std::string record = records.substr(space + 1, pos + length - space - 2);
        size_t equals = record.find('=');
        if (equals != std::string::npos && record.compare(0, equals, "path") == 0) {
            m_pending_path = record.substr(equals + 1);
        }
        pos += length;
    }
}

uint64_t TarExtractor::readNumber(size_t offset, size_t length) const {
    const unsigned char* field = reinterpret_cast<const unsigned char*>(m_block.data() + offset);

    // GNU base-256 encoding for values that do not fit in octal.
    if (field[0] & 0x80) {
        uint64_t value = field[0] & 0x7f;
        for (size_t i = 1; i < length; i++) {
            value = (value << 8) | field[i];
        }
        return value;
    }

    size_t i = 0;
    while (i < length && (field[i] == ' ' || field[i] == '\0')) {
        i++;
    }
    uint64_t value = 0;
    for (; i < length && field[i] >= '0' && field[i] <= '7'; i++) {
        value = (value << 3) | static_cast<uint64_t>(field[i] - '0');
    }
    return value;
}

std::string TarExtractor::readString(size_t offset, size_t length) const {
    const char* start = m_block.data() + offset;
    const char* end = std::find(start, start + length, '\0');
    return std::string(start, end);
}

TarGzSink::TarGzSink(const fs::path& destination)
    : m_tar(destination),
      m_gzip([this](const char* data, size_t size) { m_tar.feed(data, size); }) {}

void TarGzSink::write(const char* data, size_t size) {
    m_gzip.feed(data, size);
}

void TarGzSink::finish() {
    m_gzip.finish();
    m_tar.finish();
}

} // namespace Addonkit
