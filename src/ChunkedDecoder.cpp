#include "tickhttp.hpp"

ChunkedDecoder::ChunkedDecoder()
    : state_(READING_SIZE_LINE),
      chunk_size_(0),
      chunk_remaining_(0),
      data_end_cr_(false),
      bytes_decoded_(0) {}

ChunkedDecoder::~ChunkedDecoder() {}

bool ChunkedDecoder::is_complete() const { return state_ == BODY_COMPLETE; }

void ChunkedDecoder::reset() {
    state_ = READING_SIZE_LINE;
    size_line_.clear();
    chunk_size_ = 0;
    chunk_remaining_ = 0;
    chunk_.clear();
    data_end_cr_ = false;
    bytes_decoded_ = 0;
}

// Chunked transfer encoding sends HTTP message bodies in a series of "chunks"
// without needing to know the total size in advance. Each chunk has a size
// prefix in hexadecimal notation, followed by the chunk data. A chunk may
// span several reads and a read may hold several chunks.
codes::ChunkStatus ChunkedDecoder::feed(const std::string& fragment,
                                        std::vector<std::string>& completed) {
    if (state_ == BODY_COMPLETE) {
        log(LOG_DEBUG, "Ignoring %zu bytes after terminal chunk",
            fragment.size());
        return codes::CHUNK_AFTER_END;
    }

    size_t pos = 0;
    while (pos < fragment.size()) {
        switch (state_) {
            case READING_SIZE_LINE: {
                size_t line_end = fragment.find('\n', pos);
                if (line_end == std::string::npos) {
                    size_line_.append(fragment, pos, std::string::npos);
                    pos = fragment.size();
                } else {
                    size_line_.append(fragment, pos, line_end - pos);
                    pos = line_end + 1;
                }

                if (size_line_.size() > http_limits::MAX_CHUNK_LINE_LENGTH) {
                    log(LOG_ERROR, "Chunk-size line exceeds %zu bytes",
                        http_limits::MAX_CHUNK_LINE_LENGTH);
                    return codes::CHUNK_ERROR;
                }
                if (line_end == std::string::npos) {
                    // Size line continues in a later fragment
                    break;
                }

                codes::ChunkStatus status = parse_chunk_header();
                if (status != codes::CHUNK_INCOMPLETE) {
                    return status;
                }

                if (chunk_size_ == 0) {
                    state_ = BODY_COMPLETE;
                    log(LOG_DEBUG, "Terminal chunk received, %zu bytes decoded",
                        bytes_decoded_);
                    return codes::CHUNK_COMPLETE;
                }

                log(LOG_TRACE, "New chunk of %zu bytes", chunk_size_);
                state_ = READING_DATA;
                break;
            }

            case READING_DATA: {
                size_t bytes_to_read =
                    std::min(chunk_remaining_, fragment.size() - pos);
                chunk_.append(fragment, pos, bytes_to_read);
                pos += bytes_to_read;
                chunk_remaining_ -= bytes_to_read;
                bytes_decoded_ += bytes_to_read;

                if (chunk_remaining_ == 0) {
                    completed.push_back(chunk_);
                    chunk_.clear();
                    data_end_cr_ = false;
                    state_ = READING_DATA_END;
                } else {
                    log(LOG_TRACE, "chunk_remaining: %zu", chunk_remaining_);
                }
                break;
            }

            case READING_DATA_END: {
                char c = fragment[pos];
                if (c == '\r' && !data_end_cr_) {
                    data_end_cr_ = true;
                    ++pos;
                } else if (c == '\n') {
                    ++pos;
                    state_ = READING_SIZE_LINE;
                } else {
                    log(LOG_ERROR, "Invalid chunk terminator, expected CRLF");
                    return codes::CHUNK_ERROR;
                }
                break;
            }

            case BODY_COMPLETE:
                // Unreachable: returned as soon as the terminal chunk is seen
                return codes::CHUNK_COMPLETE;
        }
    }

    return codes::CHUNK_INCOMPLETE;
}

codes::ChunkStatus ChunkedDecoder::parse_chunk_header() {
    std::string line = size_line_;
    size_line_.clear();

    // Remove any chunk extensions (after semicolon)
    size_t semicolon = line.find(';');
    if (semicolon != std::string::npos) {
        line = line.substr(0, semicolon);
    }

    // Drop control characters and surrounding blanks
    std::string hex;
    for (size_t i = 0; i < line.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if (!iscntrl(c) && c != ' ') {
            hex += static_cast<char>(c);
        }
    }

    if (hex.empty() || hex.size() > sizeof(unsigned long) * 2 - 1) {
        log(LOG_ERROR, "Invalid chunk size format: '%s'", line.c_str());
        return codes::CHUNK_INVALID_SIZE;
    }
    for (size_t i = 0; i < hex.size(); ++i) {
        if (!isxdigit(static_cast<unsigned char>(hex[i]))) {
            log(LOG_ERROR, "Invalid chunk size format: '%s'", line.c_str());
            return codes::CHUNK_INVALID_SIZE;
        }
    }

    unsigned long size = std::strtoul(hex.c_str(), NULL, 16);

    chunk_size_ = size;
    chunk_remaining_ = size;
    return codes::CHUNK_INCOMPLETE;
}
