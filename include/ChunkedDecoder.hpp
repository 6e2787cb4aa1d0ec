#ifndef CHUNKEDDECODER_HPP
#define CHUNKEDDECODER_HPP

#include "tickhttp.hpp"

// Incremental decoder for "Transfer-Encoding: chunked" bodies. Fragments
// may split the stream anywhere, including inside a chunk-size line; all
// partial state is kept in the decoder, one instance per response.
class ChunkedDecoder {
   public:
    ChunkedDecoder();
    ~ChunkedDecoder();

    // Consumes a fragment and appends every chunk it completes to
    // completed. Returns CHUNK_COMPLETE only from the call that parses the
    // terminal zero-size chunk; afterwards returns CHUNK_AFTER_END.
    codes::ChunkStatus feed(const std::string& fragment,
                            std::vector<std::string>& completed);

    bool is_complete() const;
    size_t chunk_size() const { return chunk_size_; }
    size_t chunk_remaining() const { return chunk_remaining_; }
    const std::string& partial_chunk() const { return chunk_; }
    size_t bytes_decoded() const { return bytes_decoded_; }

    void reset();

   private:
    enum State {
        READING_SIZE_LINE,  // Accumulating "<hex>[;ext]\r\n"
        READING_DATA,       // chunk_remaining_ bytes still to come
        READING_DATA_END,   // CRLF after the chunk data
        BODY_COMPLETE       // Terminal chunk seen
    };

    State state_;
    std::string size_line_;   // Partial chunk-size line across fragments
    size_t chunk_size_;       // Size of the chunk being read
    size_t chunk_remaining_;  // Bytes missing from the current chunk
    std::string chunk_;       // Partial chunk payload
    bool data_end_cr_;        // CR of the data terminator already seen
    size_t bytes_decoded_;    // Payload bytes emitted or buffered so far

    codes::ChunkStatus parse_chunk_header();

    // Prevent copying
    ChunkedDecoder(const ChunkedDecoder&);
    ChunkedDecoder& operator=(const ChunkedDecoder&);

};  // class ChunkedDecoder

#endif  // CHUNKEDDECODER_HPP
