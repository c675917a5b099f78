/**
 * @file codec.cpp
 * @brief zlib-backed compression of packed buffers.
 */

#include <statuslist/codec.hpp>
#include <statuslist/logger.hpp>

#include <limits>
#include <utility>

#include <zlib.h>

namespace statuslist {

namespace {

// Owns a z_stream for the duration of one call
class ZStream {
public:
    explicit ZStream(bool inflating) noexcept : inflating_(inflating), initialized_(false) {
        stream_.zalloc = Z_NULL;
        stream_.zfree = Z_NULL;
        stream_.opaque = Z_NULL;
        stream_.next_in = Z_NULL;
        stream_.avail_in = 0;
    }

    ~ZStream() {
        if (!initialized_) {
            return;
        }
        if (inflating_) {
            inflateEnd(&stream_);
        } else {
            deflateEnd(&stream_);
        }
    }

    ZStream(const ZStream&) = delete;
    ZStream& operator=(const ZStream&) = delete;

    int init_deflate(int level) noexcept {
        int ret = deflateInit(&stream_, level);
        initialized_ = (ret == Z_OK);
        return ret;
    }

    int init_inflate() noexcept {
        int ret = inflateInit(&stream_);
        initialized_ = (ret == Z_OK);
        return ret;
    }

    z_stream* get() noexcept { return &stream_; }

private:
    z_stream stream_{};
    bool inflating_;
    bool initialized_;
};

} // namespace

Error compress(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out,
               int level) {
    if (level < MIN_COMPRESSION_LEVEL || level > MAX_COMPRESSION_LEVEL) {
        return Error::InvalidArgument;
    }
    if (size > std::numeric_limits<uInt>::max()) {
        return Error::InvalidArgument;
    }

    ZStream zs(false);
    if (zs.init_deflate(level) != Z_OK) {
        LogManager::Instance().Error("deflateInit failed at level {}", level);
        return Error::CompressionFailed;
    }

    z_stream* strm = zs.get();
    std::vector<std::uint8_t> buffer(deflateBound(strm, static_cast<uLong>(size)));

    // zlib never writes through next_in
    strm->next_in = const_cast<Bytef*>(data);
    strm->avail_in = static_cast<uInt>(size);
    strm->next_out = buffer.data();
    strm->avail_out = static_cast<uInt>(buffer.size());

    // deflateBound guarantees a single Z_FINISH call completes
    int ret = deflate(strm, Z_FINISH);
    if (ret != Z_STREAM_END) {
        LogManager::Instance().Error("deflate failed: {}", strm->msg ? strm->msg : "no message");
        return Error::CompressionFailed;
    }

    buffer.resize(strm->total_out);
    out = std::move(buffer);
    return Error::Ok;
}

Error decompress(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out,
                 std::size_t max_output) {
    if (size == 0 || data == nullptr) {
        return Error::CorruptData;
    }
    if (size > std::numeric_limits<uInt>::max()) {
        return Error::InvalidArgument;
    }

    ZStream zs(true);
    if (zs.init_inflate() != Z_OK) {
        LogManager::Instance().Error("inflateInit failed");
        return Error::CompressionFailed;
    }

    z_stream* strm = zs.get();
    strm->next_in = const_cast<Bytef*>(data);
    strm->avail_in = static_cast<uInt>(size);

    std::vector<std::uint8_t> buffer;
    std::size_t total = 0;

    for (;;) {
        // Allow one byte past the limit so an overrun is detectable
        std::size_t remaining = max_output - total;
        std::size_t chunk =
            (remaining >= INFLATE_CHUNK_BYTES) ? INFLATE_CHUNK_BYTES : remaining + 1;
        buffer.resize(total + chunk);

        strm->next_out = buffer.data() + total;
        strm->avail_out = static_cast<uInt>(chunk);

        int ret = inflate(strm, Z_NO_FLUSH);
        total += chunk - strm->avail_out;

        if (total > max_output) {
            LogManager::Instance().Warn("decompressed size exceeds limit of {} bytes", max_output);
            return Error::DecompressionLimitExceeded;
        }

        if (ret == Z_STREAM_END) {
            break;
        }

        switch (ret) {
        case Z_OK:
            continue;
        case Z_BUF_ERROR:
            if (strm->avail_in == 0) {
                LogManager::Instance().Warn("truncated compressed stream after {} bytes",
                                            strm->total_in);
                return Error::CorruptData;
            }
            continue;
        case Z_MEM_ERROR:
            return Error::CompressionFailed;
        case Z_NEED_DICT:
        case Z_DATA_ERROR:
        default:
            LogManager::Instance().Warn("corrupt compressed stream: {}",
                                        strm->msg ? strm->msg : "no message");
            return Error::CorruptData;
        }
    }

    if (strm->avail_in != 0) {
        LogManager::Instance().Warn("{} trailing bytes after compressed stream", strm->avail_in);
        return Error::CorruptData;
    }

    buffer.resize(total);
    out = std::move(buffer);
    return Error::Ok;
}

} // namespace statuslist
