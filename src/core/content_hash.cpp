/**
 * MixGraph - Content Hashing Implementation
 *
 * Uses libavutil's hash API so the cache key needs nothing beyond FFmpeg.
 */

#include "content_hash.h"
#include "utils.h"

extern "C" {
#include <libavutil/hash.h>
}

#include <fstream>
#include <vector>

namespace mixgraph {

namespace {

class HashContext {
public:
    HashContext() {
        if (av_hash_alloc(&ctx_, "SHA256") < 0) {
            ctx_ = nullptr;
        } else {
            av_hash_init(ctx_);
        }
    }

    ~HashContext() {
        if (ctx_) av_hash_freep(&ctx_);
    }

    HashContext(const HashContext&) = delete;
    HashContext& operator=(const HashContext&) = delete;

    bool valid() const { return ctx_ != nullptr; }

    void update(const uint8_t* data, size_t size) {
        av_hash_update(ctx_, data, size);
    }

    std::string hex() {
        uint8_t out[2 * AV_HASH_MAX_SIZE + 1] = {0};
        av_hash_final_hex(ctx_, out, sizeof(out));
        return std::string(reinterpret_cast<const char*>(out));
    }

private:
    AVHashContext* ctx_ = nullptr;
};

} // namespace

Result<std::string> hash_file(const std::string& path) {
    if (!utils::file_exists(path)) {
        return ResultError{ErrorCode::MissingInput, "File not found: " + path};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return ResultError{ErrorCode::MissingInput, "Cannot open file: " + path};
    }

    HashContext ctx;
    if (!ctx.valid()) {
        return ResultError{ErrorCode::Unknown, "SHA256 unavailable"};
    }

    std::vector<char> chunk(1 << 16);
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            ctx.update(reinterpret_cast<const uint8_t*>(chunk.data()), static_cast<size_t>(got));
        }
    }

    return ctx.hex();
}

std::string hash_string(const std::string& data) {
    HashContext ctx;
    if (!ctx.valid()) return data;
    ctx.update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    return ctx.hex();
}

} // namespace mixgraph
