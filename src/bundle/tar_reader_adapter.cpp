#include "bundle/tar_reader_adapter.hpp"

#include <vector>

// Not exported by the public <archive.h>; same value as libarchive's archive_platform.h.
#ifndef ARCHIVE_ERRNO_MISC
#define ARCHIVE_ERRNO_MISC (-1)
#endif

namespace gssa {

namespace {

struct ReaderCtx {
    IReader* reader = nullptr;
    std::vector<std::uint8_t> buffer;

    explicit ReaderCtx(IReader& in, size_t buffer_size = 64 * 1024)
        : reader(&in), buffer(buffer_size) {}
};

la_ssize_t ReadCb(struct archive* ar, void* client_data, const void** out_buf) {
    auto* ctx = static_cast<ReaderCtx*>(client_data);
    const ssize_t n = ctx->reader->Read(std::span<std::uint8_t>(ctx->buffer.data(), ctx->buffer.size()));
    if (n < 0) {
        archive_set_error(ar, ARCHIVE_ERRNO_MISC, "read from source failed");
        return -1;
    }

    *out_buf = ctx->buffer.data();
    return static_cast<la_ssize_t>(n);
}

int CloseCb(struct archive*, void* client_data) {
    delete static_cast<ReaderCtx*>(client_data);
    return ARCHIVE_OK;
}

} // namespace

// ctx belongs to the archive from here on and is released by CloseCb when the
// archive is closed or freed, whether or not the open succeeded.
int OpenArchiveFromReader(struct archive* ar, IReader& reader) {
    auto* ctx = new ReaderCtx(reader);
    return archive_read_open2(ar, ctx, nullptr, ReadCb, nullptr, CloseCb);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace gssa
