#include <deepeq/Pl_Inflate.hh>

#include <deepeq/IntC.hh>

#include <algorithm>
#include <climits>
#include <stdexcept>
#include <zlib.h>

using namespace deepeq;

namespace
{
    unsigned long long memory_limit_{0};

    // avail_in and avail_out are unsigned int
    size_t const max_chunk = 1U << 30;
} // namespace

Pl_Inflate::Members::Members(size_t out_bufsize) :
    outbuf(std::make_unique<unsigned char[]>(out_bufsize)),
    out_bufsize(out_bufsize),
    zstream(std::make_unique<z_stream>())
{
}

Pl_Inflate::Members::~Members()
{
    if (initialized) {
        inflateEnd(zstream.get());
    }
}

Pl_Inflate::Pl_Inflate(char const* identifier, Pipeline* next, size_t out_bufsize) :
    Pipeline(identifier, next)
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_Inflate with nullptr as next");
    }
    if ((out_bufsize == 0) || (out_bufsize > max_chunk)) {
        throw std::logic_error(
            "Pl_Inflate: invalid output buffer size " + std::to_string(out_bufsize));
    }
    m = std::make_unique<Members>(out_bufsize);
}

// Must be explicit and not inline -- see DEEPEQ_DLL_CLASS in DLL.h
Pl_Inflate::~Pl_Inflate() = default;

unsigned long long
Pl_Inflate::memory_limit()
{
    return memory_limit_;
}

void
Pl_Inflate::memory_limit(unsigned long long limit)
{
    memory_limit_ = limit;
}

void
Pl_Inflate::setWarnCallback(std::function<void(char const*, int)> callback)
{
    m->callback = std::move(callback);
}

void
Pl_Inflate::write(unsigned char const* data, size_t len)
{
    if (m->finished) {
        throw std::logic_error(identifier + ": Pl_Inflate: write() called after finish()");
    }
    while (len > 0) {
        size_t bytes = std::min(len, max_chunk);
        inflateData(data, bytes, Z_SYNC_FLUSH);
        data += bytes;
        len -= bytes;
    }
}

void
Pl_Inflate::inflateData(unsigned char const* data, size_t len, int flush)
{
    z_stream& zs = *m->zstream;
    if (!m->initialized) {
        // inflateInit is a macro that uses old-style casts.
#if ((defined(__GNUC__) && ((__GNUC__ * 100) + __GNUC_MINOR__) >= 406) || defined(__clang__))
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
        checkError("init", inflateInit(&zs));
#if ((defined(__GNUC__) && ((__GNUC__ * 100) + __GNUC_MINOR__) >= 406) || defined(__clang__))
# pragma GCC diagnostic pop
#endif
        m->initialized = true;
    }

    // zlib does not modify the input but only declares next_in const when built with ZLIB_CONST.
    zs.next_in = const_cast<unsigned char*>(data);
    zs.avail_in = IntC::to_uint(len);
    while (true) {
        zs.next_out = m->outbuf.get();
        zs.avail_out = IntC::to_uint(m->out_bufsize);
        int err = inflate(&zs, flush);
        if (err == Z_BUF_ERROR) {
            // No progress was possible. While writing, that only means the previous call drained
            // everything; at the end, the compressed stream was cut short.
            if (flush == Z_FINISH && m->callback) {
                m->callback("input ended before the end of the compressed stream", err);
            }
            return;
        }
        if (err != Z_STREAM_END) {
            checkError("data", err);
        }
        size_t ready = m->out_bufsize - zs.avail_out;
        if (ready > 0) {
            m->written += ready;
            if (memory_limit_ && (m->written > memory_limit_)) {
                throw std::runtime_error(identifier + ": Pl_Inflate memory limit exceeded");
            }
            getNext()->write(m->outbuf.get(), ready);
        }
        if ((err == Z_STREAM_END) || ((zs.avail_in == 0) && (zs.avail_out > 0))) {
            return;
        }
    }
}

void
Pl_Inflate::finish()
{
    if (!m->finished) {
        m->finished = true;
        if (m->initialized) {
            unsigned char none = 0;
            inflateData(&none, 0, Z_FINISH);
            m->initialized = false;
            checkError("end", inflateEnd(m->zstream.get()));
        }
    }
    getNext()->finish();
}

void
Pl_Inflate::checkError(char const* operation, int error_code)
{
    if (error_code == Z_OK) {
        return;
    }
    char const* detail = m->zstream->msg ? m->zstream->msg : zError(error_code);
    throw std::runtime_error(identifier + ": inflate " + operation + ": " + detail);
}
