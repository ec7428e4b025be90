#include <deepeq/ChainComparer.hh>

#include <deepeq/BufferInputSource.hh>
#include <deepeq/InputSource.hh>
#include <deepeq/IntC.hh>
#include <deepeq/Pl_Inflate.hh>
#include <deepeq/Pl_String.hh>

#include <algorithm>
#include <cstring>

using namespace deepeq;

namespace
{
    size_t const chunk_size = 4096;

    // Inflate the rest of a flate-encoded source into memory. The source is left at its
    // starting position, since the other side of the comparison may read the same source.
    std::shared_ptr<InputSource>
    decode(InputSource& source, Logger& logger)
    {
        std::string decoded;
        std::string const& name = source.getName();
        auto start = source.tell();
        Pl_String out("decoded stream", nullptr, decoded);
        Pl_Inflate inflate("inflate stream", &out);
        inflate.setWarnCallback([&logger, &name](char const* msg, int) {
            logger.warn(name + ": inflate: " + msg + "\n");
        });
        char buf[chunk_size];
        size_t len = 0;
        while ((len = source.read(buf, sizeof(buf))) > 0) {
            inflate.write(reinterpret_cast<unsigned char const*>(buf), len);
        }
        inflate.finish();
        source.seek(start, SEEK_SET);
        return std::make_shared<BufferInputSource>(name + " (decoded)", std::move(decoded));
    }

    deq_offset_t
    remaining(InputSource& source)
    {
        auto start = source.tell();
        source.seek(0, SEEK_END);
        auto end = source.tell();
        source.seek(start, SEEK_SET);
        return end - start;
    }
} // namespace

char const*
CC_Streams::getName() const
{
    return "streams";
}

ChainComparer::verdict_e
CC_Streams::equal(
    ValueHandle const& x, ValueHandle const& y, Tolerance const&, ComparisonState& state)
{
    if (!(x.isStream() && y.isStream())) {
        return v_not_applicable;
    }

    auto source_x = x.getStreamSource();
    auto source_y = y.getStreamSource();
    if ((source_x == source_y) && (x.getStreamFilter() == y.getStreamFilter())) {
        return v_equal;
    }

    // Both sources are read from their current positions, which are restored afterward whether
    // or not the comparison completes.
    auto start_x = source_x->tell();
    auto start_y = source_y->tell();
    auto restore = [&]() {
        source_x->seek(start_x, SEEK_SET);
        source_y->seek(start_y, SEEK_SET);
    };

    bool result = false;
    try {
        auto logger = engine.getLogger();
        auto data_x = (x.getStreamFilter() == sf_flate) ? decode(*source_x, *logger) : source_x;
        auto data_y = (y.getStreamFilter() == sf_flate) ? decode(*source_y, *logger) : source_y;

        if (remaining(*data_x) != remaining(*data_y)) {
            restore();
            return v_not_equal;
        }

        char buf_x[chunk_size];
        char buf_y[chunk_size];
        deq_offset_t offset = 0;
        result = true;
        while (result) {
            size_t len_x = data_x->read(buf_x, sizeof(buf_x));
            size_t len_y = data_y->read(buf_y, sizeof(buf_y));
            size_t len = std::min(len_x, len_y);
            if (len == 0) {
                break;
            }
            if (memcmp(buf_x, buf_y, len) != 0) {
                size_t i = 0;
                while (buf_x[i] == buf_y[i]) {
                    ++i;
                }
                FailurePoint fp;
                fp.position = offset + IntC::to_offset(i);
                fp.expected_value =
                    ValueHandle::newUnsigned(static_cast<unsigned char>(buf_x[i]), 8);
                fp.actual_value = ValueHandle::newUnsigned(static_cast<unsigned char>(buf_y[i]), 8);
                state.addFailurePoint(std::move(fp));
                result = false;
            }
            if (len_x != len_y) {
                // Reads may return short counts; realign the sources to the common offset.
                offset += IntC::to_offset(len);
                data_x->seek(data_x->getLastOffset() + IntC::to_offset(len), SEEK_SET);
                data_y->seek(data_y->getLastOffset() + IntC::to_offset(len), SEEK_SET);
            } else {
                offset += IntC::to_offset(len);
            }
        }
    } catch (...) {
        restore();
        throw;
    }
    restore();
    return verdict(result);
}
