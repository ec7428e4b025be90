#include <deepeq/assert_test.h>

#include <deepeq/BufferInputSource.hh>
#include <deepeq/EqualityComparer.hh>
#include <deepeq/FileInputSource.hh>
#include <deepeq/Util.hh>

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <zlib.h>

using namespace deepeq;

typedef ValueHandle VH;

static std::shared_ptr<InputSource>
buffer(std::string const& name, std::string const& data)
{
    return std::make_shared<BufferInputSource>(name, data);
}

static std::string
big_data(char last)
{
    std::string data;
    for (int i = 0; i < 10000; ++i) {
        data += static_cast<char>('a' + (i % 26));
    }
    data += last;
    return data;
}

static std::string
deflate(std::string const& data)
{
    uLongf len = compressBound(static_cast<uLong>(data.length()));
    std::string compressed(len, '\0');
    int err = compress(
        reinterpret_cast<Bytef*>(compressed.data()),
        &len,
        reinterpret_cast<Bytef const*>(data.data()),
        static_cast<uLong>(data.length()));
    assert(err == Z_OK);
    compressed.resize(len);
    return compressed;
}

// Reads like a buffer but fails once the given offset is reached.
class FailingSource: public BufferInputSource
{
  public:
    FailingSource(std::string const& data, deq_offset_t fail_at) :
        BufferInputSource("failing", data),
        fail_at(fail_at)
    {
    }
    ~FailingSource() override = default;

    size_t
    read(char* buffer, size_t length) override
    {
        if (tell() >= fail_at) {
            throw std::runtime_error("failing: read error");
        }
        return BufferInputSource::read(buffer, std::min(length, static_cast<size_t>(7)));
    }

  private:
    deq_offset_t fail_at;
};

static void
test_buffers()
{
    EqualityComparer engine;
    auto s1 = buffer("s1", big_data('x'));
    auto s2 = buffer("s2", big_data('x'));
    auto s3 = buffer("s3", big_data('y'));
    assert(engine.areEqual(VH::newStream(s1), VH::newStream(s2)));
    // The same source is equal to itself without reading
    assert(engine.areEqual(VH::newStream(s1), VH::newStream(s1)));

    auto result = engine.compare(VH::newStream(s1), VH::newStream(s3));
    assert(!result && (result.failure_points.size() == 1));
    auto const& fp = result.failure_points.at(0);
    assert(fp.position == 10000);
    assert(fp.expected_value.getUIntValue() == 'x');
    assert(fp.actual_value.getUIntValue() == 'y');
    assert(fp.unparse() == "at index 10000: expected 120 but was 121");

    // Different lengths
    auto s4 = buffer("s4", big_data('x') + "z");
    result = engine.compare(VH::newStream(s1), VH::newStream(s4));
    assert(!result && result.failure_points.empty());

    // Comparison starts at the current positions and leaves them where they were
    s4->seek(0, SEEK_SET);
    auto s5 = buffer("s5", "zzz" + big_data('x'));
    s5->seek(3, SEEK_SET);
    assert(engine.areEqual(VH::newStream(s1), VH::newStream(s5)));
    assert(s5->tell() == 3);
    assert(s1->tell() == 0);

    assert(engine.areEqual(VH::newStream(buffer("e1", "")), VH::newStream(buffer("e2", ""))));
    std::cout << "buffers done" << std::endl;
}

static void
test_short_reads()
{
    // FailingSource returns at most 7 bytes per read, so the sources drift apart and must be
    // realigned.
    EqualityComparer engine;
    auto data = big_data('x');
    auto failing = std::make_shared<FailingSource>(data, 1000000);
    assert(engine.areEqual(VH::newStream(failing), VH::newStream(buffer("b", data))));
    auto changed = data;
    changed[5000] = '!';
    auto result = engine.compare(VH::newStream(failing), VH::newStream(buffer("c", changed)));
    assert(!result);
    assert(result.failure_points.at(0).position == 5000);
    std::cout << "short reads done" << std::endl;
}

static void
test_errors()
{
    EqualityComparer engine;
    auto data = big_data('x');
    auto failing = std::make_shared<FailingSource>(data, 100);
    failing->seek(10, SEEK_SET);
    auto other = buffer("other", data.substr(10));
    try {
        engine.areEqual(VH::newStream(failing), VH::newStream(other));
        assert(false);
    } catch (std::runtime_error& e) {
        std::cout << "read error: " << e.what() << std::endl;
    }
    // Positions are restored when the comparison fails with an exception
    assert(failing->tell() == 10);
    assert(other->tell() == 0);
    std::cout << "errors done" << std::endl;
}

static void
test_flate()
{
    EqualityComparer engine;
    auto data = big_data('q');
    auto encoded = buffer("encoded", deflate(data));
    auto plain = buffer("plain", data);
    assert(engine.areEqual(VH::newStream(encoded, sf_flate), VH::newStream(plain)));
    assert(encoded->tell() == 0);
    // Without the filter the encoded bytes are compared
    assert(!engine.areEqual(VH::newStream(encoded), VH::newStream(plain)));

    auto other = buffer("other", deflate(big_data('r')));
    auto result = engine.compare(VH::newStream(encoded, sf_flate), VH::newStream(other, sf_flate));
    assert(!result);
    // Positions refer to the decoded data
    assert(result.failure_points.at(0).position == 10000);

    auto corrupt = buffer("corrupt", "not compressed at all");
    try {
        engine.areEqual(VH::newStream(corrupt, sf_flate), VH::newStream(plain));
        assert(false);
    } catch (std::runtime_error& e) {
        std::cout << "corrupt stream: " << e.what() << std::endl;
    }
    assert(corrupt->tell() == 0);

    // One source read with and without decoding is two different byte sequences
    assert(engine.areEqual(VH::newStream(encoded, sf_flate), VH::newStream(encoded, sf_flate)));
    assert(!engine.areEqual(VH::newStream(encoded, sf_flate), VH::newStream(encoded)));
    assert(!engine.areEqual(VH::newStream(encoded), VH::newStream(encoded, sf_flate)));
    assert(encoded->tell() == 0);

    // Only one level of compression is removed
    auto twice = buffer("twice", deflate(deflate(data)));
    auto once = buffer("once", deflate(data));
    assert(engine.areEqual(VH::newStream(twice, sf_flate), VH::newStream(once)));
    std::cout << "flate done" << std::endl;
}

static void
test_files()
{
    char const* filename = "streams.tmp";
    FILE* f = Util::safe_fopen(filename, "wb");
    auto data = big_data('x');
    assert(fwrite(data.data(), 1, data.length(), f) == data.length());
    fclose(f);

    EqualityComparer engine;
    {
        auto file = std::make_shared<FileInputSource>(filename);
        assert(engine.areEqual(VH::newStream(file), VH::newStream(buffer("b", data))));
        assert(file->tell() == 0);
        assert(!engine.areEqual(VH::newStream(file), VH::newStream(buffer("b", big_data('y')))));
    }
    remove(filename);
    std::cout << "files done" << std::endl;
}

int
main()
{
    test_buffers();
    test_short_reads();
    test_errors();
    test_flate();
    test_files();
    std::cout << "streams: all tests passed" << std::endl;
    return 0;
}
