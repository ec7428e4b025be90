#include <deepeq/assert_test.h>

#include <deepeq/BufferInputSource.hh>
#include <deepeq/FileInputSource.hh>
#include <deepeq/SystemError.hh>
#include <deepeq/Util.hh>

#include <cerrno>
#include <cstdio>
#include <iostream>
#include <stdexcept>

using namespace deepeq;

static std::string
get_data()
{
    std::string data;
    for (size_t i = 0; i < 3172; ++i) {
        data += static_cast<char>(i & 0xff);
    }
    return data;
}

static void
check_source(std::shared_ptr<InputSource> is)
{
    assert(is->tell() == 0);
    auto s = is->read(10);
    assert(s.length() == 10);
    assert(s[9] == '\x09');
    assert(is->tell() == 10);
    assert(is->getLastOffset() == 0);

    // Read at an explicit offset
    s = is->read(4, 1022);
    assert(s == std::string("\xfe\xff\x00\x01", 4));
    assert(is->getLastOffset() == 1022);
    assert(is->tell() == 1026);

    is->seek(-2, SEEK_CUR);
    assert(is->tell() == 1024);
    is->seek(-5, SEEK_END);
    s = is->read(100);
    assert(s.length() == 5);
    assert(is->tell() == 3172);

    // Reading at the end returns nothing and leaves last_offset at the end
    s = is->read(100);
    assert(s.empty());
    assert(is->getLastOffset() == 3172);

    is->rewind();
    assert(is->tell() == 0);
    char buf[3172];
    assert(is->read(buf, sizeof(buf)) == 3172);
    assert(std::string(buf, sizeof(buf)) == get_data());
}

static void
test_buffer()
{
    auto data = get_data();
    auto bis = std::make_shared<BufferInputSource>("test buffer", data);
    // The source owns a copy
    data.clear();
    assert(bis->getName() == "test buffer");
    assert(bis->getContents().length() == 3172);
    check_source(bis);

    try {
        bis->seek(-1, SEEK_SET);
        assert(false);
    } catch (std::runtime_error& e) {
        std::cout << "seek before start: " << e.what() << std::endl;
    }
    std::cout << "buffer input source done" << std::endl;
}

static void
test_file()
{
    char const* filename = "input_source.tmp";
    FILE* f = Util::safe_fopen(filename, "wb");
    auto data = get_data();
    assert(fwrite(data.data(), 1, data.length(), f) == data.length());
    fclose(f);

    auto fis = std::make_shared<FileInputSource>(filename);
    assert(fis->getName() == filename);
    check_source(fis);

    // Replace the file of an existing source
    FILE* f2 = Util::safe_fopen(filename, "rb");
    fis->setFile("second", f2, true);
    assert(fis->getName() == "second");
    assert(fis->tell() == 0);
    fis->setFilename(filename);
    check_source(fis);
    fis = nullptr;
    remove(filename);

    try {
        FileInputSource missing("/nonexistent/input_source.tmp");
        assert(false);
    } catch (SystemError& e) {
        assert(e.getErrno() == ENOENT);
        assert(e.getDescription() == "open /nonexistent/input_source.tmp");
        std::cout << "missing file: " << e.what() << std::endl;
    }
    std::cout << "file input source done" << std::endl;
}

int
main()
{
    test_buffer();
    test_file();
    std::cout << "input source: all tests passed" << std::endl;
    return 0;
}
