#include <deepeq/assert_test.h>

#include <deepeq/Pl_Discard.hh>
#include <deepeq/Pl_Inflate.hh>
#include <deepeq/Pl_OStream.hh>
#include <deepeq/Pl_String.hh>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <zlib.h>

using namespace deepeq;

static std::string
make_data()
{
    std::string data;
    for (int i = 0; i < 5000; ++i) {
        data += "line " + std::to_string(i) + " of some compressible text\n";
    }
    return data;
}

static std::string
compress_data(std::string const& data)
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

static void
test_inflate()
{
    auto data = make_data();
    auto compressed = compress_data(data);
    assert(compressed.length() < data.length());

    // Small pieces and a small output buffer exercise partial inflation.
    std::string inflated;
    Pl_String out("inflated", nullptr, inflated);
    Pl_Inflate inf("inf", &out, 1024);
    for (size_t i = 0; i < compressed.length(); i += 100) {
        auto piece = compressed.substr(i, 100);
        inf.write(piece.data(), piece.length());
    }
    inf.finish();
    assert(inflated == data);

    try {
        inf.writeCStr("too late");
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "write after finish: " << e.what() << std::endl;
    }

    // All at once with the default buffer
    std::string whole;
    Pl_String out2("whole", nullptr, whole);
    Pl_Inflate inf2("inf2", &out2);
    inf2.writeString(compressed);
    inf2.finish();
    assert(whole == data);

    // Nothing written produces nothing
    std::string empty;
    Pl_String out3("empty", nullptr, empty);
    Pl_Inflate inf3("inf3", &out3);
    inf3.finish();
    assert(empty.empty());
    std::cout << "inflate done" << std::endl;
}

static void
test_errors()
{
    std::string ignored;
    Pl_String out("out", nullptr, ignored);
    try {
        Pl_Inflate inf("corrupt", &out);
        inf.writeCStr("this is not zlib data");
        inf.finish();
        assert(false);
    } catch (std::runtime_error& e) {
        std::cout << "corrupt data: " << e.what() << std::endl;
    }

    try {
        Pl_Inflate bad("no next", nullptr);
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "null next: " << e.what() << std::endl;
    }
    try {
        Pl_Inflate bad("no buffer", &out, 0);
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "buffer size: " << e.what() << std::endl;
    }

    // Truncated input is reported through the warning callback
    auto compressed = compress_data(make_data());
    std::string partial;
    Pl_String out2("partial", nullptr, partial);
    Pl_Inflate truncated("truncated", &out2);
    int warnings = 0;
    truncated.setWarnCallback([&warnings](char const* msg, int) {
        std::cout << "warning: " << msg << std::endl;
        ++warnings;
    });
    truncated.writeString(compressed.substr(0, compressed.length() / 2));
    truncated.finish();
    assert(warnings == 1);
    assert(!partial.empty() && (make_data().compare(0, partial.length(), partial) == 0));

    Pl_Inflate::memory_limit(1000);
    assert(Pl_Inflate::memory_limit() == 1000);
    try {
        std::string limited;
        Pl_String out3("limited", nullptr, limited);
        Pl_Inflate inf("limited", &out3, 512);
        inf.writeString(compressed);
        inf.finish();
        assert(false);
    } catch (std::runtime_error& e) {
        std::cout << "memory limit: " << e.what() << std::endl;
    }
    Pl_Inflate::memory_limit(0);
    std::cout << "errors done" << std::endl;
}

static void
test_other_pipelines()
{
    std::ostringstream os;
    Pl_OStream pl_os("os", os);
    pl_os << "to the stream " << 12;
    pl_os.finish();
    assert(os.str() == "to the stream 12");
    assert(pl_os.getIdentifier() == "os");

    // Pl_String passes data through to its next pipeline
    std::string first;
    Pl_String tee("tee", &pl_os, first);
    tee.writeString("!");
    tee.finish();
    assert(first == "!");
    assert(os.str() == "to the stream 12!");

    Pl_Discard discard;
    discard.writeString("gone");
    discard.finish();
    std::cout << "other pipelines done" << std::endl;
}

int
main()
{
    test_inflate();
    test_errors();
    test_other_pipelines();
    std::cout << "inflate: all tests passed" << std::endl;
    return 0;
}
