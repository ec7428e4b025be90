#include <deepeq/assert_test.h>

#include <deepeq/Logger.hh>
#include <deepeq/Pl_String.hh>

#include <sstream>
#include <stdexcept>

using namespace deepeq;

static void
test_default()
{
    auto logger = Logger::defaultLogger();
    assert(logger == Logger::defaultLogger());
    assert(logger->getInfo() == logger->standardOutput());
    assert(logger->getError() == logger->standardError());
    // Warnings follow errors until they are set
    assert(logger->getWarn() == logger->standardError());

    logger->info("info to stdout\n");
    logger->warn("warn to stderr\n");
    logger->error("error to stderr\n");

    logger->setWarn(logger->discard());
    logger->warn("warning not seen\n");
    logger->setWarn(nullptr);
    logger->warn("restored warning to stderr\n");
}

static void
test_channels()
{
    auto l = Logger::create();
    assert(l != Logger::defaultLogger());

    std::string errors;
    l->setError(std::make_shared<Pl_String>("errors", nullptr, errors));
    l->warn("first warning\n");
    l->error(std::string("first error\n"));
    assert(errors == "first warning\nfirst error\n");

    // Once set explicitly, warnings are separate from errors
    std::string warnings;
    l->setWarn(std::make_shared<Pl_String>("warnings", nullptr, warnings));
    l->warn(std::string("second warning\n"));
    l->error("second error\n");
    assert(warnings == "second warning\n");
    assert(errors == "first warning\nfirst error\nsecond error\n");

    std::string info;
    l->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    l->info("DEBUG: trace\n");
    *(l->getInfo()) << "count: " << 3 << "\n";
    assert(info == "DEBUG: trace\ncount: 3\n");

    // Resetting the warning channel makes it follow error again
    l->setWarn(nullptr);
    l->warn("third warning\n");
    assert(warnings == "second warning\n");
    assert(errors == "first warning\nfirst error\nsecond error\nthird warning\n");

    l->setInfo(nullptr);
    l->setError(nullptr);
    assert(l->getInfo() == l->standardOutput());
    assert(l->getError() == l->standardError());
    l->info("after reset, info to stdout\n");
}

static void
test_output_streams()
{
    auto l = Logger::create();
    std::ostringstream out;
    std::ostringstream err;
    l->setOutputStreams(&out, &err);
    l->info("to out\n");
    l->warn("to err\n");
    l->error("also to err\n");
    assert(out.str() == "to out\n");
    assert(err.str() == "to err\nalso to err\n");

    l->setOutputStreams(nullptr, nullptr);
    assert(l->getInfo() == l->standardOutput());
    assert(l->getError() == l->standardError());
}

int
main()
{
    test_default();
    test_channels();
    test_output_streams();
    return 0;
}
