#include <cstdlib>
#include <cstring>
#include <iostream>

#include <deepeq/EqualityComparer.hh>
#include <deepeq/Logger.hh>
#include <deepeq/Util.hh>

using namespace deepeq;

static std::string whoami;

static void
usage()
{
    std::cerr << "Usage: " << whoami << " [--ignore-case] dir1 dir2\n"
              << "Compares two directory trees by name and content and prints where they\n"
              << "first differ. Exits with 0 when they are equal and 1 when they differ.\n";
    exit(2);
}

int
main(int argc, char* argv[])
{
    whoami = Util::getWhoami(argv[0]);
    auto logger = Logger::defaultLogger();

    if ((argc == 2) && (strcmp(argv[1], "--version") == 0)) {
        logger->info(whoami + " version 1.0\n");
        exit(0);
    }

    EqualityComparer engine;
    engine.setLogger(logger);
    int arg = 1;
    if ((arg < argc) && (strcmp(argv[arg], "--ignore-case") == 0)) {
        engine.setIgnoreCase(true);
        ++arg;
    }
    if (argc - arg != 2) {
        usage();
    }

    try {
        auto result = engine.compare(
            ValueHandle::newDirectory(argv[arg]), ValueHandle::newDirectory(argv[arg + 1]));
        if (result) {
            return 0;
        }
        logger->info(std::string(argv[arg]) + " and " + argv[arg + 1] + " differ\n");
        for (auto const& fp: result.failure_points) {
            logger->info("  " + fp.unparse() + "\n");
        }
        return 1;
    } catch (std::exception& e) {
        logger->error(whoami + ": " + e.what() + "\n");
        return 2;
    }
}
