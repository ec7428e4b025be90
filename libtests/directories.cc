#include <deepeq/assert_test.h>

#include <deepeq/EqualityComparer.hh>
#include <deepeq/SystemError.hh>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace deepeq;
namespace fs = std::filesystem;

typedef ValueHandle VH;

static fs::path const top = "directories.tmp";

static void
write_file(fs::path const& path, std::string const& contents)
{
    std::ofstream f(path, std::ios::binary);
    f << contents;
}

// Create a small tree: file.txt, sub/inner.txt and a link to file.txt.
static void
make_tree(fs::path const& dir)
{
    fs::create_directories(dir / "sub");
    write_file(dir / "file.txt", "some text\n");
    write_file(dir / "sub" / "inner.txt", "inner text\n");
    fs::create_symlink("file.txt", dir / "link");
}

static VH
dir(fs::path const& path)
{
    return VH::newDirectory(path.string());
}

static void
test_equal_trees()
{
    EqualityComparer engine;
    auto a = top / "a";
    auto b = top / "b";
    make_tree(a);
    make_tree(b);
    assert(engine.areEqual(dir(a), dir(a)));
    assert(engine.areEqual(dir(a), dir(a / "sub" / "..")));
    assert(engine.areEqual(dir(a), dir(b)));
    assert(engine.areEqual(dir(b), dir(a)));
    assert(engine.areEqual(dir(a / "sub"), dir(b / "sub")));
    std::cout << "equal trees done" << std::endl;
}

static void
test_differences()
{
    EqualityComparer engine;
    auto a = top / "a";
    auto c = top / "c";

    // An extra entry on the right
    make_tree(c);
    write_file(c / "extra", "");
    auto result = engine.compare(dir(a), dir(c));
    assert(!result && (result.failure_points.size() == 1));
    assert(result.failure_points.at(0).key.getStringValue() == "extra");
    assert(!result.failure_points.at(0).expected_has_data);
    assert(result.failure_points.at(0).actual_has_data);

    // An extra entry on the left
    result = engine.compare(dir(c), dir(a));
    assert(result.failure_points.at(0).key.getStringValue() == "extra");
    assert(result.failure_points.at(0).expected_has_data);
    assert(!result.failure_points.at(0).actual_has_data);
    fs::remove(c / "extra");
    assert(engine.areEqual(dir(a), dir(c)));

    // Different file contents of the same length
    write_file(c / "file.txt", "some TEXT\n");
    result = engine.compare(dir(a), dir(c));
    assert(!result && (result.failure_points.size() == 2));
    assert(result.failure_points.at(0).key.getStringValue() == "file.txt");
    assert(result.failure_points.at(1).position == 5);
    write_file(c / "file.txt", "some text\n");

    // Difference in a subdirectory
    write_file(c / "sub" / "inner.txt", "inner text, longer\n");
    result = engine.compare(dir(a), dir(c));
    assert(!result && (result.failure_points.size() == 2));
    assert(result.failure_points.at(0).key.getStringValue() == "sub");
    assert(result.failure_points.at(1).key.getStringValue() == "inner.txt");
    write_file(c / "sub" / "inner.txt", "inner text\n");
    assert(engine.areEqual(dir(a), dir(c)));

    // Entries of different kinds
    fs::remove(c / "link");
    write_file(c / "link", "file.txt");
    result = engine.compare(dir(a), dir(c));
    assert(!result && (result.failure_points.size() == 1));
    assert(result.failure_points.at(0).key.getStringValue() == "link");
    assert(result.failure_points.at(0).expected_value.isString());
    assert(result.failure_points.at(0).actual_value.isStream());

    // Links with different targets are not followed
    fs::remove(c / "link");
    fs::create_symlink("sub/inner.txt", c / "link");
    result = engine.compare(dir(a), dir(c));
    assert(!result);
    assert(
        result.failure_points.at(0).unparse() ==
        "at key \"link\": expected \"file.txt\" but was \"sub/inner.txt\"");
    std::cout << "differences done" << std::endl;
}

static void
test_errors()
{
    EqualityComparer engine;
    try {
        engine.areEqual(dir(top / "a"), dir(top / "missing"));
        assert(false);
    } catch (SystemError& e) {
        assert(e.getErrno() == ENOENT);
        std::cout << "missing directory: " << e.what() << std::endl;
    }
    try {
        engine.areEqual(dir(top / "a" / "file.txt"), dir(top / "a"));
        assert(false);
    } catch (SystemError& e) {
        assert(e.getErrno() == ENOTDIR);
        std::cout << "not a directory: " << e.what() << std::endl;
    }
    std::cout << "errors done" << std::endl;
}

int
main()
{
    fs::remove_all(top);
    test_equal_trees();
    test_differences();
    test_errors();
    fs::remove_all(top);
    std::cout << "directories: all tests passed" << std::endl;
    return 0;
}
