#include <deepeq/ChainComparer.hh>

#include <deepeq/FileInputSource.hh>
#include <deepeq/SystemError.hh>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

using namespace deepeq;
namespace fs = std::filesystem;

namespace
{
    struct Entry
    {
        std::string name;
        fs::path path;
        fs::file_type type;
    };

    void
    check(std::error_code const& ec, std::string const& description)
    {
        if (ec) {
            throw SystemError(description, ec.value());
        }
    }

    std::vector<Entry>
    list_directory(fs::path const& dir)
    {
        std::error_code ec;
        auto status = fs::status(dir, ec);
        check(ec, "stat " + dir.string());
        if (!fs::is_directory(status)) {
            throw SystemError(dir.string() + " is not a directory", ENOTDIR);
        }

        std::vector<Entry> result;
        fs::directory_iterator end;
        fs::directory_iterator iter(dir, ec);
        check(ec, "open directory " + dir.string());
        for (; iter != end; iter.increment(ec)) {
            check(ec, "read directory " + dir.string());
            auto type = iter->symlink_status(ec).type();
            check(ec, "stat " + iter->path().string());
            result.push_back({iter->path().filename().string(), iter->path(), type});
        }
        check(ec, "read directory " + dir.string());
        std::sort(result.begin(), result.end(), [](Entry const& a, Entry const& b) {
            return a.name < b.name;
        });
        return result;
    }

    // The value that stands for a directory entry in comparisons and failure points. Symbolic
    // links are represented by their target text so that they are never followed.
    ValueHandle
    entry_value(Entry const& entry)
    {
        switch (entry.type) {
        case fs::file_type::regular:
            return ValueHandle::newStream(
                std::make_shared<FileInputSource>(entry.path.string().c_str()));
        case fs::file_type::directory:
            return ValueHandle::newDirectory(entry.path.string());
        case fs::file_type::symlink:
            {
                std::error_code ec;
                auto target = fs::read_symlink(entry.path, ec);
                check(ec, "read link " + entry.path.string());
                return ValueHandle::newString(target.string());
            }
        default:
            return ValueHandle::newString("<special file>");
        }
    }
} // namespace

char const*
CC_Directories::getName() const
{
    return "directories";
}

ChainComparer::verdict_e
CC_Directories::equal(
    ValueHandle const& x, ValueHandle const& y, Tolerance const& tolerance, ComparisonState& state)
{
    if (!(x.isDirectory() && y.isDirectory())) {
        return v_not_applicable;
    }

    fs::path dir_x(x.getDirectoryPath());
    fs::path dir_y(y.getDirectoryPath());
    auto entries_x = list_directory(dir_x);
    auto entries_y = list_directory(dir_y);

    std::error_code ec;
    bool same = fs::equivalent(dir_x, dir_y, ec);
    check(ec, "compare " + dir_x.string() + " with " + dir_y.string());
    if (same) {
        return v_equal;
    }

    auto mismatch = [&state](std::string const& name,
                             ValueHandle const& expected,
                             ValueHandle const& actual) {
        FailurePoint fp;
        fp.key = ValueHandle::newString(name);
        fp.expected_has_data = expected.isInitialized();
        fp.actual_has_data = actual.isInitialized();
        fp.expected_value = expected;
        fp.actual_value = actual;
        state.addFailurePoint(std::move(fp));
        return v_not_equal;
    };

    // Walk both sorted listings together so that the first name present on only one side is
    // reported.
    size_t i = 0;
    size_t j = 0;
    while ((i < entries_x.size()) || (j < entries_y.size())) {
        if ((j == entries_y.size()) ||
            ((i < entries_x.size()) && (entries_x[i].name < entries_y[j].name))) {
            state.clearFailurePoints();
            return mismatch(entries_x[i].name, entry_value(entries_x[i]), ValueHandle());
        }
        if ((i == entries_x.size()) || (entries_y[j].name < entries_x[i].name)) {
            state.clearFailurePoints();
            return mismatch(entries_y[j].name, ValueHandle(), entry_value(entries_y[j]));
        }

        auto const& ex = entries_x[i];
        auto const& ey = entries_y[j];
        auto value_x = entry_value(ex);
        auto value_y = entry_value(ey);
        if (ex.type != ey.type) {
            state.clearFailurePoints();
            return mismatch(ex.name, value_x, value_y);
        }
        if ((ex.type == fs::file_type::regular) || (ex.type == fs::file_type::directory) ||
            (ex.type == fs::file_type::symlink)) {
            if (!engine.areEqual(value_x, value_y, tolerance, state)) {
                return mismatch(ex.name, value_x, value_y);
            }
        }
        ++i;
        ++j;
    }
    return v_equal;
}
