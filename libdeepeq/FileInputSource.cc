#include <deepeq/FileInputSource.hh>

#include <deepeq/Util.hh>

#include <cstring>

using namespace deepeq;

FileInputSource::FileInputSource(char const* filename) :
    close_file(true),
    filename(filename),
    file(Util::safe_fopen(filename, "rb"))
{
}

FileInputSource::FileInputSource(char const* description, FILE* filep, bool close_file) :
    close_file(close_file),
    filename(description),
    file(filep)
{
}

FileInputSource::~FileInputSource()
{
    // Must be explicit and not inline -- see DEEPEQ_DLL_CLASS in DLL.h
    closeFile();
}

void
FileInputSource::closeFile()
{
    if (file && close_file) {
        fclose(file);
    }
    file = nullptr;
}

void
FileInputSource::setFilename(char const* filename)
{
    FILE* f = Util::safe_fopen(filename, "rb");
    closeFile();
    close_file = true;
    this->filename = filename;
    file = f;
}

void
FileInputSource::setFile(char const* description, FILE* filep, bool close_file)
{
    closeFile();
    this->close_file = close_file;
    filename = description;
    file = filep;
    seek(0, SEEK_SET);
}

std::string const&
FileInputSource::getName() const
{
    return filename;
}

deq_offset_t
FileInputSource::tell()
{
    return Util::tell(file);
}

void
FileInputSource::seek(deq_offset_t offset, int whence)
{
    if (Util::seek(file, offset, whence) == -1) {
        Util::throw_system_error(
            std::string("seek to ") + filename + ", offset " + std::to_string(offset) + " (" +
            std::to_string(whence) + ")");
    }
}

void
FileInputSource::rewind()
{
    ::rewind(file);
}

size_t
FileInputSource::read(char* buffer, size_t length)
{
    last_offset = Util::tell(file);
    size_t len = fread(buffer, 1, length, file);
    if (len == 0) {
        if (ferror(file)) {
            Util::throw_system_error(
                filename + ": read " + std::to_string(length) + " bytes at offset " +
                std::to_string(last_offset));
        } else if (length > 0) {
            seek(0, SEEK_END);
            last_offset = tell();
        }
    }
    return len;
}
