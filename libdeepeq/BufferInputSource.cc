#include <deepeq/BufferInputSource.hh>

#include <deepeq/IntC.hh>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

using namespace deepeq;

BufferInputSource::BufferInputSource(std::string const& description, std::string contents) :
    description(description),
    contents(std::move(contents)),
    max_offset(IntC::to_offset(this->contents.length()))
{
}

// Must be explicit and not inline -- see DEEPEQ_DLL_CLASS in DLL.h
BufferInputSource::~BufferInputSource() = default;

std::string const&
BufferInputSource::getName() const
{
    return description;
}

std::string const&
BufferInputSource::getContents() const
{
    return contents;
}

deq_offset_t
BufferInputSource::tell()
{
    return cur_offset;
}

void
BufferInputSource::seek(deq_offset_t offset, int whence)
{
    switch (whence) {
    case SEEK_SET:
        cur_offset = offset;
        break;

    case SEEK_END:
        IntC::range_check(max_offset, offset);
        cur_offset = max_offset + offset;
        break;

    case SEEK_CUR:
        IntC::range_check(cur_offset, offset);
        cur_offset += offset;
        break;

    default:
        throw std::logic_error("INTERNAL ERROR: invalid argument to BufferInputSource::seek");
        break;
    }

    if (cur_offset < 0) {
        throw std::runtime_error(description + ": seek before beginning of buffer");
    }
}

void
BufferInputSource::rewind()
{
    cur_offset = 0;
}

size_t
BufferInputSource::read(char* buffer, size_t length)
{
    if (cur_offset < 0) {
        throw std::logic_error("INTERNAL ERROR: BufferInputSource offset < 0");
    }
    deq_offset_t end_pos = max_offset;
    if (cur_offset >= end_pos) {
        last_offset = end_pos;
        return 0;
    }

    last_offset = cur_offset;
    size_t len = std::min(IntC::to_size(end_pos - cur_offset), length);
    memcpy(buffer, contents.data() + cur_offset, len);
    cur_offset += IntC::to_offset(len);
    return len;
}
