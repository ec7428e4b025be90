#include <deepeq/InputSource.hh>

using namespace deepeq;

void
InputSource::setLastOffset(deq_offset_t offset)
{
    last_offset = offset;
}

deq_offset_t
InputSource::getLastOffset() const
{
    return last_offset;
}

std::string
InputSource::read(size_t count, deq_offset_t at)
{
    if (at >= 0) {
        seek(at, SEEK_SET);
    }
    std::string result(count, '\0');
    result.resize(read(result.data(), count));
    return result;
}
