#include <deepeq/Pl_OStream.hh>

using namespace deepeq;

Pl_OStream::Pl_OStream(char const* identifier, std::ostream& os) :
    Pipeline(identifier, nullptr),
    os(os)
{
}

// Must be explicit and not inline -- see DEEPEQ_DLL_CLASS in DLL.h
Pl_OStream::~Pl_OStream() = default;

void
Pl_OStream::write(unsigned char const* buf, size_t len)
{
    os.write(reinterpret_cast<char const*>(buf), static_cast<std::streamsize>(len));
}

void
Pl_OStream::finish()
{
    os.flush();
}
