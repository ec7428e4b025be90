#include <deepeq/Pl_String.hh>

using namespace deepeq;

Pl_String::Pl_String(char const* identifier, Pipeline* next, std::string& s) :
    Pipeline(identifier, next),
    s(s)
{
}

// Must be explicit and not inline -- see DEEPEQ_DLL_CLASS in DLL.h
Pl_String::~Pl_String() = default;

void
Pl_String::write(unsigned char const* buf, size_t len)
{
    if (!len) {
        return;
    }
    s.append(reinterpret_cast<char const*>(buf), len);
    if (next()) {
        next()->write(buf, len);
    }
}

void
Pl_String::finish()
{
    if (next()) {
        next()->finish();
    }
}
