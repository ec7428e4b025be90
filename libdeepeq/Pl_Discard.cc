#include <deepeq/Pl_Discard.hh>

using namespace deepeq;

// Pl_Discard does not use the member pattern as there is no prospect of it ever requiring data
// members.

Pl_Discard::Pl_Discard() :
    Pipeline("discard", nullptr)
{
}

// Must be explicit and not inline -- see DEEPEQ_DLL_CLASS in DLL.h
Pl_Discard::~Pl_Discard() = default;

void
Pl_Discard::write(unsigned char const* buf, size_t len)
{
}

void
Pl_Discard::finish()
{
}
