#include <deepeq/DomainObject.hh>

#include <stdexcept>

using namespace deepeq;

ElementComparer::~ElementComparer() = default;

DomainObject::~DomainObject() = default;

std::string
DomainObject::getTypeName() const
{
    return "object";
}

std::string
DomainObject::unparse() const
{
    return "<" + getTypeName() + ">";
}

bool
DomainObject::nativeEquals(DomainObject const& other) const
{
    return this == &other;
}

bool
DomainObject::isStructural() const
{
    return false;
}

bool
DomainObject::structuralEquals(DomainObject const&, ElementComparer&) const
{
    throw std::logic_error(
        "DomainObject::structuralEquals called on " + getTypeName() +
        ", which is not structural");
}

bool
DomainObject::isEquatableWith(DomainObject const&) const
{
    return false;
}

bool
DomainObject::equatableEquals(DomainObject const&) const
{
    throw std::logic_error(
        "DomainObject::equatableEquals called on " + getTypeName() +
        ", which is not equatable");
}

bool
DomainObject::isEnumerable() const
{
    return false;
}

std::vector<ValueHandle>
DomainObject::getElements() const
{
    throw std::logic_error(
        "DomainObject::getElements called on " + getTypeName() + ", which is not enumerable");
}
