#include <deepeq/FailurePoint.hh>

using namespace deepeq;

std::string
FailurePoint::unparse() const
{
    std::string result = "at ";
    if (key) {
        result += "key " + key.unparse();
    } else if (indices.size() > 1) {
        result += "index [";
        bool first = true;
        for (auto i: indices) {
            if (!first) {
                result += ",";
            }
            first = false;
            result += std::to_string(i);
        }
        result += "]";
    } else {
        result += "index " + std::to_string(position);
    }
    result += ": expected ";
    result += expected_has_data ? expected_value.unparse() : "<none>";
    result += " but was ";
    result += actual_has_data ? actual_value.unparse() : "<none>";
    return result;
}
