#include "droview/ParameterRecord.hpp"
#include "droview/Errors.hpp"
#include <algorithm>

namespace droview {

void ParameterRecord::set(const std::string& name, double val)
{
    auto it = std::find_if(p_.begin(), p_.end(),
                           [&](const auto& e) { return e.first == name; });
    if (it != p_.end()) it->second = val;
    else                p_.emplace_back(name, val);
}

double ParameterRecord::at(const std::string& name) const
{
    for (const auto& [n, v] : p_)
        if (n == name) return v;
    throw UnknownParameterError("parameter '" + name + "' not in record");
}

double ParameterRecord::value_or(const std::string& name, double fallback) const
{
    for (const auto& [n, v] : p_)
        if (n == name) return v;
    return fallback;
}

bool ParameterRecord::contains(const std::string& name) const
{
    return std::any_of(p_.begin(), p_.end(),
                       [&](const auto& e) { return e.first == name; });
}

double ParameterRecord::first() const
{
    if (p_.empty())
        throw UnknownParameterError("empty parameter record");
    return p_.front().second;
}

} // namespace droview
