#pragma once
#include <string>
#include <utility>
#include <vector>

namespace droview {

/* Fitted parameter values of one model at one voxel, in the model's
 * declared parameter order.  A value may be NaN (fit did not converge). */
class ParameterRecord {
public:
    void set(const std::string& name, double val);

    double at(const std::string& name) const;
    double value_or(const std::string& name, double fallback) const;
    bool   contains(const std::string& name) const;
    double first() const;

    std::size_t size()  const { return p_.size(); }
    bool        empty() const { return p_.empty(); }

    const std::vector<std::pair<std::string, double>>& entries() const { return p_; }

private:
    std::vector<std::pair<std::string, double>> p_;
};

} // namespace droview
