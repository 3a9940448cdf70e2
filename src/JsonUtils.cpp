#include "droview/JsonUtils.hpp"
#include "droview/Errors.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>

namespace droview {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open '" + path + "'");
    nlohmann::json j;
    f >> j;
    return j;
}

void save_json(const std::string& path, const nlohmann::json& j)
{
    std::ofstream f(path);
    if (!f)
        throw std::runtime_error("Cannot write '" + path + "'");
    f << j.dump();
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

/* ---------- numeric arrays ------------------------------------------ */
static double to_number(const nlohmann::json& v, const std::string& what)
{
    if (v.is_null())   return std::numeric_limits<double>::quiet_NaN();
    if (v.is_number()) return v.get<double>();
    throw DatasetLoadError(what + ": expected a number or null");
}

Vector json_to_vector(const nlohmann::json& j, const std::string& what)
{
    if (!j.is_array())
        throw DatasetLoadError(what + ": expected an array");
    Vector v(j.size());
    for (std::size_t i = 0; i < j.size(); ++i)
        v[i] = to_number(j[i], what);
    return v;
}

Matrix json_to_matrix(const nlohmann::json& j, const std::string& what)
{
    if (!j.is_array() || j.empty() || !j.front().is_array())
        throw DatasetLoadError(what + ": expected a non-empty array of rows");

    const std::size_t rows = j.size();
    const std::size_t cols = j.front().size();
    Matrix m(rows, cols);
    for (std::size_t r = 0; r < rows; ++r) {
        if (!j[r].is_array() || j[r].size() != cols)
            throw DatasetLoadError(what + ": ragged row " + std::to_string(r));
        for (std::size_t c = 0; c < cols; ++c)
            m(r, c) = to_number(j[r][c], what);
    }
    return m;
}

static nlohmann::json number_or_null(double x)
{
    return std::isfinite(x) ? nlohmann::json(x) : nlohmann::json(nullptr);
}

nlohmann::json vector_to_json(const Vector& v)
{
    nlohmann::json a = nlohmann::json::array();
    for (Eigen::Index i = 0; i < v.size(); ++i) a.push_back(number_or_null(v[i]));
    return a;
}

nlohmann::json matrix_to_json(const Matrix& m)
{
    nlohmann::json a = nlohmann::json::array();
    for (Eigen::Index r = 0; r < m.rows(); ++r) {
        nlohmann::json row = nlohmann::json::array();
        for (Eigen::Index c = 0; c < m.cols(); ++c) row.push_back(number_or_null(m(r, c)));
        a.push_back(std::move(row));
    }
    return a;
}

} // namespace droview
