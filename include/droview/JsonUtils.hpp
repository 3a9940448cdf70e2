#pragma once
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace droview {
nlohmann::json load_json(const std::string& path);
void save_json(const std::string& path, const nlohmann::json& j);
void expand_env(nlohmann::json& j);

// numeric arrays; JSON null <-> NaN
Vector         json_to_vector(const nlohmann::json& j, const std::string& what);
Matrix         json_to_matrix(const nlohmann::json& j, const std::string& what);
nlohmann::json vector_to_json(const Vector& v);
nlohmann::json matrix_to_json(const Matrix& m);
} // namespace droview
