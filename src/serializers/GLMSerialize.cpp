// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "serializers/GLMSerialize.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace lplay::serializers
{
    namespace
    {
        template<typename VecT>
        nlohmann::json serialize_vec(const VecT& v)
        {
            nlohmann::json j = nlohmann::json::array();
            auto& arr = j.get_ref<nlohmann::json::array_t&>();
            const int n = static_cast<int>(VecT::length());
            arr.reserve(n);
            for (int i = 0; i < n; ++i)
                arr.emplace_back(v[i]);
            return j;
        }

        template<typename VecT>
        VecT deserialize_vec(const nlohmann::json& j)
        {
            using scalar_t = typename VecT::value_type;
            VecT v{};

            if (j.is_array())
            {
                const size_t n = std::min<size_t>(j.size(), VecT::length());
                for (size_t i = 0; i < n; ++i)
                    v[static_cast<int>(i)] = j[i].get<scalar_t>();
            }
            else if (j.is_object())
            {
                v.x = j.value("x", scalar_t{});
                v.y = j.value("y", scalar_t{});
                v.z = j.value("z", scalar_t{});
                v.w = j.value("w", scalar_t{});
            }
            return v;
        }
    } // namespace

    nlohmann::json serialize_vec4(const glm::vec4& v) { return serialize_vec(v); }

    glm::vec4 deserialize_vec4(const nlohmann::json& j) { return deserialize_vec<glm::vec4>(j); }
}
