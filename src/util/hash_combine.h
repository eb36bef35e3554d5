// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef hash_combine_h
#define hash_combine_h

#include <cstddef>
#include <functional>

inline void hash_combine_into(std::size_t&) {}

template<typename T, typename... Rest>
inline void hash_combine_into(std::size_t& seed, const T& v, const Rest&... rest)
{
    seed ^= std::hash<T>{}(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    hash_combine_into(seed, rest...);
}

/// Combine the hashes of all arguments (boost::hash_combine mixing)
template<typename... Ts>
inline std::size_t hash_combine(const Ts&... values)
{
    std::size_t seed = 0;
    hash_combine_into(seed, values...);
    return seed;
}

#endif /* hash_combine_h */
