/**
 * @file fnv1a.hpp
 * @brief FNV-1a string hash used for path colours
 *
 * @see TreemapRenderer::colourFor()
 */

#ifndef DIRMAP_FNV1A_HPP
#define DIRMAP_FNV1A_HPP

#include <cstdint>
#include <string>

/**
 * @brief FNV-1a (Fowler-Noll-Vo) hash over a string
 *
 * Used to derive a stable colour from a node path, so a block keeps its
 * colour between runs and between layout passes. 64-bit variant:
 * - FNV prime: 2^40 + 2^8 + 0xb3 (1099511628211)
 * - FNV offset basis: 14695981039346656037
 *
 * @see http://www.isthe.com/chongo/tech/comp/fnv/
 */
class FNV1A {
public:
  static uint64_t hash(const std::string &value) {
    const uint64_t FNV_prime = 1099511628211u;
    uint64_t hash = 14695981039346656037u;

    for (char c : value) {
      hash ^= static_cast<unsigned char>(c);
      hash *= FNV_prime;
    }
    return hash;
  }
};

#endif // DIRMAP_FNV1A_HPP
