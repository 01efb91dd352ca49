//
// Created by chris on 1/9/26.
//

#ifndef ESTRENDER_REFLECTION_HPP
#define ESTRENDER_REFLECTION_HPP
#include <expected>

#include "Error.hpp"
#include "ShaderAst.hpp"
#include "ShaderTypes.hpp"

namespace est
{

struct TypeLayout
{
	uint32_t size;		// UNBOUNDED_SIZE for runtime sized data
	uint32_t alignment;
};

/**
 * @brief Compute the std140-like size and alignment of a type
 *
 * scalar 4/4, vec2 8/8, vec3 12/16, vec4 16/16, matrices 16 aligned with every
 * column padded to 16 bytes, structs padded to their largest member alignment.
 */
[[nodiscard]] std::expected<TypeLayout, Error> compute_type_layout(const ast::Module& module, ast::TypeHandle type);

/**
 * @brief Reflect bindings, entry points and the vertex input layout of a module
 *
 * Pure and deterministic: the same module always produces the same reflection,
 * bindings sorted by (group, binding).
 *
 * @return Reflection on success, Error describing the first unsupported construct otherwise
 */
[[nodiscard]] std::expected<ShaderReflection, Error> reflect(const ast::Module& module);

} // namespace est

#endif // ESTRENDER_REFLECTION_HPP
