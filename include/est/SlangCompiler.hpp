//
// Created by chris on 1/12/26.
//

#ifndef ESTRENDER_SLANGCOMPILER_HPP
#define ESTRENDER_SLANGCOMPILER_HPP
#include <cstdint>
#include <expected>
#include <limits>
#include <string_view>
#include <vector>

#include "Error.hpp"
#include "ShaderAst.hpp"

namespace est
{

/// Group assigned to push constant blocks, which Vulkan does not place in a descriptor set.
constexpr uint32_t PUSH_CONSTANT_GROUP = std::numeric_limits<uint32_t>::max();

struct CompiledShader
{
	ast::Module			 module;
	std::vector<uint8_t> spirv; // all entry points of the module
};

/**
 * @brief Compile Slang source text to SPIR-V
 *
 * Every entry point the module defines is linked into the produced SPIR-V and
 * lowered into the returned module for reflection.
 *
 * @return ShaderCompilationFailed with the Slang diagnostics on failure
 */
[[nodiscard]] std::expected<CompiledShader, Error> compile_slang_source(std::string_view name, std::string_view source);

/// Same as compile_slang_source for a module found on the SHADER_DIR search path.
[[nodiscard]] std::expected<CompiledShader, Error> compile_slang_module(std::string_view name);

} // namespace est

#endif // ESTRENDER_SLANGCOMPILER_HPP
