//
// Created by chris on 1/10/26.
//

#ifndef ESTRENDER_BINARYSHADER_HPP
#define ESTRENDER_BINARYSHADER_HPP
#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "Error.hpp"
#include "ShaderTypes.hpp"

namespace est
{

constexpr std::array<char, 20> BINARY_SHADER_MAGIC = {'e', 's', 't', '-', 'b', 'i', 'n', 'a', 'r', 'y',
													  '-', 's', 'h', 'a', 'd', 'e', 'r', '-', 'v', '1'};

/// Precompiled shader: reflection plus SPIR-V, stored in the est-binary-shader-v1 container.
struct BinaryShader
{
	ShaderReflection	 reflection;
	std::vector<uint8_t> spirv;
};

/**
 * @brief Parse an est-binary-shader-v1 container
 *
 * All fields are little endian. Truncated data, unknown type tags or a bad magic
 * yield MalformedBinaryShader.
 */
[[nodiscard]] std::expected<BinaryShader, Error> load_binary_shader(std::span<const uint8_t> data);

/// Serialize a shader into the container format read by load_binary_shader.
[[nodiscard]] std::vector<uint8_t> write_binary_shader(const BinaryShader& shader);

} // namespace est

#endif // ESTRENDER_BINARYSHADER_HPP
