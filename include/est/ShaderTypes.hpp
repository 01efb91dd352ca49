//
// Created by chris on 1/9/26.
//

#ifndef ESTRENDER_SHADERTYPES_HPP
#define ESTRENDER_SHADERTYPES_HPP
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Common.hpp"

namespace est
{

/// Size reported for runtime-sized arrays.
constexpr uint32_t UNBOUNDED_SIZE = std::numeric_limits<uint32_t>::max();

enum class StorageAccess : uint32_t
{
	None   = 0,
	Read   = 1,
	Write  = 2,
	Atomic = 4,
};
EST_DECLARE_FLAGS(StorageAccess)

enum class ShaderStageFlags : uint32_t
{
	None	 = 0,
	Vertex	 = 1,
	Fragment = 2,
	Compute	 = 4,
};
EST_DECLARE_FLAGS(ShaderStageFlags)

struct UniformBufferBinding
{
	uint32_t size;
	bool operator==(const UniformBufferBinding&) const = default;
};

struct StorageBufferBinding
{
	uint32_t	  size;
	StorageAccess access;
	bool operator==(const StorageBufferBinding&) const = default;
};

struct StorageTextureBinding
{
	StorageAccess access;
	bool operator==(const StorageTextureBinding&) const = default;
};

struct SamplerBinding
{
	bool comparison;
	bool operator==(const SamplerBinding&) const = default;
};

struct TextureBinding
{
	bool multisampled;
	bool operator==(const TextureBinding&) const = default;
};

struct PushConstantBinding
{
	uint32_t size;
	bool operator==(const PushConstantBinding&) const = default;
};

using BindingType = std::variant<UniformBufferBinding, StorageBufferBinding, StorageTextureBinding, SamplerBinding,
								 TextureBinding, PushConstantBinding>;

[[nodiscard]] std::string to_string(const BindingType& type);

struct BindingInfo
{
	uint32_t	group;
	uint32_t	binding;
	std::string name;
	BindingType type;

	bool operator==(const BindingInfo&) const = default;
};

enum class VertexType : uint32_t
{
	Float32	  = 0,
	Float32x2 = 1,
	Float32x3 = 2,
	Float32x4 = 3,
	Sint32	  = 4,
	Sint32x2  = 5,
	Sint32x3  = 6,
	Sint32x4  = 7,
	Uint32	  = 8,
	Uint32x2  = 9,
	Uint32x3  = 10,
	Uint32x4  = 11,
};

[[nodiscard]] uint32_t vertex_type_size(VertexType type);
[[nodiscard]] std::string_view to_string(VertexType type);

struct VertexAttribute
{
	uint32_t   location;
	uint64_t   offset;
	VertexType type;

	bool operator==(const VertexAttribute&) const = default;
};

struct VertexInputDescription
{
	std::string					 name;
	uint64_t					 stride;
	std::vector<VertexAttribute> attributes;

	bool operator==(const VertexInputDescription&) const = default;
};

struct VertexReflection
{
	std::string							  entry_point;
	std::optional<VertexInputDescription> input;
	std::vector<BindingInfo>			  bindings;

	bool operator==(const VertexReflection&) const = default;
};

struct FragmentReflection
{
	std::string				 entry_point;
	std::vector<BindingInfo> bindings;

	bool operator==(const FragmentReflection&) const = default;
};

struct VertexFragmentReflection
{
	std::string							  vertex_entry_point;
	std::optional<VertexInputDescription> vertex_input;
	std::string							  fragment_entry_point;
	std::vector<BindingInfo>			  bindings;

	bool operator==(const VertexFragmentReflection&) const = default;
};

struct ComputeReflection
{
	std::string				 entry_point;
	std::vector<BindingInfo> bindings;

	bool operator==(const ComputeReflection&) const = default;
};

using ShaderReflectionBase =
	std::variant<VertexReflection, FragmentReflection, VertexFragmentReflection, ComputeReflection>;

/// Result of reflecting one shader module. Bindings are sorted by (group, binding).
struct ShaderReflection : ShaderReflectionBase
{
	using ShaderReflectionBase::ShaderReflectionBase;

	[[nodiscard]] const std::vector<BindingInfo>& bindings() const;
	[[nodiscard]] const VertexInputDescription*	  vertex_input() const;
	[[nodiscard]] ShaderStageFlags				  stages() const;
	[[nodiscard]] bool							  is_compute() const;
	[[nodiscard]] const BindingInfo*			  find_binding(uint32_t group, uint32_t binding) const;

	bool operator==(const ShaderReflection& other) const
	{
		return static_cast<const ShaderReflectionBase&>(*this) == static_cast<const ShaderReflectionBase&>(other);
	}
};

} // namespace est

#endif // ESTRENDER_SHADERTYPES_HPP
