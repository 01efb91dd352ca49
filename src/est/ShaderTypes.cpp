//
// Created by chris on 1/9/26.
//
#include <est/ShaderTypes.hpp>

#include <algorithm>
#include <fmt/format.h>

namespace est
{

namespace
{

std::string access_string(StorageAccess access)
{
	std::string out;
	if (has_flag(access, StorageAccess::Read))
		out += "r";
	if (has_flag(access, StorageAccess::Write))
		out += "w";
	if (has_flag(access, StorageAccess::Atomic))
		out += "a";
	return out.empty() ? "-" : out;
}

std::string size_string(uint32_t size)
{
	return size == UNBOUNDED_SIZE ? std::string{"unbounded"} : std::to_string(size);
}

} // anonymous namespace

std::string to_string(const BindingType& type)
{
	return std::visit(
		overloaded{
			[](const UniformBufferBinding& b) { return fmt::format("UniformBuffer({})", size_string(b.size)); },
			[](const StorageBufferBinding& b)
			{ return fmt::format("StorageBuffer({}, {})", size_string(b.size), access_string(b.access)); },
			[](const StorageTextureBinding& b) { return fmt::format("StorageTexture({})", access_string(b.access)); },
			[](const SamplerBinding& b) { return fmt::format("Sampler(comparison={})", b.comparison); },
			[](const TextureBinding& b) { return fmt::format("Texture(multisampled={})", b.multisampled); },
			[](const PushConstantBinding& b) { return fmt::format("PushConstant({})", b.size); },
		},
		type);
}

uint32_t vertex_type_size(VertexType type)
{
	// Codes come in groups of four widths per scalar kind.
	return 4 * (static_cast<uint32_t>(type) % 4 + 1);
}

std::string_view to_string(VertexType type)
{
	switch (type)
	{
		case VertexType::Float32: return "Float32";
		case VertexType::Float32x2: return "Float32x2";
		case VertexType::Float32x3: return "Float32x3";
		case VertexType::Float32x4: return "Float32x4";
		case VertexType::Sint32: return "Sint32";
		case VertexType::Sint32x2: return "Sint32x2";
		case VertexType::Sint32x3: return "Sint32x3";
		case VertexType::Sint32x4: return "Sint32x4";
		case VertexType::Uint32: return "Uint32";
		case VertexType::Uint32x2: return "Uint32x2";
		case VertexType::Uint32x3: return "Uint32x3";
		case VertexType::Uint32x4: return "Uint32x4";
	}
	return "Unknown";
}

const std::vector<BindingInfo>& ShaderReflection::bindings() const
{
	return std::visit([](const auto& r) -> const std::vector<BindingInfo>& { return r.bindings; },
					  static_cast<const ShaderReflectionBase&>(*this));
}

const VertexInputDescription* ShaderReflection::vertex_input() const
{
	return std::visit(overloaded{
						  [](const VertexReflection& r) { return r.input ? &*r.input : nullptr; },
						  [](const VertexFragmentReflection& r)
						  { return r.vertex_input ? &*r.vertex_input : nullptr; },
						  [](const auto&) -> const VertexInputDescription* { return nullptr; },
					  },
					  static_cast<const ShaderReflectionBase&>(*this));
}

ShaderStageFlags ShaderReflection::stages() const
{
	return std::visit(overloaded{
						  [](const VertexReflection&) { return ShaderStageFlags::Vertex; },
						  [](const FragmentReflection&) { return ShaderStageFlags::Fragment; },
						  [](const VertexFragmentReflection&)
						  { return ShaderStageFlags::Vertex | ShaderStageFlags::Fragment; },
						  [](const ComputeReflection&) { return ShaderStageFlags::Compute; },
					  },
					  static_cast<const ShaderReflectionBase&>(*this));
}

bool ShaderReflection::is_compute() const
{
	return std::holds_alternative<ComputeReflection>(*this);
}

const BindingInfo* ShaderReflection::find_binding(uint32_t group, uint32_t binding) const
{
	const auto& all = bindings();
	auto		it	= std::ranges::find_if(all, [&](const BindingInfo& info)
										   { return info.group == group && info.binding == binding; });
	return it == all.end() ? nullptr : &*it;
}

} // namespace est
