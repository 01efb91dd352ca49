//
// Created by chris on 1/11/26.
//
#include <est/LayoutDerivation.hpp>
#include <est/Logger.hpp>

#include <algorithm>
#include <map>

namespace est
{

namespace
{

/// Returns the merged type, or nullopt when the two declarations cannot share a slot.
std::optional<BindingType> merge_types(const BindingType& a, const BindingType& b)
{
	if (a.index() != b.index())
	{
		return std::nullopt;
	}

	return std::visit(
		overloaded{
			[&](const UniformBufferBinding& x) -> std::optional<BindingType>
			{ return UniformBufferBinding{.size = std::max(x.size, std::get<UniformBufferBinding>(b).size)}; },
			[&](const StorageBufferBinding& x) -> std::optional<BindingType>
			{
				const auto& y = std::get<StorageBufferBinding>(b);
				return StorageBufferBinding{.size = std::max(x.size, y.size), .access = x.access | y.access};
			},
			[&](const StorageTextureBinding& x) -> std::optional<BindingType>
			{ return StorageTextureBinding{.access = x.access | std::get<StorageTextureBinding>(b).access}; },
			[&](const SamplerBinding& x) -> std::optional<BindingType>
			{
				if (x != std::get<SamplerBinding>(b))
					return std::nullopt;
				return x;
			},
			[&](const TextureBinding& x) -> std::optional<BindingType>
			{
				if (x != std::get<TextureBinding>(b))
					return std::nullopt;
				return x;
			},
			[&](const PushConstantBinding& x) -> std::optional<BindingType>
			{ return PushConstantBinding{.size = std::max(x.size, std::get<PushConstantBinding>(b).size)}; },
		},
		a);
}

std::string make_label(uint32_t group, const std::vector<LayoutBinding>& entries)
{
	std::string label = fmt::format("BindGroupLayout for group {}, binding: ", group);
	for (std::size_t i = 0; i < entries.size(); ++i)
	{
		if (i > 0)
			label += ", ";
		label += std::to_string(entries[i].binding);
	}
	return label;
}

} // anonymous namespace

std::vector<uint32_t> GroupLayoutInfo::bindings() const
{
	std::vector<uint32_t> out;
	out.reserve(entries.size());
	for (const auto& entry : entries)
	{
		out.push_back(entry.binding);
	}
	return out;
}

std::expected<DerivedLayouts, Error> derive_bind_group_layouts(std::span<const ShaderReflection> reflections)
{
	std::map<uint32_t, std::map<uint32_t, LayoutBinding>> groups;
	DerivedLayouts										  derived;

	for (const auto& reflection : reflections)
	{
		auto stages = reflection.stages();
		for (const auto& info : reflection.bindings())
		{
			if (const auto* push = std::get_if<PushConstantBinding>(&info.type))
			{
				if (!derived.push_constants)
				{
					derived.push_constants = PushConstantRange{.stages = stages, .size = push->size};
				} else
				{
					derived.push_constants->stages |= stages;
					derived.push_constants->size = std::max(derived.push_constants->size, push->size);
				}
				continue;
			}

			auto& group = groups[info.group];
			auto  it	= group.find(info.binding);
			if (it == group.end())
			{
				group.emplace(info.binding, LayoutBinding{.binding	  = info.binding,
														  .name		  = info.name,
														  .type		  = info.type,
														  .visibility = stages});
				continue;
			}

			auto merged = merge_types(it->second.type, info.type);
			if (!merged)
			{
				return std::unexpected{make_error(ErrorKind::BindingTypeMismatch,
												  "Binding (group {}, binding {}) is declared as {} and as {}",
												  info.group, info.binding, to_string(it->second.type),
												  to_string(info.type))};
			}
			it->second.type = std::move(*merged);
			it->second.visibility |= stages;
		}
	}

	for (auto& [group, bindings] : groups)
	{
		GroupLayoutInfo info{.group = group, .entries = {}, .label = {}};
		for (auto& [binding, entry] : bindings)
		{
			info.entries.push_back(std::move(entry));
		}
		info.label = make_label(group, info.entries);
		Logger::instance().debug("Derived {}", info.label);
		derived.groups.push_back(std::move(info));
	}

	return derived;
}

} // namespace est
