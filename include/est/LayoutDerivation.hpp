//
// Created by chris on 1/11/26.
//

#ifndef ESTRENDER_LAYOUTDERIVATION_HPP
#define ESTRENDER_LAYOUTDERIVATION_HPP
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "Error.hpp"
#include "GpuDevice.hpp"
#include "ShaderTypes.hpp"

namespace est
{

struct LayoutBinding
{
	uint32_t		 binding;
	std::string		 name;
	BindingType		 type;
	ShaderStageFlags visibility;
};

struct GroupLayoutInfo
{
	uint32_t				   group;
	std::vector<LayoutBinding> entries; // sorted by binding
	std::string				   label;

	[[nodiscard]] std::vector<uint32_t> bindings() const;
};

struct DerivedLayouts
{
	std::vector<GroupLayoutInfo>	 groups; // sorted by group
	std::optional<PushConstantRange> push_constants;
};

/**
 * @brief Merge the bindings of every stage reflection into one layout per group
 *
 * A binding shared by several stages ORs their visibility. Sharing requires a
 * compatible type, otherwise BindingTypeMismatch is returned. Push constants are
 * collected into a single range instead of a group entry.
 */
[[nodiscard]] std::expected<DerivedLayouts, Error> derive_bind_group_layouts(std::span<const ShaderReflection> reflections);

} // namespace est

#endif // ESTRENDER_LAYOUTDERIVATION_HPP
