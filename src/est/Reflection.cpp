//
// Created by chris on 1/9/26.
//
#include <est/Logger.hpp>
#include <est/Reflection.hpp>

#include <algorithm>
#include <tuple>

namespace est
{

// ============================================================================
// Type Layout
// ============================================================================
// std140-like sizes and alignments. vec3 reports its packed size (12) but
// aligns like a vec4.
// ============================================================================

namespace
{

std::expected<uint32_t, Error> scalar_size(ast::ScalarKind kind)
{
	switch (kind)
	{
		case ast::ScalarKind::Float:
		case ast::ScalarKind::Sint:
		case ast::ScalarKind::Uint:
		case ast::ScalarKind::Bool: return 4;
		case ast::ScalarKind::Float64:
		case ast::ScalarKind::Other: break;
	}
	return std::unexpected{make_error(ErrorKind::UnsupportedType, "Only 32 bit scalars are supported")};
}

uint32_t vector_alignment(uint32_t components)
{
	return components == 2 ? 8 : 16;
}

std::string type_name(const ast::Module& module, ast::TypeHandle handle)
{
	const auto& type = module.types[handle];
	return type.name.value_or(fmt::format("unnamed_{}", handle));
}

} // anonymous namespace

std::expected<TypeLayout, Error> compute_type_layout(const ast::Module& module, ast::TypeHandle handle)
{
	if (handle >= module.types.size())
	{
		return std::unexpected{make_error(ErrorKind::UnsupportedType, "Type handle {} out of range", handle)};
	}

	return std::visit(
		overloaded{
			[&](const ast::Scalar& s) -> std::expected<TypeLayout, Error>
			{
				auto size = scalar_size(s.kind);
				if (!size)
					return std::unexpected{size.error()};
				return TypeLayout{.size = *size, .alignment = 4};
			},
			[&](const ast::Vector& v) -> std::expected<TypeLayout, Error>
			{
				auto size = scalar_size(v.kind);
				if (!size)
					return std::unexpected{size.error()};
				if (v.size < 2 || v.size > 4)
				{
					return std::unexpected{make_error(ErrorKind::UnsupportedType, "Vector of {} components", v.size)};
				}
				return TypeLayout{.size = *size * v.size, .alignment = vector_alignment(v.size)};
			},
			[&](const ast::Matrix& m) -> std::expected<TypeLayout, Error>
			{
				auto size = scalar_size(m.kind);
				if (!size)
					return std::unexpected{size.error()};
				auto row_size = static_cast<uint32_t>(align_to(*size * m.rows, 16));
				return TypeLayout{.size = m.columns * row_size, .alignment = 16};
			},
			[&](const ast::Struct& s) -> std::expected<TypeLayout, Error>
			{
				uint32_t offset		   = 0;
				uint32_t max_alignment = 1;
				bool	 unbounded	   = false;
				for (const auto& member : s.members)
				{
					auto layout = compute_type_layout(module, member.type);
					if (!layout)
						return layout;
					max_alignment = std::max(max_alignment, layout->alignment);
					if (layout->size == UNBOUNDED_SIZE)
					{
						unbounded = true;
						continue;
					}
					offset = static_cast<uint32_t>(align_to(offset, layout->alignment)) + layout->size;
				}
				if (unbounded)
				{
					return TypeLayout{.size = UNBOUNDED_SIZE, .alignment = max_alignment};
				}
				return TypeLayout{.size		 = static_cast<uint32_t>(align_to(offset, max_alignment)),
								  .alignment = max_alignment};
			},
			[&](const ast::Array& a) -> std::expected<TypeLayout, Error>
			{
				auto element = compute_type_layout(module, a.element);
				if (!element)
					return element;
				if (!a.count)
				{
					return TypeLayout{.size = UNBOUNDED_SIZE, .alignment = element->alignment};
				}
				auto stride = a.stride.value_or(static_cast<uint32_t>(align_to(element->size, element->alignment)));
				return TypeLayout{.size = *a.count * stride, .alignment = element->alignment};
			},
			[](const ast::Image&) -> std::expected<TypeLayout, Error> { return TypeLayout{.size = 0, .alignment = 1}; },
			[](const ast::Sampler&) -> std::expected<TypeLayout, Error>
			{ return TypeLayout{.size = 0, .alignment = 1}; },
		},
		module.types[handle].inner);
}

// ============================================================================
// Binding Classification
// ============================================================================

namespace
{

std::expected<BindingType, Error> classify_uniform(const ast::Module& module, const ast::GlobalVariable& var,
												   const std::string& name)
{
	auto layout = compute_type_layout(module, var.type);
	if (!layout)
		return std::unexpected{layout.error()};
	if (layout->size == UNBOUNDED_SIZE)
	{
		return std::unexpected{
			make_error(ErrorKind::UnsupportedType, "Uniform variable '{}' cannot be runtime sized", name)};
	}
	if (layout->size <= 16)
	{
		return std::unexpected{make_error(ErrorKind::UniformTooSmall,
										  "Uniform variable '{}' is too small ({} bytes), must be larger than 16 bytes",
										  name, layout->size)};
	}
	return UniformBufferBinding{.size = layout->size};
}

std::expected<BindingType, Error> classify_storage(const ast::Module& module, const ast::GlobalVariable& var,
												   const std::string& name)
{
	const auto& inner = module.types[var.type].inner;
	if (const auto* image = std::get_if<ast::Image>(&inner))
	{
		auto access = image->access == StorageAccess::None ? var.access : image->access;
		return StorageTextureBinding{.access = access};
	}
	if (std::holds_alternative<ast::Struct>(inner) || std::holds_alternative<ast::Array>(inner))
	{
		auto layout = compute_type_layout(module, var.type);
		if (!layout)
			return std::unexpected{layout.error()};
		return StorageBufferBinding{.size = layout->size, .access = var.access};
	}
	return std::unexpected{make_error(ErrorKind::UnsupportedType,
									  "Storage variable '{}' must be a struct, an array or an image", name)};
}

std::expected<BindingType, Error> classify_handle(const ast::Module& module, const ast::GlobalVariable& var,
												  const std::string& name)
{
	const auto& inner = module.types[var.type].inner;
	if (const auto* sampler = std::get_if<ast::Sampler>(&inner))
	{
		return SamplerBinding{.comparison = sampler->comparison};
	}
	if (const auto* image = std::get_if<ast::Image>(&inner))
	{
		if (image->image_class == ast::ImageClass::Storage)
		{
			return std::unexpected{make_error(ErrorKind::StorageImageMisrouted,
											  "Storage image '{}' must be declared in the storage address space",
											  name)};
		}
		return TextureBinding{.multisampled = image->multisampled};
	}
	return std::unexpected{
		make_error(ErrorKind::UnsupportedType, "Handle variable '{}' must be a sampler or a texture", name)};
}

std::expected<BindingType, Error> classify(const ast::Module& module, const ast::GlobalVariable& var,
										  const std::string& name)
{
	switch (var.space)
	{
		case ast::AddressSpace::Uniform: return classify_uniform(module, var, name);
		case ast::AddressSpace::Storage: return classify_storage(module, var, name);
		case ast::AddressSpace::Handle: return classify_handle(module, var, name);
		case ast::AddressSpace::PushConstant:
		{
			auto layout = compute_type_layout(module, var.type);
			if (!layout)
				return std::unexpected{layout.error()};
			return PushConstantBinding{.size = layout->size};
		}
		default: break;
	}
	return std::unexpected{make_error(ErrorKind::UnsupportedType,
									  "Variable '{}' carries a binding in an unbindable address space", name)};
}

std::expected<std::vector<BindingInfo>, Error> collect_bindings(const ast::Module& module)
{
	std::vector<BindingInfo> bindings;

	for (std::size_t i = 0; i < module.globals.size(); ++i)
	{
		const auto& var = module.globals[i];
		if (!var.binding)
		{
			continue;
		}
		if (var.type >= module.types.size())
		{
			return std::unexpected{make_error(ErrorKind::UnsupportedType, "Global {} has an invalid type", i)};
		}

		auto name = var.name.value_or(fmt::format("unnamed_{}", i));

		auto type = classify(module, var, name);
		if (!type)
		{
			return std::unexpected{type.error()};
		}

		Logger::instance().trace("  Binding: group={} binding={} name='{}' type={}", var.binding->group,
								 var.binding->binding, name, to_string(*type));

		bindings.push_back(BindingInfo{.group	= var.binding->group,
									   .binding = var.binding->binding,
									   .name	= std::move(name),
									   .type	= std::move(*type)});
	}

	std::ranges::stable_sort(bindings, [](const BindingInfo& a, const BindingInfo& b)
							 { return std::tie(a.group, a.binding) < std::tie(b.group, b.binding); });

	auto duplicate = std::ranges::adjacent_find(
		bindings, [](const BindingInfo& a, const BindingInfo& b)
		{ return a.group == b.group && a.binding == b.binding; });
	if (duplicate != bindings.end())
	{
		return std::unexpected{make_error(ErrorKind::DuplicateBinding, "Binding (group {}, binding {}) declared twice",
										  duplicate->group, duplicate->binding)};
	}

	return bindings;
}

} // anonymous namespace

// ============================================================================
// Vertex Input Extraction
// ============================================================================

namespace
{

std::optional<VertexType> to_vertex_type(ast::ScalarKind kind, uint32_t components)
{
	uint32_t base = 0;
	switch (kind)
	{
		case ast::ScalarKind::Float: base = 0; break;
		case ast::ScalarKind::Sint: base = 4; break;
		case ast::ScalarKind::Uint:
		case ast::ScalarKind::Bool: base = 8; break;
		default: return std::nullopt;
	}
	if (components < 1 || components > 4)
	{
		return std::nullopt;
	}
	return static_cast<VertexType>(base + components - 1);
}

std::expected<VertexInputDescription, Error> extract_vertex_struct(const ast::Module& module, ast::TypeHandle handle)
{
	const auto& members = std::get<ast::Struct>(module.types[handle].inner).members;

	VertexInputDescription description{.name = type_name(module, handle), .stride = 0, .attributes = {}};

	uint64_t offset = 0;
	for (const auto& member : members)
	{
		if (!member.location)
		{
			return std::unexpected{make_error(ErrorKind::MissingLocation,
											  "Vertex input '{}' in '{}' has no location binding", member.name,
											  description.name)};
		}

		const auto&				  inner = module.types.at(member.type).inner;
		std::optional<VertexType> type;
		if (const auto* scalar = std::get_if<ast::Scalar>(&inner))
		{
			type = to_vertex_type(scalar->kind, 1);
		} else if (const auto* vector = std::get_if<ast::Vector>(&inner))
		{
			type = to_vertex_type(vector->kind, vector->size);
		}
		if (!type)
		{
			return std::unexpected{make_error(ErrorKind::UnsupportedVertexInputType,
											  "Unsupported vertex input type for member '{}' of '{}'", member.name,
											  description.name)};
		}

		description.attributes.push_back({.location = *member.location, .offset = offset, .type = *type});
		offset += vertex_type_size(*type);
	}

	description.stride = offset;
	return description;
}

std::expected<std::optional<VertexInputDescription>, Error> extract_vertex_input(const ast::Module&		module,
																				 const ast::EntryPoint& entry)
{
	std::optional<VertexInputDescription> input;

	for (const auto& argument : entry.arguments)
	{
		if (argument.builtin)
		{
			continue;
		}
		if (argument.type >= module.types.size() ||
			!std::holds_alternative<ast::Struct>(module.types[argument.type].inner))
		{
			return std::unexpected{make_error(ErrorKind::UnsupportedVertexInputType,
											  "Vertex entry point '{}' takes a non-struct input '{}'", entry.name,
											  argument.name.value_or("?"))};
		}
		if (input)
		{
			return std::unexpected{make_error(ErrorKind::UnsupportedVertexInputType,
											  "Vertex entry point '{}' takes more than one input struct", entry.name)};
		}

		auto description = extract_vertex_struct(module, argument.type);
		if (!description)
		{
			return std::unexpected{description.error()};
		}
		input = std::move(*description);
	}

	return input;
}

std::string_view to_string(ast::Stage stage)
{
	switch (stage)
	{
		case ast::Stage::Vertex: return "vertex";
		case ast::Stage::Fragment: return "fragment";
		case ast::Stage::Compute: return "compute";
		case ast::Stage::Geometry: return "geometry";
		case ast::Stage::TessellationControl: return "tessellation control";
		case ast::Stage::TessellationEvaluation: return "tessellation evaluation";
		case ast::Stage::Mesh: return "mesh";
		case ast::Stage::Task: return "task";
	}
	return "unknown";
}

} // anonymous namespace

// ============================================================================
// Reflection
// ============================================================================

std::expected<ShaderReflection, Error> reflect(const ast::Module& module)
{
	auto bindings = collect_bindings(module);
	if (!bindings)
	{
		return std::unexpected{bindings.error()};
	}

	const ast::EntryPoint*				  vertex   = nullptr;
	const ast::EntryPoint*				  fragment = nullptr;
	const ast::EntryPoint*				  compute  = nullptr;
	std::optional<VertexInputDescription> vertex_input;

	for (const auto& entry : module.entry_points)
	{
		switch (entry.stage)
		{
			case ast::Stage::Vertex:
			{
				if (vertex)
				{
					Logger::instance().warn("Ignoring additional vertex entry point '{}'", entry.name);
					break;
				}
				auto input = extract_vertex_input(module, entry);
				if (!input)
				{
					return std::unexpected{input.error()};
				}
				vertex		 = &entry;
				vertex_input = std::move(*input);
				break;
			}
			case ast::Stage::Fragment:
				if (!fragment)
					fragment = &entry;
				break;
			case ast::Stage::Compute:
				if (!compute)
					compute = &entry;
				break;
			default:
				return std::unexpected{make_error(ErrorKind::UnsupportedStage, "Entry point '{}' has unsupported stage {}",
												  entry.name, to_string(entry.stage))};
		}
	}

	Logger::instance().debug("Reflected {} bindings, {} entry points", bindings->size(), module.entry_points.size());

	if (vertex && fragment)
	{
		return VertexFragmentReflection{.vertex_entry_point	  = vertex->name,
										.vertex_input		  = std::move(vertex_input),
										.fragment_entry_point = fragment->name,
										.bindings			  = std::move(*bindings)};
	}
	if (vertex)
	{
		return VertexReflection{
			.entry_point = vertex->name, .input = std::move(vertex_input), .bindings = std::move(*bindings)};
	}
	if (fragment)
	{
		return FragmentReflection{.entry_point = fragment->name, .bindings = std::move(*bindings)};
	}
	if (compute)
	{
		return ComputeReflection{.entry_point = compute->name, .bindings = std::move(*bindings)};
	}

	return std::unexpected{make_error(ErrorKind::MissingEntryPoint, "No entry point found in shader module")};
}

} // namespace est
