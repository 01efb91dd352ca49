//
// Created by chris on 1/12/26.
//
#include <est/BinaryShader.hpp>
#include <est/GraphicsContext.hpp>
#include <est/Logger.hpp>
#include <est/Reflection.hpp>
#include <est/Shader.hpp>
#include <est/SlangCompiler.hpp>

#include <algorithm>

namespace est
{

// ============================================================================
// Shader Loading
// ============================================================================
// Every input is turned into a reflection plus the SPIR-V it describes.
// ============================================================================

namespace
{

struct ShaderUnit
{
	ShaderReflection	 reflection;
	std::vector<uint8_t> spirv;
	std::string			 name;
};

std::expected<ShaderUnit, Error> reflect_unit(const ast::Module& module, std::vector<uint8_t> spirv, std::string name)
{
	auto reflection = reflect(module);
	if (!reflection)
	{
		return std::unexpected{reflection.error()};
	}
	return ShaderUnit{.reflection = std::move(*reflection), .spirv = std::move(spirv), .name = std::move(name)};
}

std::expected<ShaderUnit, Error> load_unit(const ShaderInput& input)
{
	return std::visit(
		overloaded{[](const SlangSource& source) -> std::expected<ShaderUnit, Error>
				   {
					   auto compiled = compile_slang_source(source.name, source.source);
					   if (!compiled)
						   return std::unexpected{compiled.error()};
					   return reflect_unit(compiled->module, std::move(compiled->spirv), source.name);
				   },
				   [](const SlangModule& module) -> std::expected<ShaderUnit, Error>
				   {
					   auto compiled = compile_slang_module(module.name);
					   if (!compiled)
						   return std::unexpected{compiled.error()};
					   return reflect_unit(compiled->module, std::move(compiled->spirv), module.name);
				   },
				   [](const BinaryShaderData& binary) -> std::expected<ShaderUnit, Error>
				   {
					   auto shader = load_binary_shader(binary.data);
					   if (!shader)
						   return std::unexpected{shader.error()};
					   return ShaderUnit{.reflection = std::move(shader->reflection),
										 .spirv		 = std::move(shader->spirv),
										 .name		 = "binary"};
				   },
				   [](const ModuleShader& module) -> std::expected<ShaderUnit, Error>
				   { return reflect_unit(module.module, module.spirv, module.name); }},
		input);
}

/// Entry point of a stage and the index of the unit that provides it.
struct StageSource
{
	std::size_t unit;
	std::string entry_point;
};

std::expected<void, Error> assign_stage(std::optional<StageSource>& slot, std::size_t unit, const std::string& entry,
										std::string_view stage, const std::string& label)
{
	if (slot)
	{
		return std::unexpected{make_error(ErrorKind::InvalidShaderType,
										  "Shader '{}' provides more than one {} stage ('{}' and '{}')", label, stage,
										  slot->entry_point, entry)};
	}
	slot = StageSource{.unit = unit, .entry_point = entry};
	return {};
}

struct StageAssignment
{
	std::optional<StageSource>			  vertex;
	std::optional<StageSource>			  fragment;
	std::optional<StageSource>			  compute;
	std::optional<VertexInputDescription> vertex_input;
};

std::expected<StageAssignment, Error> assign_stages(const std::vector<ShaderUnit>& units, const std::string& label)
{
	StageAssignment assignment;

	for (std::size_t i = 0; i < units.size(); ++i)
	{
		const auto&				   reflection = units[i].reflection;
		std::expected<void, Error> assigned	  = std::visit(
			  overloaded{[&](const VertexFragmentReflection& r) -> std::expected<void, Error>
						 {
							 assignment.vertex_input = r.vertex_input;
							 auto vertex = assign_stage(assignment.vertex, i, r.vertex_entry_point, "vertex", label);
							 if (!vertex)
								 return vertex;
							 return assign_stage(assignment.fragment, i, r.fragment_entry_point, "fragment", label);
						 },
						 [&](const VertexReflection& r) -> std::expected<void, Error>
						 {
							 assignment.vertex_input = r.input;
							 return assign_stage(assignment.vertex, i, r.entry_point, "vertex", label);
						 },
						 [&](const FragmentReflection& r) -> std::expected<void, Error>
						 { return assign_stage(assignment.fragment, i, r.entry_point, "fragment", label); },
						 [&](const ComputeReflection& r) -> std::expected<void, Error>
						 { return assign_stage(assignment.compute, i, r.entry_point, "compute", label); }},
			  static_cast<const ShaderReflectionBase&>(reflection));
		if (!assigned)
		{
			return std::unexpected{assigned.error()};
		}
	}

	return assignment;
}

/// Creates the backend modules, layouts and the pipeline layout for a set of units.
std::expected<std::shared_ptr<const ShaderResource>, Error> create_resource(GraphicsContext&		 context,
																			 std::vector<ShaderUnit> units,
																			 const StageAssignment& stages,
																			 const std::string&		 label,
																			 const PrimitiveState&	 primitive)
{
	std::vector<ShaderReflection> reflections;
	for (const auto& unit : units)
	{
		reflections.push_back(unit.reflection);
	}

	auto derived = derive_bind_group_layouts(reflections);
	if (!derived)
	{
		return std::unexpected{derived.error()};
	}

	const auto& device = context.shared_device();
	try
	{
		std::vector<std::shared_ptr<const ShaderModuleObject>> modules;
		for (const auto& unit : units)
		{
			auto module_label = fmt::format("{} ({})", label, unit.name);
			auto handle = device->create_shader_module(ShaderModuleDescriptor{.label = module_label, .spirv = unit.spirv});
			modules.push_back(std::make_shared<const ShaderModuleObject>(
				ShaderModuleObject{.handle = OwnedHandle{device, handle}, .label = module_label}));
		}

		auto resource = std::make_shared<ShaderResource>();
		resource->label			 = label;
		resource->reflections	 = std::move(reflections);
		resource->push_constants = derived->push_constants;
		resource->vertex_input	 = stages.vertex_input;
		resource->primitive		 = primitive;

		auto make_stage = [&modules](const std::optional<StageSource>& source) -> std::optional<ShaderStage>
		{
			if (!source)
				return std::nullopt;
			return ShaderStage{.module = modules[source->unit], .entry_point = source->entry_point};
		};
		resource->vertex   = make_stage(stages.vertex);
		resource->fragment = make_stage(stages.fragment);
		resource->compute  = make_stage(stages.compute);

		PipelineLayoutDescriptor pipeline_layout{.label					= label + " layout",
												 .bind_group_layouts	= {},
												 .push_constants		= derived->push_constants};

		for (auto& group : derived->groups)
		{
			BindGroupLayoutDescriptor descriptor{.label = group.label, .entries = {}};
			for (const auto& entry : group.entries)
			{
				descriptor.entries.push_back(
					{.binding = entry.binding, .type = entry.type, .visibility = entry.visibility});
			}
			auto handle = device->create_bind_group_layout(descriptor);
			pipeline_layout.bind_group_layouts.emplace_back(group.group, handle);

			resource->layouts.push_back(BindGroupLayout{.group	  = group.group,
														.bindings = group.bindings(),
														.entries  = std::move(group.entries),
														.label	  = std::move(group.label),
														.handle	  = OwnedHandle{device, handle}});
		}

		resource->pipeline_layout = OwnedHandle{device, device->create_pipeline_layout(pipeline_layout)};

		Logger::instance().info("Shader '{}' built: {} modules, {} bind group layouts{}", label, modules.size(),
								resource->layouts.size(), resource->push_constants ? ", push constants" : "");
		return resource;
	} catch (const DeviceError& e)
	{
		return std::unexpected{
			make_error(ErrorKind::DeviceFailure, "Failed to create backend objects for shader '{}': {}", label, e.what())};
	}
}

std::expected<std::vector<ShaderUnit>, Error> load_units(const std::vector<ShaderInput>& inputs)
{
	std::vector<ShaderUnit> units;
	for (const auto& input : inputs)
	{
		auto unit = load_unit(input);
		if (!unit)
		{
			return std::unexpected{unit.error()};
		}
		units.push_back(std::move(*unit));
	}
	return units;
}

} // anonymous namespace

// ============================================================================
// Shader
// ============================================================================

const LayoutBinding* BindGroupLayout::find(uint32_t binding) const
{
	auto it = std::ranges::find(entries, binding, &LayoutBinding::binding);
	return it == entries.end() ? nullptr : &*it;
}

Shader::Shader(std::shared_ptr<const ShaderResource> resource)
	: m_resource(std::move(resource))
{}

const BindGroupLayout* Shader::find_layout(uint32_t group) const
{
	auto it = std::ranges::find(m_resource->layouts, group, &BindGroupLayout::group);
	return it == m_resource->layouts.end() ? nullptr : &*it;
}

const LayoutBinding* Shader::find_binding(uint32_t group, uint32_t binding) const
{
	const auto* layout = find_layout(group);
	return layout ? layout->find(binding) : nullptr;
}

// ============================================================================
// ShaderBuilder
// ============================================================================

ShaderBuilder::ShaderBuilder(GraphicsContext& context)
	: m_context(&context)
{}

ShaderBuilder& ShaderBuilder::add_source(std::string name, std::string source)
{
	m_inputs.emplace_back(SlangSource{.name = std::move(name), .source = std::move(source)});
	return *this;
}

ShaderBuilder& ShaderBuilder::add_module(std::string name)
{
	m_inputs.emplace_back(SlangModule{.name = std::move(name)});
	return *this;
}

ShaderBuilder& ShaderBuilder::add_binary(std::span<const uint8_t> data)
{
	m_inputs.emplace_back(BinaryShaderData{.data = {data.begin(), data.end()}});
	return *this;
}

ShaderBuilder& ShaderBuilder::add_module(ast::Module module, std::vector<uint8_t> spirv, std::string name)
{
	m_inputs.emplace_back(ModuleShader{.module = std::move(module), .spirv = std::move(spirv), .name = std::move(name)});
	return *this;
}

ShaderBuilder& ShaderBuilder::set_primitive(const PrimitiveState& primitive)
{
	m_primitive = primitive;
	return *this;
}

ShaderBuilder& ShaderBuilder::set_topology(PrimitiveTopology topology)
{
	m_primitive.topology = topology;
	return *this;
}

ShaderBuilder& ShaderBuilder::set_index_format(std::optional<IndexFormat> format)
{
	m_primitive.index_format = format;
	return *this;
}

ShaderBuilder& ShaderBuilder::set_cull_mode(CullMode mode)
{
	m_primitive.cull_mode = mode;
	return *this;
}

ShaderBuilder& ShaderBuilder::set_polygon_mode(PolygonMode mode)
{
	m_primitive.polygon_mode = mode;
	return *this;
}

ShaderBuilder& ShaderBuilder::set_front_face(FrontFace face)
{
	m_primitive.front_face = face;
	return *this;
}

ShaderBuilder& ShaderBuilder::set_label(std::string label)
{
	m_label = std::move(label);
	return *this;
}

std::expected<Shader, Error> ShaderBuilder::build() const
{
	if (m_inputs.empty())
	{
		return std::unexpected{make_error(ErrorKind::ShaderNotSet, "Shader '{}' has no source", m_label)};
	}

	auto units = load_units(m_inputs);
	if (!units)
	{
		return std::unexpected{units.error()};
	}

	auto stages = assign_stages(*units, m_label);
	if (!stages)
	{
		return std::unexpected{stages.error()};
	}
	if (stages->compute)
	{
		return std::unexpected{make_error(ErrorKind::InvalidShaderType,
										  "Graphics shader '{}' contains compute entry point '{}'", m_label,
										  stages->compute->entry_point)};
	}
	if (!stages->vertex || !stages->fragment)
	{
		return std::unexpected{make_error(ErrorKind::MissingEntryPoint, "Graphics shader '{}' is missing its {} stage",
										  m_label, stages->vertex ? "fragment" : "vertex")};
	}

	auto resource = create_resource(*m_context, std::move(*units), *stages, m_label, m_primitive);
	if (!resource)
	{
		return std::unexpected{resource.error()};
	}
	return Shader{std::move(*resource)};
}

// ============================================================================
// ComputeShaderBuilder
// ============================================================================

ComputeShaderBuilder::ComputeShaderBuilder(GraphicsContext& context)
	: m_context(&context)
{}

ComputeShaderBuilder& ComputeShaderBuilder::set_source(std::string name, std::string source)
{
	m_input = SlangSource{.name = std::move(name), .source = std::move(source)};
	return *this;
}

ComputeShaderBuilder& ComputeShaderBuilder::set_module(std::string name)
{
	m_input = SlangModule{.name = std::move(name)};
	return *this;
}

ComputeShaderBuilder& ComputeShaderBuilder::set_binary(std::span<const uint8_t> data)
{
	m_input = BinaryShaderData{.data = {data.begin(), data.end()}};
	return *this;
}

ComputeShaderBuilder& ComputeShaderBuilder::set_module(ast::Module module, std::vector<uint8_t> spirv,
													   std::string name)
{
	m_input = ModuleShader{.module = std::move(module), .spirv = std::move(spirv), .name = std::move(name)};
	return *this;
}

ComputeShaderBuilder& ComputeShaderBuilder::set_label(std::string label)
{
	m_label = std::move(label);
	return *this;
}

std::expected<Shader, Error> ComputeShaderBuilder::build() const
{
	if (!m_input)
	{
		return std::unexpected{make_error(ErrorKind::ShaderNotSet, "Compute shader '{}' has no source", m_label)};
	}

	auto unit = load_unit(*m_input);
	if (!unit)
	{
		return std::unexpected{unit.error()};
	}
	const auto* compute = std::get_if<ComputeReflection>(&unit->reflection);
	if (!compute)
	{
		return std::unexpected{
			make_error(ErrorKind::InvalidShaderType, "Shader '{}' is not a compute shader", m_label)};
	}

	StageAssignment stages{.compute = StageSource{.unit = 0, .entry_point = compute->entry_point}};

	std::vector<ShaderUnit> units;
	units.push_back(std::move(*unit));
	auto resource = create_resource(*m_context, std::move(units), stages, m_label, PrimitiveState{});
	if (!resource)
	{
		return std::unexpected{resource.error()};
	}
	return Shader{std::move(*resource)};
}

} // namespace est
