//
// Created by chris on 1/16/26.
//

#ifndef ESTRENDER_TEST_TESTSUPPORT_HPP
#define ESTRENDER_TEST_TESTSUPPORT_HPP
#include <memory>
#include <optional>
#include <string>

#include <est/Error.hpp>
#include <est/GraphicsContext.hpp>
#include <est/ShaderAst.hpp>
#include <est/SlangCompiler.hpp>

#include "RecordingDevice.hpp"

namespace est::test
{

/// Context on top of a fresh RecordingDevice.
struct TestContext
{
	explicit TestContext(ContextConfig config = {})
		: device(std::make_shared<RecordingDevice>())
		, context(device, config)
	{}

	std::shared_ptr<RecordingDevice> device;
	GraphicsContext					 context;
};

/// Kind of the UsageError thrown by f, nullopt when it returns normally.
template<class F>
std::optional<ErrorKind> fatal_kind(F&& f)
{
	try
	{
		f();
	} catch (const UsageError& e)
	{
		return e.kind();
	}
	return std::nullopt;
}

// ============================================================================
// Hand assembled modules
// ============================================================================

inline ast::EntryPoint entry(std::string name, ast::Stage stage)
{
	return ast::EntryPoint{.name = std::move(name), .stage = stage, .arguments = {}, .workgroup_size = {1, 1, 1}};
}

/// Vertex and fragment entry points, a float4x4 uniform block (64 bytes) at (group 0, binding 0).
inline ast::Module uniform_module()
{
	ast::Module module;
	auto		matrix = module.add_type({.name = "float4x4", .inner = ast::Matrix{ast::ScalarKind::Float, 4, 4}});
	auto		block  = module.add_type(
		  {.name = "Transforms", .inner = ast::Struct{{{.name = "mvp", .type = matrix, .location = std::nullopt}}}});
	module.globals.push_back({.name	   = "transforms",
							  .space   = ast::AddressSpace::Uniform,
							  .access  = StorageAccess::Read,
							  .binding = ast::ResourceBinding{.group = 0, .binding = 0},
							  .type	   = block});
	module.entry_points.push_back(entry("vertex_main", ast::Stage::Vertex));
	module.entry_points.push_back(entry("fragment_main", ast::Stage::Fragment));
	return module;
}

/// Layout of DrawVertex as vertex input, a texture at (0, 0) and a sampler at (0, 1).
inline ast::Module drawing_module()
{
	ast::Module module;
	auto		vec2 = module.add_type({.name = "float2", .inner = ast::Vector{ast::ScalarKind::Float, 2}});
	auto		vec3 = module.add_type({.name = "float3", .inner = ast::Vector{ast::ScalarKind::Float, 3}});
	auto		vec4 = module.add_type({.name = "float4", .inner = ast::Vector{ast::ScalarKind::Float, 4}});
	auto		input =
		module.add_type({.name	= "DrawVertex",
						 .inner = ast::Struct{{{.name = "position", .type = vec3, .location = 0},
											   {.name = "color", .type = vec4, .location = 1},
											   {.name = "uv", .type = vec2, .location = 2}}}});
	auto texture = module.add_type(
		{.name	= "Texture2D",
		 .inner = ast::Image{.image_class = ast::ImageClass::Sampled, .multisampled = false, .access = StorageAccess::None}});
	auto sampler = module.add_type({.name = "SamplerState", .inner = ast::Sampler{.comparison = false}});

	module.globals.push_back({.name	   = "draw_texture",
							  .space   = ast::AddressSpace::Handle,
							  .access  = StorageAccess::Read,
							  .binding = ast::ResourceBinding{.group = 0, .binding = 0},
							  .type	   = texture});
	module.globals.push_back({.name	   = "draw_sampler",
							  .space   = ast::AddressSpace::Handle,
							  .access  = StorageAccess::Read,
							  .binding = ast::ResourceBinding{.group = 0, .binding = 1},
							  .type	   = sampler});

	auto vertex = entry("vertex_main", ast::Stage::Vertex);
	vertex.arguments.push_back({.name = "input", .type = input, .location = 0, .builtin = false});
	module.entry_points.push_back(std::move(vertex));
	module.entry_points.push_back(entry("fragment_main", ast::Stage::Fragment));
	return module;
}

/// Runtime sized uint storage buffer at (0, 0) and an 8 byte push constant block.
inline ast::Module compute_module()
{
	ast::Module module;
	auto		uint_type = module.add_type({.name = "uint", .inner = ast::Scalar{ast::ScalarKind::Uint}});
	auto		values	  = module.add_type(
		{.name = std::nullopt, .inner = ast::Array{.element = uint_type, .count = std::nullopt, .stride = 4}});
	auto params = module.add_type({.name  = "Params",
								   .inner = ast::Struct{{{.name = "count", .type = uint_type, .location = std::nullopt},
														 {.name = "factor", .type = uint_type, .location = std::nullopt}}}});

	module.globals.push_back({.name	   = "values",
							  .space   = ast::AddressSpace::Storage,
							  .access  = StorageAccess::Read | StorageAccess::Write,
							  .binding = ast::ResourceBinding{.group = 0, .binding = 0},
							  .type	   = values});
	module.globals.push_back({.name	   = "params",
							  .space   = ast::AddressSpace::PushConstant,
							  .access  = StorageAccess::Read,
							  .binding = ast::ResourceBinding{.group = PUSH_CONSTANT_GROUP, .binding = 0},
							  .type	   = params});

	auto compute		   = entry("compute_main", ast::Stage::Compute);
	compute.workgroup_size = {64, 1, 1};
	module.entry_points.push_back(std::move(compute));
	return module;
}

/// Vertex and fragment entry points without any resource.
inline ast::Module plain_module()
{
	ast::Module module;
	module.entry_points.push_back(entry("vertex_main", ast::Stage::Vertex));
	module.entry_points.push_back(entry("fragment_main", ast::Stage::Fragment));
	return module;
}

inline Shader build_shader(GraphicsContext& context, ast::Module module, std::string label = "Test shader")
{
	return ShaderBuilder(context).add_module(std::move(module), {}, "module").set_label(std::move(label)).build().value();
}

inline Shader build_compute_shader(GraphicsContext& context, ast::Module module = compute_module())
{
	return ComputeShaderBuilder(context).set_module(std::move(module), {}, "module").set_label("Test compute").build().value();
}

inline Texture build_target(GraphicsContext& context, uint32_t width, uint32_t height,
							TextureFormat format = TextureFormat::Rgba8Unorm)
{
	return TextureBuilder(context)
		.set_size(width, height)
		.set_format(format)
		.set_usage(TextureUsage::RenderAttachment | TextureUsage::CopySrc)
		.set_label("Target")
		.build()
		.value();
}

inline Buffer build_buffer(GraphicsContext& context, uint64_t size, BufferUsage usage, std::string label = "Buffer")
{
	return BufferBuilder(context).set_size(size).set_usage(usage).set_label(std::move(label)).build().value();
}

} // namespace est::test

#endif // ESTRENDER_TEST_TESTSUPPORT_HPP
