//
// Created by chris on 1/12/26.
//

#ifndef ESTRENDER_SHADER_HPP
#define ESTRENDER_SHADER_HPP
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "Error.hpp"
#include "GpuDevice.hpp"
#include "LayoutDerivation.hpp"
#include "ShaderAst.hpp"
#include "ShaderTypes.hpp"

namespace est
{

class GraphicsContext;

struct BindGroupLayout
{
	uint32_t							group;
	std::vector<uint32_t>				bindings;
	std::vector<LayoutBinding>			entries;
	std::string							label;
	OwnedHandle<BindGroupLayoutHandle>	handle;

	[[nodiscard]] const LayoutBinding* find(uint32_t binding) const;
};

struct ShaderModuleObject
{
	OwnedHandle<ShaderModuleHandle> handle;
	std::string						label;
};

struct ShaderStage
{
	std::shared_ptr<const ShaderModuleObject> module;
	std::string								  entry_point;
};

struct ShaderResource
{
	std::string						 label;
	std::vector<ShaderReflection>	 reflections;
	std::vector<BindGroupLayout>	 layouts; // sorted by group
	std::optional<PushConstantRange> push_constants;
	OwnedHandle<PipelineLayoutHandle> pipeline_layout;
	std::optional<VertexInputDescription> vertex_input;
	std::optional<ShaderStage>		 vertex;
	std::optional<ShaderStage>		 fragment;
	std::optional<ShaderStage>		 compute;
	PrimitiveState					 primitive;
};

/**
 * @brief Linked shader program with its derived bind group and pipeline layouts
 *
 * Reflection and layout derivation run once when the shader is built. Copies share
 * the backend objects, equality is identity.
 */
class Shader
{
public:
	/// Stable identity, the id of the pipeline layout handle.
	[[nodiscard]] uint64_t			 id() const { return m_resource->pipeline_layout.get().id; }
	[[nodiscard]] const std::string& label() const { return m_resource->label; }
	[[nodiscard]] bool				 is_compute() const { return m_resource->compute.has_value(); }

	[[nodiscard]] const std::vector<ShaderReflection>& reflections() const { return m_resource->reflections; }
	[[nodiscard]] const std::vector<BindGroupLayout>&	layouts() const { return m_resource->layouts; }
	[[nodiscard]] const BindGroupLayout*				find_layout(uint32_t group) const;
	[[nodiscard]] const LayoutBinding*					find_binding(uint32_t group, uint32_t binding) const;
	[[nodiscard]] const std::optional<PushConstantRange>& push_constants() const { return m_resource->push_constants; }
	[[nodiscard]] PipelineLayoutHandle pipeline_layout() const { return m_resource->pipeline_layout.get(); }

	[[nodiscard]] const std::optional<VertexInputDescription>& vertex_input() const { return m_resource->vertex_input; }
	[[nodiscard]] const std::optional<ShaderStage>& vertex_stage() const { return m_resource->vertex; }
	[[nodiscard]] const std::optional<ShaderStage>& fragment_stage() const { return m_resource->fragment; }
	[[nodiscard]] const std::optional<ShaderStage>& compute_stage() const { return m_resource->compute; }
	[[nodiscard]] const PrimitiveState&				primitive() const { return m_resource->primitive; }

	bool operator==(const Shader& other) const { return m_resource == other.m_resource; }

private:
	friend class ShaderBuilder;
	friend class ComputeShaderBuilder;
	explicit Shader(std::shared_ptr<const ShaderResource> resource);

	std::shared_ptr<const ShaderResource> m_resource;
};

/// Slang source text, compiled on build.
struct SlangSource
{
	std::string name;
	std::string source;
};

/// Slang module resolved through the SHADER_DIR search path.
struct SlangModule
{
	std::string name;
};

/// Container in the est-binary-shader-v1 format.
struct BinaryShaderData
{
	std::vector<uint8_t> data;
};

/// Already parsed module with its SPIR-V.
struct ModuleShader
{
	ast::Module			 module;
	std::vector<uint8_t> spirv;
	std::string			 name;
};

using ShaderInput = std::variant<SlangSource, SlangModule, BinaryShaderData, ModuleShader>;

/**
 * @brief Build a graphics Shader from one or more modules
 *
 * The modules together must provide exactly one vertex and one fragment entry point.
 * A duplicated stage or a compute module gives InvalidShaderType, a missing stage
 * MissingEntryPoint.
 */
class ShaderBuilder
{
public:
	explicit ShaderBuilder(GraphicsContext& context);

	ShaderBuilder& add_source(std::string name, std::string source);
	ShaderBuilder& add_module(std::string name);
	ShaderBuilder& add_binary(std::span<const uint8_t> data);
	ShaderBuilder& add_module(ast::Module module, std::vector<uint8_t> spirv, std::string name = "module");

	ShaderBuilder& set_primitive(const PrimitiveState& primitive);
	ShaderBuilder& set_topology(PrimitiveTopology topology);
	ShaderBuilder& set_index_format(std::optional<IndexFormat> format);
	ShaderBuilder& set_cull_mode(CullMode mode);
	ShaderBuilder& set_polygon_mode(PolygonMode mode);
	ShaderBuilder& set_front_face(FrontFace face);
	ShaderBuilder& set_label(std::string label);

	[[nodiscard]] std::expected<Shader, Error> build() const;

private:
	GraphicsContext*		 m_context;
	std::vector<ShaderInput> m_inputs;
	PrimitiveState			 m_primitive;
	std::string				 m_label = "Shader";
};

/// Build a compute Shader from a single module with one compute entry point.
class ComputeShaderBuilder
{
public:
	explicit ComputeShaderBuilder(GraphicsContext& context);

	ComputeShaderBuilder& set_source(std::string name, std::string source);
	ComputeShaderBuilder& set_module(std::string name);
	ComputeShaderBuilder& set_binary(std::span<const uint8_t> data);
	ComputeShaderBuilder& set_module(ast::Module module, std::vector<uint8_t> spirv, std::string name = "module");
	ComputeShaderBuilder& set_label(std::string label);

	/// ShaderNotSet without input, InvalidShaderType when the module is not a compute shader.
	[[nodiscard]] std::expected<Shader, Error> build() const;

private:
	GraphicsContext*		   m_context;
	std::optional<ShaderInput> m_input;
	std::string				   m_label = "ComputeShader";
};

} // namespace est

#endif // ESTRENDER_SHADER_HPP
