//
// Created by chris on 1/13/26.
//

#ifndef ESTRENDER_PIPELINE_HPP
#define ESTRENDER_PIPELINE_HPP
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

#include "BindGroup.hpp"
#include "Error.hpp"
#include "GpuObjects.hpp"
#include "Shader.hpp"

namespace est
{

class GraphicsContext;

/// Every field that decides the identity of a backend render pipeline.
struct RenderPipelineState
{
	Shader							 shader;
	PrimitiveState					 primitive;
	std::vector<ColorTargetState>	 targets;
	std::optional<DepthStencilState> depth;
	uint32_t						 sample_count = 1;
};

struct ComputePipelineState
{
	Shader shader;
};

[[nodiscard]] uint64_t render_pipeline_key(const RenderPipelineState& state);
[[nodiscard]] uint64_t compute_pipeline_key(const ComputePipelineState& state);

/// Fetch the pipeline from the context cache, creating it on a miss. DeviceFailure when creation fails.
[[nodiscard]] std::expected<PipelinePtr, Error> get_render_pipeline(GraphicsContext& context,
																	const RenderPipelineState& state);
[[nodiscard]] std::expected<PipelinePtr, Error> get_compute_pipeline(GraphicsContext& context,
																	 const ComputePipelineState& state);

/**
 * @brief Shader with its attachments resolved up front
 *
 * The backend pipeline still depends on the render targets, it is fetched from the
 * cache when a pass draws with it.
 */
class RenderPipeline
{
public:
	[[nodiscard]] const Shader&					   shader() const { return m_shader; }
	[[nodiscard]] const PrimitiveState&			   primitive() const { return m_primitive; }
	[[nodiscard]] const std::optional<BlendState>& blend() const { return m_blend; }
	[[nodiscard]] ColorWrite					   write_mask() const { return m_write_mask; }
	[[nodiscard]] const BindGroupPtr&			   bind_groups() const { return m_bind_groups; }

private:
	friend class RenderPipelineBuilder;
	RenderPipeline(Shader shader, PrimitiveState primitive, std::optional<BlendState> blend, ColorWrite write_mask,
				   BindGroupPtr bind_groups);

	Shader					  m_shader;
	PrimitiveState			  m_primitive;
	std::optional<BlendState> m_blend;
	ColorWrite				  m_write_mask;
	BindGroupPtr			  m_bind_groups;
};

class RenderPipelineBuilder
{
public:
	explicit RenderPipelineBuilder(GraphicsContext& context);

	/// Takes the primitive state of the shader, override it with set_primitive afterwards.
	RenderPipelineBuilder& set_shader(const Shader& shader);
	RenderPipelineBuilder& set_primitive(const PrimitiveState& primitive);
	/// Applied to every color target of the pass, nullopt keeps the per target blend.
	RenderPipelineBuilder& set_blend(std::optional<BlendState> blend);
	RenderPipelineBuilder& set_write_mask(ColorWrite mask);

	RenderPipelineBuilder& set_attachment_uniform(uint32_t group, uint32_t binding, const Buffer& buffer);
	RenderPipelineBuilder& set_attachment_storage(uint32_t group, uint32_t binding, const Buffer& buffer);
	RenderPipelineBuilder& set_attachment_texture(uint32_t group, uint32_t binding, const Texture& texture);
	RenderPipelineBuilder& set_attachment_texture_storage(uint32_t group, uint32_t binding, const Texture& texture);
	RenderPipelineBuilder& set_attachment_sampler(uint32_t group, uint32_t binding, const Sampler& sampler);
	RenderPipelineBuilder& remove_attachment(uint32_t group, uint32_t binding);

	/**
	 * @brief Validate the attachments against the shader and create its bind groups
	 *
	 * ShaderNotSet without a shader, InvalidShaderType for a compute shader. Attachment
	 * problems come back as BindingTypeMismatch, BindingNotFound, BindGroupNotFound or
	 * MissingBinding.
	 */
	[[nodiscard]] std::expected<RenderPipeline, Error> build() const;

private:
	GraphicsContext*			  m_context;
	std::optional<Shader>		  m_shader;
	std::optional<PrimitiveState> m_primitive;
	std::optional<BlendState>	  m_blend;
	ColorWrite					  m_write_mask = ColorWrite::All;
	BindingSet					  m_attachments;
};

/// Compute shader, its bind groups and the backend pipeline, ready to dispatch.
class ComputePipeline
{
public:
	[[nodiscard]] const Shader&		  shader() const { return m_shader; }
	[[nodiscard]] const BindGroupPtr& bind_groups() const { return m_bind_groups; }
	[[nodiscard]] const PipelinePtr&  pipeline() const { return m_pipeline; }

private:
	friend class ComputePipelineBuilder;
	ComputePipeline(Shader shader, BindGroupPtr bind_groups, PipelinePtr pipeline);

	Shader		 m_shader;
	BindGroupPtr m_bind_groups;
	PipelinePtr	 m_pipeline;
};

class ComputePipelineBuilder
{
public:
	explicit ComputePipelineBuilder(GraphicsContext& context);

	ComputePipelineBuilder& set_shader(const Shader& shader);
	ComputePipelineBuilder& set_attachment_uniform(uint32_t group, uint32_t binding, const Buffer& buffer);
	ComputePipelineBuilder& set_attachment_storage(uint32_t group, uint32_t binding, const Buffer& buffer);
	ComputePipelineBuilder& set_attachment_texture_storage(uint32_t group, uint32_t binding, const Texture& texture);
	ComputePipelineBuilder& remove_attachment(uint32_t group, uint32_t binding);

	/// ShaderNotSet without a shader, InvalidShaderType for a graphics shader, attachment errors as for render pipelines.
	[[nodiscard]] std::expected<ComputePipeline, Error> build() const;

private:
	GraphicsContext*	  m_context;
	std::optional<Shader> m_shader;
	BindingSet			  m_attachments;
};

} // namespace est

#endif // ESTRENDER_PIPELINE_HPP
