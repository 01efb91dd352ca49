//
// Created by chris on 1/13/26.
//
#include <est/GraphicsContext.hpp>
#include <est/Logger.hpp>
#include <est/Pipeline.hpp>

#include <string>

namespace est
{

namespace
{

constexpr uint64_t RENDER_PIPELINE_DISCRIMINATOR  = 0;
constexpr uint64_t COMPUTE_PIPELINE_DISCRIMINATOR = 1;

void hash_stage(uint64_t& seed, const std::optional<ShaderStage>& stage)
{
	if (!stage)
	{
		hash_value(seed, uint64_t{0});
		return;
	}
	hash_value(seed, stage->module->handle.get().id);
	hash_value(seed, stage->entry_point);
}

void hash_blend(uint64_t& seed, const std::optional<BlendState>& blend)
{
	hash_value(seed, blend.has_value());
	if (!blend)
		return;
	for (const auto& component : {blend->color, blend->alpha})
	{
		hash_value(seed, component.src_factor);
		hash_value(seed, component.dst_factor);
		hash_value(seed, component.operation);
	}
}

std::expected<PipelinePtr, Error> create_cached(GraphicsContext& context, uint64_t key, const std::string& label,
												PipelineKind kind, const auto& create)
{
	try
	{
		return context.pipeline_cache().get_or_create(key,
													  [&]
													  {
														  auto handle = create();
														  Logger::instance().debug("Created pipeline '{}'", label);
														  return std::make_shared<const PipelineObject>(PipelineObject{
															  .handle = OwnedHandle{context.shared_device(), handle},
															  .kind	  = kind,
															  .label  = label});
													  });
	} catch (const DeviceError& e)
	{
		return std::unexpected{make_error(ErrorKind::DeviceFailure, "Failed to create pipeline '{}': {}", label, e.what())};
	}
}

} // anonymous namespace

// ============================================================================
// Keys and cache lookup
// ============================================================================

uint64_t render_pipeline_key(const RenderPipelineState& state)
{
	uint64_t seed = 0;
	hash_value(seed, RENDER_PIPELINE_DISCRIMINATOR);
	hash_stage(seed, state.shader.vertex_stage());
	hash_stage(seed, state.shader.fragment_stage());
	hash_value(seed, state.shader.pipeline_layout().id);

	const auto& input = state.shader.vertex_input();
	hash_value(seed, input.has_value());
	if (input)
	{
		hash_value(seed, input->stride);
		for (const auto& attribute : input->attributes)
		{
			hash_value(seed, attribute.location);
			hash_value(seed, attribute.offset);
			hash_value(seed, attribute.type);
		}
	}

	const auto& primitive = state.primitive;
	hash_value(seed, primitive.index_format.has_value());
	hash_value(seed, primitive.index_format.value_or(IndexFormat::Uint16));
	hash_value(seed, primitive.topology);
	hash_value(seed, primitive.cull_mode);
	hash_value(seed, primitive.polygon_mode);
	hash_value(seed, primitive.front_face);

	hash_value(seed, state.targets.size());
	for (const auto& target : state.targets)
	{
		hash_value(seed, target.format);
		hash_blend(seed, target.blend);
		hash_value(seed, target.write_mask);
	}

	hash_value(seed, state.depth.has_value());
	if (state.depth)
	{
		hash_value(seed, state.depth->format);
		hash_value(seed, state.depth->depth_write);
		hash_value(seed, state.depth->compare);
	}
	hash_value(seed, state.sample_count);
	return seed;
}

uint64_t compute_pipeline_key(const ComputePipelineState& state)
{
	uint64_t seed = 0;
	hash_value(seed, COMPUTE_PIPELINE_DISCRIMINATOR);
	hash_stage(seed, state.shader.compute_stage());
	hash_value(seed, state.shader.pipeline_layout().id);
	return seed;
}

std::expected<PipelinePtr, Error> get_render_pipeline(GraphicsContext& context, const RenderPipelineState& state)
{
	const auto& shader = state.shader;
	if (!shader.vertex_stage() || !shader.fragment_stage())
	{
		return std::unexpected{
			make_error(ErrorKind::InvalidShaderType, "Shader '{}' is not a graphics shader", shader.label())};
	}

	auto label = fmt::format("RenderPipeline for '{}'", shader.label());
	return create_cached(context, render_pipeline_key(state), label, PipelineKind::Render,
						 [&]
						 {
							 RenderPipelineDescriptor descriptor{
								 .label				   = label,
								 .layout			   = shader.pipeline_layout(),
								 .vertex_module		   = shader.vertex_stage()->module->handle.get(),
								 .vertex_entry_point   = shader.vertex_stage()->entry_point,
								 .fragment_module	   = shader.fragment_stage()->module->handle.get(),
								 .fragment_entry_point = shader.fragment_stage()->entry_point,
								 .vertex_buffer		   = std::nullopt,
								 .primitive			   = state.primitive,
								 .targets			   = state.targets,
								 .depth_stencil		   = state.depth,
								 .sample_count		   = state.sample_count};
							 if (const auto& input = shader.vertex_input())
							 {
								 descriptor.vertex_buffer =
									 VertexBufferLayout{.stride = input->stride, .attributes = input->attributes};
							 }
							 return context.device().create_render_pipeline(descriptor);
						 });
}

std::expected<PipelinePtr, Error> get_compute_pipeline(GraphicsContext& context, const ComputePipelineState& state)
{
	const auto& shader = state.shader;
	if (!shader.compute_stage())
	{
		return std::unexpected{
			make_error(ErrorKind::InvalidShaderType, "Shader '{}' is not a compute shader", shader.label())};
	}

	auto label = fmt::format("ComputePipeline for '{}'", shader.label());
	return create_cached(context, compute_pipeline_key(state), label, PipelineKind::Compute,
						 [&]
						 {
							 return context.device().create_compute_pipeline(
								 ComputePipelineDescriptor{.label		= label,
														   .layout		= shader.pipeline_layout(),
														   .module		= shader.compute_stage()->module->handle.get(),
														   .entry_point = shader.compute_stage()->entry_point});
						 });
}

// ============================================================================
// RenderPipeline
// ============================================================================

RenderPipeline::RenderPipeline(Shader shader, PrimitiveState primitive, std::optional<BlendState> blend,
							   ColorWrite write_mask, BindGroupPtr bind_groups)
	: m_shader(std::move(shader))
	, m_primitive(primitive)
	, m_blend(blend)
	, m_write_mask(write_mask)
	, m_bind_groups(std::move(bind_groups))
{}

RenderPipelineBuilder::RenderPipelineBuilder(GraphicsContext& context)
	: m_context(&context)
{}

RenderPipelineBuilder& RenderPipelineBuilder::set_shader(const Shader& shader)
{
	m_shader = shader;
	return *this;
}

RenderPipelineBuilder& RenderPipelineBuilder::set_primitive(const PrimitiveState& primitive)
{
	m_primitive = primitive;
	return *this;
}

RenderPipelineBuilder& RenderPipelineBuilder::set_blend(std::optional<BlendState> blend)
{
	m_blend = blend;
	return *this;
}

RenderPipelineBuilder& RenderPipelineBuilder::set_write_mask(ColorWrite mask)
{
	m_write_mask = mask;
	return *this;
}

RenderPipelineBuilder& RenderPipelineBuilder::set_attachment_uniform(uint32_t group, uint32_t binding,
																	 const Buffer& buffer)
{
	m_attachments.set_uniform(group, binding, buffer);
	return *this;
}

RenderPipelineBuilder& RenderPipelineBuilder::set_attachment_storage(uint32_t group, uint32_t binding,
																	 const Buffer& buffer)
{
	m_attachments.set_storage(group, binding, buffer);
	return *this;
}

RenderPipelineBuilder& RenderPipelineBuilder::set_attachment_texture(uint32_t group, uint32_t binding,
																	 const Texture& texture)
{
	m_attachments.set_texture(group, binding, texture);
	return *this;
}

RenderPipelineBuilder& RenderPipelineBuilder::set_attachment_texture_storage(uint32_t group, uint32_t binding,
																			 const Texture& texture)
{
	m_attachments.set_storage_texture(group, binding, texture);
	return *this;
}

RenderPipelineBuilder& RenderPipelineBuilder::set_attachment_sampler(uint32_t group, uint32_t binding,
																	 const Sampler& sampler)
{
	m_attachments.set_sampler(group, binding, sampler);
	return *this;
}

RenderPipelineBuilder& RenderPipelineBuilder::remove_attachment(uint32_t group, uint32_t binding)
{
	m_attachments.remove(group, binding);
	return *this;
}

std::expected<RenderPipeline, Error> RenderPipelineBuilder::build() const
{
	if (!m_shader)
	{
		return std::unexpected{make_error(ErrorKind::ShaderNotSet, "RenderPipelineBuilder has no shader")};
	}
	if (m_shader->is_compute())
	{
		return std::unexpected{make_error(ErrorKind::InvalidShaderType,
										  "Shader '{}' is a compute shader, use ComputePipelineBuilder",
										  m_shader->label())};
	}

	auto bind_groups = create_bind_groups(*m_context, *m_shader, m_attachments);
	if (!bind_groups)
	{
		return std::unexpected{bind_groups.error()};
	}

	Logger::instance().debug("Built render pipeline for '{}' with {} attachments", m_shader->label(),
							 m_attachments.size());
	return RenderPipeline(*m_shader, m_primitive.value_or(m_shader->primitive()), m_blend, m_write_mask,
						  std::move(*bind_groups));
}

// ============================================================================
// ComputePipeline
// ============================================================================

ComputePipeline::ComputePipeline(Shader shader, BindGroupPtr bind_groups, PipelinePtr pipeline)
	: m_shader(std::move(shader))
	, m_bind_groups(std::move(bind_groups))
	, m_pipeline(std::move(pipeline))
{}

ComputePipelineBuilder::ComputePipelineBuilder(GraphicsContext& context)
	: m_context(&context)
{}

ComputePipelineBuilder& ComputePipelineBuilder::set_shader(const Shader& shader)
{
	m_shader = shader;
	return *this;
}

ComputePipelineBuilder& ComputePipelineBuilder::set_attachment_uniform(uint32_t group, uint32_t binding,
																	   const Buffer& buffer)
{
	m_attachments.set_uniform(group, binding, buffer);
	return *this;
}

ComputePipelineBuilder& ComputePipelineBuilder::set_attachment_storage(uint32_t group, uint32_t binding,
																	   const Buffer& buffer)
{
	m_attachments.set_storage(group, binding, buffer);
	return *this;
}

ComputePipelineBuilder& ComputePipelineBuilder::set_attachment_texture_storage(uint32_t group, uint32_t binding,
																			   const Texture& texture)
{
	m_attachments.set_storage_texture(group, binding, texture);
	return *this;
}

ComputePipelineBuilder& ComputePipelineBuilder::remove_attachment(uint32_t group, uint32_t binding)
{
	m_attachments.remove(group, binding);
	return *this;
}

std::expected<ComputePipeline, Error> ComputePipelineBuilder::build() const
{
	if (!m_shader)
	{
		return std::unexpected{make_error(ErrorKind::ShaderNotSet, "ComputePipelineBuilder has no shader")};
	}
	if (!m_shader->is_compute())
	{
		return std::unexpected{make_error(ErrorKind::InvalidShaderType,
										  "Shader '{}' is a graphics shader, use RenderPipelineBuilder",
										  m_shader->label())};
	}

	auto bind_groups = create_bind_groups(*m_context, *m_shader, m_attachments);
	if (!bind_groups)
	{
		return std::unexpected{bind_groups.error()};
	}

	auto pipeline = get_compute_pipeline(*m_context, ComputePipelineState{.shader = *m_shader});
	if (!pipeline)
	{
		return std::unexpected{pipeline.error()};
	}
	return ComputePipeline(*m_shader, std::move(*bind_groups), std::move(*pipeline));
}

} // namespace est
