//
// Created by chris on 1/14/26.
//
#include <est/DrawingContext.hpp>
#include <est/GraphicsContext.hpp>
#include <est/Logger.hpp>
#include <est/RenderPass.hpp>

#include <algorithm>
#include <exception>

namespace est
{

namespace
{

bool is_supported_depth_format(TextureFormat format)
{
	return format == TextureFormat::Depth32Float || format == TextureFormat::Depth24PlusStencil8;
}

std::expected<void, Error> check_size(std::optional<glm::uvec2>& pass_size, const Texture& texture)
{
	if (pass_size && *pass_size != texture.size())
	{
		return std::unexpected{make_error(ErrorKind::AttachmentSizeMismatch,
										  "Attachment '{}' is {}x{}, the pass is {}x{}", texture.label(),
										  texture.width(), texture.height(), pass_size->x, pass_size->y)};
	}
	pass_size = texture.size();
	return {};
}

/// Intersection of the scissor with the target, the whole target for nullopt. nullopt when empty.
std::optional<ScissorRect> clip_scissor(const std::optional<ScissorRect>& scissor, glm::uvec2 size)
{
	const auto width  = static_cast<int64_t>(size.x);
	const auto height = static_cast<int64_t>(size.y);
	if (!scissor)
	{
		return ScissorRect{0, 0, static_cast<int32_t>(width), static_cast<int32_t>(height)};
	}

	const int64_t left	 = std::clamp<int64_t>(scissor->x, 0, width);
	const int64_t top	 = std::clamp<int64_t>(scissor->y, 0, height);
	const int64_t right	 = std::clamp<int64_t>(int64_t{scissor->x} + scissor->width, 0, width);
	const int64_t bottom = std::clamp<int64_t>(int64_t{scissor->y} + scissor->height, 0, height);
	if (right <= left || bottom <= top)
	{
		return std::nullopt;
	}
	return ScissorRect{static_cast<int32_t>(left), static_cast<int32_t>(top), static_cast<int32_t>(right - left),
					   static_cast<int32_t>(bottom - top)};
}

} // anonymous namespace

// ============================================================================
// RenderPass
// ============================================================================

RenderPass::RenderPass(CommandBuffer& commands, glm::uvec2 size)
	: m_commands(&commands)
	, m_size(size)
	, m_exceptions(std::uncaught_exceptions())
{
	m_commands->begin_pass("render");
}

RenderPass::RenderPass(RenderPass&& other) noexcept
	: m_commands(std::exchange(other.m_commands, nullptr))
	, m_size(other.m_size)
	, m_state(other.m_state)
	, m_exceptions(other.m_exceptions)
	, m_targets(std::move(other.m_targets))
	, m_msaa_targets(std::move(other.m_msaa_targets))
	, m_msaa_count(other.m_msaa_count)
	, m_depth(std::move(other.m_depth))
	, m_clear_color(other.m_clear_color)
	, m_shader(std::move(other.m_shader))
	, m_primitive(other.m_primitive)
	, m_pipeline(std::move(other.m_pipeline))
	, m_index_format_override(other.m_index_format_override)
	, m_attachments(std::move(other.m_attachments))
	, m_vertex(std::move(other.m_vertex))
	, m_index(std::move(other.m_index))
	, m_push_constants(std::move(other.m_push_constants))
	, m_viewport(other.m_viewport)
	, m_scissor(other.m_scissor)
	, m_queue(std::move(other.m_queue))
{}

RenderPass::~RenderPass() noexcept(false)
{
	if (!m_commands || m_state == PassState::Ended)
	{
		return;
	}

	if (std::uncaught_exceptions() > m_exceptions)
	{
		Logger::instance().warn("Render pass abandoned during stack unwinding, {} queued draws dropped",
								m_queue.size());
		m_commands->end_pass();
		return;
	}
	end();
}

GraphicsContext& RenderPass::context() const
{
	return m_commands->context();
}

const Shader& RenderPass::current_shader(const char* operation) const
{
	if (m_pipeline)
	{
		return m_pipeline->shader();
	}
	if (!m_shader)
	{
		fatal(ErrorKind::ShaderNotSet, "Render pass has no shader or pipeline for {}", operation);
	}
	return *m_shader;
}

void RenderPass::set_shader(const Shader& shader)
{
	set_shader(shader, shader.primitive());
}

void RenderPass::set_shader(const Shader& shader, const PrimitiveState& primitive)
{
	if (shader.is_compute())
	{
		fatal(ErrorKind::InvalidShaderType, "Compute shader '{}' cannot be used in a render pass", shader.label());
	}
	m_shader	= shader;
	m_primitive = primitive;
	m_pipeline.reset();
}

void RenderPass::set_pipeline(const RenderPipeline& pipeline)
{
	m_pipeline = pipeline;
	m_shader.reset();
	m_primitive.reset();
}

void RenderPass::set_blend(std::size_t index, std::optional<BlendState> blend)
{
	if (index >= m_targets.size())
	{
		fatal(ErrorKind::InvalidUsage, "Color target {} does not exist, the pass has {}", index, m_targets.size());
	}
	m_targets[index].blend = blend;
}

void RenderPass::attach(BindGroupAttachment attachment)
{
	if (m_pipeline)
	{
		fatal(ErrorKind::InvalidAttachmentType,
			  "Cannot attach to (group {}, binding {}) while a prebuilt pipeline is bound", attachment.group,
			  attachment.binding);
	}

	const auto& shader = current_shader("an attachment");
	if (auto valid = validate_attachment(shader, attachment); !valid)
	{
		fatal(valid.error().kind, "{}", valid.error().message);
	}
	m_attachments.set(std::move(attachment));
}

void RenderPass::set_attachment_uniform(uint32_t group, uint32_t binding, const Buffer& buffer)
{
	attach(BindGroupAttachment::uniform(group, binding, buffer));
}

void RenderPass::set_attachment_storage(uint32_t group, uint32_t binding, const Buffer& buffer)
{
	attach(BindGroupAttachment::storage(group, binding, buffer));
}

void RenderPass::set_attachment_texture(uint32_t group, uint32_t binding, const Texture& texture)
{
	attach(BindGroupAttachment::texture(group, binding, texture));
}

void RenderPass::set_attachment_texture_storage(uint32_t group, uint32_t binding, const Texture& texture)
{
	attach(BindGroupAttachment::storage_texture(group, binding, texture));
}

void RenderPass::set_attachment_sampler(uint32_t group, uint32_t binding, const Sampler& sampler)
{
	attach(BindGroupAttachment::sampler(group, binding, sampler));
}

void RenderPass::remove_attachment(uint32_t group, uint32_t binding)
{
	if (m_pipeline)
	{
		fatal(ErrorKind::InvalidAttachmentType, "Cannot remove attachments while a prebuilt pipeline is bound");
	}
	m_attachments.remove(group, binding);
}

void RenderPass::clear_attachments()
{
	m_attachments.clear();
}

void RenderPass::set_vertex_buffer(std::optional<Buffer> buffer)
{
	if (buffer && !has_flag(buffer->usage(), BufferUsage::Vertex))
	{
		fatal(ErrorKind::InvalidUsage, "Buffer '{}' was created without Vertex usage", buffer->label());
	}
	m_vertex = std::move(buffer);
}

void RenderPass::set_index_buffer(std::optional<Buffer> buffer)
{
	if (buffer && !has_flag(buffer->usage(), BufferUsage::Index))
	{
		fatal(ErrorKind::InvalidUsage, "Buffer '{}' was created without Index usage", buffer->label());
	}
	m_index = std::move(buffer);
}

void RenderPass::set_index_format(std::optional<IndexFormat> format)
{
	m_index_format_override = format;
}

void RenderPass::set_push_constants(std::span<const uint8_t> data)
{
	if (data.empty())
	{
		m_push_constants.clear();
		return;
	}

	const auto& shader = current_shader("push constants");
	m_push_constants.assign(data.begin(), data.end());
	m_push_constants.resize(align_to(data.size(), 4), 0);
	if (auto valid = validate_push_constants(shader, m_push_constants.size()); !valid)
	{
		fatal(valid.error().kind, "{}", valid.error().message);
	}
}

void RenderPass::set_viewport(std::optional<Viewport> viewport)
{
	m_viewport = viewport;
}

void RenderPass::set_scissor(std::optional<ScissorRect> scissor)
{
	m_scissor = scissor;
}

bool RenderPass::is_degenerate() const
{
	return (m_viewport && m_viewport->is_degenerate()) || (m_scissor && m_scissor->is_degenerate());
}

void RenderPass::check_buffers(bool indexed) const
{
	const auto& shader = current_shader("a draw");
	if (shader.vertex_input() && !m_vertex)
	{
		fatal(ErrorKind::MissingVertexBuffer, "Shader '{}' takes vertex input but no vertex buffer is bound",
			  shader.label());
	}
	if (indexed && !m_index)
	{
		fatal(ErrorKind::MissingIndexBuffer, "Indexed draw without an index buffer");
	}
}

RenderPass::Resolved RenderPass::resolve() const
{
	const auto& shader	  = current_shader("a draw");
	auto		primitive = m_pipeline ? m_pipeline->primitive() : *m_primitive;
	if (m_index_format_override)
	{
		primitive.index_format = m_index_format_override;
	}

	RenderPipelineState state{.shader		= shader,
							  .primitive	= primitive,
							  .targets		= {},
							  .depth		= std::nullopt,
							  .sample_count = m_msaa_count.value_or(1)};
	for (const auto& target : m_targets)
	{
		auto blend = m_pipeline && m_pipeline->blend() ? m_pipeline->blend() : target.blend;
		auto mask  = m_pipeline ? m_pipeline->write_mask() : target.write_mask;
		state.targets.push_back(
			ColorTargetState{.format = target.texture.format(), .blend = blend, .write_mask = mask});
	}
	if (m_depth)
	{
		state.depth = DepthStencilState{.format = m_depth->format()};
	}

	auto pipeline = get_render_pipeline(context(), state);
	if (!pipeline)
	{
		fatal(pipeline.error().kind, "{}", pipeline.error().message);
	}

	BindGroupPtr bind_groups;
	if (m_pipeline)
	{
		bind_groups = m_pipeline->bind_groups();
	} else
	{
		auto created = create_bind_groups(context(), shader, m_attachments);
		if (!created)
		{
			fatal(created.error().kind, "{}", created.error().message);
		}
		bind_groups = std::move(*created);
	}

	return Resolved{.pipeline			 = std::move(*pipeline),
					.bind_groups		 = std::move(bind_groups),
					.index_format		 = primitive.index_format,
					.needs_vertex_buffer = shader.vertex_input().has_value()};
}

void RenderPass::enqueue(bool indexed, std::variant<DirectDraw, IndirectDraw> draw)
{
	if (m_state == PassState::Ended)
	{
		fatal(ErrorKind::PassAlreadyEnded, "Cannot draw into a render pass that has ended");
	}
	if (is_degenerate())
	{
		Logger::instance().trace("Skipping draw with a zero area viewport or scissor");
		return;
	}

	check_buffers(indexed);
	auto resolved = resolve();
	if (indexed && !resolved.index_format)
	{
		fatal(ErrorKind::MissingIndexFormat,
			  "Indexed draw without an index format, set one on the shader or with set_index_format");
	}

	auto stages = ShaderStageFlags::None;
	if (!m_push_constants.empty())
	{
		auto valid = validate_push_constants(current_shader("a draw"), m_push_constants.size());
		if (!valid)
		{
			fatal(valid.error().kind, "{}", valid.error().message);
		}
		stages = *valid;
	}

	m_queue.push_back(RenderPassQueue{.pipeline		  = std::move(resolved.pipeline),
									  .bind_groups	  = std::move(resolved.bind_groups),
									  .vertex		  = resolved.needs_vertex_buffer ? m_vertex : std::nullopt,
									  .index		  = indexed ? m_index : std::nullopt,
									  .index_format	  = indexed ? resolved.index_format : std::nullopt,
									  .viewport		  = m_viewport,
									  .scissor		  = m_scissor,
									  .draw			  = std::move(draw),
									  .push_constants = m_push_constants,
									  .push_stages	  = stages});
	m_state = PassState::Recording;
}

void RenderPass::draw(uint32_t first_vertex, uint32_t vertex_count, uint32_t instances)
{
	enqueue(false, DirectDraw{.first = first_vertex, .count = vertex_count, .base_vertex = 0, .instances = instances});
}

void RenderPass::draw_indexed(uint32_t first_index, uint32_t index_count, int32_t base_vertex, uint32_t instances)
{
	enqueue(true, DirectDraw{
					  .first = first_index, .count = index_count, .base_vertex = base_vertex, .instances = instances});
}

void RenderPass::draw_indirect(const Buffer& buffer, uint64_t offset)
{
	if (!has_flag(buffer.usage(), BufferUsage::Indirect))
	{
		fatal(ErrorKind::InvalidUsage, "Buffer '{}' was created without Indirect usage", buffer.label());
	}
	enqueue(false, IndirectDraw{.buffer = buffer, .offset = offset});
}

void RenderPass::draw_indexed_indirect(const Buffer& buffer, uint64_t offset)
{
	if (!has_flag(buffer.usage(), BufferUsage::Indirect))
	{
		fatal(ErrorKind::InvalidUsage, "Buffer '{}' was created without Indirect usage", buffer.label());
	}
	enqueue(true, IndirectDraw{.buffer = buffer, .offset = offset});
}

DrawingContext RenderPass::begin_drawing()
{
	return DrawingContext(*this);
}

void RenderPass::end()
{
	if (!m_commands || m_state == PassState::Ended)
	{
		fatal(ErrorKind::PassAlreadyEnded, "Render pass was already ended");
	}
	if (m_msaa_count && m_msaa_targets.size() != m_targets.size())
	{
		fatal(ErrorKind::MsaaTargetCountMismatch, "{} MSAA targets for {} color targets", m_msaa_targets.size(),
			  m_targets.size());
	}

	replay();
	m_state = PassState::Ended;
	m_commands->end_pass();
}

void RenderPass::replay()
{
	auto& commands = m_commands->commands();

	RenderPassDescriptor descriptor{.label			   = "Render Pass",
									.width			   = m_size.x,
									.height			   = m_size.y,
									.color_attachments = {},
									.depth_attachment  = std::nullopt};
	std::optional<glm::vec4> clear;
	if (m_clear_color && m_clear_color->a > 0.0f)
	{
		clear = m_clear_color;
	}
	for (std::size_t i = 0; i < m_targets.size(); ++i)
	{
		const bool msaa = m_msaa_count.has_value();
		descriptor.color_attachments.push_back(ColorAttachmentDescriptor{
			.view			= msaa ? m_msaa_targets[i].handle() : m_targets[i].texture.handle(),
			.resolve_target = msaa ? m_targets[i].texture.handle() : TextureHandle{},
			.clear			= clear});
		m_commands->retain(m_targets[i].texture.resource());
		if (msaa)
			m_commands->retain(m_msaa_targets[i].resource());
	}
	if (m_depth)
	{
		descriptor.depth_attachment = DepthAttachmentDescriptor{.view = m_depth->handle(), .clear = 1.0f};
		m_commands->retain(m_depth->resource());
	}

	commands.begin_render_pass(descriptor);
	for (const auto& entry : m_queue)
	{
		if (entry.viewport && entry.viewport->is_degenerate())
		{
			continue;
		}
		auto scissor = clip_scissor(entry.scissor, m_size);
		if (!scissor)
		{
			Logger::instance().trace("Skipping draw whose scissor lies outside the {}x{} target", m_size.x, m_size.y);
			continue;
		}

		commands.set_pipeline(entry.pipeline->handle.get());
		m_commands->retain(entry.pipeline);
		if (entry.bind_groups)
		{
			for (const auto& [group, bind_group] : entry.bind_groups->groups)
			{
				commands.set_bind_group(group, bind_group.get());
			}
			m_commands->retain(entry.bind_groups);
		}
		if (entry.vertex)
		{
			commands.set_vertex_buffer(0, entry.vertex->handle(), 0);
			m_commands->retain(entry.vertex->resource());
		}
		if (entry.index)
		{
			commands.set_index_buffer(entry.index->handle(), *entry.index_format, 0);
			m_commands->retain(entry.index->resource());
		}
		if (!entry.push_constants.empty())
		{
			commands.set_push_constants(entry.push_stages, 0, entry.push_constants);
		}
		commands.set_scissor(*scissor);
		commands.set_viewport(entry.viewport.value_or(
			Viewport{0.0f, 0.0f, static_cast<float>(m_size.x), static_cast<float>(m_size.y)}));

		std::visit(overloaded{
					   [&](const DirectDraw& direct)
					   {
						   if (entry.index)
							   commands.draw_indexed(direct.count, direct.instances, direct.first,
													 direct.base_vertex, 0);
						   else
							   commands.draw(direct.count, direct.instances, direct.first, 0);
					   },
					   [&](const IndirectDraw& indirect)
					   {
						   if (entry.index)
							   commands.draw_indexed_indirect(indirect.buffer.handle(), indirect.offset);
						   else
							   commands.draw_indirect(indirect.buffer.handle(), indirect.offset);
						   m_commands->retain(indirect.buffer.resource());
					   },
				   },
				   entry.draw);
	}
	commands.end_render_pass();

	Logger::instance().debug("Render pass replayed {} draws into {}x{}", m_queue.size(), m_size.x, m_size.y);
	m_queue.clear();
}

// ============================================================================
// RenderPassBuilder
// ============================================================================

RenderPassBuilder::RenderPassBuilder(CommandBuffer& commands)
	: m_commands(&commands)
{}

RenderPassBuilder& RenderPassBuilder::add_color_attachment(const Texture& texture, std::optional<BlendState> blend)
{
	m_colors.push_back(ColorTarget{.texture = texture, .blend = blend, .write_mask = ColorWrite::All});
	return *this;
}

RenderPassBuilder& RenderPassBuilder::add_msaa_attachment(const Texture& texture)
{
	m_msaa.push_back(texture);
	return *this;
}

RenderPassBuilder& RenderPassBuilder::set_depth_attachment(const Texture& texture)
{
	m_depth = texture;
	return *this;
}

RenderPassBuilder& RenderPassBuilder::set_clear_color(std::optional<glm::vec4> color)
{
	m_clear_color = color;
	return *this;
}

std::expected<RenderPass, Error> RenderPassBuilder::build() const
{
	std::optional<glm::uvec2> size;

	for (const auto& target : m_colors)
	{
		const auto& texture = target.texture;
		if (!has_flag(texture.usage(), TextureUsage::RenderAttachment))
		{
			return std::unexpected{make_error(ErrorKind::ColorAttachmentNotRenderTarget,
											  "Color attachment '{}' lacks RenderAttachment usage", texture.label())};
		}
		if (texture.is_multisampled())
		{
			return std::unexpected{make_error(ErrorKind::ColorAttachmentMultiSampled,
											  "Color attachment '{}' is multisampled, add it as an MSAA attachment",
											  texture.label())};
		}
		if (auto checked = check_size(size, texture); !checked)
		{
			return std::unexpected{checked.error()};
		}
	}

	std::optional<uint32_t> sample_count;
	for (const auto& texture : m_msaa)
	{
		if (!has_flag(texture.usage(), TextureUsage::RenderAttachment))
		{
			return std::unexpected{make_error(ErrorKind::MsaaTextureNotRenderAttachment,
											  "MSAA attachment '{}' lacks RenderAttachment usage", texture.label())};
		}
		if (!texture.is_multisampled())
		{
			return std::unexpected{make_error(ErrorKind::MsaaTextureNotMultiSampled,
											  "MSAA attachment '{}' has a single sample", texture.label())};
		}
		if (size && *size != texture.size())
		{
			return std::unexpected{make_error(ErrorKind::MsaaTextureInvalidSize,
											  "MSAA attachment '{}' is {}x{}, the color targets are {}x{}",
											  texture.label(), texture.width(), texture.height(), size->x, size->y)};
		}
		if (sample_count && *sample_count != texture.sample_count())
		{
			return std::unexpected{make_error(ErrorKind::MismatchedAttachmentSampleCount,
											  "MSAA attachment '{}' has {} samples, expected {}", texture.label(),
											  texture.sample_count(), *sample_count)};
		}
		sample_count = texture.sample_count();
	}

	if (m_depth)
	{
		if (!has_flag(m_depth->usage(), TextureUsage::RenderAttachment))
		{
			return std::unexpected{make_error(ErrorKind::DepthTextureNotRenderAttachment,
											  "Depth attachment '{}' lacks RenderAttachment usage", m_depth->label())};
		}
		if (!is_supported_depth_format(m_depth->format()))
		{
			return std::unexpected{make_error(ErrorKind::DepthTextureFormatNotSupported,
											  "Depth attachment '{}' has format {}, Depth32Float or "
											  "Depth24PlusStencil8 expected",
											  m_depth->label(), to_string(m_depth->format()))};
		}
		if (size && *size != m_depth->size())
		{
			return std::unexpected{make_error(ErrorKind::DepthTextureInvalidSize,
											  "Depth attachment '{}' is {}x{}, the color targets are {}x{}",
											  m_depth->label(), m_depth->width(), m_depth->height(), size->x,
											  size->y)};
		}
		if (sample_count.value_or(1) != m_depth->sample_count())
		{
			return std::unexpected{make_error(ErrorKind::MismatchedAttachmentSampleCount,
											  "Depth attachment '{}' has {} samples, the color targets {}",
											  m_depth->label(), m_depth->sample_count(), sample_count.value_or(1))};
		}
		size = m_depth->size();
	}

	if (!size)
	{
		return std::unexpected{
			make_error(ErrorKind::NoColorOrDepthAttachment, "Render pass has neither a color nor a depth attachment")};
	}

	RenderPass pass(*m_commands, *size);
	pass.m_targets		= m_colors;
	pass.m_msaa_targets = m_msaa;
	pass.m_msaa_count	= sample_count;
	pass.m_depth		= m_depth;
	pass.m_clear_color	= m_clear_color;
	Logger::instance().debug("Render pass {}x{} with {} color targets, {} MSAA targets{}", size->x, size->y,
							 m_colors.size(), m_msaa.size(), m_depth ? ", depth" : "");
	return pass;
}

} // namespace est
