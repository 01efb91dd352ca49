//
// Created by chris on 1/14/26.
//
#include <est/ComputePass.hpp>
#include <est/GraphicsContext.hpp>
#include <est/Logger.hpp>

#include <exception>

namespace est
{

ComputePass::ComputePass(CommandBuffer& commands)
	: m_commands(&commands)
	, m_exceptions(std::uncaught_exceptions())
{
	m_commands->begin_pass("compute");
}

ComputePass::ComputePass(ComputePass&& other) noexcept
	: m_commands(std::exchange(other.m_commands, nullptr))
	, m_state(other.m_state)
	, m_exceptions(other.m_exceptions)
	, m_shader(std::move(other.m_shader))
	, m_pipeline(std::move(other.m_pipeline))
	, m_attachments(std::move(other.m_attachments))
	, m_push_constants(std::move(other.m_push_constants))
	, m_queue(std::move(other.m_queue))
{}

ComputePass::~ComputePass() noexcept(false)
{
	if (!m_commands || m_state == PassState::Ended)
	{
		return;
	}

	if (std::uncaught_exceptions() > m_exceptions)
	{
		Logger::instance().warn("Compute pass abandoned during stack unwinding, {} queued dispatches dropped",
								m_queue.size());
		m_commands->end_pass();
		return;
	}
	end();
}

const Shader& ComputePass::current_shader(const char* operation) const
{
	if (m_pipeline)
	{
		return m_pipeline->shader();
	}
	if (!m_shader)
	{
		fatal(ErrorKind::ShaderNotSet, "Compute pass has no shader or pipeline for {}", operation);
	}
	return *m_shader;
}

void ComputePass::set_shader(const Shader& shader)
{
	if (!shader.is_compute())
	{
		fatal(ErrorKind::InvalidShaderType, "Graphics shader '{}' cannot be used in a compute pass", shader.label());
	}
	m_shader = shader;
	m_pipeline.reset();
}

void ComputePass::set_pipeline(const ComputePipeline& pipeline)
{
	m_pipeline = pipeline;
	m_shader.reset();
}

void ComputePass::set_attachment(BindGroupAttachment attachment)
{
	if (attachment.kind == AttachmentKind::Texture || attachment.kind == AttachmentKind::Sampler)
	{
		fatal(ErrorKind::InvalidAttachmentType, "A {} cannot be attached to a compute pass (group {}, binding {})",
			  to_string(attachment.kind), attachment.group, attachment.binding);
	}
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

void ComputePass::set_attachment_uniform(uint32_t group, uint32_t binding, const Buffer& buffer)
{
	set_attachment(BindGroupAttachment::uniform(group, binding, buffer));
}

void ComputePass::set_attachment_storage(uint32_t group, uint32_t binding, const Buffer& buffer)
{
	set_attachment(BindGroupAttachment::storage(group, binding, buffer));
}

void ComputePass::set_attachment_texture_storage(uint32_t group, uint32_t binding, const Texture& texture)
{
	set_attachment(BindGroupAttachment::storage_texture(group, binding, texture));
}

void ComputePass::remove_attachment(uint32_t group, uint32_t binding)
{
	m_attachments.remove(group, binding);
}

void ComputePass::clear_attachments()
{
	m_attachments.clear();
}

void ComputePass::set_push_constants(std::span<const uint8_t> data)
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

void ComputePass::enqueue(std::variant<DirectDispatch, IndirectDispatch> dispatch)
{
	if (m_state == PassState::Ended)
	{
		fatal(ErrorKind::PassAlreadyEnded, "Cannot dispatch in a compute pass that has ended");
	}

	const auto& shader = current_shader("a dispatch");
	auto&		context = m_commands->context();

	PipelinePtr	 pipeline;
	BindGroupPtr bind_groups;
	if (m_pipeline)
	{
		pipeline	= m_pipeline->pipeline();
		bind_groups = m_pipeline->bind_groups();
	} else
	{
		auto created = create_bind_groups(context, shader, m_attachments);
		if (!created)
		{
			fatal(created.error().kind, "{}", created.error().message);
		}
		auto resolved = get_compute_pipeline(context, ComputePipelineState{.shader = shader});
		if (!resolved)
		{
			fatal(resolved.error().kind, "{}", resolved.error().message);
		}
		pipeline	= std::move(*resolved);
		bind_groups = std::move(*created);
	}

	auto stages = ShaderStageFlags::None;
	if (!m_push_constants.empty())
	{
		auto valid = validate_push_constants(shader, m_push_constants.size());
		if (!valid)
		{
			fatal(valid.error().kind, "{}", valid.error().message);
		}
		stages = *valid;
	}

	m_queue.push_back(ComputePassQueue{.pipeline	   = std::move(pipeline),
									   .bind_groups	   = std::move(bind_groups),
									   .dispatch	   = std::move(dispatch),
									   .push_constants = m_push_constants,
									   .push_stages	   = stages});
	m_state = PassState::Recording;
}

void ComputePass::dispatch(uint32_t x, uint32_t y, uint32_t z)
{
	if (x == 0 || y == 0 || z == 0)
	{
		Logger::instance().trace("Skipping empty dispatch {}x{}x{}", x, y, z);
		return;
	}
	enqueue(DirectDispatch{.x = x, .y = y, .z = z});
}

void ComputePass::dispatch_indirect(const Buffer& buffer, uint64_t offset)
{
	if (!has_flag(buffer.usage(), BufferUsage::Indirect))
	{
		fatal(ErrorKind::InvalidUsage, "Buffer '{}' was created without Indirect usage", buffer.label());
	}
	enqueue(IndirectDispatch{.buffer = buffer, .offset = offset});
}

void ComputePass::end()
{
	if (!m_commands || m_state == PassState::Ended)
	{
		fatal(ErrorKind::PassAlreadyEnded, "Compute pass was already ended");
	}

	auto& commands = m_commands->commands();
	commands.begin_compute_pass();
	for (const auto& entry : m_queue)
	{
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
		if (!entry.push_constants.empty())
		{
			commands.set_push_constants(entry.push_stages, 0, entry.push_constants);
		}

		std::visit(overloaded{
					   [&](const DirectDispatch& direct) { commands.dispatch(direct.x, direct.y, direct.z); },
					   [&](const IndirectDispatch& indirect)
					   {
						   commands.dispatch_indirect(indirect.buffer.handle(), indirect.offset);
						   m_commands->retain(indirect.buffer.resource());
					   },
				   },
				   entry.dispatch);
	}
	commands.end_compute_pass();

	Logger::instance().debug("Compute pass replayed {} dispatches", m_queue.size());
	m_queue.clear();
	m_state = PassState::Ended;
	m_commands->end_pass();
}

} // namespace est
