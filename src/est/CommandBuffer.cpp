//
// Created by chris on 1/14/26.
//
#include <est/CommandBuffer.hpp>
#include <est/ComputePass.hpp>
#include <est/GraphicsContext.hpp>
#include <est/Logger.hpp>
#include <est/RenderPass.hpp>

#include <algorithm>
#include <exception>

namespace est
{

CommandBuffer::CommandBuffer(GraphicsContext& context)
	: m_context(&context)
	, m_commands(context.device().create_command_list())
	, m_exceptions(std::uncaught_exceptions())
{
	m_context->command_buffer_opened();
}

CommandBuffer::~CommandBuffer() noexcept(false)
{
	if (m_submitted)
	{
		return;
	}
	if (std::uncaught_exceptions() > m_exceptions)
	{
		Logger::instance().warn("Command buffer dropped during stack unwinding, nothing was submitted");
		m_context->command_buffer_closed();
		return;
	}
	submit();
}

RenderPassBuilder CommandBuffer::render_pass()
{
	if (m_in_pass)
	{
		fatal(ErrorKind::InvalidUsage, "Command buffer is already inside a pass");
	}
	return RenderPassBuilder(*this);
}

ComputePass CommandBuffer::compute_pass()
{
	return ComputePass(*this);
}

void CommandBuffer::copy_buffer(const Buffer& src, const Buffer& dst)
{
	if (m_in_pass)
	{
		fatal(ErrorKind::InvalidUsage, "Copies cannot be recorded inside a pass");
	}
	if (!has_flag(src.usage(), BufferUsage::CopySrc))
	{
		fatal(ErrorKind::InvalidUsage, "Copy source '{}' lacks CopySrc usage", src.label());
	}
	if (!has_flag(dst.usage(), BufferUsage::CopyDst))
	{
		fatal(ErrorKind::BufferNotWritable, "Copy destination '{}' lacks CopyDst usage", dst.label());
	}

	m_commands->copy_buffer_to_buffer(src.handle(), 0, dst.handle(), 0, std::min(src.size(), dst.size()));
	retain(src.resource());
	retain(dst.resource());
}

void CommandBuffer::submit()
{
	if (m_in_pass)
	{
		fatal(ErrorKind::InvalidUsage, "Command buffer submitted while a pass is still open");
	}
	if (m_submitted)
	{
		fatal(ErrorKind::InvalidUsage, "Command buffer was already submitted");
	}

	m_submitted = true;
	m_context->command_buffer_closed();
	auto& device = m_context->device();
	try
	{
		device.submit(*m_commands);
		device.wait_idle(m_context->config().readback_timeout);
	} catch (const DeviceTimeoutError& e)
	{
		fatal(ErrorKind::DeviceTimeout, "Command buffer did not finish in time: {}", e.what());
	} catch (const DeviceError& e)
	{
		fatal(ErrorKind::DeviceFailure, "Command buffer submission failed: {}", e.what());
	}
	Logger::instance().trace("Command buffer submitted, releasing {} retained objects", m_retained.size());
	m_retained.clear();
}

void CommandBuffer::begin_pass(const char* kind)
{
	if (m_in_pass)
	{
		fatal(ErrorKind::InvalidUsage, "Cannot begin a {} pass while another pass is open", kind);
	}
	if (m_submitted)
	{
		fatal(ErrorKind::InvalidUsage, "Cannot begin a {} pass on a submitted command buffer", kind);
	}
	m_in_pass = true;
}

void CommandBuffer::end_pass()
{
	m_in_pass = false;
}

void CommandBuffer::retain(std::shared_ptr<const void> object)
{
	if (object)
	{
		m_retained.push_back(std::move(object));
	}
}

} // namespace est
