//
// Created by chris on 1/14/26.
//

#ifndef ESTRENDER_COMMANDBUFFER_HPP
#define ESTRENDER_COMMANDBUFFER_HPP
#include <memory>
#include <vector>

#include "Buffer.hpp"
#include "GpuDevice.hpp"

namespace est
{

class GraphicsContext;
class RenderPassBuilder;
class ComputePass;

/**
 * @brief One command list, the passes recorded into it and the objects they reference
 *
 * Only one pass may be open at a time. submit() hands the list to the device and waits
 * for it to finish, afterwards the retained objects are released. A buffer that was
 * never submitted is submitted on scope exit unless an exception is unwinding.
 */
class CommandBuffer
{
public:
	explicit CommandBuffer(GraphicsContext& context);
	~CommandBuffer() noexcept(false);

	CommandBuffer(const CommandBuffer&)			   = delete;
	CommandBuffer& operator=(const CommandBuffer&) = delete;

	/// Fatal while another pass is open.
	[[nodiscard]] RenderPassBuilder render_pass();
	[[nodiscard]] ComputePass		compute_pass();

	/// Record a copy of min(src.size(), dst.size()) bytes. Needs CopySrc on src and CopyDst on dst.
	void copy_buffer(const Buffer& src, const Buffer& dst);

	/// Fatal when a pass is still open or the buffer was already submitted.
	void submit();

	[[nodiscard]] bool			   is_submitted() const { return m_submitted; }
	[[nodiscard]] bool			   in_pass() const { return m_in_pass; }
	[[nodiscard]] GraphicsContext& context() const { return *m_context; }

private:
	friend class RenderPass;
	friend class ComputePass;

	CommandList& commands() { return *m_commands; }
	void		 begin_pass(const char* kind);
	void		 end_pass();
	/// Keep an object alive until the commands referencing it have executed.
	void retain(std::shared_ptr<const void> object);

	GraphicsContext*						 m_context;
	std::unique_ptr<CommandList>			 m_commands;
	std::vector<std::shared_ptr<const void>> m_retained;
	bool									 m_in_pass	 = false;
	bool									 m_submitted = false;
	int										 m_exceptions;
};

} // namespace est

#endif // ESTRENDER_COMMANDBUFFER_HPP
