//
// Created by chris on 1/14/26.
//

#ifndef ESTRENDER_COMPUTEPASS_HPP
#define ESTRENDER_COMPUTEPASS_HPP
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

#include "BindGroup.hpp"
#include "Buffer.hpp"
#include "CommandBuffer.hpp"
#include "GpuObjects.hpp"
#include "Pipeline.hpp"
#include "RenderPass.hpp"
#include "Shader.hpp"

namespace est
{

struct DirectDispatch
{
	uint32_t x;
	uint32_t y;
	uint32_t z;
};

struct IndirectDispatch
{
	Buffer	 buffer;
	uint64_t offset;
};

struct ComputePassQueue
{
	PipelinePtr									pipeline;
	BindGroupPtr								bind_groups;
	std::variant<DirectDispatch, IndirectDispatch> dispatch;
	std::vector<uint8_t>						push_constants;
	ShaderStageFlags							push_stages = ShaderStageFlags::None;
};

/**
 * @brief Compute counterpart of RenderPass
 *
 * Only uniform buffers, storage buffers and storage textures can be attached. A
 * dispatch with a zero sized grid is skipped.
 */
class ComputePass
{
public:
	ComputePass(ComputePass&& other) noexcept;
	ComputePass& operator=(ComputePass&&) = delete;
	~ComputePass() noexcept(false);

	void set_shader(const Shader& shader);
	void set_pipeline(const ComputePipeline& pipeline);

	void set_attachment_uniform(uint32_t group, uint32_t binding, const Buffer& buffer);
	void set_attachment_storage(uint32_t group, uint32_t binding, const Buffer& buffer);
	void set_attachment_texture_storage(uint32_t group, uint32_t binding, const Texture& texture);
	/// Fatal (InvalidAttachmentType) for sampled textures and samplers.
	void set_attachment(BindGroupAttachment attachment);
	void remove_attachment(uint32_t group, uint32_t binding);
	void clear_attachments();

	void set_push_constants(std::span<const uint8_t> data);

	template<class T>
	void set_push_constants_value(const T& value)
	{
		set_push_constants(std::span{reinterpret_cast<const uint8_t*>(&value), sizeof(T)});
	}

	void dispatch(uint32_t x, uint32_t y, uint32_t z);
	void dispatch_indirect(const Buffer& buffer, uint64_t offset = 0);

	void end();

	[[nodiscard]] PassState							   state() const { return m_state; }
	[[nodiscard]] const std::vector<ComputePassQueue>& queued() const { return m_queue; }

private:
	friend class CommandBuffer;
	explicit ComputePass(CommandBuffer& commands);

	[[nodiscard]] const Shader& current_shader(const char* operation) const;
	void						enqueue(std::variant<DirectDispatch, IndirectDispatch> dispatch);

	CommandBuffer* m_commands;
	PassState	   m_state = PassState::Configuring;
	int			   m_exceptions;

	std::optional<Shader>		   m_shader;
	std::optional<ComputePipeline> m_pipeline;
	BindingSet					   m_attachments;
	std::vector<uint8_t>		   m_push_constants;

	std::vector<ComputePassQueue> m_queue;
};

} // namespace est

#endif // ESTRENDER_COMPUTEPASS_HPP
