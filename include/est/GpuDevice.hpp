//
// Created by chris on 1/10/26.
//

#ifndef ESTRENDER_GPUDEVICE_HPP
#define ESTRENDER_GPUDEVICE_HPP
#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <glm/vec4.hpp>

#include "GpuTypes.hpp"
#include "ShaderTypes.hpp"

namespace est
{

// ============================================================================
// Object Descriptors
// ============================================================================

struct BufferDescriptor
{
	std::string label;
	uint64_t	size;
	BufferUsage usage;
	bool		mapped_at_creation = false;
};

struct TextureDescriptor
{
	std::string	  label;
	uint32_t	  width;
	uint32_t	  height;
	TextureFormat format;
	uint32_t	  sample_count = 1;
	TextureUsage  usage;
};

struct SamplerDescriptor
{
	std::string					   label;
	FilterMode					   mag_filter	 = FilterMode::Linear;
	FilterMode					   min_filter	 = FilterMode::Linear;
	AddressMode					   address_u	 = AddressMode::ClampToEdge;
	AddressMode					   address_v	 = AddressMode::ClampToEdge;
	AddressMode					   address_w	 = AddressMode::ClampToEdge;
	std::optional<CompareFunction> compare		 = std::nullopt;
	float						   max_anisotropy = 1.0f;

	bool operator==(const SamplerDescriptor&) const = default;
};

struct ShaderModuleDescriptor
{
	std::string				 label;
	std::span<const uint8_t> spirv;
};

struct BindGroupLayoutEntry
{
	uint32_t		 binding;
	BindingType		 type;
	ShaderStageFlags visibility;
};

struct BindGroupLayoutDescriptor
{
	std::string						  label;
	std::vector<BindGroupLayoutEntry> entries;
};

struct PushConstantRange
{
	ShaderStageFlags stages;
	uint32_t		 size;
};

struct PipelineLayoutDescriptor
{
	std::string label;
	/// (group, layout) pairs sorted by group. Gaps are filled with empty layouts by the backend.
	std::vector<std::pair<uint32_t, BindGroupLayoutHandle>> bind_group_layouts;
	std::optional<PushConstantRange>						push_constants;
};

struct VertexBufferLayout
{
	uint64_t					 stride;
	std::vector<VertexAttribute> attributes;
};

struct ColorTargetState
{
	TextureFormat			  format;
	std::optional<BlendState> blend;
	ColorWrite				  write_mask = ColorWrite::All;
};

struct DepthStencilState
{
	TextureFormat	format;
	bool			depth_write = true;
	CompareFunction compare		= CompareFunction::Less;
};

struct RenderPipelineDescriptor
{
	std::string						  label;
	PipelineLayoutHandle			  layout;
	ShaderModuleHandle				  vertex_module;
	std::string						  vertex_entry_point;
	ShaderModuleHandle				  fragment_module;
	std::string						  fragment_entry_point;
	std::optional<VertexBufferLayout> vertex_buffer;
	PrimitiveState					  primitive;
	std::vector<ColorTargetState>	  targets;
	std::optional<DepthStencilState>  depth_stencil;
	uint32_t						  sample_count = 1;
};

struct ComputePipelineDescriptor
{
	std::string			 label;
	PipelineLayoutHandle layout;
	ShaderModuleHandle	 module;
	std::string			 entry_point;
};

struct BufferBinding
{
	BufferHandle buffer;
	uint64_t	 offset = 0;
	uint64_t	 size;
};

using BindGroupResource = std::variant<BufferBinding, TextureHandle, SamplerHandle>;

struct BindGroupEntry
{
	uint32_t		  binding;
	BindGroupResource resource;
};

struct BindGroupDescriptor
{
	std::string					label;
	BindGroupLayoutHandle		layout;
	std::vector<BindGroupEntry> entries;
};

// ============================================================================
// Command Recording
// ============================================================================

struct ColorAttachmentDescriptor
{
	TextureHandle			 view;
	TextureHandle			 resolve_target;
	std::optional<glm::vec4> clear;
};

struct DepthAttachmentDescriptor
{
	TextureHandle		 view;
	std::optional<float> clear;
};

struct RenderPassDescriptor
{
	std::string								 label;
	uint32_t								 width;
	uint32_t								 height;
	std::vector<ColorAttachmentDescriptor>	 color_attachments;
	std::optional<DepthAttachmentDescriptor> depth_attachment;
};

/**
 * @brief Backend command recorder
 *
 * Commands are recorded in call order and executed when the list is submitted
 * through GpuDevice::submit.
 */
class CommandList
{
public:
	virtual ~CommandList() = default;

	virtual void begin_render_pass(const RenderPassDescriptor& descriptor) = 0;
	virtual void end_render_pass()										   = 0;
	virtual void begin_compute_pass()									   = 0;
	virtual void end_compute_pass()										   = 0;

	virtual void set_pipeline(PipelineHandle pipeline)																 = 0;
	virtual void set_bind_group(uint32_t group, BindGroupHandle bind_group)											 = 0;
	virtual void set_vertex_buffer(uint32_t slot, BufferHandle buffer, uint64_t offset)								 = 0;
	virtual void set_index_buffer(BufferHandle buffer, IndexFormat format, uint64_t offset)							 = 0;
	virtual void set_push_constants(ShaderStageFlags stages, uint32_t offset, std::span<const uint8_t> data)		 = 0;
	virtual void set_viewport(const Viewport& viewport)																 = 0;
	virtual void set_scissor(const ScissorRect& scissor)															 = 0;
	virtual void draw(uint32_t vertex_count, uint32_t instance_count, uint32_t first_vertex, uint32_t first_instance) = 0;
	virtual void draw_indexed(uint32_t index_count, uint32_t instance_count, uint32_t first_index, int32_t base_vertex,
							  uint32_t first_instance)																 = 0;
	virtual void draw_indirect(BufferHandle buffer, uint64_t offset)												 = 0;
	virtual void draw_indexed_indirect(BufferHandle buffer, uint64_t offset)										 = 0;
	virtual void dispatch(uint32_t x, uint32_t y, uint32_t z)														 = 0;
	virtual void dispatch_indirect(BufferHandle buffer, uint64_t offset)											 = 0;

	virtual void copy_buffer_to_buffer(BufferHandle src, uint64_t src_offset, BufferHandle dst, uint64_t dst_offset,
									   uint64_t size)						  = 0;
	virtual void copy_texture_to_buffer(TextureHandle src, BufferHandle dst) = 0;
	virtual void copy_buffer_to_texture(BufferHandle src, TextureHandle dst) = 0;
};

struct DeviceLimits
{
	uint64_t min_copy_alignment		= 4;
	uint32_t max_push_constant_size = 128;
	uint32_t max_bind_groups		= 4;
	uint32_t max_texture_dimension	= 8192;
};

// ============================================================================
// Device
// ============================================================================

/**
 * @brief Graphics device consumed by the core
 *
 * Creation functions throw DeviceError when the backend refuses to create the object.
 * Every created object is released through the matching destroy overload.
 */
class GpuDevice
{
public:
	virtual ~GpuDevice() = default;

	virtual BufferHandle create_buffer(const BufferDescriptor& descriptor)													= 0;
	virtual BufferHandle create_buffer_with_data(const BufferDescriptor& descriptor, std::span<const uint8_t> data)			= 0;
	virtual TextureHandle create_texture(const TextureDescriptor& descriptor)												= 0;
	virtual SamplerHandle create_sampler(const SamplerDescriptor& descriptor)												= 0;
	virtual ShaderModuleHandle create_shader_module(const ShaderModuleDescriptor& descriptor)								= 0;
	virtual BindGroupLayoutHandle create_bind_group_layout(const BindGroupLayoutDescriptor& descriptor)						= 0;
	virtual PipelineLayoutHandle create_pipeline_layout(const PipelineLayoutDescriptor& descriptor)							= 0;
	virtual PipelineHandle create_render_pipeline(const RenderPipelineDescriptor& descriptor)								= 0;
	virtual PipelineHandle create_compute_pipeline(const ComputePipelineDescriptor& descriptor)								= 0;
	virtual BindGroupHandle create_bind_group(const BindGroupDescriptor& descriptor)										= 0;

	virtual void destroy(BufferHandle handle)		   = 0;
	virtual void destroy(TextureHandle handle)		   = 0;
	virtual void destroy(SamplerHandle handle)		   = 0;
	virtual void destroy(ShaderModuleHandle handle)	   = 0;
	virtual void destroy(BindGroupLayoutHandle handle) = 0;
	virtual void destroy(PipelineLayoutHandle handle)  = 0;
	virtual void destroy(PipelineHandle handle)		   = 0;
	virtual void destroy(BindGroupHandle handle)	   = 0;

	virtual std::unique_ptr<CommandList> create_command_list() = 0;
	virtual void						 submit(CommandList& commands) = 0;
	/// Block until all submitted work has finished. Throws DeviceError once timeout is exceeded.
	virtual void wait_idle(std::chrono::nanoseconds timeout) = 0;

	/// Upload through the queue. The destination needs CopyDst usage.
	virtual void write_buffer(BufferHandle buffer, uint64_t offset, std::span<const uint8_t> data) = 0;
	virtual void write_texture(TextureHandle texture, std::span<const uint8_t> data)				   = 0;
	/// Map a MapRead buffer, copy `size` bytes out and unmap it.
	virtual std::vector<uint8_t> map_read(BufferHandle buffer, uint64_t size, std::chrono::nanoseconds timeout) = 0;

	[[nodiscard]] virtual DeviceLimits limits() const = 0;
};

/**
 * @brief Move-only owner of a device object, destroys it on scope exit
 */
template<class H>
class OwnedHandle
{
public:
	OwnedHandle() = default;
	OwnedHandle(std::shared_ptr<GpuDevice> device, H handle)
		: m_device(std::move(device))
		, m_handle(handle)
	{}

	~OwnedHandle() { reset(); }

	OwnedHandle(const OwnedHandle&)			   = delete;
	OwnedHandle& operator=(const OwnedHandle&) = delete;

	OwnedHandle(OwnedHandle&& other) noexcept
		: m_device(std::move(other.m_device))
		, m_handle(std::exchange(other.m_handle, H{}))
	{}

	OwnedHandle& operator=(OwnedHandle&& other) noexcept
	{
		if (this != &other)
		{
			reset();
			m_device = std::move(other.m_device);
			m_handle = std::exchange(other.m_handle, H{});
		}
		return *this;
	}

	[[nodiscard]] H							get() const { return m_handle; }
	[[nodiscard]] const std::shared_ptr<GpuDevice>& device() const { return m_device; }
	explicit operator bool() const { return m_handle.valid(); }

	void reset()
	{
		if (m_device && m_handle)
		{
			m_device->destroy(m_handle);
		}
		m_handle = H{};
	}

private:
	std::shared_ptr<GpuDevice> m_device;
	H						   m_handle{};
};

} // namespace est

#endif // ESTRENDER_GPUDEVICE_HPP
