//
// Created by chris on 1/16/26.
//

#ifndef ESTRENDER_TEST_RECORDINGDEVICE_HPP
#define ESTRENDER_TEST_RECORDINGDEVICE_HPP
#include <algorithm>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <est/Error.hpp>
#include <est/GpuDevice.hpp>

namespace est::test
{

// ============================================================================
// Recorded commands
// ============================================================================

struct BeginRenderPass
{
	RenderPassDescriptor descriptor;
};
struct EndRenderPass
{};
struct BeginComputePass
{};
struct EndComputePass
{};
struct SetPipeline
{
	PipelineHandle pipeline;
};
struct SetBindGroup
{
	uint32_t		group;
	BindGroupHandle bind_group;
};
struct SetVertexBuffer
{
	uint32_t	 slot;
	BufferHandle buffer;
	uint64_t	 offset;
};
struct SetIndexBuffer
{
	BufferHandle buffer;
	IndexFormat	 format;
	uint64_t	 offset;
};
struct SetPushConstants
{
	ShaderStageFlags	 stages;
	uint32_t			 offset;
	std::vector<uint8_t> data;
};
struct SetViewport
{
	Viewport viewport;
};
struct SetScissor
{
	ScissorRect scissor;
};
struct Draw
{
	uint32_t vertex_count;
	uint32_t instance_count;
	uint32_t first_vertex;
	uint32_t first_instance;
};
struct DrawIndexed
{
	uint32_t index_count;
	uint32_t instance_count;
	uint32_t first_index;
	int32_t	 base_vertex;
	uint32_t first_instance;
};
struct DrawIndirect
{
	BufferHandle buffer;
	uint64_t	 offset;
	bool		 indexed;
};
struct Dispatch
{
	uint32_t x;
	uint32_t y;
	uint32_t z;
};
struct DispatchIndirect
{
	BufferHandle buffer;
	uint64_t	 offset;
};
struct CopyBufferToBuffer
{
	BufferHandle src;
	uint64_t	 src_offset;
	BufferHandle dst;
	uint64_t	 dst_offset;
	uint64_t	 size;
};
struct CopyTextureToBuffer
{
	TextureHandle src;
	BufferHandle  dst;
};
struct CopyBufferToTexture
{
	BufferHandle  src;
	TextureHandle dst;
};

using Command = std::variant<BeginRenderPass, EndRenderPass, BeginComputePass, EndComputePass, SetPipeline,
							 SetBindGroup, SetVertexBuffer, SetIndexBuffer, SetPushConstants, SetViewport, SetScissor,
							 Draw, DrawIndexed, DrawIndirect, Dispatch, DispatchIndirect, CopyBufferToBuffer,
							 CopyTextureToBuffer, CopyBufferToTexture>;

/// Position of T among the Command alternatives.
template<class T>
std::size_t command_index()
{
	return Command{std::in_place_type<T>}.index();
}

inline std::vector<std::size_t> command_indices(const std::vector<Command>& commands)
{
	std::vector<std::size_t> out;
	out.reserve(commands.size());
	for (const auto& command : commands)
	{
		out.push_back(command.index());
	}
	return out;
}

class RecordingCommandList final : public CommandList
{
public:
	void begin_render_pass(const RenderPassDescriptor& descriptor) override { record(BeginRenderPass{descriptor}); }
	void end_render_pass() override { record(EndRenderPass{}); }
	void begin_compute_pass() override { record(BeginComputePass{}); }
	void end_compute_pass() override { record(EndComputePass{}); }

	void set_pipeline(PipelineHandle pipeline) override { record(SetPipeline{pipeline}); }
	void set_bind_group(uint32_t group, BindGroupHandle bind_group) override { record(SetBindGroup{group, bind_group}); }
	void set_vertex_buffer(uint32_t slot, BufferHandle buffer, uint64_t offset) override
	{
		record(SetVertexBuffer{slot, buffer, offset});
	}
	void set_index_buffer(BufferHandle buffer, IndexFormat format, uint64_t offset) override
	{
		record(SetIndexBuffer{buffer, format, offset});
	}
	void set_push_constants(ShaderStageFlags stages, uint32_t offset, std::span<const uint8_t> data) override
	{
		record(SetPushConstants{stages, offset, {data.begin(), data.end()}});
	}
	void set_viewport(const Viewport& viewport) override { record(SetViewport{viewport}); }
	void set_scissor(const ScissorRect& scissor) override { record(SetScissor{scissor}); }
	void draw(uint32_t vertex_count, uint32_t instance_count, uint32_t first_vertex, uint32_t first_instance) override
	{
		record(Draw{vertex_count, instance_count, first_vertex, first_instance});
	}
	void draw_indexed(uint32_t index_count, uint32_t instance_count, uint32_t first_index, int32_t base_vertex,
					  uint32_t first_instance) override
	{
		record(DrawIndexed{index_count, instance_count, first_index, base_vertex, first_instance});
	}
	void draw_indirect(BufferHandle buffer, uint64_t offset) override { record(DrawIndirect{buffer, offset, false}); }
	void draw_indexed_indirect(BufferHandle buffer, uint64_t offset) override
	{
		record(DrawIndirect{buffer, offset, true});
	}
	void dispatch(uint32_t x, uint32_t y, uint32_t z) override { record(Dispatch{x, y, z}); }
	void dispatch_indirect(BufferHandle buffer, uint64_t offset) override { record(DispatchIndirect{buffer, offset}); }

	void copy_buffer_to_buffer(BufferHandle src, uint64_t src_offset, BufferHandle dst, uint64_t dst_offset,
							   uint64_t size) override
	{
		record(CopyBufferToBuffer{src, src_offset, dst, dst_offset, size});
	}
	void copy_texture_to_buffer(TextureHandle src, BufferHandle dst) override { record(CopyTextureToBuffer{src, dst}); }
	void copy_buffer_to_texture(BufferHandle src, TextureHandle dst) override { record(CopyBufferToTexture{src, dst}); }

	[[nodiscard]] const std::vector<Command>& commands() const { return m_commands; }

private:
	void record(Command command) { m_commands.push_back(std::move(command)); }

	std::vector<Command> m_commands;
};

// ============================================================================
// Device
// ============================================================================

struct CreationCounts
{
	uint32_t buffers			= 0;
	uint32_t textures			= 0;
	uint32_t samplers			= 0;
	uint32_t shader_modules		= 0;
	uint32_t bind_group_layouts = 0;
	uint32_t pipeline_layouts	= 0;
	uint32_t render_pipelines	= 0;
	uint32_t compute_pipelines	= 0;
	uint32_t bind_groups		= 0;
};

/**
 * @brief GpuDevice that keeps everything in memory
 *
 * Buffer and texture content lives in byte vectors so uploads and readbacks round trip.
 * Submitted command lists are executed for their copies and appended to submitted().
 */
class RecordingDevice final : public GpuDevice
{
public:
	BufferHandle create_buffer(const BufferDescriptor& descriptor) override
	{
		maybe_fail("buffer");
		++m_created.buffers;
		auto id = next_id();
		m_buffers[id] = StoredBuffer{.descriptor = descriptor, .data = std::vector<uint8_t>(descriptor.size, 0)};
		return BufferHandle{id};
	}

	BufferHandle create_buffer_with_data(const BufferDescriptor& descriptor, std::span<const uint8_t> data) override
	{
		auto handle = create_buffer(descriptor);
		auto& bytes = m_buffers.at(handle.id).data;
		std::copy_n(data.begin(), std::min<std::size_t>(data.size(), bytes.size()), bytes.begin());
		return handle;
	}

	TextureHandle create_texture(const TextureDescriptor& descriptor) override
	{
		maybe_fail("texture");
		++m_created.textures;
		auto id = next_id();
		auto size = static_cast<std::size_t>(descriptor.width) * descriptor.height * bytes_per_pixel(descriptor.format);
		m_textures[id] = StoredTexture{.descriptor = descriptor, .data = std::vector<uint8_t>(size, 0)};
		return TextureHandle{id};
	}

	SamplerHandle create_sampler(const SamplerDescriptor& descriptor) override
	{
		maybe_fail("sampler");
		++m_created.samplers;
		auto id = next_id();
		m_samplers[id] = descriptor;
		return SamplerHandle{id};
	}

	ShaderModuleHandle create_shader_module(const ShaderModuleDescriptor& descriptor) override
	{
		maybe_fail("shader module");
		++m_created.shader_modules;
		auto id = next_id();
		m_shader_modules[id] = descriptor.label;
		return ShaderModuleHandle{id};
	}

	BindGroupLayoutHandle create_bind_group_layout(const BindGroupLayoutDescriptor& descriptor) override
	{
		maybe_fail("bind group layout");
		++m_created.bind_group_layouts;
		auto id = next_id();
		m_bind_group_layouts[id] = descriptor.entries;
		return BindGroupLayoutHandle{id};
	}

	PipelineLayoutHandle create_pipeline_layout(const PipelineLayoutDescriptor& descriptor) override
	{
		maybe_fail("pipeline layout");
		++m_created.pipeline_layouts;
		auto id = next_id();
		m_pipeline_layouts[id] = descriptor;
		return PipelineLayoutHandle{id};
	}

	PipelineHandle create_render_pipeline(const RenderPipelineDescriptor& descriptor) override
	{
		maybe_fail("render pipeline");
		++m_created.render_pipelines;
		auto id = next_id();
		m_render_pipelines[id] = descriptor;
		return PipelineHandle{id};
	}

	PipelineHandle create_compute_pipeline(const ComputePipelineDescriptor& descriptor) override
	{
		maybe_fail("compute pipeline");
		++m_created.compute_pipelines;
		auto id = next_id();
		m_compute_pipelines[id] = descriptor;
		return PipelineHandle{id};
	}

	BindGroupHandle create_bind_group(const BindGroupDescriptor& descriptor) override
	{
		maybe_fail("bind group");
		++m_created.bind_groups;
		auto id = next_id();
		m_bind_groups[id] = descriptor;
		return BindGroupHandle{id};
	}

	void destroy(BufferHandle handle) override { release(m_buffers, handle.id); }
	void destroy(TextureHandle handle) override { release(m_textures, handle.id); }
	void destroy(SamplerHandle handle) override { release(m_samplers, handle.id); }
	void destroy(ShaderModuleHandle handle) override { release(m_shader_modules, handle.id); }
	void destroy(BindGroupLayoutHandle handle) override { release(m_bind_group_layouts, handle.id); }
	void destroy(PipelineLayoutHandle handle) override { release(m_pipeline_layouts, handle.id); }
	void destroy(PipelineHandle handle) override
	{
		if (m_render_pipelines.contains(handle.id))
			release(m_render_pipelines, handle.id);
		else
			release(m_compute_pipelines, handle.id);
	}
	void destroy(BindGroupHandle handle) override { release(m_bind_groups, handle.id); }

	std::unique_ptr<CommandList> create_command_list() override { return std::make_unique<RecordingCommandList>(); }

	void submit(CommandList& commands) override
	{
		maybe_fail("submission");
		const auto& recorded = dynamic_cast<RecordingCommandList&>(commands).commands();
		for (const auto& command : recorded)
		{
			execute(command);
			m_submitted.push_back(command);
		}
		++m_submissions;
	}

	void wait_idle(std::chrono::nanoseconds) override
	{
		if (m_time_out)
		{
			throw DeviceTimeoutError("Recording device timed out on purpose");
		}
		++m_waits;
	}

	void write_buffer(BufferHandle buffer, uint64_t offset, std::span<const uint8_t> data) override
	{
		auto& bytes = m_buffers.at(buffer.id).data;
		std::copy(data.begin(), data.end(), bytes.begin() + static_cast<std::ptrdiff_t>(offset));
		++m_buffer_writes;
	}

	void write_texture(TextureHandle texture, std::span<const uint8_t> data) override
	{
		m_textures.at(texture.id).data.assign(data.begin(), data.end());
	}

	std::vector<uint8_t> map_read(BufferHandle buffer, uint64_t size, std::chrono::nanoseconds) override
	{
		const auto& stored = m_buffers.at(buffer.id);
		if (!has_flag(stored.descriptor.usage, BufferUsage::MapRead))
		{
			throw DeviceError("Buffer is not mappable for reading");
		}
		return {stored.data.begin(), stored.data.begin() + static_cast<std::ptrdiff_t>(size)};
	}

	[[nodiscard]] DeviceLimits limits() const override { return {}; }

	// ========================================================================
	// Inspection
	// ========================================================================

	[[nodiscard]] const CreationCounts&		  created() const { return m_created; }
	[[nodiscard]] const std::vector<Command>& submitted() const { return m_submitted; }
	[[nodiscard]] uint32_t					  submissions() const { return m_submissions; }
	[[nodiscard]] uint32_t					  waits() const { return m_waits; }
	[[nodiscard]] uint32_t					  buffer_writes() const { return m_buffer_writes; }
	[[nodiscard]] std::size_t				  destroyed() const { return m_destroyed; }

	[[nodiscard]] std::size_t live_objects() const
	{
		return m_buffers.size() + m_textures.size() + m_samplers.size() + m_shader_modules.size() +
			   m_bind_group_layouts.size() + m_pipeline_layouts.size() + m_render_pipelines.size() +
			   m_compute_pipelines.size() + m_bind_groups.size();
	}

	[[nodiscard]] bool is_live(BufferHandle handle) const { return m_buffers.contains(handle.id); }
	[[nodiscard]] bool is_live(PipelineHandle handle) const
	{
		return m_render_pipelines.contains(handle.id) || m_compute_pipelines.contains(handle.id);
	}
	[[nodiscard]] bool is_live(BindGroupHandle handle) const { return m_bind_groups.contains(handle.id); }

	[[nodiscard]] const std::vector<uint8_t>& buffer_data(BufferHandle handle) const
	{
		return m_buffers.at(handle.id).data;
	}
	[[nodiscard]] const std::vector<uint8_t>& texture_data(TextureHandle handle) const
	{
		return m_textures.at(handle.id).data;
	}
	[[nodiscard]] const RenderPipelineDescriptor& render_pipeline(PipelineHandle handle) const
	{
		return m_render_pipelines.at(handle.id);
	}
	[[nodiscard]] const BindGroupDescriptor& bind_group(BindGroupHandle handle) const
	{
		return m_bind_groups.at(handle.id);
	}

	template<class T>
	[[nodiscard]] std::vector<T> submitted_of() const
	{
		std::vector<T> out;
		for (const auto& command : m_submitted)
		{
			if (const auto* typed = std::get_if<T>(&command))
				out.push_back(*typed);
		}
		return out;
	}

	template<class T>
	[[nodiscard]] std::size_t count() const
	{
		return static_cast<std::size_t>(std::ranges::count_if(
			m_submitted, [](const Command& command) { return std::holds_alternative<T>(command); }));
	}

	/// The next object creation or submission throws DeviceError.
	void fail_next() { m_fail_next = true; }
	/// Every wait_idle throws DeviceTimeoutError from now on.
	void set_time_out(bool time_out) { m_time_out = time_out; }
	void clear_submitted() { m_submitted.clear(); }

private:
	struct StoredBuffer
	{
		BufferDescriptor	 descriptor;
		std::vector<uint8_t> data;
	};

	struct StoredTexture
	{
		TextureDescriptor	 descriptor;
		std::vector<uint8_t> data;
	};

	uint64_t next_id() { return m_next_id++; }

	void maybe_fail(const char* what)
	{
		if (m_fail_next)
		{
			m_fail_next = false;
			throw DeviceError(fmt::format("Recording device refused to create a {}", what));
		}
	}

	template<class Map>
	void release(Map& objects, uint64_t id)
	{
		if (objects.erase(id) > 0)
			++m_destroyed;
	}

	void execute(const Command& command)
	{
		if (const auto* copy = std::get_if<CopyBufferToBuffer>(&command))
		{
			const auto& src = m_buffers.at(copy->src.id).data;
			auto&		dst = m_buffers.at(copy->dst.id).data;
			std::memcpy(dst.data() + copy->dst_offset, src.data() + copy->src_offset, copy->size);
		} else if (const auto* readback = std::get_if<CopyTextureToBuffer>(&command))
		{
			const auto& src = m_textures.at(readback->src.id).data;
			auto&		dst = m_buffers.at(readback->dst.id).data;
			std::copy_n(src.begin(), std::min(src.size(), dst.size()), dst.begin());
		} else if (const auto* upload = std::get_if<CopyBufferToTexture>(&command))
		{
			const auto& src = m_buffers.at(upload->src.id).data;
			auto&		dst = m_textures.at(upload->dst.id).data;
			std::copy_n(src.begin(), std::min(src.size(), dst.size()), dst.begin());
		}
	}

	uint64_t	   m_next_id = 1;
	CreationCounts m_created;
	std::size_t	   m_destroyed	   = 0;
	uint32_t	   m_submissions   = 0;
	uint32_t	   m_waits		   = 0;
	uint32_t	   m_buffer_writes = 0;
	bool		   m_fail_next	   = false;
	bool		   m_time_out	   = false;

	std::map<uint64_t, StoredBuffer>							m_buffers;
	std::map<uint64_t, StoredTexture>							m_textures;
	std::map<uint64_t, SamplerDescriptor>						m_samplers;
	std::map<uint64_t, std::string>								m_shader_modules;
	std::map<uint64_t, std::vector<BindGroupLayoutEntry>>		m_bind_group_layouts;
	std::map<uint64_t, PipelineLayoutDescriptor>				m_pipeline_layouts;
	std::map<uint64_t, RenderPipelineDescriptor>				m_render_pipelines;
	std::map<uint64_t, ComputePipelineDescriptor>				m_compute_pipelines;
	std::map<uint64_t, BindGroupDescriptor>						m_bind_groups;
	std::vector<Command>										m_submitted;
};

} // namespace est::test

#endif // ESTRENDER_TEST_RECORDINGDEVICE_HPP
