//
// Created by chris on 1/12/26.
//

#ifndef ESTRENDER_GRAPHICSCONTEXT_HPP
#define ESTRENDER_GRAPHICSCONTEXT_HPP
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string_view>

#include "Buffer.hpp"
#include "GpuDevice.hpp"
#include "GpuObjects.hpp"
#include "Shader.hpp"
#include "Texture.hpp"

namespace est
{

struct ContextConfig
{
	CacheConfig				 pipeline_cache	  = PIPELINE_CACHE_CONFIG;
	CacheConfig				 bind_group_cache = BIND_GROUP_CACHE_CONFIG;
	std::chrono::nanoseconds readback_timeout = std::chrono::seconds{5};
};

/// Byte range inside a shared geometry buffer.
struct GeometrySlice
{
	Buffer	 buffer;
	uint64_t offset;
};

/// Slang module on the SHADER_DIR search path used by DrawingContext when no shader is set.
constexpr std::string_view DRAWING_SHADER_MODULE = "drawing";

/**
 * @brief Owner of the device, both object caches and the drawing defaults
 *
 * Not thread-safe. cycle() must be called once per frame, it is the only path
 * that releases idle pipelines and bind groups.
 */
class GraphicsContext
{
public:
	explicit GraphicsContext(std::shared_ptr<GpuDevice> device, ContextConfig config = {});
	~GraphicsContext();

	GraphicsContext(const GraphicsContext&)			   = delete;
	GraphicsContext& operator=(const GraphicsContext&) = delete;
	GraphicsContext(GraphicsContext&&)				   = delete;
	GraphicsContext& operator=(GraphicsContext&&)	   = delete;

	[[nodiscard]] GpuDevice&						device() const { return *m_device; }
	[[nodiscard]] const std::shared_ptr<GpuDevice>& shared_device() const { return m_device; }
	[[nodiscard]] const ContextConfig&				config() const { return m_config; }

	[[nodiscard]] PipelineCache&  pipeline_cache() { return m_pipeline_cache; }
	[[nodiscard]] BindGroupCache& bind_group_cache() { return m_bind_group_cache; }

	/// Age both caches by one frame and drop idle entries. The drawing buffers are rewound
	/// once no command buffer is left unsubmitted.
	void cycle();

	/// 1x1 opaque white texture, created on first use.
	[[nodiscard]] const Texture& default_texture();
	/// Linear filtering, clamp to edge.
	[[nodiscard]] const Sampler& default_sampler();

	/// Shader used by DrawingContext for queues without one. Compiled from DRAWING_SHADER_MODULE on first use.
	[[nodiscard]] std::expected<Shader, Error> drawing_shader();
	void									   set_drawing_shader(Shader shader);

	/**
	 * @brief Reserve room in the grow-only geometry buffers shared by every drawing session
	 *
	 * Reservations are handed out back to back until the next cycle(), so several sessions
	 * can record into one command buffer. A cycle() while command buffers are still open
	 * defers the rewind until the last of them is submitted or dropped. A reservation that does not fit replaces the
	 * buffer with one at least twice as large.
	 */
	[[nodiscard]] GeometrySlice allocate_drawing_vertices(uint64_t size, uint64_t stride);
	[[nodiscard]] GeometrySlice allocate_drawing_indices(uint64_t size);

private:
	friend class CommandBuffer;
	void command_buffer_opened();
	void command_buffer_closed();
	void rewind_drawing();

	struct DrawingArena
	{
		std::optional<Buffer> buffer;
		uint64_t			  cursor = 0;
	};

	GeometrySlice allocate_drawing(DrawingArena& arena, uint64_t size, uint64_t alignment, BufferUsage usage,
								   const char* label);

	std::shared_ptr<GpuDevice> m_device;
	ContextConfig			   m_config;
	PipelineCache			   m_pipeline_cache;
	BindGroupCache			   m_bind_group_cache;

	std::optional<Texture> m_default_texture;
	std::optional<Sampler> m_default_sampler;
	std::optional<Shader>  m_drawing_shader;
	DrawingArena		   m_drawing_vertices;
	DrawingArena		   m_drawing_indices;
	uint64_t			   m_frame = 0;
	uint32_t			   m_open_command_buffers = 0;
	bool				   m_rewind_pending		  = false;
};

} // namespace est

#endif // ESTRENDER_GRAPHICSCONTEXT_HPP
