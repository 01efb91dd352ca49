//
// Created by chris on 1/14/26.
//

#ifndef ESTRENDER_RENDERPASS_HPP
#define ESTRENDER_RENDERPASS_HPP
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <variant>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include "BindGroup.hpp"
#include "Buffer.hpp"
#include "CommandBuffer.hpp"
#include "Error.hpp"
#include "GpuObjects.hpp"
#include "Pipeline.hpp"
#include "Shader.hpp"
#include "Texture.hpp"

namespace est
{

class DrawingContext;

enum class PassState
{
	Configuring,
	Recording,
	Ended,
};

struct ColorTarget
{
	Texture					  texture;
	std::optional<BlendState> blend;
	ColorWrite				  write_mask = ColorWrite::All;
};

struct DirectDraw
{
	uint32_t first;
	uint32_t count;
	int32_t	 base_vertex;
	uint32_t instances;
};

struct IndirectDraw
{
	Buffer	 buffer;
	uint64_t offset;
};

/// One recorded draw with a snapshot of the state it needs.
struct RenderPassQueue
{
	PipelinePtr						pipeline;
	BindGroupPtr					bind_groups;
	std::optional<Buffer>			vertex;
	std::optional<Buffer>			index;
	std::optional<IndexFormat>		index_format;
	std::optional<Viewport>			viewport;
	std::optional<ScissorRect>		scissor;
	std::variant<DirectDraw, IndirectDraw> draw;
	std::vector<uint8_t>			push_constants;
	ShaderStageFlags				push_stages = ShaderStageFlags::None;
};

/**
 * @brief Render pass in immediate mode or with a prebuilt RenderPipeline
 *
 * Draw calls are validated and queued, end() replays the queue into the command
 * buffer. A pass that goes out of scope is ended automatically unless an exception
 * is unwinding, in which case it is abandoned and nothing is recorded.
 *
 * Usage contract violations (missing shader or buffers, mismatched attachments,
 * ending twice) are fatal and throw UsageError.
 */
class RenderPass
{
public:
	RenderPass(RenderPass&& other) noexcept;
	RenderPass& operator=(RenderPass&&) = delete;
	~RenderPass() noexcept(false);

	/// Immediate mode. Clears a pipeline set earlier, keeps the attachments.
	void set_shader(const Shader& shader);
	void set_shader(const Shader& shader, const PrimitiveState& primitive);
	/// Pipeline mode. Attachments come from the pipeline and cannot be changed.
	void set_pipeline(const RenderPipeline& pipeline);

	/// Blend of color target index, nullopt disables blending.
	void set_blend(std::size_t index, std::optional<BlendState> blend);

	void set_attachment_uniform(uint32_t group, uint32_t binding, const Buffer& buffer);
	void set_attachment_storage(uint32_t group, uint32_t binding, const Buffer& buffer);
	void set_attachment_texture(uint32_t group, uint32_t binding, const Texture& texture);
	void set_attachment_texture_storage(uint32_t group, uint32_t binding, const Texture& texture);
	void set_attachment_sampler(uint32_t group, uint32_t binding, const Sampler& sampler);
	void remove_attachment(uint32_t group, uint32_t binding);
	void clear_attachments();

	void set_vertex_buffer(std::optional<Buffer> buffer);
	void set_index_buffer(std::optional<Buffer> buffer);
	/// Overrides the index format of the shader primitive state, nullopt restores it.
	void set_index_format(std::optional<IndexFormat> format);
	[[nodiscard]] const std::optional<IndexFormat>& index_format() const { return m_index_format_override; }

	/// Zero padded to a multiple of 4 bytes. Fatal when the shader declares no push constants or a smaller range.
	/// The check is repeated on every draw, so switching to an incompatible shader needs set_push_constants({}).
	void set_push_constants(std::span<const uint8_t> data);

	template<class T>
	void set_push_constants_value(const T& value)
	{
		set_push_constants(std::span{reinterpret_cast<const uint8_t*>(&value), sizeof(T)});
	}

	/// nullopt covers the whole target. The scissor is clipped to the target when replayed.
	void set_viewport(std::optional<Viewport> viewport);
	void set_scissor(std::optional<ScissorRect> scissor);
	[[nodiscard]] const std::optional<Viewport>&	viewport() const { return m_viewport; }
	[[nodiscard]] const std::optional<ScissorRect>& scissor() const { return m_scissor; }

	void draw(uint32_t first_vertex, uint32_t vertex_count, uint32_t instances = 1);
	void draw_indexed(uint32_t first_index, uint32_t index_count, int32_t base_vertex = 0, uint32_t instances = 1);
	void draw_indirect(const Buffer& buffer, uint64_t offset = 0);
	void draw_indexed_indirect(const Buffer& buffer, uint64_t offset = 0);

	/// Batched 2D drawing into this pass. The pass must outlive the returned context.
	[[nodiscard]] DrawingContext begin_drawing();

	/// Replay the queue into the command buffer. Fatal the second time.
	void end();

	[[nodiscard]] PassState							state() const { return m_state; }
	[[nodiscard]] glm::uvec2						size() const { return m_size; }
	[[nodiscard]] const std::vector<ColorTarget>&	color_targets() const { return m_targets; }
	[[nodiscard]] const std::vector<RenderPassQueue>& queued() const { return m_queue; }
	[[nodiscard]] GraphicsContext&					context() const;

private:
	friend class RenderPassBuilder;
	RenderPass(CommandBuffer& commands, glm::uvec2 size);

	struct Resolved
	{
		PipelinePtr				   pipeline;
		BindGroupPtr			   bind_groups;
		std::optional<IndexFormat> index_format;
		bool					   needs_vertex_buffer;
	};

	[[nodiscard]] const Shader& current_shader(const char* operation) const;
	void						attach(BindGroupAttachment attachment);
	[[nodiscard]] bool			is_degenerate() const;
	void						check_buffers(bool indexed) const;
	[[nodiscard]] Resolved		resolve() const;
	void						enqueue(bool indexed, std::variant<DirectDraw, IndirectDraw> draw);
	void						replay();

	CommandBuffer*		  m_commands;
	glm::uvec2			  m_size;
	PassState			  m_state = PassState::Configuring;
	int					  m_exceptions;

	std::vector<ColorTarget>		m_targets;
	std::vector<Texture>			m_msaa_targets;
	std::optional<uint32_t>			m_msaa_count;
	std::optional<Texture>			m_depth;
	std::optional<glm::vec4>		m_clear_color;

	std::optional<Shader>		  m_shader;
	std::optional<PrimitiveState> m_primitive;
	std::optional<RenderPipeline> m_pipeline;
	std::optional<IndexFormat>	  m_index_format_override;
	BindingSet					  m_attachments;

	std::optional<Buffer>	   m_vertex;
	std::optional<Buffer>	   m_index;
	std::vector<uint8_t>	   m_push_constants;
	std::optional<Viewport>	   m_viewport;
	std::optional<ScissorRect> m_scissor;

	std::vector<RenderPassQueue> m_queue;
};

/**
 * @brief Validates the targets of a render pass
 *
 * Color targets must be single sampled render attachments of one size. MSAA targets
 * must be multisampled render attachments sharing one sample count, the depth target a
 * Depth32Float or Depth24PlusStencil8 render attachment. All build errors are returned.
 */
class RenderPassBuilder
{
public:
	explicit RenderPassBuilder(CommandBuffer& commands);

	RenderPassBuilder& add_color_attachment(const Texture& texture, std::optional<BlendState> blend = std::nullopt);
	RenderPassBuilder& add_msaa_attachment(const Texture& texture);
	RenderPassBuilder& set_depth_attachment(const Texture& texture);
	/// Color targets are cleared when the alpha is above 0, loaded otherwise. Defaults to opaque black.
	RenderPassBuilder& set_clear_color(std::optional<glm::vec4> color);

	[[nodiscard]] std::expected<RenderPass, Error> build() const;

private:
	CommandBuffer*			 m_commands;
	std::vector<ColorTarget> m_colors;
	std::vector<Texture>	 m_msaa;
	std::optional<Texture>	 m_depth;
	std::optional<glm::vec4> m_clear_color = glm::vec4{0.0f, 0.0f, 0.0f, 1.0f};
};

} // namespace est

#endif // ESTRENDER_RENDERPASS_HPP
