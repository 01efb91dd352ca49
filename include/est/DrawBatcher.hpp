//
// Created by chris on 1/15/26.
//

#ifndef ESTRENDER_DRAWBATCHER_HPP
#define ESTRENDER_DRAWBATCHER_HPP
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include "GpuTypes.hpp"
#include "Shader.hpp"
#include "Texture.hpp"

namespace est
{

/// Vertex layout of the drawing shader: position, color, uv. 36 bytes, tightly packed.
struct DrawVertex
{
	glm::vec3 position;
	glm::vec4 color;
	glm::vec2 uv;
};

static_assert(sizeof(DrawVertex) == 36);

/// Render state a queue was recorded with. Texture, sampler and shader compare by identity.
struct DrawState
{
	std::optional<Texture>	   texture;
	std::optional<Sampler>	   sampler;
	std::optional<Shader>	   shader;
	BlendState				   blend = BlendState::alpha_blending();
	std::optional<ScissorRect> scissor;
	std::optional<Viewport>	   viewport;

	bool operator==(const DrawState&) const = default;
};

/// Run of consecutive indices drawn with one state.
struct DrawingQueue
{
	DrawState state;
	uint32_t  start_index;
	uint32_t  index_count;
};

/**
 * @brief CPU side geometry accumulator of the immediate mode drawing API
 *
 * Shapes are expanded into one growing vertex and index list in pixel coordinates.
 * Consecutive shapes recorded with the same DrawState extend the current queue,
 * any change starts a new one. Shapes without an image are recorded without a texture.
 */
class DrawBatcher
{
public:
	/// Also leaves the atlas item selected by set_texture_atlas.
	void set_texture(std::optional<Texture> texture, std::optional<Sampler> sampler = std::nullopt);
	/// Sub rectangle (u0, v0, u1, v1) of the texture used by image shapes. Defaults to the whole texture.
	/// Relative to the atlas item while one is selected.
	void set_texture_uv(std::optional<glm::vec4> uv);
	/// Bind the atlas texture and restrict image shapes to the item. Fatal (InvalidUsage) for an unknown id.
	void set_texture_atlas(const TextureAtlas& atlas, std::string_view id,
						   std::optional<Sampler> sampler = std::nullopt);
	/// Uv rectangle image shapes sample: the explicit rectangle mapped into the atlas item.
	[[nodiscard]] glm::vec4 absolute_uv() const;
	void set_shader(std::optional<Shader> shader);
	void set_blend(const BlendState& blend);
	void set_scissor(std::optional<ScissorRect> scissor);
	void set_viewport(std::optional<Viewport> viewport);

	void rectangle(glm::vec2 position, glm::vec2 size, float thickness, const glm::vec4& color);
	void rectangle_filled(glm::vec2 position, glm::vec2 size, const glm::vec4& color);
	/// Corner colors in the order top left, top right, bottom right, bottom left.
	void rectangle_filled(glm::vec2 position, glm::vec2 size, const glm::vec4& top_left, const glm::vec4& top_right,
						  const glm::vec4& bottom_right, const glm::vec4& bottom_left);
	void line(glm::vec2 a, glm::vec2 b, float thickness, const glm::vec4& color);
	void triangle(glm::vec2 a, glm::vec2 b, glm::vec2 c, float thickness, const glm::vec4& color);
	void triangle_filled(glm::vec2 a, glm::vec2 b, glm::vec2 c, const glm::vec4& color);
	void circle(glm::vec2 center, float radius, uint32_t segments, float thickness, const glm::vec4& color);
	void circle_filled(glm::vec2 center, float radius, uint32_t segments, const glm::vec4& color);

	/// Textured rectangle using the current texture and uv rectangle.
	void image(glm::vec2 position, glm::vec2 size, const glm::vec4& tint = glm::vec4{1.0f});
	void image_triangle(glm::vec2 a, glm::vec2 b, glm::vec2 c, const glm::vec4& tint = glm::vec4{1.0f});
	void image_circle(glm::vec2 center, float radius, uint32_t segments, const glm::vec4& tint = glm::vec4{1.0f});

	/**
	 * @brief Append raw geometry with indices local to vertices
	 *
	 * The uv of every vertex is replaced by its position normalized into the bounding box
	 * of the draw, remapped into absolute_uv() for textured geometry. Empty input is
	 * ignored, geometry with an index past the vertices is dropped with an error.
	 */
	void push_geometry(std::span<DrawVertex> vertices, std::span<const uint32_t> indices, bool textured);

	/// Close the open queue and return every queue recorded so far.
	[[nodiscard]] const std::vector<DrawingQueue>& finish();

	[[nodiscard]] const std::vector<DrawVertex>&   vertices() const { return m_vertices; }
	[[nodiscard]] const std::vector<uint32_t>&	   indices() const { return m_indices; }
	[[nodiscard]] const std::vector<DrawingQueue>& queues() const { return m_queues; }
	[[nodiscard]] const std::optional<DrawingQueue>& current_queue() const { return m_current; }
	[[nodiscard]] bool								 empty() const { return m_vertices.empty(); }

	void clear();

private:
	void push_queue(uint32_t index_count, bool textured);
	/// Closed polyline through points, one quad per edge.
	void push_outline(std::span<const glm::vec2> points, float thickness, const glm::vec4& color);
	/// Center vertex followed by segments rim vertices, triangles (0, i + 1, (i + 1) % segments + 1).
	void push_fan(glm::vec2 center, float radius, uint32_t segments, const glm::vec4& color, bool textured);

	DrawState				   m_state;
	std::optional<glm::vec4>   m_uv;
	std::optional<glm::vec4>   m_atlas_uv;
	std::vector<DrawVertex>	   m_vertices;
	std::vector<uint32_t>	   m_indices;
	std::optional<DrawingQueue> m_current;
	std::vector<DrawingQueue>  m_queues;
};

/// Expand a segment of the given thickness into a quad [a+p, b+p, b-p, a-p]. Empty for zero length.
[[nodiscard]] std::optional<std::array<glm::vec2, 4>> expand_line(glm::vec2 a, glm::vec2 b, float thickness);

[[nodiscard]] glm::vec4 linear_to_srgb(const glm::vec4& color);

} // namespace est

#endif // ESTRENDER_DRAWBATCHER_HPP
