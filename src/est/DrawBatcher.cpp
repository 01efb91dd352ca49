//
// Created by chris on 1/15/26.
//
#include <est/DrawBatcher.hpp>
#include <est/Logger.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

#include <glm/common.hpp>
#include <glm/geometric.hpp>

namespace est
{

namespace
{

// ============================================================================
// Geometry helpers
// ============================================================================

float to_srgb_channel(float linear)
{
	linear = std::clamp(linear, 0.0f, 1.0f);
	if (linear <= 0.0031308f)
	{
		return linear * 12.92f;
	}
	return 1.055f * std::pow(linear, 1.0f / 2.4f) - 0.055f;
}

DrawVertex vertex(glm::vec2 position, const glm::vec4& color)
{
	return DrawVertex{.position = {position, 0.0f}, .color = color, .uv = {}};
}

std::vector<glm::vec2> circle_points(glm::vec2 center, float radius, uint32_t segments)
{
	std::vector<glm::vec2> points;
	points.reserve(segments);
	for (uint32_t i = 0; i < segments; ++i)
	{
		const float angle = 2.0f * std::numbers::pi_v<float> * static_cast<float>(i) / static_cast<float>(segments);
		points.emplace_back(center.x + radius * std::cos(angle), center.y + radius * std::sin(angle));
	}
	return points;
}

constexpr std::array<uint32_t, 6> QUAD_INDICES{0, 1, 2, 0, 2, 3};

} // namespace

std::optional<std::array<glm::vec2, 4>> expand_line(glm::vec2 a, glm::vec2 b, float thickness)
{
	const auto delta  = b - a;
	const auto length = glm::length(delta);
	if (length == 0.0f)
	{
		return std::nullopt;
	}
	const auto dir	= delta / length;
	const auto perp = glm::vec2{-dir.y, dir.x} * (thickness / 2.0f);
	return std::array{a + perp, b + perp, b - perp, a - perp};
}

glm::vec4 linear_to_srgb(const glm::vec4& color)
{
	return {to_srgb_channel(color.r), to_srgb_channel(color.g), to_srgb_channel(color.b), color.a};
}

// ============================================================================
// State
// ============================================================================

void DrawBatcher::set_texture(std::optional<Texture> texture, std::optional<Sampler> sampler)
{
	m_state.texture = std::move(texture);
	m_state.sampler = std::move(sampler);
	m_atlas_uv.reset();
}

void DrawBatcher::set_texture_uv(std::optional<glm::vec4> uv)
{
	m_uv = uv;
}

void DrawBatcher::set_texture_atlas(const TextureAtlas& atlas, std::string_view id, std::optional<Sampler> sampler)
{
	const auto* region = atlas.find(id);
	if (!region)
	{
		fatal(ErrorKind::InvalidUsage, "Texture atlas '{}' has no item '{}'", atlas.texture().label(), id);
	}
	set_texture(atlas.texture(), std::move(sampler));
	m_atlas_uv = region->uv;
}

glm::vec4 DrawBatcher::absolute_uv() const
{
	const glm::vec4 whole{0.0f, 0.0f, 1.0f, 1.0f};
	const auto		uv = m_uv.value_or(whole);
	if (!m_atlas_uv)
	{
		return uv;
	}
	const glm::vec2 origin{m_atlas_uv->x, m_atlas_uv->y};
	const glm::vec2 extent = glm::vec2{m_atlas_uv->z, m_atlas_uv->w} - origin;
	return {origin + extent * glm::vec2{uv.x, uv.y}, origin + extent * glm::vec2{uv.z, uv.w}};
}

void DrawBatcher::set_shader(std::optional<Shader> shader)
{
	m_state.shader = std::move(shader);
}

void DrawBatcher::set_blend(const BlendState& blend)
{
	m_state.blend = blend;
}

void DrawBatcher::set_scissor(std::optional<ScissorRect> scissor)
{
	m_state.scissor = scissor;
}

void DrawBatcher::set_viewport(std::optional<Viewport> viewport)
{
	m_state.viewport = viewport;
}

// ============================================================================
// Batching
// ============================================================================

void DrawBatcher::push_geometry(std::span<DrawVertex> vertices, std::span<const uint32_t> indices, bool textured)
{
	if (vertices.empty() || indices.empty())
	{
		return;
	}
	if (const auto largest = *std::max_element(indices.begin(), indices.end()); largest >= vertices.size())
	{
		Logger::instance().error("Dropping geometry with index {} past its {} vertices", largest, vertices.size());
		return;
	}

	glm::vec2 min{vertices.front().position};
	glm::vec2 max{min};
	for (const auto& v : vertices)
	{
		min = glm::min(min, glm::vec2{v.position});
		max = glm::max(max, glm::vec2{v.position});
	}
	const auto extent	= max - min;
	const auto image_uv = absolute_uv();
	for (auto& v : vertices)
	{
		const glm::vec2 p{v.position};
		glm::vec2		uv{extent.x > 0.0f ? (p.x - min.x) / extent.x : 0.0f,
					   extent.y > 0.0f ? (p.y - min.y) / extent.y : 0.0f};
		if (textured)
		{
			uv = glm::mix(glm::vec2{image_uv.x, image_uv.y}, glm::vec2{image_uv.z, image_uv.w}, uv);
		}
		v.uv = uv;
	}

	const auto base = static_cast<uint32_t>(m_vertices.size());
	m_vertices.insert(m_vertices.end(), vertices.begin(), vertices.end());
	for (const auto index : indices)
	{
		m_indices.push_back(base + index);
	}
	push_queue(static_cast<uint32_t>(indices.size()), textured);
}

void DrawBatcher::push_queue(uint32_t index_count, bool textured)
{
	auto state = m_state;
	if (!textured)
	{
		state.texture.reset();
		state.sampler.reset();
	}

	if (m_current && m_current->state == state)
	{
		m_current->index_count += index_count;
		return;
	}
	if (m_current)
	{
		m_queues.push_back(std::move(*m_current));
	}
	m_current = DrawingQueue{.state		  = std::move(state),
							 .start_index = static_cast<uint32_t>(m_indices.size()) - index_count,
							 .index_count = index_count};
}

const std::vector<DrawingQueue>& DrawBatcher::finish()
{
	if (m_current)
	{
		m_queues.push_back(std::move(*m_current));
		m_current.reset();
	}
	return m_queues;
}

void DrawBatcher::clear()
{
	m_vertices.clear();
	m_indices.clear();
	m_queues.clear();
	m_current.reset();
}

// ============================================================================
// Shapes
// ============================================================================

void DrawBatcher::push_outline(std::span<const glm::vec2> points, float thickness, const glm::vec4& color)
{
	std::vector<DrawVertex> vertices;
	std::vector<uint32_t>	indices;
	for (std::size_t i = 0; i < points.size(); ++i)
	{
		const auto quad = expand_line(points[i], points[(i + 1) % points.size()], thickness);
		if (!quad)
		{
			continue;
		}
		const auto base = static_cast<uint32_t>(vertices.size());
		for (const auto& corner : *quad)
		{
			vertices.push_back(vertex(corner, color));
		}
		for (const auto index : QUAD_INDICES)
		{
			indices.push_back(base + index);
		}
	}
	push_geometry(vertices, indices, false);
}

void DrawBatcher::rectangle(glm::vec2 position, glm::vec2 size, float thickness, const glm::vec4& color)
{
	const std::array corners{position, position + glm::vec2{size.x, 0.0f}, position + size,
							 position + glm::vec2{0.0f, size.y}};
	push_outline(corners, thickness, color);
}

void DrawBatcher::rectangle_filled(glm::vec2 position, glm::vec2 size, const glm::vec4& color)
{
	rectangle_filled(position, size, color, color, color, color);
}

void DrawBatcher::rectangle_filled(glm::vec2 position, glm::vec2 size, const glm::vec4& top_left,
								   const glm::vec4& top_right, const glm::vec4& bottom_right,
								   const glm::vec4& bottom_left)
{
	std::array vertices{vertex(position, top_left), vertex(position + glm::vec2{size.x, 0.0f}, top_right),
						vertex(position + size, bottom_right), vertex(position + glm::vec2{0.0f, size.y}, bottom_left)};
	push_geometry(vertices, QUAD_INDICES, false);
}

void DrawBatcher::line(glm::vec2 a, glm::vec2 b, float thickness, const glm::vec4& color)
{
	const auto quad = expand_line(a, b, thickness);
	if (!quad)
	{
		Logger::instance().trace("Skipping zero length line at ({}, {})", a.x, a.y);
		return;
	}
	std::array vertices{vertex((*quad)[0], color), vertex((*quad)[1], color), vertex((*quad)[2], color),
						vertex((*quad)[3], color)};
	push_geometry(vertices, QUAD_INDICES, false);
}

void DrawBatcher::triangle(glm::vec2 a, glm::vec2 b, glm::vec2 c, float thickness, const glm::vec4& color)
{
	const std::array points{a, b, c};
	push_outline(points, thickness, color);
}

void DrawBatcher::triangle_filled(glm::vec2 a, glm::vec2 b, glm::vec2 c, const glm::vec4& color)
{
	std::array					  vertices{vertex(a, color), vertex(b, color), vertex(c, color)};
	constexpr std::array<uint32_t, 3> indices{0, 1, 2};
	push_geometry(vertices, indices, false);
}

void DrawBatcher::circle(glm::vec2 center, float radius, uint32_t segments, float thickness, const glm::vec4& color)
{
	if (segments < 3)
	{
		return;
	}
	const auto points = circle_points(center, radius, segments);
	push_outline(points, thickness, color);
}

void DrawBatcher::circle_filled(glm::vec2 center, float radius, uint32_t segments, const glm::vec4& color)
{
	push_fan(center, radius, segments, color, false);
}

void DrawBatcher::push_fan(glm::vec2 center, float radius, uint32_t segments, const glm::vec4& color, bool textured)
{
	if (segments < 3)
	{
		return;
	}

	std::vector<DrawVertex> vertices{vertex(center, color)};
	for (const auto& point : circle_points(center, radius, segments))
	{
		vertices.push_back(vertex(point, color));
	}
	std::vector<uint32_t> indices;
	indices.reserve(segments * 3);
	for (uint32_t i = 0; i < segments; ++i)
	{
		indices.insert(indices.end(), {0, i + 1, (i + 1) % segments + 1});
	}
	push_geometry(vertices, indices, textured);
}

void DrawBatcher::image(glm::vec2 position, glm::vec2 size, const glm::vec4& tint)
{
	std::array vertices{vertex(position, tint), vertex(position + glm::vec2{size.x, 0.0f}, tint),
						vertex(position + size, tint), vertex(position + glm::vec2{0.0f, size.y}, tint)};
	push_geometry(vertices, QUAD_INDICES, true);
}

void DrawBatcher::image_triangle(glm::vec2 a, glm::vec2 b, glm::vec2 c, const glm::vec4& tint)
{
	std::array					  vertices{vertex(a, tint), vertex(b, tint), vertex(c, tint)};
	constexpr std::array<uint32_t, 3> indices{0, 1, 2};
	push_geometry(vertices, indices, true);
}

void DrawBatcher::image_circle(glm::vec2 center, float radius, uint32_t segments, const glm::vec4& tint)
{
	push_fan(center, radius, segments, tint, true);
}

} // namespace est
