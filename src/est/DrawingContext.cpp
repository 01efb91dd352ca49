//
// Created by chris on 1/15/26.
//
#include <est/DrawingContext.hpp>
#include <est/GraphicsContext.hpp>
#include <est/Logger.hpp>
#include <est/RenderPass.hpp>

#include <exception>
#include <utility>

namespace est
{

namespace
{

// Drawing shader convention: sampled texture at (0, 0), sampler at (0, 1).
constexpr uint32_t TEXTURE_GROUP	= 0;
constexpr uint32_t TEXTURE_BINDING = 0;
constexpr uint32_t SAMPLER_BINDING = 1;

} // namespace

DrawingContext::DrawingContext(RenderPass& pass)
	: m_pass(&pass)
	, m_exceptions(std::uncaught_exceptions())
{}

DrawingContext::DrawingContext(DrawingContext&& other) noexcept
	: DrawBatcher(std::move(other))
	, m_pass(std::exchange(other.m_pass, nullptr))
	, m_ended(other.m_ended)
	, m_exceptions(other.m_exceptions)
{}

DrawingContext::~DrawingContext() noexcept(false)
{
	if (!m_pass || m_ended)
	{
		return;
	}
	if (std::uncaught_exceptions() > m_exceptions)
	{
		Logger::instance().warn("Drawing session abandoned during stack unwinding, {} vertices dropped",
								vertices().size());
		return;
	}
	end();
}

void DrawingContext::end()
{
	if (!m_pass || m_ended)
	{
		fatal(ErrorKind::PassAlreadyEnded, "Drawing session was already ended");
	}
	m_ended = true;

	if (empty())
	{
		Logger::instance().trace("Empty drawing session, nothing to record");
		return;
	}

	const auto& queues = finish();
	replay(queues);
	Logger::instance().debug("Drawing session recorded {} queues, {} vertices, {} indices", queues.size(),
							 vertices().size(), indices().size());
	clear();
}

void DrawingContext::replay(const std::vector<DrawingQueue>& queues)
{
	auto&	   pass	   = *m_pass;
	auto&	   context = pass.context();
	const auto size	   = glm::vec2{pass.size()};

	const auto& targets = pass.color_targets();
	const bool	srgb	= !targets.empty() && is_srgb_format(targets.front().texture.format());

	std::vector<DrawVertex> clip = vertices();
	for (auto& v : clip)
	{
		v.position.x = v.position.x / size.x * 2.0f - 1.0f;
		v.position.y = 1.0f - v.position.y / size.y * 2.0f;
		if (srgb)
		{
			v.color = linear_to_srgb(v.color);
		}
	}

	auto default_shader = context.drawing_shader();
	if (!default_shader)
	{
		fatal(default_shader.error().kind, "Cannot load the drawing shader: {}", default_shader.error().message);
	}
	const auto& default_texture = context.default_texture();
	const auto& default_sampler = context.default_sampler();

	const auto vertex_bytes = std::span{clip}.size_bytes();
	const auto index_bytes	= std::span{indices()}.size_bytes();
	auto	   vertex_slice = context.allocate_drawing_vertices(vertex_bytes, sizeof(DrawVertex));
	auto	   index_slice	= context.allocate_drawing_indices(index_bytes);
	vertex_slice.buffer.write_values(std::span<const DrawVertex>{clip}, vertex_slice.offset);
	index_slice.buffer.write_values(std::span{indices()}, index_slice.offset);

	const auto base_vertex = static_cast<int32_t>(vertex_slice.offset / sizeof(DrawVertex));
	const auto first_index = static_cast<uint32_t>(index_slice.offset / sizeof(uint32_t));

	std::vector<std::optional<BlendState>> saved_blends;
	for (const auto& target : targets)
	{
		saved_blends.push_back(target.blend);
	}
	const auto saved_viewport	  = pass.viewport();
	const auto saved_scissor	  = pass.scissor();
	const auto saved_index_format = pass.index_format();

	pass.set_vertex_buffer(vertex_slice.buffer);
	pass.set_index_buffer(index_slice.buffer);
	pass.set_index_format(IndexFormat::Uint32);

	for (const auto& queue : queues)
	{
		const auto& state  = queue.state;
		const auto& shader = state.shader ? *state.shader : *default_shader;

		for (std::size_t i = 0; i < saved_blends.size(); ++i)
		{
			pass.set_blend(i, state.blend);
		}
		pass.set_shader(shader);
		pass.clear_attachments();
		if (shader.find_binding(TEXTURE_GROUP, TEXTURE_BINDING))
		{
			pass.set_attachment_texture(TEXTURE_GROUP, TEXTURE_BINDING, state.texture.value_or(default_texture));
		}
		if (shader.find_binding(TEXTURE_GROUP, SAMPLER_BINDING))
		{
			pass.set_attachment_sampler(TEXTURE_GROUP, SAMPLER_BINDING, state.sampler.value_or(default_sampler));
		}
		pass.set_scissor(state.scissor ? state.scissor : saved_scissor);
		pass.set_viewport(state.viewport ? state.viewport : saved_viewport);

		pass.draw_indexed(first_index + queue.start_index, queue.index_count, base_vertex);
	}

	for (std::size_t i = 0; i < saved_blends.size(); ++i)
	{
		pass.set_blend(i, saved_blends[i]);
	}
	pass.set_viewport(saved_viewport);
	pass.set_scissor(saved_scissor);
	pass.set_index_format(saved_index_format);
}

} // namespace est
