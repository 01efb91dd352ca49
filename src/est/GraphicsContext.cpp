//
// Created by chris on 1/12/26.
//
#include <est/GraphicsContext.hpp>
#include <est/Logger.hpp>

#include <algorithm>
#include <array>
#include <numeric>

namespace est
{

GraphicsContext::GraphicsContext(std::shared_ptr<GpuDevice> device, ContextConfig config)
	: m_device(std::move(device))
	, m_config(config)
	, m_pipeline_cache("PipelineCache", config.pipeline_cache)
	, m_bind_group_cache("BindGroupCache", config.bind_group_cache)
{
	Logger::instance().info("GraphicsContext initialized (pipeline cache {}/{}/{}, bind group cache {}/{}/{})",
							config.pipeline_cache.capacity, config.pipeline_cache.lifetime,
							config.pipeline_cache.emergency_lifetime, config.bind_group_cache.capacity,
							config.bind_group_cache.lifetime, config.bind_group_cache.emergency_lifetime);
}

GraphicsContext::~GraphicsContext()
{
	const auto& pipelines	= m_pipeline_cache.stats();
	const auto& bind_groups = m_bind_group_cache.stats();
	Logger::instance().debug("GraphicsContext destroyed after {} frames. Pipelines: {} hits, {} misses, {} evictions. "
							 "Bind groups: {} hits, {} misses, {} evictions",
							 m_frame, pipelines.hits, pipelines.misses, pipelines.evictions, bind_groups.hits,
							 bind_groups.misses, bind_groups.evictions);
}

void GraphicsContext::cycle()
{
	++m_frame;
	m_pipeline_cache.cycle();
	m_bind_group_cache.cycle();
	if (m_open_command_buffers == 0)
	{
		rewind_drawing();
	} else
	{
		m_rewind_pending = true;
	}
	Logger::instance().trace("Frame {}: {} pipelines, {} bind groups cached", m_frame, m_pipeline_cache.size(),
							 m_bind_group_cache.size());
}

void GraphicsContext::command_buffer_opened()
{
	++m_open_command_buffers;
}

void GraphicsContext::command_buffer_closed()
{
	if (--m_open_command_buffers == 0 && m_rewind_pending)
	{
		rewind_drawing();
	}
}

void GraphicsContext::rewind_drawing()
{
	m_drawing_vertices.cursor = 0;
	m_drawing_indices.cursor  = 0;
	m_rewind_pending		  = false;
}

const Texture& GraphicsContext::default_texture()
{
	if (!m_default_texture)
	{
		constexpr std::array<uint8_t, 4> white = {255, 255, 255, 255};

		auto texture = TextureBuilder(*this)
						   .set_size(1, 1)
						   .set_format(TextureFormat::Rgba8Unorm)
						   .set_usage(TextureUsage::TextureBinding | TextureUsage::CopyDst)
						   .set_data(white)
						   .set_label("Default white texture")
						   .build();
		if (!texture)
		{
			fatal(ErrorKind::DeviceFailure, "Cannot create the default texture: {}", texture.error().message);
		}
		m_default_texture = std::move(*texture);
	}
	return *m_default_texture;
}

const Sampler& GraphicsContext::default_sampler()
{
	if (!m_default_sampler)
	{
		auto sampler = SamplerBuilder(*this)
						   .set_filter(FilterMode::Linear, FilterMode::Linear)
						   .set_address_mode(AddressMode::ClampToEdge)
						   .set_label("Default sampler")
						   .build();
		if (!sampler)
		{
			fatal(ErrorKind::DeviceFailure, "Cannot create the default sampler: {}", sampler.error().message);
		}
		m_default_sampler = std::move(*sampler);
	}
	return *m_default_sampler;
}

std::expected<Shader, Error> GraphicsContext::drawing_shader()
{
	if (!m_drawing_shader)
	{
		auto shader = ShaderBuilder(*this)
						  .add_module(std::string{DRAWING_SHADER_MODULE})
						  .set_index_format(IndexFormat::Uint32)
						  .set_label("Drawing shader")
						  .build();
		if (!shader)
		{
			return std::unexpected{shader.error()};
		}
		m_drawing_shader = std::move(*shader);
	}
	return *m_drawing_shader;
}

void GraphicsContext::set_drawing_shader(Shader shader)
{
	m_drawing_shader = std::move(shader);
}

GeometrySlice GraphicsContext::allocate_drawing_vertices(uint64_t size, uint64_t stride)
{
	return allocate_drawing(m_drawing_vertices, size, stride, BufferUsage::Vertex | BufferUsage::CopyDst,
							"Drawing vertices");
}

GeometrySlice GraphicsContext::allocate_drawing_indices(uint64_t size)
{
	return allocate_drawing(m_drawing_indices, size, COPY_BUFFER_ALIGNMENT, BufferUsage::Index | BufferUsage::CopyDst,
							"Drawing indices");
}

GeometrySlice GraphicsContext::allocate_drawing(DrawingArena& arena, uint64_t size, uint64_t alignment,
												BufferUsage usage, const char* label)
{
	// Offsets must be a multiple of both the element stride and the copy alignment.
	auto step	= std::lcm(alignment, COPY_BUFFER_ALIGNMENT);
	auto offset = (arena.cursor + step - 1) / step * step;

	if (!arena.buffer || offset + size > arena.buffer->size())
	{
		auto capacity = std::max(size, arena.buffer ? arena.buffer->size() * 2 : size);
		Logger::instance().debug("Growing '{}' to {} bytes", label, capacity);

		auto created = BufferBuilder(*this).set_size(capacity).set_usage(usage).set_label(label).build();
		if (!created)
		{
			fatal(ErrorKind::DeviceFailure, "Cannot grow '{}': {}", label, created.error().message);
		}
		// Draws recorded earlier keep the previous buffer alive through their own copies.
		arena.buffer = std::move(*created);
		offset		 = 0;
	}

	arena.cursor = offset + size;
	return GeometrySlice{.buffer = *arena.buffer, .offset = offset};
}

} // namespace est
