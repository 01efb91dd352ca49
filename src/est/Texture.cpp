//
// Created by chris on 1/11/26.
//
#include <est/GraphicsContext.hpp>
#include <est/Logger.hpp>
#include <est/Texture.hpp>

#include <algorithm>
#include <cstring>

#include <glm/common.hpp>

namespace est
{

namespace
{

bool valid_sample_count(uint32_t count)
{
	return count == 1 || count == 2 || count == 4 || count == 8 || count == 16;
}

constexpr uint32_t ATLAS_PADDING = 1;

struct Placement
{
	uint32_t x;
	uint32_t y;
};

} // anonymous namespace

// ============================================================================
// Texture
// ============================================================================

Texture::Texture(std::shared_ptr<const TextureResource> resource, std::chrono::nanoseconds readback_timeout)
	: m_resource(std::move(resource))
	, m_readback_timeout(readback_timeout)
{}

void Texture::write(std::span<const uint8_t> data)
{
	if (!has_flag(usage(), TextureUsage::CopyDst))
	{
		fatal(ErrorKind::InvalidUsage, "Texture '{}' was created without CopyDst usage", label());
	}
	auto expected_size = static_cast<uint64_t>(width()) * height() * bytes_per_pixel(format());
	if (data.size() != expected_size)
	{
		fatal(ErrorKind::InvalidSize, "Texture '{}' expects {} bytes, got {}", label(), expected_size, data.size());
	}
	device().write_texture(handle(), data);
}

std::expected<std::vector<uint8_t>, Error> Texture::read() const
{
	if (!has_flag(usage(), TextureUsage::CopySrc))
	{
		return std::unexpected{
			make_error(ErrorKind::TextureNotReadable, "Texture '{}' was created without CopySrc usage", label())};
	}
	if (is_multisampled())
	{
		return std::unexpected{
			make_error(ErrorKind::TextureNotReadable, "Multisampled texture '{}' cannot be read back", label())};
	}

	try
	{
		auto size			= static_cast<uint64_t>(width()) * height() * bytes_per_pixel(format());
		auto staging_size	= align_to(size, COPY_BUFFER_ALIGNMENT);
		auto staging_handle = device().create_buffer(BufferDescriptor{.label			  = label() + " readback",
																	  .size				  = staging_size,
																	  .usage			  = BufferUsage::CopyDst |
																				  BufferUsage::MapRead,
																	  .mapped_at_creation = false});
		OwnedHandle staging{m_resource->handle.device(), staging_handle};

		auto commands = device().create_command_list();
		commands->copy_texture_to_buffer(handle(), staging.get());
		device().submit(*commands);
		device().wait_idle(m_readback_timeout);

		auto bytes = device().map_read(staging.get(), staging_size, m_readback_timeout);
		bytes.resize(size);
		return bytes;
	} catch (const DeviceTimeoutError& e)
	{
		fatal(ErrorKind::DeviceTimeout, "Reading texture '{}' timed out: {}", label(), e.what());
	} catch (const DeviceError& e)
	{
		return std::unexpected{make_error(ErrorKind::DeviceFailure, "Reading texture '{}' failed: {}", label(), e.what())};
	}
}

// ============================================================================
// TextureBuilder
// ============================================================================

TextureBuilder::TextureBuilder(GraphicsContext& context)
	: m_context(&context)
{}

TextureBuilder& TextureBuilder::set_size(uint32_t width, uint32_t height)
{
	m_width	 = width;
	m_height = height;
	return *this;
}

TextureBuilder& TextureBuilder::set_format(TextureFormat format)
{
	m_format = format;
	return *this;
}

TextureBuilder& TextureBuilder::set_sample_count(uint32_t sample_count)
{
	m_sample_count = sample_count;
	return *this;
}

TextureBuilder& TextureBuilder::set_usage(TextureUsage usage)
{
	m_usage = usage;
	return *this;
}

TextureBuilder& TextureBuilder::set_data(std::span<const uint8_t> data)
{
	m_data.assign(data.begin(), data.end());
	return *this;
}

TextureBuilder& TextureBuilder::set_label(std::string label)
{
	m_label = std::move(label);
	return *this;
}

std::expected<Texture, Error> TextureBuilder::build() const
{
	if (m_width == 0 || m_height == 0)
	{
		return std::unexpected{
			make_error(ErrorKind::InvalidSize, "Texture '{}' has a zero extent {}x{}", m_label, m_width, m_height)};
	}
	if (!valid_sample_count(m_sample_count))
	{
		return std::unexpected{
			make_error(ErrorKind::InvalidSize, "Texture '{}' has unsupported sample count {}", m_label, m_sample_count)};
	}

	auto usage = m_usage;
	if (!m_data.empty())
	{
		auto expected_size = static_cast<uint64_t>(m_width) * m_height * bytes_per_pixel(m_format);
		if (m_data.size() != expected_size)
		{
			return std::unexpected{make_error(ErrorKind::InvalidSize, "Texture '{}' expects {} bytes of data, got {}",
											  m_label, expected_size, m_data.size())};
		}
		usage |= TextureUsage::CopyDst;
	}
	if (usage == TextureUsage::None)
	{
		return std::unexpected{make_error(ErrorKind::InvalidUsage, "Texture '{}' has no usage flags", m_label)};
	}

	auto device = m_context->shared_device();
	try
	{
		auto handle = device->create_texture(TextureDescriptor{.label		 = m_label,
																.width		 = m_width,
																.height		 = m_height,
																.format		 = m_format,
																.sample_count = m_sample_count,
																.usage		 = usage});
		auto resource = std::make_shared<const TextureResource>(TextureResource{.handle		   = OwnedHandle{device, handle},
																				 .width		   = m_width,
																				 .height	   = m_height,
																				 .format	   = m_format,
																				 .sample_count = m_sample_count,
																				 .usage		   = usage,
																				 .label		   = m_label});
		if (!m_data.empty())
		{
			device->write_texture(handle, m_data);
		}
		Logger::instance().debug("Created texture '{}' {}x{} {} x{}", m_label, m_width, m_height, to_string(m_format),
								 m_sample_count);
		return Texture{std::move(resource), m_context->config().readback_timeout};
	} catch (const DeviceError& e)
	{
		return std::unexpected{
			make_error(ErrorKind::DeviceFailure, "Failed to create texture '{}': {}", m_label, e.what())};
	}
}

// ============================================================================
// TextureAtlas
// ============================================================================

TextureAtlas::TextureAtlas(Texture texture, std::map<std::string, AtlasRegion, std::less<>> regions)
	: m_texture(std::move(texture))
	, m_regions(std::move(regions))
{}

const AtlasRegion* TextureAtlas::find(std::string_view id) const
{
	auto it = m_regions.find(id);
	return it == m_regions.end() ? nullptr : &it->second;
}

TextureAtlasBuilder::TextureAtlasBuilder(GraphicsContext& context)
	: m_context(&context)
{}

TextureAtlasBuilder& TextureAtlasBuilder::add_texture_raw(std::string id, std::span<const uint8_t> data,
														  uint32_t width, uint32_t height)
{
	m_items[std::move(id)] = Item{.data = {data.begin(), data.end()}, .width = width, .height = height};
	return *this;
}

TextureAtlasBuilder& TextureAtlasBuilder::set_srgb(bool srgb)
{
	m_srgb = srgb;
	return *this;
}

TextureAtlasBuilder& TextureAtlasBuilder::set_label(std::string label)
{
	m_label = std::move(label);
	return *this;
}

std::expected<TextureAtlas, Error> TextureAtlasBuilder::build() const
{
	if (m_items.empty())
	{
		return std::unexpected{make_error(ErrorKind::EmptyAtlas, "Texture atlas '{}' has no items", m_label)};
	}

	std::vector<const std::pair<const std::string, Item>*> order;
	for (const auto& entry : m_items)
	{
		const auto& [id, item] = entry;
		if (item.width == 0 || item.height == 0)
		{
			return std::unexpected{make_error(ErrorKind::InvalidSize, "Atlas item '{}' has a zero extent {}x{}", id,
											  item.width, item.height)};
		}
		if (item.data.size() != static_cast<uint64_t>(item.width) * item.height * 4)
		{
			return std::unexpected{make_error(ErrorKind::InvalidSize, "Atlas item '{}' expects {} bytes, got {}", id,
											  static_cast<uint64_t>(item.width) * item.height * 4, item.data.size())};
		}
		if (item.width + 2 * ATLAS_PADDING > MAX_ATLAS_SIZE || item.height + 2 * ATLAS_PADDING > MAX_ATLAS_SIZE)
		{
			return std::unexpected{make_error(ErrorKind::AtlasTooLarge, "Atlas item '{}' of {}x{} exceeds {}", id,
											  item.width, item.height, MAX_ATLAS_SIZE)};
		}
		order.push_back(&entry);
	}
	std::stable_sort(order.begin(), order.end(),
					 [](const auto* a, const auto* b) { return a->second.height > b->second.height; });

	// Shelf packing, the shelf height is set by its first (tallest) item
	std::map<std::string_view, Placement> placements;
	uint32_t							  x = ATLAS_PADDING, y = ATLAS_PADDING, shelf_height = 0;
	glm::uvec2							  extent{0, 0};
	for (const auto* entry : order)
	{
		const auto& [id, item] = *entry;
		if (x + item.width + ATLAS_PADDING > MAX_ATLAS_SIZE)
		{
			x = ATLAS_PADDING;
			y += shelf_height + ATLAS_PADDING;
			shelf_height = 0;
		}
		if (y + item.height + ATLAS_PADDING > MAX_ATLAS_SIZE)
		{
			return std::unexpected{make_error(ErrorKind::AtlasTooLarge,
											  "{} items do not fit into a {}x{} atlas '{}'", m_items.size(),
											  MAX_ATLAS_SIZE, MAX_ATLAS_SIZE, m_label)};
		}
		placements.emplace(id, Placement{x, y});
		extent		 = glm::max(extent, glm::uvec2{x + item.width, y + item.height});
		shelf_height = std::max(shelf_height, item.height);
		x += item.width + ATLAS_PADDING;
	}

	std::vector<uint8_t>							 texels(static_cast<std::size_t>(extent.x) * extent.y * 4, 0);
	std::map<std::string, AtlasRegion, std::less<>> regions;
	const glm::vec2									 atlas_size{extent};
	for (const auto& [id, item] : m_items)
	{
		const auto& place = placements.at(id);
		for (uint32_t row = 0; row < item.height; ++row)
		{
			std::memcpy(texels.data() + ((static_cast<std::size_t>(place.y) + row) * extent.x + place.x) * 4,
						item.data.data() + static_cast<std::size_t>(row) * item.width * 4,
						static_cast<std::size_t>(item.width) * 4);
		}
		const glm::vec4 uv{(static_cast<float>(place.x) + 0.5f) / atlas_size.x,
						   (static_cast<float>(place.y) + 0.5f) / atlas_size.y,
						   (static_cast<float>(place.x + item.width) - 0.5f) / atlas_size.x,
						   (static_cast<float>(place.y + item.height) - 0.5f) / atlas_size.y};
		regions.emplace(id, AtlasRegion{.uv = uv, .size = {item.width, item.height}});
	}

	auto texture = TextureBuilder(*m_context)
					   .set_size(extent.x, extent.y)
					   .set_format(m_srgb ? TextureFormat::Rgba8UnormSrgb : TextureFormat::Rgba8Unorm)
					   .set_usage(TextureUsage::TextureBinding)
					   .set_data(texels)
					   .set_label(m_label)
					   .build();
	if (!texture)
	{
		return std::unexpected{texture.error()};
	}
	Logger::instance().debug("Packed {} items into atlas '{}' of {}x{}", m_items.size(), m_label, extent.x, extent.y);
	return TextureAtlas{std::move(*texture), std::move(regions)};
}

// ============================================================================
// Sampler
// ============================================================================

Sampler::Sampler(std::shared_ptr<const SamplerResource> resource)
	: m_resource(std::move(resource))
{}

SamplerBuilder::SamplerBuilder(GraphicsContext& context)
	: m_context(&context)
{}

SamplerBuilder& SamplerBuilder::set_filter(FilterMode mag, FilterMode min)
{
	m_descriptor.mag_filter = mag;
	m_descriptor.min_filter = min;
	return *this;
}

SamplerBuilder& SamplerBuilder::set_address_mode(AddressMode mode)
{
	return set_address_mode(mode, mode, mode);
}

SamplerBuilder& SamplerBuilder::set_address_mode(AddressMode u, AddressMode v, AddressMode w)
{
	m_descriptor.address_u = u;
	m_descriptor.address_v = v;
	m_descriptor.address_w = w;
	return *this;
}

SamplerBuilder& SamplerBuilder::set_compare(CompareFunction compare)
{
	m_descriptor.compare = compare;
	return *this;
}

SamplerBuilder& SamplerBuilder::set_max_anisotropy(float anisotropy)
{
	m_descriptor.max_anisotropy = anisotropy;
	return *this;
}

SamplerBuilder& SamplerBuilder::set_label(std::string label)
{
	m_descriptor.label = std::move(label);
	return *this;
}

std::expected<Sampler, Error> SamplerBuilder::build() const
{
	auto device = m_context->shared_device();
	try
	{
		auto handle = device->create_sampler(m_descriptor);
		Logger::instance().debug("Created sampler '{}'", m_descriptor.label);
		return Sampler{std::make_shared<const SamplerResource>(
			SamplerResource{.handle = OwnedHandle{device, handle}, .descriptor = m_descriptor})};
	} catch (const DeviceError& e)
	{
		return std::unexpected{
			make_error(ErrorKind::DeviceFailure, "Failed to create sampler '{}': {}", m_descriptor.label, e.what())};
	}
}

} // namespace est
