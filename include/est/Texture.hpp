//
// Created by chris on 1/11/26.
//

#ifndef ESTRENDER_TEXTURE_HPP
#define ESTRENDER_TEXTURE_HPP
#include <chrono>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include "Error.hpp"
#include "GpuDevice.hpp"

namespace est
{

class GraphicsContext;

struct TextureResource
{
	OwnedHandle<TextureHandle> handle;
	uint32_t				   width;
	uint32_t				   height;
	TextureFormat			   format;
	uint32_t				   sample_count;
	TextureUsage			   usage;
	std::string				   label;
};

/**
 * @brief Reference counted GPU texture
 *
 * Copies share the backend image.
 */
class Texture
{
public:
	[[nodiscard]] TextureHandle		 handle() const { return m_resource->handle.get(); }
	[[nodiscard]] uint32_t			 width() const { return m_resource->width; }
	[[nodiscard]] uint32_t			 height() const { return m_resource->height; }
	[[nodiscard]] glm::uvec2		 size() const { return {m_resource->width, m_resource->height}; }
	[[nodiscard]] TextureFormat		 format() const { return m_resource->format; }
	[[nodiscard]] uint32_t			 sample_count() const { return m_resource->sample_count; }
	[[nodiscard]] bool				 is_multisampled() const { return m_resource->sample_count > 1; }
	[[nodiscard]] TextureUsage		 usage() const { return m_resource->usage; }
	[[nodiscard]] const std::string& label() const { return m_resource->label; }
	[[nodiscard]] const std::shared_ptr<const TextureResource>& resource() const { return m_resource; }

	/// Replace the whole image. Fatal without CopyDst or when data does not cover width * height texels exactly.
	void write(std::span<const uint8_t> data);

	/**
	 * @brief Read the image back, tightly packed rows
	 *
	 * TextureNotReadable without CopySrc usage or for multisampled textures.
	 */
	[[nodiscard]] std::expected<std::vector<uint8_t>, Error> read() const;

	bool operator==(const Texture& other) const { return m_resource == other.m_resource; }

private:
	friend class TextureBuilder;
	Texture(std::shared_ptr<const TextureResource> resource, std::chrono::nanoseconds readback_timeout);

	[[nodiscard]] GpuDevice& device() const { return *m_resource->handle.device(); }

	std::shared_ptr<const TextureResource> m_resource;
	std::chrono::nanoseconds			   m_readback_timeout;
};

class TextureBuilder
{
public:
	explicit TextureBuilder(GraphicsContext& context);

	TextureBuilder& set_size(uint32_t width, uint32_t height);
	TextureBuilder& set_format(TextureFormat format);
	TextureBuilder& set_sample_count(uint32_t sample_count);
	TextureBuilder& set_usage(TextureUsage usage);
	/// Initial content, adds CopyDst to the usage.
	TextureBuilder& set_data(std::span<const uint8_t> data);
	TextureBuilder& set_label(std::string label);

	/// InvalidSize for a zero extent, an unsupported sample count or data of the wrong length,
	/// InvalidUsage without usage flags.
	[[nodiscard]] std::expected<Texture, Error> build() const;

private:
	GraphicsContext*	 m_context;
	uint32_t			 m_width		= 0;
	uint32_t			 m_height		= 0;
	TextureFormat		 m_format		= TextureFormat::Rgba8Unorm;
	uint32_t			 m_sample_count = 1;
	TextureUsage		 m_usage		= TextureUsage::None;
	std::vector<uint8_t> m_data;
	std::string			 m_label = "Texture";
};

// ============================================================================
// Texture atlas
// ============================================================================

/// Largest atlas edge in texels.
constexpr uint32_t MAX_ATLAS_SIZE = 2048;

/// Normalized sub rectangle (u0, v0, u1, v1) of one atlas item, inset by half a texel, and its size in texels.
struct AtlasRegion
{
	glm::vec4  uv;
	glm::uvec2 size;

	bool operator==(const AtlasRegion&) const = default;
};

/**
 * @brief One sampled RGBA8 texture holding several images packed side by side
 *
 * Items are looked up by the id they were added with.
 */
class TextureAtlas
{
public:
	[[nodiscard]] const Texture&	 texture() const { return m_texture; }
	[[nodiscard]] glm::uvec2		 size() const { return m_texture.size(); }
	[[nodiscard]] std::size_t		 item_count() const { return m_regions.size(); }
	/// nullptr for an unknown id.
	[[nodiscard]] const AtlasRegion* find(std::string_view id) const;

private:
	friend class TextureAtlasBuilder;
	TextureAtlas(Texture texture, std::map<std::string, AtlasRegion, std::less<>> regions);

	Texture											 m_texture;
	std::map<std::string, AtlasRegion, std::less<>> m_regions;
};

/**
 * @brief Packs raw RGBA8 images into a TextureAtlas
 *
 * Items are placed on shelves, tallest first, with one texel of padding around and
 * between them. The atlas is as large as the packed items need.
 */
class TextureAtlasBuilder
{
public:
	explicit TextureAtlasBuilder(GraphicsContext& context);

	/// Tightly packed RGBA8 texels. An item added with an existing id replaces it.
	TextureAtlasBuilder& add_texture_raw(std::string id, std::span<const uint8_t> data, uint32_t width, uint32_t height);
	/// Rgba8UnormSrgb instead of Rgba8Unorm.
	TextureAtlasBuilder& set_srgb(bool srgb);
	TextureAtlasBuilder& set_label(std::string label);

	/// EmptyAtlas without items, InvalidSize for a zero extent or data of the wrong length,
	/// AtlasTooLarge when the items do not fit into MAX_ATLAS_SIZE.
	[[nodiscard]] std::expected<TextureAtlas, Error> build() const;

private:
	struct Item
	{
		std::vector<uint8_t> data;
		uint32_t			 width;
		uint32_t			 height;
	};

	GraphicsContext*			m_context;
	std::map<std::string, Item> m_items;
	bool						m_srgb	= false;
	std::string					m_label = "Texture Atlas";
};

struct SamplerResource
{
	OwnedHandle<SamplerHandle> handle;
	SamplerDescriptor		   descriptor;
};

class Sampler
{
public:
	[[nodiscard]] SamplerHandle			   handle() const { return m_resource->handle.get(); }
	[[nodiscard]] const SamplerDescriptor& descriptor() const { return m_resource->descriptor; }
	[[nodiscard]] bool					   is_comparison() const { return m_resource->descriptor.compare.has_value(); }
	[[nodiscard]] const std::shared_ptr<const SamplerResource>& resource() const { return m_resource; }

	bool operator==(const Sampler& other) const { return m_resource == other.m_resource; }

private:
	friend class SamplerBuilder;
	explicit Sampler(std::shared_ptr<const SamplerResource> resource);

	std::shared_ptr<const SamplerResource> m_resource;
};

class SamplerBuilder
{
public:
	explicit SamplerBuilder(GraphicsContext& context);

	SamplerBuilder& set_filter(FilterMode mag, FilterMode min);
	SamplerBuilder& set_address_mode(AddressMode mode);
	SamplerBuilder& set_address_mode(AddressMode u, AddressMode v, AddressMode w);
	/// Turns the sampler into a comparison sampler.
	SamplerBuilder& set_compare(CompareFunction compare);
	SamplerBuilder& set_max_anisotropy(float anisotropy);
	SamplerBuilder& set_label(std::string label);

	[[nodiscard]] std::expected<Sampler, Error> build() const;

private:
	GraphicsContext*  m_context;
	SamplerDescriptor m_descriptor{.label = "Sampler"};
};

} // namespace est

#endif // ESTRENDER_TEXTURE_HPP
