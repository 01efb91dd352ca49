//
// Created by chris on 1/10/26.
//

#ifndef ESTRENDER_GPUTYPES_HPP
#define ESTRENDER_GPUTYPES_HPP
#include <compare>
#include <cstdint>
#include <optional>
#include <string_view>

#include "Common.hpp"

namespace est
{

/// Opaque backend object id. Zero is the null handle.
template<class Tag>
struct Handle
{
	uint64_t id = 0;

	[[nodiscard]] bool valid() const { return id != 0; }
	explicit operator bool() const { return valid(); }
	auto operator<=>(const Handle&) const = default;
};

using BufferHandle			= Handle<struct BufferTag>;
using TextureHandle			= Handle<struct TextureTag>;
using SamplerHandle			= Handle<struct SamplerTag>;
using ShaderModuleHandle	= Handle<struct ShaderModuleTag>;
using BindGroupLayoutHandle = Handle<struct BindGroupLayoutTag>;
using PipelineLayoutHandle	= Handle<struct PipelineLayoutTag>;
using PipelineHandle		= Handle<struct PipelineTag>;
using BindGroupHandle		= Handle<struct BindGroupTag>;

enum class BufferUsage : uint32_t
{
	None		 = 0,
	MapRead		 = 0x1,
	MapWrite	 = 0x2,
	CopySrc		 = 0x4,
	CopyDst		 = 0x8,
	Index		 = 0x10,
	Vertex		 = 0x20,
	Uniform		 = 0x40,
	Storage		 = 0x80,
	Indirect	 = 0x100,
	QueryResolve = 0x200,
};
EST_DECLARE_FLAGS(BufferUsage)

enum class TextureUsage : uint32_t
{
	None			 = 0,
	CopySrc			 = 0x1,
	CopyDst			 = 0x2,
	TextureBinding	 = 0x4,
	StorageBinding	 = 0x8,
	RenderAttachment = 0x10,
};
EST_DECLARE_FLAGS(TextureUsage)

enum class TextureFormat
{
	R8Unorm,
	Rg8Unorm,
	Rgba8Unorm,
	Rgba8UnormSrgb,
	Bgra8Unorm,
	Bgra8UnormSrgb,
	R32Float,
	Rgba16Float,
	Rgba32Float,
	Depth16Unorm,
	Depth24Plus,
	Depth24PlusStencil8,
	Depth32Float,
};

[[nodiscard]] bool			   is_depth_format(TextureFormat format);
[[nodiscard]] bool			   is_srgb_format(TextureFormat format);
[[nodiscard]] uint32_t		   bytes_per_pixel(TextureFormat format);
[[nodiscard]] std::string_view to_string(TextureFormat format);

enum class IndexFormat
{
	Uint16,
	Uint32,
};

[[nodiscard]] constexpr uint32_t index_size(IndexFormat format)
{
	return format == IndexFormat::Uint16 ? 2 : 4;
}

enum class PrimitiveTopology
{
	PointList,
	LineList,
	LineStrip,
	TriangleList,
	TriangleStrip,
};

enum class CullMode
{
	None,
	Front,
	Back,
};

enum class PolygonMode
{
	Fill,
	Line,
	Point,
};

enum class FrontFace
{
	Clockwise,
	CounterClockwise,
};

struct PrimitiveState
{
	std::optional<IndexFormat> index_format = IndexFormat::Uint16;
	PrimitiveTopology		   topology		= PrimitiveTopology::TriangleList;
	CullMode				   cull_mode	= CullMode::None;
	PolygonMode				   polygon_mode = PolygonMode::Fill;
	FrontFace				   front_face	= FrontFace::Clockwise;

	bool operator==(const PrimitiveState&) const = default;
};

enum class BlendFactor
{
	Zero,
	One,
	Src,
	OneMinusSrc,
	SrcAlpha,
	OneMinusSrcAlpha,
	Dst,
	OneMinusDst,
	DstAlpha,
	OneMinusDstAlpha,
};

enum class BlendOperation
{
	Add,
	Subtract,
	ReverseSubtract,
	Min,
	Max,
};

struct BlendComponent
{
	BlendFactor	   src_factor = BlendFactor::One;
	BlendFactor	   dst_factor = BlendFactor::Zero;
	BlendOperation operation  = BlendOperation::Add;

	bool operator==(const BlendComponent&) const = default;
};

struct BlendState
{
	BlendComponent color;
	BlendComponent alpha;

	bool operator==(const BlendState&) const = default;

	static constexpr BlendState replace() { return {}; }
	static constexpr BlendState alpha_blending()
	{
		return {.color = {BlendFactor::SrcAlpha, BlendFactor::OneMinusSrcAlpha, BlendOperation::Add},
				.alpha = {BlendFactor::One, BlendFactor::OneMinusSrcAlpha, BlendOperation::Add}};
	}
	static constexpr BlendState premultiplied_alpha()
	{
		return {.color = {BlendFactor::One, BlendFactor::OneMinusSrcAlpha, BlendOperation::Add},
				.alpha = {BlendFactor::One, BlendFactor::OneMinusSrcAlpha, BlendOperation::Add}};
	}
	static constexpr BlendState additive()
	{
		return {.color = {BlendFactor::One, BlendFactor::One, BlendOperation::Add},
				.alpha = {BlendFactor::One, BlendFactor::One, BlendOperation::Add}};
	}
};

enum class ColorWrite : uint32_t
{
	None  = 0,
	Red	  = 1,
	Green = 2,
	Blue  = 4,
	Alpha = 8,
	All	  = 15,
};
EST_DECLARE_FLAGS(ColorWrite)

enum class CompareFunction
{
	Never,
	Less,
	Equal,
	LessEqual,
	Greater,
	NotEqual,
	GreaterEqual,
	Always,
};

enum class FilterMode
{
	Nearest,
	Linear,
};

enum class AddressMode
{
	ClampToEdge,
	Repeat,
	MirrorRepeat,
};

struct Viewport
{
	float x;
	float y;
	float width;
	float height;
	float min_depth = 0.0f;
	float max_depth = 1.0f;

	[[nodiscard]] bool is_degenerate() const { return width <= 0.0f || height <= 0.0f; }
	bool			   operator==(const Viewport&) const = default;
};

struct ScissorRect
{
	int32_t x;
	int32_t y;
	int32_t width;
	int32_t height;

	[[nodiscard]] bool is_degenerate() const { return width <= 0 || height <= 0; }
	bool			   operator==(const ScissorRect&) const = default;
};

} // namespace est

#endif // ESTRENDER_GPUTYPES_HPP
