//
// Created by chris on 1/10/26.
//
#include <est/GpuTypes.hpp>

namespace est
{

bool is_depth_format(TextureFormat format)
{
	switch (format)
	{
		case TextureFormat::Depth16Unorm:
		case TextureFormat::Depth24Plus:
		case TextureFormat::Depth24PlusStencil8:
		case TextureFormat::Depth32Float: return true;
		default: return false;
	}
}

bool is_srgb_format(TextureFormat format)
{
	return format == TextureFormat::Rgba8UnormSrgb || format == TextureFormat::Bgra8UnormSrgb;
}

uint32_t bytes_per_pixel(TextureFormat format)
{
	switch (format)
	{
		case TextureFormat::R8Unorm: return 1;
		case TextureFormat::Rg8Unorm:
		case TextureFormat::Depth16Unorm: return 2;
		case TextureFormat::Rgba8Unorm:
		case TextureFormat::Rgba8UnormSrgb:
		case TextureFormat::Bgra8Unorm:
		case TextureFormat::Bgra8UnormSrgb:
		case TextureFormat::R32Float:
		case TextureFormat::Depth24Plus:
		case TextureFormat::Depth24PlusStencil8:
		case TextureFormat::Depth32Float: return 4;
		case TextureFormat::Rgba16Float: return 8;
		case TextureFormat::Rgba32Float: return 16;
	}
	return 4;
}

std::string_view to_string(TextureFormat format)
{
	switch (format)
	{
		case TextureFormat::R8Unorm: return "R8Unorm";
		case TextureFormat::Rg8Unorm: return "Rg8Unorm";
		case TextureFormat::Rgba8Unorm: return "Rgba8Unorm";
		case TextureFormat::Rgba8UnormSrgb: return "Rgba8UnormSrgb";
		case TextureFormat::Bgra8Unorm: return "Bgra8Unorm";
		case TextureFormat::Bgra8UnormSrgb: return "Bgra8UnormSrgb";
		case TextureFormat::R32Float: return "R32Float";
		case TextureFormat::Rgba16Float: return "Rgba16Float";
		case TextureFormat::Rgba32Float: return "Rgba32Float";
		case TextureFormat::Depth16Unorm: return "Depth16Unorm";
		case TextureFormat::Depth24Plus: return "Depth24Plus";
		case TextureFormat::Depth24PlusStencil8: return "Depth24PlusStencil8";
		case TextureFormat::Depth32Float: return "Depth32Float";
	}
	return "Unknown";
}

} // namespace est
