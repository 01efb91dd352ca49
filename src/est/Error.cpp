//
// Created by chris on 1/9/26.
//
#include <est/Error.hpp>

namespace est
{

std::string_view to_string(ErrorKind kind)
{
	switch (kind)
	{
		case ErrorKind::UnsupportedType: return "UnsupportedType";
		case ErrorKind::UnsupportedVertexInputType: return "UnsupportedVertexInputType";
		case ErrorKind::MissingLocation: return "MissingLocation";
		case ErrorKind::UnsupportedStage: return "UnsupportedStage";
		case ErrorKind::StorageImageMisrouted: return "StorageImageMisrouted";
		case ErrorKind::UniformTooSmall: return "UniformTooSmall";
		case ErrorKind::DuplicateBinding: return "DuplicateBinding";
		case ErrorKind::MissingEntryPoint: return "MissingEntryPoint";
		case ErrorKind::MalformedBinaryShader: return "MalformedBinaryShader";
		case ErrorKind::ShaderCompilationFailed: return "ShaderCompilationFailed";
		case ErrorKind::InvalidShaderType: return "InvalidShaderType";
		case ErrorKind::ShaderNotSet: return "ShaderNotSet";
		case ErrorKind::BindingTypeMismatch: return "BindingTypeMismatch";
		case ErrorKind::BindingNotFound: return "BindingNotFound";
		case ErrorKind::MissingBinding: return "MissingBinding";
		case ErrorKind::BindGroupNotFound: return "BindGroupNotFound";
		case ErrorKind::InvalidAttachmentType: return "InvalidAttachmentType";
		case ErrorKind::ColorAttachmentNotRenderTarget: return "ColorAttachmentNotRenderTarget";
		case ErrorKind::AttachmentSizeMismatch: return "AttachmentSizeMismatch";
		case ErrorKind::ColorAttachmentMultiSampled: return "ColorAttachmentMultiSampled";
		case ErrorKind::MsaaTextureNotRenderAttachment: return "MsaaTextureNotRenderAttachment";
		case ErrorKind::MsaaTextureNotMultiSampled: return "MsaaTextureNotMultiSampled";
		case ErrorKind::MsaaTextureInvalidSize: return "MsaaTextureInvalidSize";
		case ErrorKind::MismatchedAttachmentSampleCount: return "MismatchedAttachmentSampleCount";
		case ErrorKind::DepthTextureNotRenderAttachment: return "DepthTextureNotRenderAttachment";
		case ErrorKind::DepthTextureInvalidSize: return "DepthTextureInvalidSize";
		case ErrorKind::DepthTextureFormatNotSupported: return "DepthTextureFormatNotSupported";
		case ErrorKind::NoColorOrDepthAttachment: return "NoColorOrDepthAttachment";
		case ErrorKind::MissingVertexBuffer: return "MissingVertexBuffer";
		case ErrorKind::MissingIndexBuffer: return "MissingIndexBuffer";
		case ErrorKind::MissingIndexFormat: return "MissingIndexFormat";
		case ErrorKind::MsaaTargetCountMismatch: return "MsaaTargetCountMismatch";
		case ErrorKind::PassAlreadyEnded: return "PassAlreadyEnded";
		case ErrorKind::InvalidSize: return "InvalidSize";
		case ErrorKind::InvalidUsage: return "InvalidUsage";
		case ErrorKind::BufferNotReadable: return "BufferNotReadable";
		case ErrorKind::BufferNotWritable: return "BufferNotWritable";
		case ErrorKind::BufferTooSmall: return "BufferTooSmall";
		case ErrorKind::BufferNotMapped: return "BufferNotMapped";
		case ErrorKind::TextureNotReadable: return "TextureNotReadable";
		case ErrorKind::EmptyAtlas: return "EmptyAtlas";
		case ErrorKind::AtlasTooLarge: return "AtlasTooLarge";
		case ErrorKind::CacheCapacityExceeded: return "CacheCapacityExceeded";
		case ErrorKind::DeviceFailure: return "DeviceFailure";
		case ErrorKind::DeviceTimeout: return "DeviceTimeout";
	}
	return "Unknown";
}

UsageError::UsageError(ErrorKind kind, const std::string& message)
	: std::logic_error(fmt::format("{}: {}", to_string(kind), message))
	, m_kind(kind)
{}

} // namespace est
