//
// Created by chris on 1/9/26.
//

#ifndef ESTRENDER_ERROR_HPP
#define ESTRENDER_ERROR_HPP
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "Logger.hpp"

namespace est
{

enum class ErrorKind
{
	// Shader reflection and loading
	UnsupportedType,
	UnsupportedVertexInputType,
	MissingLocation,
	UnsupportedStage,
	StorageImageMisrouted,
	UniformTooSmall,
	DuplicateBinding,
	MissingEntryPoint,
	MalformedBinaryShader,
	ShaderCompilationFailed,
	InvalidShaderType,

	// Pipelines and bind groups
	ShaderNotSet,
	BindingTypeMismatch,
	BindingNotFound,
	MissingBinding,
	BindGroupNotFound,
	InvalidAttachmentType,

	// Pass building
	ColorAttachmentNotRenderTarget,
	AttachmentSizeMismatch,
	ColorAttachmentMultiSampled,
	MsaaTextureNotRenderAttachment,
	MsaaTextureNotMultiSampled,
	MsaaTextureInvalidSize,
	MismatchedAttachmentSampleCount,
	DepthTextureNotRenderAttachment,
	DepthTextureInvalidSize,
	DepthTextureFormatNotSupported,
	NoColorOrDepthAttachment,

	// Pass usage
	MissingVertexBuffer,
	MissingIndexBuffer,
	MissingIndexFormat,
	MsaaTargetCountMismatch,
	PassAlreadyEnded,

	// Resources
	InvalidSize,
	InvalidUsage,
	BufferNotReadable,
	BufferNotWritable,
	BufferTooSmall,
	BufferNotMapped,
	TextureNotReadable,
	EmptyAtlas,
	AtlasTooLarge,

	// Cache and device
	CacheCapacityExceeded,
	DeviceFailure,
	DeviceTimeout,
};

[[nodiscard]] std::string_view to_string(ErrorKind kind);

/// Recoverable build-time error carried by every std::expected in the library.
struct Error
{
	ErrorKind	kind;
	std::string message;
};

/// Thrown when a usage contract is broken (wrong binding, missing buffer, cache exhaustion...).
/// Continuing after one would corrupt cached state, callers are not expected to recover.
class UsageError : public std::logic_error
{
public:
	UsageError(ErrorKind kind, const std::string& message);

	[[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }

private:
	ErrorKind m_kind;
};

/// Backend object creation or submission failed.
class DeviceError : public std::runtime_error
{
public:
	using std::runtime_error::runtime_error;
};

/// Waiting on the device ran past its timeout.
class DeviceTimeoutError : public DeviceError
{
public:
	using DeviceError::DeviceError;
};

template<class... Args>
[[nodiscard]] Error make_error(ErrorKind kind, fmt::format_string<Args...> format, Args&&... args)
{
	auto message = fmt::format(format, std::forward<Args>(args)...);
	Logger::instance().error("{}: {}", to_string(kind), message);
	return Error{.kind = kind, .message = std::move(message)};
}

template<class... Args>
[[noreturn]] void fatal(ErrorKind kind, fmt::format_string<Args...> format, Args&&... args)
{
	auto message = fmt::format(format, std::forward<Args>(args)...);
	Logger::instance().error("{}: {}", to_string(kind), message);
	throw UsageError(kind, message);
}

} // namespace est

#endif // ESTRENDER_ERROR_HPP
