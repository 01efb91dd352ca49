//
// Created by chris on 1/11/26.
//
#include <est/Buffer.hpp>
#include <est/GraphicsContext.hpp>
#include <est/Logger.hpp>

#include <algorithm>

namespace est
{

namespace
{

uint64_t aligned_size(uint64_t size)
{
	return std::max<uint64_t>(align_to(size, COPY_BUFFER_ALIGNMENT), COPY_BUFFER_ALIGNMENT);
}

std::expected<std::shared_ptr<const BufferResource>, Error> create_resource(const std::shared_ptr<GpuDevice>& device,
																			 const std::string& label, uint64_t size,
																			 BufferUsage usage,
																			 std::span<const uint8_t> data)
{
	auto descriptor = BufferDescriptor{.label = label, .size = size, .usage = usage, .mapped_at_creation = false};
	try
	{
		auto handle = data.empty() ? device->create_buffer(descriptor) : device->create_buffer_with_data(descriptor, data);
		Logger::instance().debug("Created buffer '{}' ({} bytes, usage {:#x})", label, size,
								 static_cast<uint32_t>(usage));
		return std::make_shared<const BufferResource>(
			BufferResource{.handle = OwnedHandle{device, handle}, .size = size, .usage = usage, .label = label});
	} catch (const DeviceError& e)
	{
		return std::unexpected{make_error(ErrorKind::DeviceFailure, "Failed to create buffer '{}': {}", label, e.what())};
	}
}

} // anonymous namespace

// ============================================================================
// Buffer
// ============================================================================

Buffer::Buffer(std::shared_ptr<const BufferResource> resource, std::chrono::nanoseconds readback_timeout)
	: m_resource(std::move(resource))
	, m_readback_timeout(readback_timeout)
{}

void Buffer::write(std::span<const uint8_t> data, uint64_t offset)
{
	if (data.empty())
	{
		fatal(ErrorKind::InvalidSize, "Cannot write zero bytes to buffer '{}'", label());
	}
	if (!has_flag(usage(), BufferUsage::CopyDst))
	{
		fatal(ErrorKind::BufferNotWritable, "Buffer '{}' was created without CopyDst usage", label());
	}
	if (offset % COPY_BUFFER_ALIGNMENT != 0)
	{
		fatal(ErrorKind::InvalidSize, "Write offset {} into '{}' is not {} byte aligned", offset, label(),
			  COPY_BUFFER_ALIGNMENT);
	}
	if (offset + data.size() > size())
	{
		fatal(ErrorKind::BufferTooSmall, "Writing {} bytes at offset {} overflows buffer '{}' of {} bytes",
			  data.size(), offset, label(), size());
	}

	if (data.size() % COPY_BUFFER_ALIGNMENT == 0)
	{
		device().write_buffer(handle(), offset, data);
		return;
	}

	std::vector<uint8_t> padded(align_to(data.size(), COPY_BUFFER_ALIGNMENT), 0);
	std::ranges::copy(data, padded.begin());
	device().write_buffer(handle(), offset, padded);
}

void Buffer::copy_from(const Buffer& src)
{
	if (!has_flag(src.usage(), BufferUsage::CopySrc))
	{
		fatal(ErrorKind::InvalidUsage, "Copy source '{}' was created without CopySrc usage", src.label());
	}
	if (!has_flag(usage(), BufferUsage::CopyDst))
	{
		fatal(ErrorKind::BufferNotWritable, "Copy destination '{}' was created without CopyDst usage", label());
	}

	auto commands = device().create_command_list();
	commands->copy_buffer_to_buffer(src.handle(), 0, handle(), 0, std::min(src.size(), size()));
	device().submit(*commands);
	device().wait_idle(m_readback_timeout);
}

std::expected<std::vector<uint8_t>, Error> Buffer::read() const
{
	if (!has_any(usage(), BufferUsage::CopySrc | BufferUsage::MapRead))
	{
		return std::unexpected{
			make_error(ErrorKind::BufferNotReadable, "Buffer '{}' has neither CopySrc nor MapRead usage", label())};
	}

	try
	{
		if (has_flag(usage(), BufferUsage::MapRead))
		{
			device().wait_idle(m_readback_timeout);
			return device().map_read(handle(), size(), m_readback_timeout);
		}

		auto staging_descriptor = BufferDescriptor{.label			   = label() + " readback",
												   .size			   = size(),
												   .usage			   = BufferUsage::CopyDst | BufferUsage::MapRead,
												   .mapped_at_creation = false};
		OwnedHandle staging{m_resource->handle.device(), device().create_buffer(staging_descriptor)};

		auto commands = device().create_command_list();
		commands->copy_buffer_to_buffer(handle(), 0, staging.get(), 0, size());
		device().submit(*commands);
		device().wait_idle(m_readback_timeout);

		return device().map_read(staging.get(), size(), m_readback_timeout);
	} catch (const DeviceTimeoutError& e)
	{
		fatal(ErrorKind::DeviceTimeout, "Reading buffer '{}' timed out: {}", label(), e.what());
	} catch (const DeviceError& e)
	{
		return std::unexpected{make_error(ErrorKind::DeviceFailure, "Reading buffer '{}' failed: {}", label(), e.what())};
	}
}

std::expected<void, Error> Buffer::resize(uint64_t new_size)
{
	if (new_size == 0)
	{
		return std::unexpected{make_error(ErrorKind::InvalidSize, "Cannot resize buffer '{}' to zero", label())};
	}
	auto size_aligned = aligned_size(new_size);
	Logger::instance().debug("Resizing buffer '{}': {} -> {} bytes", label(), size(), size_aligned);

	std::vector<uint8_t> content;
	if (has_any(usage(), BufferUsage::CopySrc | BufferUsage::MapRead))
	{
		auto old = read();
		if (!old)
			return std::unexpected{old.error()};
		content = std::move(*old);
		content.resize(size_aligned, 0);
	}

	auto resource = create_resource(m_resource->handle.device(), label(), size_aligned, usage(), content);
	if (!resource)
	{
		return std::unexpected{resource.error()};
	}
	m_resource = std::move(*resource);
	m_mapped.clear();
	m_map_mode.reset();
	return {};
}

std::expected<std::span<uint8_t>, Error> Buffer::map(MapMode mode)
{
	if (m_map_mode)
	{
		fatal(ErrorKind::InvalidUsage, "Buffer '{}' is already mapped", label());
	}

	if (mode == MapMode::Read)
	{
		auto content = read();
		if (!content)
			return std::unexpected{content.error()};
		m_mapped = std::move(*content);
	} else
	{
		m_mapped.assign(size(), 0);
	}
	m_map_mode = mode;
	return std::span{m_mapped};
}

void Buffer::unmap()
{
	if (!m_map_mode)
	{
		fatal(ErrorKind::BufferNotMapped, "Buffer '{}' is not mapped", label());
	}
	auto mode = *std::exchange(m_map_mode, std::nullopt);
	if (mode == MapMode::Write)
	{
		write(m_mapped);
	}
	m_mapped.clear();
}

// ============================================================================
// BufferBuilder
// ============================================================================

BufferBuilder::BufferBuilder(GraphicsContext& context)
	: m_context(&context)
{}

BufferBuilder& BufferBuilder::set_size(uint64_t size)
{
	m_size = size;
	return *this;
}

BufferBuilder& BufferBuilder::set_data(std::span<const uint8_t> data)
{
	m_data.assign(data.begin(), data.end());
	return *this;
}

BufferBuilder& BufferBuilder::set_usage(BufferUsage usage)
{
	m_usage = usage;
	return *this;
}

BufferBuilder& BufferBuilder::set_mapped(bool mapped)
{
	m_mapped = mapped;
	return *this;
}

BufferBuilder& BufferBuilder::set_label(std::string label)
{
	m_label = std::move(label);
	return *this;
}

std::expected<Buffer, Error> BufferBuilder::build() const
{
	if (m_size == 0 && m_data.empty())
	{
		return std::unexpected{make_error(ErrorKind::InvalidSize, "Buffer '{}' needs a size or initial data", m_label)};
	}
	if (m_usage == BufferUsage::None)
	{
		return std::unexpected{make_error(ErrorKind::InvalidUsage, "Buffer '{}' has no usage flags", m_label)};
	}

	auto size = aligned_size(std::max<uint64_t>(m_size, m_data.size()));

	std::vector<uint8_t> initial;
	if (!m_data.empty())
	{
		initial = m_data;
		initial.resize(size, 0);
	}

	auto resource = create_resource(m_context->shared_device(), m_label, size, m_usage, initial);
	if (!resource)
	{
		return std::unexpected{resource.error()};
	}

	Buffer buffer(std::move(*resource), m_context->config().readback_timeout);
	if (m_mapped)
	{
		buffer.m_mapped	  = initial.empty() ? std::vector<uint8_t>(size, 0) : initial;
		buffer.m_map_mode = MapMode::Write;
	}
	return buffer;
}

} // namespace est
