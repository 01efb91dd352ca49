//
// Created by chris on 1/11/26.
//

#ifndef ESTRENDER_BUFFER_HPP
#define ESTRENDER_BUFFER_HPP
#include <chrono>
#include <cstring>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "Error.hpp"
#include "GpuDevice.hpp"

namespace est
{

class GraphicsContext;

struct BufferResource
{
	OwnedHandle<BufferHandle> handle;
	uint64_t				  size;
	BufferUsage				  usage;
	std::string				  label;
};

enum class MapMode
{
	Read,
	Write,
};

/**
 * @brief Reference counted GPU buffer
 *
 * Copies share the backend buffer. Sizes are always a multiple of COPY_BUFFER_ALIGNMENT.
 */
class Buffer
{
public:
	[[nodiscard]] BufferHandle handle() const { return m_resource->handle.get(); }
	[[nodiscard]] uint64_t	   size() const { return m_resource->size; }
	[[nodiscard]] BufferUsage  usage() const { return m_resource->usage; }
	[[nodiscard]] const std::string& label() const { return m_resource->label; }
	[[nodiscard]] const std::shared_ptr<const BufferResource>& resource() const { return m_resource; }

	/**
	 * @brief Upload bytes at offset
	 *
	 * Fatal when the buffer lacks CopyDst, data is empty, offset is unaligned or
	 * the write runs past the end of the buffer. Waits for the upload to land.
	 */
	void write(std::span<const uint8_t> data, uint64_t offset = 0);

	template<class T>
	void write_values(std::span<const T> values, uint64_t offset = 0)
	{
		write(std::span{reinterpret_cast<const uint8_t*>(values.data()), values.size_bytes()}, offset);
	}

	/// Copy the whole content of src into this buffer. Both sizes must match usage requirements.
	void copy_from(const Buffer& src);

	/**
	 * @brief Read the buffer back to the CPU
	 *
	 * Needs CopySrc or MapRead usage, BufferNotReadable otherwise. Without MapRead
	 * the data goes through a staging buffer.
	 */
	[[nodiscard]] std::expected<std::vector<uint8_t>, Error> read() const;

	template<class T>
	[[nodiscard]] std::expected<std::vector<T>, Error> read_values() const
	{
		auto bytes = read();
		if (!bytes)
			return std::unexpected{bytes.error()};
		std::vector<T> out(bytes->size() / sizeof(T));
		std::memcpy(out.data(), bytes->data(), out.size() * sizeof(T));
		return out;
	}

	/**
	 * @brief Replace the backend buffer with one of the new size
	 *
	 * Content is preserved (truncated or zero padded) when the buffer is readable.
	 * Other Buffer copies and bind groups keep the previous allocation alive.
	 */
	[[nodiscard]] std::expected<void, Error> resize(uint64_t size);

	/// CPU side staging view. Write mode starts zeroed, read mode holds the current content.
	[[nodiscard]] std::expected<std::span<uint8_t>, Error> map(MapMode mode);
	/// Flushes a write mapping to the GPU. Fatal when not mapped.
	void unmap();
	[[nodiscard]] bool is_mapped() const { return m_map_mode.has_value(); }

	bool operator==(const Buffer& other) const { return m_resource == other.m_resource; }

private:
	friend class BufferBuilder;
	Buffer(std::shared_ptr<const BufferResource> resource, std::chrono::nanoseconds readback_timeout);

	[[nodiscard]] GpuDevice& device() const { return *m_resource->handle.device(); }

	std::shared_ptr<const BufferResource> m_resource;
	std::chrono::nanoseconds			  m_readback_timeout;
	std::vector<uint8_t>				  m_mapped;
	std::optional<MapMode>				  m_map_mode;
};

class BufferBuilder
{
public:
	explicit BufferBuilder(GraphicsContext& context);

	BufferBuilder& set_size(uint64_t size);
	BufferBuilder& set_data(std::span<const uint8_t> data);
	BufferBuilder& set_usage(BufferUsage usage);
	BufferBuilder& set_mapped(bool mapped);
	BufferBuilder& set_label(std::string label);

	template<class T>
	BufferBuilder& set_values(std::span<const T> values)
	{
		return set_data(std::span{reinterpret_cast<const uint8_t*>(values.data()), values.size_bytes()});
	}

	/// InvalidSize when neither a size nor data was given, InvalidUsage without usage flags.
	[[nodiscard]] std::expected<Buffer, Error> build() const;

private:
	GraphicsContext*	 m_context;
	uint64_t			 m_size = 0;
	std::vector<uint8_t> m_data;
	BufferUsage			 m_usage  = BufferUsage::None;
	bool				 m_mapped = false;
	std::string			 m_label  = "Buffer";
};

} // namespace est

#endif // ESTRENDER_BUFFER_HPP
