//
// Created by chris on 1/10/26.
//
#include <est/BinaryShader.hpp>
#include <est/Logger.hpp>

#include <algorithm>
#include <cstring>
#include <string>

namespace est
{

namespace
{

enum class ShaderKind : uint32_t
{
	Vertex		   = 0,
	Fragment	   = 1,
	VertexFragment = 2,
	Compute		   = 3,
};

class Reader
{
public:
	explicit Reader(std::span<const uint8_t> data)
		: m_data(data)
	{}

	std::expected<uint32_t, Error> u32() { return read_le<uint32_t>(); }
	std::expected<uint64_t, Error> u64() { return read_le<uint64_t>(); }

	std::expected<std::span<const uint8_t>, Error> bytes(std::size_t count)
	{
		if (m_data.size() - m_offset < count)
		{
			return std::unexpected{truncated(count)};
		}
		auto out = m_data.subspan(m_offset, count);
		m_offset += count;
		return out;
	}

	std::expected<std::string, Error> string()
	{
		auto length = u32();
		if (!length)
			return std::unexpected{length.error()};
		auto raw = bytes(*length);
		if (!raw)
			return std::unexpected{raw.error()};
		return std::string{reinterpret_cast<const char*>(raw->data()), raw->size()};
	}

	[[nodiscard]] std::size_t offset() const { return m_offset; }

private:
	template<class T>
	std::expected<T, Error> read_le()
	{
		auto raw = bytes(sizeof(T));
		if (!raw)
			return std::unexpected{raw.error()};
		T value = 0;
		for (std::size_t i = 0; i < sizeof(T); ++i)
		{
			value |= static_cast<T>((*raw)[i]) << (8 * i);
		}
		return value;
	}

	Error truncated(std::size_t wanted) const
	{
		return make_error(ErrorKind::MalformedBinaryShader, "Unexpected end of data at offset {} (wanted {} bytes)",
						  m_offset, wanted);
	}

	std::span<const uint8_t> m_data;
	std::size_t				 m_offset = 0;
};

class Writer
{
public:
	void u32(uint32_t value) { write_le(value); }
	void u64(uint64_t value) { write_le(value); }

	void bytes(std::span<const uint8_t> data) { m_out.insert(m_out.end(), data.begin(), data.end()); }

	void string(std::string_view value)
	{
		u32(static_cast<uint32_t>(value.size()));
		m_out.insert(m_out.end(), value.begin(), value.end());
	}

	std::vector<uint8_t> take() { return std::move(m_out); }

private:
	template<class T>
	void write_le(T value)
	{
		for (std::size_t i = 0; i < sizeof(T); ++i)
		{
			m_out.push_back(static_cast<uint8_t>(value >> (8 * i)));
		}
	}

	std::vector<uint8_t> m_out;
};

#define EST_TRY_READ(var, expr) \
	auto var = (expr);          \
	if (!var)                   \
		return std::unexpected { var.error() }

constexpr uint32_t VALID_ACCESS_BITS = 0x7;

std::expected<StorageAccess, Error> read_access(Reader& reader)
{
	EST_TRY_READ(bits, reader.u32());
	if ((*bits & ~VALID_ACCESS_BITS) != 0)
	{
		return std::unexpected{make_error(ErrorKind::MalformedBinaryShader, "Invalid storage access bits {:#x}", *bits)};
	}
	return static_cast<StorageAccess>(*bits);
}

std::expected<BindingType, Error> read_binding_type(Reader& reader)
{
	EST_TRY_READ(tag, reader.u32());
	switch (*tag)
	{
		case 0:
		{
			EST_TRY_READ(size, reader.u32());
			return UniformBufferBinding{.size = *size};
		}
		case 1:
		{
			EST_TRY_READ(size, reader.u32());
			EST_TRY_READ(access, read_access(reader));
			return StorageBufferBinding{.size = *size, .access = *access};
		}
		case 2:
		{
			EST_TRY_READ(access, read_access(reader));
			return StorageTextureBinding{.access = *access};
		}
		case 3:
		{
			EST_TRY_READ(comparison, reader.u32());
			return SamplerBinding{.comparison = *comparison != 0};
		}
		case 4:
		{
			EST_TRY_READ(multisampled, reader.u32());
			return TextureBinding{.multisampled = *multisampled != 0};
		}
		case 5:
		{
			EST_TRY_READ(size, reader.u32());
			return PushConstantBinding{.size = *size};
		}
		default: break;
	}
	return std::unexpected{make_error(ErrorKind::MalformedBinaryShader, "Unknown binding type tag {}", *tag)};
}

std::expected<std::optional<VertexInputDescription>, Error> read_vertex_block(Reader& reader)
{
	EST_TRY_READ(name, reader.string());
	EST_TRY_READ(stride, reader.u32());
	EST_TRY_READ(count, reader.u32());

	VertexInputDescription input{.name = std::move(*name), .stride = *stride, .attributes = {}};
	for (uint32_t i = 0; i < *count; ++i)
	{
		EST_TRY_READ(location, reader.u32());
		EST_TRY_READ(offset, reader.u64());
		EST_TRY_READ(type, reader.u32());
		if (*type > static_cast<uint32_t>(VertexType::Uint32x4))
		{
			return std::unexpected{make_error(ErrorKind::MalformedBinaryShader, "Invalid vertex input type {}", *type)};
		}
		input.attributes.push_back({.location = *location, .offset = *offset, .type = static_cast<VertexType>(*type)});
	}

	// An empty block marks a vertex stage without vertex buffers.
	if (input.attributes.empty() && input.name.empty())
	{
		return std::nullopt;
	}
	return input;
}

void write_binding_type(Writer& writer, const BindingType& type)
{
	std::visit(overloaded{
				   [&](const UniformBufferBinding& b)
				   {
					   writer.u32(0);
					   writer.u32(b.size);
				   },
				   [&](const StorageBufferBinding& b)
				   {
					   writer.u32(1);
					   writer.u32(b.size);
					   writer.u32(static_cast<uint32_t>(b.access));
				   },
				   [&](const StorageTextureBinding& b)
				   {
					   writer.u32(2);
					   writer.u32(static_cast<uint32_t>(b.access));
				   },
				   [&](const SamplerBinding& b)
				   {
					   writer.u32(3);
					   writer.u32(b.comparison ? 1 : 0);
				   },
				   [&](const TextureBinding& b)
				   {
					   writer.u32(4);
					   writer.u32(b.multisampled ? 1 : 0);
				   },
				   [&](const PushConstantBinding& b)
				   {
					   writer.u32(5);
					   writer.u32(b.size);
				   },
			   },
			   type);
}

void write_vertex_block(Writer& writer, const std::optional<VertexInputDescription>& input)
{
	if (!input)
	{
		writer.string("");
		writer.u32(0);
		writer.u32(0);
		return;
	}
	writer.string(input->name);
	writer.u32(static_cast<uint32_t>(input->stride));
	writer.u32(static_cast<uint32_t>(input->attributes.size()));
	for (const auto& attribute : input->attributes)
	{
		writer.u32(attribute.location);
		writer.u64(attribute.offset);
		writer.u32(static_cast<uint32_t>(attribute.type));
	}
}

} // anonymous namespace

std::expected<BinaryShader, Error> load_binary_shader(std::span<const uint8_t> data)
{
	Reader reader(data);

	EST_TRY_READ(magic, reader.bytes(BINARY_SHADER_MAGIC.size()));
	if (!std::equal(magic->begin(), magic->end(), BINARY_SHADER_MAGIC.begin(),
					[](uint8_t a, char b) { return a == static_cast<uint8_t>(b); }))
	{
		return std::unexpected{make_error(ErrorKind::MalformedBinaryShader, "Invalid shader magic")};
	}

	EST_TRY_READ(kind_id, reader.u32());
	if (*kind_id > static_cast<uint32_t>(ShaderKind::Compute))
	{
		return std::unexpected{make_error(ErrorKind::MalformedBinaryShader, "Unknown shader type id {}", *kind_id)};
	}
	auto kind = static_cast<ShaderKind>(*kind_id);

	EST_TRY_READ(entry_point, reader.string());

	EST_TRY_READ(binding_count, reader.u32());
	std::vector<BindingInfo> bindings;
	for (uint32_t i = 0; i < *binding_count; ++i)
	{
		EST_TRY_READ(group, reader.u32());
		EST_TRY_READ(binding, reader.u32());
		EST_TRY_READ(name, reader.string());
		EST_TRY_READ(type, read_binding_type(reader));
		bindings.push_back(
			BindingInfo{.group = *group, .binding = *binding, .name = std::move(*name), .type = std::move(*type)});
	}

	std::optional<VertexInputDescription> vertex_input;
	if (kind == ShaderKind::Vertex || kind == ShaderKind::VertexFragment)
	{
		EST_TRY_READ(block, read_vertex_block(reader));
		vertex_input = std::move(*block);
	}

	std::optional<ShaderReflection> reflection;
	switch (kind)
	{
		case ShaderKind::Vertex:
			reflection = VertexReflection{
				.entry_point = std::move(*entry_point), .input = std::move(vertex_input), .bindings = std::move(bindings)};
			break;
		case ShaderKind::Fragment:
			reflection = FragmentReflection{.entry_point = std::move(*entry_point), .bindings = std::move(bindings)};
			break;
		case ShaderKind::VertexFragment:
		{
			auto comma = entry_point->find(',');
			if (comma == std::string::npos || entry_point->find(',', comma + 1) != std::string::npos)
			{
				return std::unexpected{make_error(ErrorKind::MalformedBinaryShader,
												  "Invalid vertex/fragment entry point '{}'", *entry_point)};
			}
			reflection = VertexFragmentReflection{.vertex_entry_point	= entry_point->substr(0, comma),
												  .vertex_input			= std::move(vertex_input),
												  .fragment_entry_point = entry_point->substr(comma + 1),
												  .bindings				= std::move(bindings)};
			break;
		}
		case ShaderKind::Compute:
			reflection = ComputeReflection{.entry_point = std::move(*entry_point), .bindings = std::move(bindings)};
			break;
	}

	EST_TRY_READ(spirv_size, reader.u32());
	EST_TRY_READ(spirv, reader.bytes(*spirv_size));

	Logger::instance().debug("Loaded binary shader: {} bindings, {} bytes of SPIR-V", reflection->bindings().size(),
							 spirv->size());

	return BinaryShader{.reflection = std::move(*reflection), .spirv = {spirv->begin(), spirv->end()}};
}

std::vector<uint8_t> write_binary_shader(const BinaryShader& shader)
{
	Writer writer;
	writer.bytes(std::span{reinterpret_cast<const uint8_t*>(BINARY_SHADER_MAGIC.data()), BINARY_SHADER_MAGIC.size()});

	const auto& base = static_cast<const ShaderReflectionBase&>(shader.reflection);
	std::visit(overloaded{
				   [&](const VertexReflection& r)
				   {
					   writer.u32(static_cast<uint32_t>(ShaderKind::Vertex));
					   writer.string(r.entry_point);
				   },
				   [&](const FragmentReflection& r)
				   {
					   writer.u32(static_cast<uint32_t>(ShaderKind::Fragment));
					   writer.string(r.entry_point);
				   },
				   [&](const VertexFragmentReflection& r)
				   {
					   writer.u32(static_cast<uint32_t>(ShaderKind::VertexFragment));
					   writer.string(r.vertex_entry_point + "," + r.fragment_entry_point);
				   },
				   [&](const ComputeReflection& r)
				   {
					   writer.u32(static_cast<uint32_t>(ShaderKind::Compute));
					   writer.string(r.entry_point);
				   },
			   },
			   base);

	const auto& bindings = shader.reflection.bindings();
	writer.u32(static_cast<uint32_t>(bindings.size()));
	for (const auto& binding : bindings)
	{
		writer.u32(binding.group);
		writer.u32(binding.binding);
		writer.string(binding.name);
		write_binding_type(writer, binding.type);
	}

	if (std::holds_alternative<VertexReflection>(base) || std::holds_alternative<VertexFragmentReflection>(base))
	{
		const auto* input = shader.reflection.vertex_input();
		write_vertex_block(writer, input ? std::optional{*input} : std::nullopt);
	}

	writer.u32(static_cast<uint32_t>(shader.spirv.size()));
	writer.bytes(shader.spirv);
	return writer.take();
}

} // namespace est
