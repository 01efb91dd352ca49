//
// Created by chris on 1/13/26.
//
#include <est/BindGroup.hpp>
#include <est/GraphicsContext.hpp>
#include <est/Logger.hpp>

#include <map>

namespace est
{

namespace
{

std::expected<void, Error> mismatch(const BindGroupAttachment& attachment, const LayoutBinding& declared,
									std::string_view reason)
{
	return std::unexpected{make_error(ErrorKind::BindingTypeMismatch,
									  "Attachment {} at (group {}, binding {}) does not match '{}' declared as {}: {}",
									  to_string(attachment.kind), attachment.group, attachment.binding, declared.name,
									  to_string(declared.type), reason)};
}

std::expected<void, Error> check_buffer(const BindGroupAttachment& attachment, const LayoutBinding& declared)
{
	const auto& buffer = std::get<Buffer>(attachment.resource);
	return std::visit(
		overloaded{
			[&](const UniformBufferBinding& uniform) -> std::expected<void, Error>
			{
				if (attachment.kind != AttachmentKind::Uniform)
					return mismatch(attachment, declared, "expected a uniform buffer");
				if (!has_flag(buffer.usage(), BufferUsage::Uniform))
					return mismatch(attachment, declared, "buffer lacks Uniform usage");
				if (buffer.size() < uniform.size)
					return mismatch(attachment, declared,
									fmt::format("buffer holds {} bytes, {} required", buffer.size(), uniform.size));
				return {};
			},
			[&](const StorageBufferBinding& storage) -> std::expected<void, Error>
			{
				if (attachment.kind != AttachmentKind::Storage)
					return mismatch(attachment, declared, "expected a storage buffer");
				if (!has_flag(buffer.usage(), BufferUsage::Storage))
					return mismatch(attachment, declared, "buffer lacks Storage usage");
				if (storage.size != UNBOUNDED_SIZE && buffer.size() < storage.size)
					return mismatch(attachment, declared,
									fmt::format("buffer holds {} bytes, {} required", buffer.size(), storage.size));
				return {};
			},
			[&](const auto&) -> std::expected<void, Error>
			{ return mismatch(attachment, declared, "a buffer cannot be bound here"); },
		},
		declared.type);
}

std::expected<void, Error> check_texture(const BindGroupAttachment& attachment, const LayoutBinding& declared)
{
	const auto& texture = std::get<Texture>(attachment.resource);
	return std::visit(
		overloaded{
			[&](const TextureBinding& sampled) -> std::expected<void, Error>
			{
				if (attachment.kind != AttachmentKind::Texture)
					return mismatch(attachment, declared, "expected a sampled texture");
				if (!has_flag(texture.usage(), TextureUsage::TextureBinding))
					return mismatch(attachment, declared, "texture lacks TextureBinding usage");
				if (texture.is_multisampled() != sampled.multisampled)
					return mismatch(attachment, declared, "multisampling differs");
				return {};
			},
			[&](const StorageTextureBinding&) -> std::expected<void, Error>
			{
				if (attachment.kind != AttachmentKind::StorageTexture)
					return mismatch(attachment, declared, "expected a storage texture");
				if (!has_flag(texture.usage(), TextureUsage::StorageBinding))
					return mismatch(attachment, declared, "texture lacks StorageBinding usage");
				return {};
			},
			[&](const auto&) -> std::expected<void, Error>
			{ return mismatch(attachment, declared, "a texture cannot be bound here"); },
		},
		declared.type);
}

std::expected<void, Error> check_sampler(const BindGroupAttachment& attachment, const LayoutBinding& declared)
{
	const auto* sampler_binding = std::get_if<SamplerBinding>(&declared.type);
	if (!sampler_binding)
		return mismatch(attachment, declared, "a sampler cannot be bound here");
	if (std::get<Sampler>(attachment.resource).is_comparison() != sampler_binding->comparison)
		return mismatch(attachment, declared, "comparison mode differs");
	return {};
}

BindGroupResource to_resource(const BindGroupAttachment& attachment)
{
	return std::visit(overloaded{
						  [](const Buffer& buffer) -> BindGroupResource
						  { return BufferBinding{.buffer = buffer.handle(), .offset = 0, .size = buffer.size()}; },
						  [](const Texture& texture) -> BindGroupResource { return texture.handle(); },
						  [](const Sampler& sampler) -> BindGroupResource { return sampler.handle(); },
					  },
					  attachment.resource);
}

BindGroupPtr build_bind_groups(GraphicsContext& context, const Shader& shader,
							   const std::map<uint32_t, std::vector<const BindGroupAttachment*>>& grouped)
{
	auto object = std::make_shared<BindGroupObject>();
	for (const auto& layout : shader.layouts())
	{
		const auto& entries = grouped.at(layout.group);

		BindGroupDescriptor descriptor{.label	= fmt::format("BindGroup for group {} of '{}'", layout.group, shader.label()),
									   .layout	= layout.handle.get(),
									   .entries = {}};
		for (const auto* attachment : entries)
		{
			descriptor.entries.push_back(BindGroupEntry{.binding = attachment->binding, .resource = to_resource(*attachment)});
			object->resources.push_back(attachment->keep_alive());
		}

		auto handle = context.device().create_bind_group(descriptor);
		Logger::instance().debug("Created {} with {} entries", descriptor.label, descriptor.entries.size());
		object->groups.emplace_back(layout.group, OwnedHandle{context.shared_device(), handle});
	}
	return object;
}

} // anonymous namespace

std::string_view to_string(AttachmentKind kind)
{
	switch (kind)
	{
	case AttachmentKind::Uniform:
		return "uniform buffer";
	case AttachmentKind::Storage:
		return "storage buffer";
	case AttachmentKind::Texture:
		return "texture";
	case AttachmentKind::StorageTexture:
		return "storage texture";
	case AttachmentKind::Sampler:
		return "sampler";
	}
	return "unknown";
}

// ============================================================================
// BindGroupAttachment
// ============================================================================

BindGroupAttachment BindGroupAttachment::uniform(uint32_t group, uint32_t binding, const Buffer& buffer)
{
	return {.group = group, .binding = binding, .kind = AttachmentKind::Uniform, .resource = buffer};
}

BindGroupAttachment BindGroupAttachment::storage(uint32_t group, uint32_t binding, const Buffer& buffer)
{
	return {.group = group, .binding = binding, .kind = AttachmentKind::Storage, .resource = buffer};
}

BindGroupAttachment BindGroupAttachment::texture(uint32_t group, uint32_t binding, const Texture& texture)
{
	return {.group = group, .binding = binding, .kind = AttachmentKind::Texture, .resource = texture};
}

BindGroupAttachment BindGroupAttachment::storage_texture(uint32_t group, uint32_t binding, const Texture& texture)
{
	return {.group = group, .binding = binding, .kind = AttachmentKind::StorageTexture, .resource = texture};
}

BindGroupAttachment BindGroupAttachment::sampler(uint32_t group, uint32_t binding, const Sampler& sampler)
{
	return {.group = group, .binding = binding, .kind = AttachmentKind::Sampler, .resource = sampler};
}

uint64_t BindGroupAttachment::resource_id() const
{
	return std::visit([](const auto& resource) { return resource.handle().id; }, resource);
}

std::shared_ptr<const void> BindGroupAttachment::keep_alive() const
{
	return std::visit([](const auto& resource) -> std::shared_ptr<const void> { return resource.resource(); },
					  resource);
}

// ============================================================================
// BindingSet
// ============================================================================

void BindingSet::set(BindGroupAttachment attachment)
{
	auto slot = Slot{attachment.group, attachment.binding};
	m_attachments.insert_or_assign(slot, std::move(attachment));
}

void BindingSet::set_uniform(uint32_t group, uint32_t binding, const Buffer& buffer)
{
	set(BindGroupAttachment::uniform(group, binding, buffer));
}

void BindingSet::set_storage(uint32_t group, uint32_t binding, const Buffer& buffer)
{
	set(BindGroupAttachment::storage(group, binding, buffer));
}

void BindingSet::set_texture(uint32_t group, uint32_t binding, const Texture& texture)
{
	set(BindGroupAttachment::texture(group, binding, texture));
}

void BindingSet::set_storage_texture(uint32_t group, uint32_t binding, const Texture& texture)
{
	set(BindGroupAttachment::storage_texture(group, binding, texture));
}

void BindingSet::set_sampler(uint32_t group, uint32_t binding, const Sampler& sampler)
{
	set(BindGroupAttachment::sampler(group, binding, sampler));
}

bool BindingSet::remove(uint32_t group, uint32_t binding)
{
	return m_attachments.erase(Slot{group, binding}) > 0;
}

const BindGroupAttachment* BindingSet::find(uint32_t group, uint32_t binding) const
{
	auto it = m_attachments.find(Slot{group, binding});
	return it == m_attachments.end() ? nullptr : &it->second;
}

// ============================================================================
// Validation and caching
// ============================================================================

std::expected<void, Error> validate_attachment(const Shader& shader, const BindGroupAttachment& attachment)
{
	const auto* declared = shader.find_binding(attachment.group, attachment.binding);
	if (!declared)
	{
		return std::unexpected{make_error(ErrorKind::BindingNotFound,
										  "Shader '{}' declares no binding at (group {}, binding {})", shader.label(),
										  attachment.group, attachment.binding)};
	}

	switch (attachment.kind)
	{
	case AttachmentKind::Uniform:
	case AttachmentKind::Storage:
		return check_buffer(attachment, *declared);
	case AttachmentKind::Texture:
	case AttachmentKind::StorageTexture:
		return check_texture(attachment, *declared);
	case AttachmentKind::Sampler:
		return check_sampler(attachment, *declared);
	}
	return mismatch(attachment, *declared, "unknown attachment kind");
}

std::expected<ShaderStageFlags, Error> validate_push_constants(const Shader& shader, std::size_t size)
{
	const auto& range = shader.push_constants();
	if (!range)
	{
		return std::unexpected{
			make_error(ErrorKind::InvalidUsage, "Shader '{}' declares no push constants", shader.label())};
	}
	if (size > range->size)
	{
		return std::unexpected{make_error(ErrorKind::InvalidSize,
										  "{} bytes of push constants exceed the {} bytes declared by '{}'", size,
										  range->size, shader.label())};
	}
	return range->stages;
}

uint64_t bind_group_key(const Shader& shader, const BindingSet& attachments)
{
	uint64_t seed = 0;
	hash_value(seed, uint64_t{0});
	for (const auto& [slot, attachment] : attachments.attachments())
	{
		hash_value(seed, slot.first);
		hash_value(seed, slot.second);
		hash_value(seed, attachment.kind);
		hash_value(seed, attachment.resource_id());
	}
	hash_value(seed, shader.id());
	return seed;
}

std::expected<BindGroupPtr, Error> create_bind_groups(GraphicsContext& context, const Shader& shader,
													  const BindingSet& attachments)
{
	std::map<uint32_t, std::vector<const BindGroupAttachment*>> grouped;
	for (const auto& [slot, attachment] : attachments.attachments())
	{
		if (!shader.find_layout(slot.first))
		{
			return std::unexpected{make_error(ErrorKind::BindGroupNotFound,
											  "Shader '{}' has no bind group {} for the attachment at binding {}",
											  shader.label(), slot.first, slot.second)};
		}
		if (auto valid = validate_attachment(shader, attachment); !valid)
		{
			return std::unexpected{valid.error()};
		}
		grouped[slot.first].push_back(&attachment);
	}

	for (const auto& layout : shader.layouts())
	{
		for (const auto& entry : layout.entries)
		{
			if (!attachments.find(layout.group, entry.binding))
			{
				return std::unexpected{make_error(ErrorKind::MissingBinding,
												  "Shader '{}' needs '{}' at (group {}, binding {}) but nothing is attached",
												  shader.label(), entry.name, layout.group, entry.binding)};
			}
		}
	}

	if (shader.layouts().empty())
	{
		return BindGroupPtr{};
	}

	try
	{
		return context.bind_group_cache().get_or_create(bind_group_key(shader, attachments),
														[&] { return build_bind_groups(context, shader, grouped); });
	} catch (const DeviceError& e)
	{
		return std::unexpected{
			make_error(ErrorKind::DeviceFailure, "Failed to create bind groups for '{}': {}", shader.label(), e.what())};
	}
}

} // namespace est
