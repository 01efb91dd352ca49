//
// Created by chris on 1/13/26.
//

#ifndef ESTRENDER_BINDGROUP_HPP
#define ESTRENDER_BINDGROUP_HPP
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <string_view>
#include <utility>
#include <variant>

#include "Buffer.hpp"
#include "Error.hpp"
#include "GpuObjects.hpp"
#include "Shader.hpp"
#include "Texture.hpp"

namespace est
{

class GraphicsContext;

enum class AttachmentKind
{
	Uniform,
	Storage,
	Texture,
	StorageTexture,
	Sampler,
};

[[nodiscard]] std::string_view to_string(AttachmentKind kind);

/// One resource bound at (group, binding).
struct BindGroupAttachment
{
	uint32_t							   group;
	uint32_t							   binding;
	AttachmentKind						   kind;
	std::variant<Buffer, Texture, Sampler> resource;

	static BindGroupAttachment uniform(uint32_t group, uint32_t binding, const Buffer& buffer);
	static BindGroupAttachment storage(uint32_t group, uint32_t binding, const Buffer& buffer);
	static BindGroupAttachment texture(uint32_t group, uint32_t binding, const Texture& texture);
	static BindGroupAttachment storage_texture(uint32_t group, uint32_t binding, const Texture& texture);
	static BindGroupAttachment sampler(uint32_t group, uint32_t binding, const Sampler& sampler);

	/// Backend handle id of the referenced resource.
	[[nodiscard]] uint64_t					  resource_id() const;
	[[nodiscard]] std::shared_ptr<const void> keep_alive() const;
};

/**
 * @brief Attachments keyed by (group, binding)
 *
 * Setting a slot twice replaces the previous attachment. Iteration is in ascending
 * (group, binding) order.
 */
class BindingSet
{
public:
	using Slot = std::pair<uint32_t, uint32_t>;

	void set(BindGroupAttachment attachment);
	void set_uniform(uint32_t group, uint32_t binding, const Buffer& buffer);
	void set_storage(uint32_t group, uint32_t binding, const Buffer& buffer);
	void set_texture(uint32_t group, uint32_t binding, const Texture& texture);
	void set_storage_texture(uint32_t group, uint32_t binding, const Texture& texture);
	void set_sampler(uint32_t group, uint32_t binding, const Sampler& sampler);

	bool remove(uint32_t group, uint32_t binding);
	void clear() { m_attachments.clear(); }

	[[nodiscard]] const BindGroupAttachment*				   find(uint32_t group, uint32_t binding) const;
	[[nodiscard]] const std::map<Slot, BindGroupAttachment>& attachments() const { return m_attachments; }
	[[nodiscard]] bool										   empty() const { return m_attachments.empty(); }
	[[nodiscard]] std::size_t								   size() const { return m_attachments.size(); }

private:
	std::map<Slot, BindGroupAttachment> m_attachments;
};

/**
 * @brief Check one attachment against the binding the shader declares at its slot
 *
 * BindingNotFound when the shader has no such binding. BindingTypeMismatch when the
 * resource kind differs from the declared type, a buffer is smaller than the declared
 * size or lacks the usage flag the binding needs, or a texture or sampler disagrees
 * with the declared multisampling or comparison mode.
 */
[[nodiscard]] std::expected<void, Error> validate_attachment(const Shader& shader,
															  const BindGroupAttachment& attachment);

/**
 * @brief Check a push constant block of the given padded size against the shader
 *
 * Returns the stages the range is visible to. InvalidUsage when the shader declares no
 * push constants, InvalidSize when the block is larger than the declared range.
 */
[[nodiscard]] std::expected<ShaderStageFlags, Error> validate_push_constants(const Shader& shader, std::size_t size);

/// Cache key: discriminator 0, then (group, binding, kind, handle id) per attachment, then the shader id.
[[nodiscard]] uint64_t bind_group_key(const Shader& shader, const BindingSet& attachments);

/**
 * @brief Validate the attachments and fetch their bind groups through the cache
 *
 * Returns nullptr when the shader declares no bind groups at all. Every declared
 * binding needs an attachment (MissingBinding) and every attachment needs a declared
 * group (BindGroupNotFound) and binding.
 */
[[nodiscard]] std::expected<BindGroupPtr, Error> create_bind_groups(GraphicsContext& context, const Shader& shader,
																	const BindingSet& attachments);

} // namespace est

#endif // ESTRENDER_BINDGROUP_HPP
