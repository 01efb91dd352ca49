//
// Created by chris on 1/6/26.
//

#ifndef ESTRENDER_VULKANDEVICE_HPP
#define ESTRENDER_VULKANDEVICE_HPP
#include <expected>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <vulkan/vulkan.hpp>

#include "Error.hpp"
#include "GpuDevice.hpp"

namespace est
{

enum class PreferredDeviceType
{
	Discrete,
	Integrated,
	Cpu,
};

struct VulkanDeviceConfig
{
	std::string application_name = "EstRender";
#ifdef NDEBUG
	bool enable_validation = false;
#else
	bool enable_validation = true;
#endif
	/// Falls back to any other device type when no device of this type exists.
	PreferredDeviceType preferred_device = PreferredDeviceType::Discrete;
};

/**
 * @brief Headless GpuDevice on Vulkan 1.3
 *
 * One queue family that supports graphics and compute is used for everything.
 * Render passes use dynamic rendering and every image lives in the general layout,
 * passes and copies are separated by full memory barriers. Vulkan failures are
 * thrown as DeviceError carrying the vk::Result text.
 */
class VulkanDevice final : public GpuDevice
{
public:
	static std::expected<std::shared_ptr<VulkanDevice>, Error> create(const VulkanDeviceConfig& config = {});
	~VulkanDevice() override;

	VulkanDevice(const VulkanDevice&)			 = delete;
	VulkanDevice& operator=(const VulkanDevice&) = delete;
	VulkanDevice(VulkanDevice&&)				 = delete;
	VulkanDevice& operator=(VulkanDevice&&)		 = delete;

	BufferHandle		  create_buffer(const BufferDescriptor& descriptor) override;
	BufferHandle		  create_buffer_with_data(const BufferDescriptor& descriptor, std::span<const uint8_t> data) override;
	TextureHandle		  create_texture(const TextureDescriptor& descriptor) override;
	SamplerHandle		  create_sampler(const SamplerDescriptor& descriptor) override;
	ShaderModuleHandle	  create_shader_module(const ShaderModuleDescriptor& descriptor) override;
	BindGroupLayoutHandle create_bind_group_layout(const BindGroupLayoutDescriptor& descriptor) override;
	PipelineLayoutHandle  create_pipeline_layout(const PipelineLayoutDescriptor& descriptor) override;
	PipelineHandle		  create_render_pipeline(const RenderPipelineDescriptor& descriptor) override;
	PipelineHandle		  create_compute_pipeline(const ComputePipelineDescriptor& descriptor) override;
	BindGroupHandle		  create_bind_group(const BindGroupDescriptor& descriptor) override;

	void destroy(BufferHandle handle) override;
	void destroy(TextureHandle handle) override;
	void destroy(SamplerHandle handle) override;
	void destroy(ShaderModuleHandle handle) override;
	void destroy(BindGroupLayoutHandle handle) override;
	void destroy(PipelineLayoutHandle handle) override;
	void destroy(PipelineHandle handle) override;
	void destroy(BindGroupHandle handle) override;

	std::unique_ptr<CommandList> create_command_list() override;
	void						 submit(CommandList& commands) override;
	void						 wait_idle(std::chrono::nanoseconds timeout) override;

	void				 write_buffer(BufferHandle buffer, uint64_t offset, std::span<const uint8_t> data) override;
	void				 write_texture(TextureHandle texture, std::span<const uint8_t> data) override;
	std::vector<uint8_t> map_read(BufferHandle buffer, uint64_t size, std::chrono::nanoseconds timeout) override;

	[[nodiscard]] DeviceLimits limits() const override { return m_limits; }

	[[nodiscard]] vk::Instance		 instance() const { return m_instance; }
	[[nodiscard]] vk::PhysicalDevice physical_device() const { return m_physical_device; }
	[[nodiscard]] vk::Device		 device() const { return m_device; }
	[[nodiscard]] uint32_t			 queue_family() const { return m_queue_family; }

private:
	friend class VulkanCommandList;

	struct BufferRecord
	{
		vk::Buffer		 buffer;
		vk::DeviceMemory memory;
		uint64_t		 size;
		bool			 host_visible;
	};

	struct TextureRecord
	{
		vk::Image			 image;
		vk::DeviceMemory	 memory;
		vk::ImageView		 view;
		vk::Format			 format;
		vk::ImageAspectFlags aspect;
		uint32_t			 width;
		uint32_t			 height;
		uint32_t			 texel_size;
	};

	struct SetLayoutRecord
	{
		vk::DescriptorSetLayout						  layout;
		std::unordered_map<uint32_t, vk::DescriptorType> types;
	};

	struct PipelineLayoutRecord
	{
		vk::PipelineLayout					 layout;
		std::vector<vk::DescriptorSetLayout> gap_layouts;
	};

	struct PipelineRecord
	{
		vk::Pipeline		  pipeline;
		vk::PipelineLayout	  layout;
		vk::PipelineBindPoint bind_point;
	};

	struct BindGroupRecord
	{
		vk::DescriptorPool pool;
		vk::DescriptorSet  set;
	};

	struct Submission
	{
		vk::Fence		  fence;
		vk::CommandBuffer commands;
	};

	explicit VulkanDevice(VulkanDeviceConfig config);
	void initialize();

	uint64_t									next_id() { return m_next_id++; }
	[[nodiscard]] uint32_t						find_memory_type(uint32_t type_filter, vk::MemoryPropertyFlags properties) const;
	[[nodiscard]] vk::DeviceMemory				allocate_memory(vk::MemoryRequirements requirements,
																vk::MemoryPropertyFlags properties);
	[[nodiscard]] BufferRecord					make_buffer(uint64_t size, vk::BufferUsageFlags usage, bool host_visible);
	void										release(const BufferRecord& entry);
	[[nodiscard]] vk::CommandBuffer				begin_commands();
	void										submit_commands(vk::CommandBuffer commands);
	void										run_now(vk::CommandBuffer commands);

	[[nodiscard]] const BufferRecord&		 buffer(BufferHandle handle) const;
	[[nodiscard]] const TextureRecord&		 texture(TextureHandle handle) const;
	[[nodiscard]] vk::Sampler				 sampler(SamplerHandle handle) const;
	[[nodiscard]] const PipelineRecord&		 pipeline(PipelineHandle handle) const;
	[[nodiscard]] vk::DescriptorSet			 bind_group(BindGroupHandle handle) const;

	VulkanDeviceConfig m_config;

	vk::Instance			   m_instance;
	vk::DebugUtilsMessengerEXT m_debug_messenger;
	vk::PhysicalDevice		   m_physical_device;
	uint32_t				   m_queue_family = 0;
	vk::Device				   m_device;
	vk::Queue				   m_queue;
	vk::CommandPool			   m_command_pool;
	DeviceLimits			   m_limits;

	uint64_t												m_next_id = 1;
	std::unordered_map<uint64_t, BufferRecord>				m_buffers;
	std::unordered_map<uint64_t, TextureRecord>				m_textures;
	std::unordered_map<uint64_t, vk::Sampler>				m_samplers;
	std::unordered_map<uint64_t, vk::ShaderModule>			m_shader_modules;
	std::unordered_map<uint64_t, SetLayoutRecord>		m_bind_group_layouts;
	std::unordered_map<uint64_t, PipelineLayoutRecord>		m_pipeline_layouts;
	std::unordered_map<uint64_t, PipelineRecord>				m_pipelines;
	std::unordered_map<uint64_t, BindGroupRecord>			m_bind_groups;
	std::vector<Submission>									m_in_flight;
};

} // namespace est

#endif // ESTRENDER_VULKANDEVICE_HPP
