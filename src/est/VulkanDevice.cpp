//
// Created by chris on 1/6/26.
//
#include <est/Logger.hpp>
#include <est/VulkanDevice.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <optional>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace est
{

namespace
{

constexpr std::array VALIDATION_LAYERS = {"VK_LAYER_KHRONOS_validation"};

/// Bound for internal uploads and layout transitions.
constexpr std::chrono::nanoseconds UPLOAD_TIMEOUT = std::chrono::seconds{10};

// ============================================================================
// Result checking
// ============================================================================

void check(vk::Result result, std::string_view what)
{
	if (result != vk::Result::eSuccess)
	{
		throw DeviceError{fmt::format("{}: {}", what, vk::to_string(result))};
	}
}

template<class T>
T check(vk::ResultValue<T> result, std::string_view what)
{
	check(result.result, what);
	return std::move(result.value);
}

// ============================================================================
// Instance setup
// ============================================================================

vk::Bool32 debug_callback(vk::DebugUtilsMessageSeverityFlagBitsEXT severity,
						  [[maybe_unused]] vk::DebugUtilsMessageTypeFlagsEXT type,
						  const vk::DebugUtilsMessengerCallbackDataEXT* callback_data, [[maybe_unused]] void* user_data)
{
	auto& logger  = Logger::instance();
	auto  pattern = fmt::format("[EstRender]{:<30}[%^%5l%$] %v", "[VulkanDebug]");
	logger.set_pattern(pattern);
	switch (severity)
	{
		case vk::DebugUtilsMessageSeverityFlagBitsEXT::eVerbose: logger.trace("{}", callback_data->pMessage); break;
		case vk::DebugUtilsMessageSeverityFlagBitsEXT::eInfo: logger.debug("{}", callback_data->pMessage); break;
		case vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning: logger.warn("{}", callback_data->pMessage); break;
		case vk::DebugUtilsMessageSeverityFlagBitsEXT::eError: logger.error("{}", callback_data->pMessage); break;
		default: logger.info("{}", callback_data->pMessage); break;
	}
	return vk::False;
}

bool check_validation_layer_support()
{
	auto available_res = vk::enumerateInstanceLayerProperties();
	if (available_res.result != vk::Result::eSuccess)
	{
		Logger::instance().warn("Could not query instance layer properties {}", vk::to_string(available_res.result));
		return false;
	}
	for (const char* layer_name : VALIDATION_LAYERS)
	{
		auto found = std::ranges::any_of(available_res.value, [&](const vk::LayerProperties& layer)
										 { return std::strcmp(layer_name, layer.layerName) == 0; });
		if (!found)
		{
			Logger::instance().warn("Validation layer {} not available", layer_name);
			return false;
		}
	}
	return true;
}

vk::DebugUtilsMessengerCreateInfoEXT make_debug_messenger_create_info()
{
	return vk::DebugUtilsMessengerCreateInfoEXT()
		.setMessageSeverity(vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning |
							vk::DebugUtilsMessageSeverityFlagBitsEXT::eError)
		.setMessageType(vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral |
						vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation |
						vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance)
		.setPfnUserCallback(debug_callback);
}

vk::Instance create_instance(const VulkanDeviceConfig& config, bool& validation)
{
	static vk::detail::DynamicLoader dl;
	auto vkGetInstanceProcAddr = dl.getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr");
	if (!vkGetInstanceProcAddr)
	{
		throw DeviceError{"Vulkan loader not found"};
	}
	VULKAN_HPP_DEFAULT_DISPATCHER.init(vkGetInstanceProcAddr);

	auto app_info = vk::ApplicationInfo()
						.setPApplicationName(config.application_name.c_str())
						.setApplicationVersion(VK_MAKE_VERSION(1, 0, 0))
						.setPEngineName("EstRender")
						.setEngineVersion(VK_MAKE_VERSION(1, 0, 0))
						.setApiVersion(VK_API_VERSION_1_3);

	validation = config.enable_validation && check_validation_layer_support();

	std::vector<const char*> extensions;
	if (validation)
	{
		extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
	}

	auto create_info = vk::InstanceCreateInfo().setPApplicationInfo(&app_info).setPEnabledExtensionNames(extensions);

	auto debug_create_info = make_debug_messenger_create_info();
	if (validation)
	{
		create_info.setPEnabledLayerNames(VALIDATION_LAYERS);
		create_info.setPNext(&debug_create_info);
		Logger::instance().info("Validation layers enabled");
	}

	auto instance = check(vk::createInstance(create_info), "Failed to create instance");
	VULKAN_HPP_DEFAULT_DISPATCHER.init(instance);
	Logger::instance().debug("Created Vulkan instance");
	return instance;
}

vk::PhysicalDeviceType to_vk(PreferredDeviceType type)
{
	switch (type)
	{
		case PreferredDeviceType::Discrete: return vk::PhysicalDeviceType::eDiscreteGpu;
		case PreferredDeviceType::Integrated: return vk::PhysicalDeviceType::eIntegratedGpu;
		case PreferredDeviceType::Cpu: return vk::PhysicalDeviceType::eCpu;
	}
	return vk::PhysicalDeviceType::eDiscreteGpu;
}

vk::PhysicalDevice select_physical_device(vk::Instance instance, PreferredDeviceType preferred)
{
	auto devices = check(instance.enumeratePhysicalDevices(), "Failed to enumerate physical devices");

	const std::array order = {to_vk(preferred), vk::PhysicalDeviceType::eDiscreteGpu,
							  vk::PhysicalDeviceType::eIntegratedGpu, vk::PhysicalDeviceType::eVirtualGpu,
							  vk::PhysicalDeviceType::eCpu};
	for (auto type : order)
	{
		for (const auto& dev : devices)
		{
			auto props = dev.getProperties();
			if (props.deviceType == type && props.apiVersion >= VK_API_VERSION_1_3)
			{
				Logger::instance().info("Selected {} device: {}", vk::to_string(type), props.deviceName.data());
				return dev;
			}
		}
	}

	throw DeviceError{"No Vulkan 1.3 capable physical device found"};
}

uint32_t find_queue_family(vk::PhysicalDevice physical_device)
{
	auto queue_families = physical_device.getQueueFamilyProperties();
	for (uint32_t i = 0; i < queue_families.size(); i++)
	{
		const auto flags = queue_families[i].queueFlags;
		if ((flags & vk::QueueFlagBits::eGraphics) && (flags & vk::QueueFlagBits::eCompute))
		{
			Logger::instance().debug("Queue family {} supports graphics and compute", i);
			return i;
		}
	}
	throw DeviceError{"No queue family supports both graphics and compute"};
}

vk::Device create_logical_device(vk::PhysicalDevice physical_device, uint32_t queue_family)
{
	float queue_priority	= 1.0f;
	auto  queue_create_info = vk::DeviceQueueCreateInfo()
								 .setQueueFamilyIndex(queue_family)
								 .setQueueCount(1)
								 .setPQueuePriorities(&queue_priority);

	const auto supported = physical_device.getFeatures();

	// Base features
	vk::PhysicalDeviceFeatures features{};
	features.samplerAnisotropy = supported.samplerAnisotropy;
	features.fillModeNonSolid  = supported.fillModeNonSolid;

	// Vulkan 1.1 features
	vk::PhysicalDeviceVulkan11Features vulkan11_features{};
	vulkan11_features.shaderDrawParameters = VK_TRUE;

	// Vulkan 1.2 features
	vk::PhysicalDeviceVulkan12Features vulkan12_features{};
	vulkan12_features.pNext = &vulkan11_features;

	// Vulkan 1.3 features
	vk::PhysicalDeviceVulkan13Features vulkan13_features{};
	vulkan13_features.dynamicRendering = VK_TRUE;
	vulkan13_features.pNext			   = &vulkan12_features;

	// Features2 container
	vk::PhysicalDeviceFeatures2 features2{};
	features2.features = features;
	features2.pNext	   = &vulkan13_features;

	auto create_info = vk::DeviceCreateInfo().setQueueCreateInfos(queue_create_info).setPNext(&features2);

	auto device = check(physical_device.createDevice(create_info), "Failed to create device");
	Logger::instance().debug("Created logical device");
	return device;
}

// ============================================================================
// Type conversion
// ============================================================================

vk::Format to_vk(TextureFormat format)
{
	switch (format)
	{
		case TextureFormat::R8Unorm: return vk::Format::eR8Unorm;
		case TextureFormat::Rg8Unorm: return vk::Format::eR8G8Unorm;
		case TextureFormat::Rgba8Unorm: return vk::Format::eR8G8B8A8Unorm;
		case TextureFormat::Rgba8UnormSrgb: return vk::Format::eR8G8B8A8Srgb;
		case TextureFormat::Bgra8Unorm: return vk::Format::eB8G8R8A8Unorm;
		case TextureFormat::Bgra8UnormSrgb: return vk::Format::eB8G8R8A8Srgb;
		case TextureFormat::R32Float: return vk::Format::eR32Sfloat;
		case TextureFormat::Rgba16Float: return vk::Format::eR16G16B16A16Sfloat;
		case TextureFormat::Rgba32Float: return vk::Format::eR32G32B32A32Sfloat;
		case TextureFormat::Depth16Unorm: return vk::Format::eD16Unorm;
		case TextureFormat::Depth24Plus: return vk::Format::eD32Sfloat;
		case TextureFormat::Depth24PlusStencil8: return vk::Format::eD32SfloatS8Uint;
		case TextureFormat::Depth32Float: return vk::Format::eD32Sfloat;
	}
	return vk::Format::eUndefined;
}

vk::Format to_vk(VertexType type)
{
	switch (type)
	{
		case VertexType::Float32: return vk::Format::eR32Sfloat;
		case VertexType::Float32x2: return vk::Format::eR32G32Sfloat;
		case VertexType::Float32x3: return vk::Format::eR32G32B32Sfloat;
		case VertexType::Float32x4: return vk::Format::eR32G32B32A32Sfloat;
		case VertexType::Sint32: return vk::Format::eR32Sint;
		case VertexType::Sint32x2: return vk::Format::eR32G32Sint;
		case VertexType::Sint32x3: return vk::Format::eR32G32B32Sint;
		case VertexType::Sint32x4: return vk::Format::eR32G32B32A32Sint;
		case VertexType::Uint32: return vk::Format::eR32Uint;
		case VertexType::Uint32x2: return vk::Format::eR32G32Uint;
		case VertexType::Uint32x3: return vk::Format::eR32G32B32Uint;
		case VertexType::Uint32x4: return vk::Format::eR32G32B32A32Uint;
	}
	return vk::Format::eUndefined;
}

vk::BufferUsageFlags to_vk(BufferUsage usage)
{
	// Every buffer can receive queue writes.
	vk::BufferUsageFlags flags = vk::BufferUsageFlagBits::eTransferDst;
	if (has_flag(usage, BufferUsage::CopySrc))
		flags |= vk::BufferUsageFlagBits::eTransferSrc;
	if (has_flag(usage, BufferUsage::Index))
		flags |= vk::BufferUsageFlagBits::eIndexBuffer;
	if (has_flag(usage, BufferUsage::Vertex))
		flags |= vk::BufferUsageFlagBits::eVertexBuffer;
	if (has_flag(usage, BufferUsage::Uniform))
		flags |= vk::BufferUsageFlagBits::eUniformBuffer;
	if (has_flag(usage, BufferUsage::Storage))
		flags |= vk::BufferUsageFlagBits::eStorageBuffer;
	if (has_flag(usage, BufferUsage::Indirect))
		flags |= vk::BufferUsageFlagBits::eIndirectBuffer;
	return flags;
}

vk::ImageUsageFlags to_vk(TextureUsage usage, bool depth)
{
	// Uploads and layout transitions go through transfer commands.
	vk::ImageUsageFlags flags = vk::ImageUsageFlagBits::eTransferDst;
	if (has_flag(usage, TextureUsage::CopySrc))
		flags |= vk::ImageUsageFlagBits::eTransferSrc;
	if (has_flag(usage, TextureUsage::TextureBinding))
		flags |= vk::ImageUsageFlagBits::eSampled;
	if (has_flag(usage, TextureUsage::StorageBinding))
		flags |= vk::ImageUsageFlagBits::eStorage;
	if (has_flag(usage, TextureUsage::RenderAttachment))
		flags |= depth ? vk::ImageUsageFlagBits::eDepthStencilAttachment : vk::ImageUsageFlagBits::eColorAttachment;
	return flags;
}

vk::ShaderStageFlags to_vk(ShaderStageFlags stages)
{
	vk::ShaderStageFlags flags;
	if (has_flag(stages, ShaderStageFlags::Vertex))
		flags |= vk::ShaderStageFlagBits::eVertex;
	if (has_flag(stages, ShaderStageFlags::Fragment))
		flags |= vk::ShaderStageFlagBits::eFragment;
	if (has_flag(stages, ShaderStageFlags::Compute))
		flags |= vk::ShaderStageFlagBits::eCompute;
	return flags;
}

vk::DescriptorType to_vk(const BindingType& type)
{
	return std::visit(overloaded{
						  [](const UniformBufferBinding&) { return vk::DescriptorType::eUniformBuffer; },
						  [](const StorageBufferBinding&) { return vk::DescriptorType::eStorageBuffer; },
						  [](const StorageTextureBinding&) { return vk::DescriptorType::eStorageImage; },
						  [](const SamplerBinding&) { return vk::DescriptorType::eSampler; },
						  [](const TextureBinding&) { return vk::DescriptorType::eSampledImage; },
						  [](const PushConstantBinding&) -> vk::DescriptorType
						  { throw DeviceError{"Push constants cannot be part of a bind group layout"}; },
					  },
					  type);
}

vk::Filter to_vk(FilterMode mode)
{
	return mode == FilterMode::Nearest ? vk::Filter::eNearest : vk::Filter::eLinear;
}

vk::SamplerAddressMode to_vk(AddressMode mode)
{
	switch (mode)
	{
		case AddressMode::ClampToEdge: return vk::SamplerAddressMode::eClampToEdge;
		case AddressMode::Repeat: return vk::SamplerAddressMode::eRepeat;
		case AddressMode::MirrorRepeat: return vk::SamplerAddressMode::eMirroredRepeat;
	}
	return vk::SamplerAddressMode::eClampToEdge;
}

vk::CompareOp to_vk(CompareFunction compare)
{
	switch (compare)
	{
		case CompareFunction::Never: return vk::CompareOp::eNever;
		case CompareFunction::Less: return vk::CompareOp::eLess;
		case CompareFunction::Equal: return vk::CompareOp::eEqual;
		case CompareFunction::LessEqual: return vk::CompareOp::eLessOrEqual;
		case CompareFunction::Greater: return vk::CompareOp::eGreater;
		case CompareFunction::NotEqual: return vk::CompareOp::eNotEqual;
		case CompareFunction::GreaterEqual: return vk::CompareOp::eGreaterOrEqual;
		case CompareFunction::Always: return vk::CompareOp::eAlways;
	}
	return vk::CompareOp::eAlways;
}

vk::BlendFactor to_vk(BlendFactor factor)
{
	switch (factor)
	{
		case BlendFactor::Zero: return vk::BlendFactor::eZero;
		case BlendFactor::One: return vk::BlendFactor::eOne;
		case BlendFactor::Src: return vk::BlendFactor::eSrcColor;
		case BlendFactor::OneMinusSrc: return vk::BlendFactor::eOneMinusSrcColor;
		case BlendFactor::SrcAlpha: return vk::BlendFactor::eSrcAlpha;
		case BlendFactor::OneMinusSrcAlpha: return vk::BlendFactor::eOneMinusSrcAlpha;
		case BlendFactor::Dst: return vk::BlendFactor::eDstColor;
		case BlendFactor::OneMinusDst: return vk::BlendFactor::eOneMinusDstColor;
		case BlendFactor::DstAlpha: return vk::BlendFactor::eDstAlpha;
		case BlendFactor::OneMinusDstAlpha: return vk::BlendFactor::eOneMinusDstAlpha;
	}
	return vk::BlendFactor::eOne;
}

vk::BlendOp to_vk(BlendOperation operation)
{
	switch (operation)
	{
		case BlendOperation::Add: return vk::BlendOp::eAdd;
		case BlendOperation::Subtract: return vk::BlendOp::eSubtract;
		case BlendOperation::ReverseSubtract: return vk::BlendOp::eReverseSubtract;
		case BlendOperation::Min: return vk::BlendOp::eMin;
		case BlendOperation::Max: return vk::BlendOp::eMax;
	}
	return vk::BlendOp::eAdd;
}

vk::PrimitiveTopology to_vk(PrimitiveTopology topology)
{
	switch (topology)
	{
		case PrimitiveTopology::PointList: return vk::PrimitiveTopology::ePointList;
		case PrimitiveTopology::LineList: return vk::PrimitiveTopology::eLineList;
		case PrimitiveTopology::LineStrip: return vk::PrimitiveTopology::eLineStrip;
		case PrimitiveTopology::TriangleList: return vk::PrimitiveTopology::eTriangleList;
		case PrimitiveTopology::TriangleStrip: return vk::PrimitiveTopology::eTriangleStrip;
	}
	return vk::PrimitiveTopology::eTriangleList;
}

vk::CullModeFlags to_vk(CullMode mode)
{
	switch (mode)
	{
		case CullMode::None: return vk::CullModeFlagBits::eNone;
		case CullMode::Front: return vk::CullModeFlagBits::eFront;
		case CullMode::Back: return vk::CullModeFlagBits::eBack;
	}
	return vk::CullModeFlagBits::eNone;
}

vk::PolygonMode to_vk(PolygonMode mode)
{
	switch (mode)
	{
		case PolygonMode::Fill: return vk::PolygonMode::eFill;
		case PolygonMode::Line: return vk::PolygonMode::eLine;
		case PolygonMode::Point: return vk::PolygonMode::ePoint;
	}
	return vk::PolygonMode::eFill;
}

vk::IndexType to_vk(IndexFormat format)
{
	return format == IndexFormat::Uint16 ? vk::IndexType::eUint16 : vk::IndexType::eUint32;
}

vk::ImageAspectFlags full_aspect(TextureFormat format)
{
	if (format == TextureFormat::Depth24PlusStencil8)
	{
		return vk::ImageAspectFlagBits::eDepth | vk::ImageAspectFlagBits::eStencil;
	}
	return is_depth_format(format) ? vk::ImageAspectFlagBits::eDepth : vk::ImageAspectFlagBits::eColor;
}

void full_barrier(vk::CommandBuffer commands)
{
	auto barrier = vk::MemoryBarrier()
					   .setSrcAccessMask(vk::AccessFlagBits::eMemoryWrite)
					   .setDstAccessMask(vk::AccessFlagBits::eMemoryRead | vk::AccessFlagBits::eMemoryWrite);
	commands.pipelineBarrier(vk::PipelineStageFlagBits::eAllCommands, vk::PipelineStageFlagBits::eAllCommands, {},
							 barrier, nullptr, nullptr);
}

} // namespace

// ============================================================================
// VulkanCommandList
// ============================================================================

class VulkanCommandList final : public CommandList
{
public:
	VulkanCommandList(VulkanDevice& device, vk::CommandBuffer commands)
		: m_device(&device)
		, m_commands(commands)
	{}

	~VulkanCommandList() override
	{
		if (!m_submitted)
		{
			m_device->m_device.freeCommandBuffers(m_device->m_command_pool, m_commands);
		}
	}

	VulkanCommandList(const VulkanCommandList&)			   = delete;
	VulkanCommandList& operator=(const VulkanCommandList&) = delete;

	void begin_render_pass(const RenderPassDescriptor& descriptor) override
	{
		std::vector<vk::RenderingAttachmentInfo> colors;
		for (const auto& attachment : descriptor.color_attachments)
		{
			auto info = vk::RenderingAttachmentInfo()
							.setImageView(m_device->texture(attachment.view).view)
							.setImageLayout(vk::ImageLayout::eGeneral)
							.setLoadOp(attachment.clear ? vk::AttachmentLoadOp::eClear : vk::AttachmentLoadOp::eLoad)
							.setStoreOp(vk::AttachmentStoreOp::eStore);
			if (attachment.clear)
			{
				const auto& c = *attachment.clear;
				info.setClearValue(vk::ClearColorValue(std::array{c.r, c.g, c.b, c.a}));
			}
			if (attachment.resolve_target)
			{
				info.setResolveMode(vk::ResolveModeFlagBits::eAverage)
					.setResolveImageView(m_device->texture(attachment.resolve_target).view)
					.setResolveImageLayout(vk::ImageLayout::eGeneral);
			}
			colors.push_back(info);
		}

		vk::RenderingAttachmentInfo depth;
		if (descriptor.depth_attachment)
		{
			const auto& attachment = *descriptor.depth_attachment;
			depth.setImageView(m_device->texture(attachment.view).view)
				.setImageLayout(vk::ImageLayout::eGeneral)
				.setLoadOp(attachment.clear ? vk::AttachmentLoadOp::eClear : vk::AttachmentLoadOp::eLoad)
				.setStoreOp(vk::AttachmentStoreOp::eStore)
				.setClearValue(vk::ClearDepthStencilValue(attachment.clear.value_or(1.0f), 0));
		}

		auto rendering = vk::RenderingInfo()
							 .setRenderArea(vk::Rect2D({0, 0}, {descriptor.width, descriptor.height}))
							 .setLayerCount(1)
							 .setColorAttachments(colors)
							 .setPDepthAttachment(descriptor.depth_attachment ? &depth : nullptr);

		full_barrier(m_commands);
		m_commands.beginRendering(rendering);

		// Pipelines declare viewport and scissor dynamic, start with the full target.
		set_viewport(Viewport{.x		 = 0.0f,
							  .y		 = 0.0f,
							  .width	 = static_cast<float>(descriptor.width),
							  .height	 = static_cast<float>(descriptor.height),
							  .min_depth = 0.0f,
							  .max_depth = 1.0f});
		set_scissor(ScissorRect{.x		= 0,
								.y		= 0,
								.width	= static_cast<int32_t>(descriptor.width),
								.height = static_cast<int32_t>(descriptor.height)});
	}

	void end_render_pass() override
	{
		m_commands.endRendering();
		full_barrier(m_commands);
	}

	void begin_compute_pass() override { full_barrier(m_commands); }

	void end_compute_pass() override { full_barrier(m_commands); }

	void set_pipeline(PipelineHandle handle) override
	{
		const auto& record = m_device->pipeline(handle);
		m_commands.bindPipeline(record.bind_point, record.pipeline);
		m_layout	 = record.layout;
		m_bind_point = record.bind_point;
	}

	void set_bind_group(uint32_t group, BindGroupHandle handle) override
	{
		m_commands.bindDescriptorSets(m_bind_point, m_layout, group, m_device->bind_group(handle), nullptr);
	}

	void set_vertex_buffer(uint32_t slot, BufferHandle handle, uint64_t offset) override
	{
		m_commands.bindVertexBuffers(slot, m_device->buffer(handle).buffer, offset);
	}

	void set_index_buffer(BufferHandle handle, IndexFormat format, uint64_t offset) override
	{
		m_commands.bindIndexBuffer(m_device->buffer(handle).buffer, offset, to_vk(format));
	}

	void set_push_constants(ShaderStageFlags stages, uint32_t offset, std::span<const uint8_t> data) override
	{
		m_commands.pushConstants(m_layout, to_vk(stages), offset, static_cast<uint32_t>(data.size()), data.data());
	}

	void set_viewport(const Viewport& viewport) override
	{
		// Negative height keeps +y up in clip space.
		m_commands.setViewport(0, vk::Viewport(viewport.x, viewport.y + viewport.height, viewport.width,
											   -viewport.height, viewport.min_depth, viewport.max_depth));
	}

	void set_scissor(const ScissorRect& scissor) override
	{
		m_commands.setScissor(0, vk::Rect2D({scissor.x, scissor.y}, {static_cast<uint32_t>(scissor.width),
																	   static_cast<uint32_t>(scissor.height)}));
	}

	void draw(uint32_t vertex_count, uint32_t instance_count, uint32_t first_vertex, uint32_t first_instance) override
	{
		m_commands.draw(vertex_count, instance_count, first_vertex, first_instance);
	}

	void draw_indexed(uint32_t index_count, uint32_t instance_count, uint32_t first_index, int32_t base_vertex,
					  uint32_t first_instance) override
	{
		m_commands.drawIndexed(index_count, instance_count, first_index, base_vertex, first_instance);
	}

	void draw_indirect(BufferHandle handle, uint64_t offset) override
	{
		m_commands.drawIndirect(m_device->buffer(handle).buffer, offset, 1, 0);
	}

	void draw_indexed_indirect(BufferHandle handle, uint64_t offset) override
	{
		m_commands.drawIndexedIndirect(m_device->buffer(handle).buffer, offset, 1, 0);
	}

	void dispatch(uint32_t x, uint32_t y, uint32_t z) override { m_commands.dispatch(x, y, z); }

	void dispatch_indirect(BufferHandle handle, uint64_t offset) override
	{
		m_commands.dispatchIndirect(m_device->buffer(handle).buffer, offset);
	}

	void copy_buffer_to_buffer(BufferHandle src, uint64_t src_offset, BufferHandle dst, uint64_t dst_offset,
							   uint64_t size) override
	{
		full_barrier(m_commands);
		m_commands.copyBuffer(m_device->buffer(src).buffer, m_device->buffer(dst).buffer,
							  vk::BufferCopy(src_offset, dst_offset, size));
		full_barrier(m_commands);
	}

	void copy_texture_to_buffer(TextureHandle src, BufferHandle dst) override
	{
		const auto& image = m_device->texture(src);
		full_barrier(m_commands);
		m_commands.copyImageToBuffer(image.image, vk::ImageLayout::eGeneral, m_device->buffer(dst).buffer,
									 image_copy(image));
		full_barrier(m_commands);
	}

	void copy_buffer_to_texture(BufferHandle src, TextureHandle dst) override
	{
		const auto& image = m_device->texture(dst);
		full_barrier(m_commands);
		m_commands.copyBufferToImage(m_device->buffer(src).buffer, image.image, vk::ImageLayout::eGeneral,
									 image_copy(image));
		full_barrier(m_commands);
	}

	/// End recording and hand the command buffer to the device.
	vk::CommandBuffer finish()
	{
		if (m_submitted)
		{
			throw DeviceError{"Command list was already submitted"};
		}
		check(m_commands.end(), "Failed to end command buffer");
		m_submitted = true;
		return m_commands;
	}

	static vk::BufferImageCopy image_copy(const VulkanDevice::TextureRecord& image)
	{
		return vk::BufferImageCopy()
			.setBufferOffset(0)
			.setBufferRowLength(0)
			.setBufferImageHeight(0)
			.setImageSubresource(vk::ImageSubresourceLayers(image.aspect, 0, 0, 1))
			.setImageExtent(vk::Extent3D(image.width, image.height, 1));
	}

private:
	VulkanDevice*		  m_device;
	vk::CommandBuffer	  m_commands;
	bool				  m_submitted = false;
	vk::PipelineLayout	  m_layout;
	vk::PipelineBindPoint m_bind_point = vk::PipelineBindPoint::eGraphics;
};

// ============================================================================
// VulkanDevice
// ============================================================================

std::expected<std::shared_ptr<VulkanDevice>, Error> VulkanDevice::create(const VulkanDeviceConfig& config)
{
	auto device = std::shared_ptr<VulkanDevice>(new VulkanDevice(config));
	try
	{
		device->initialize();
	} catch (const DeviceError& e)
	{
		return std::unexpected{make_error(ErrorKind::DeviceFailure, "Vulkan initialization failed: {}", e.what())};
	}
	return device;
}

VulkanDevice::VulkanDevice(VulkanDeviceConfig config)
	: m_config(std::move(config))
{}

void VulkanDevice::initialize()
{
	bool validation = false;
	m_instance		= create_instance(m_config, validation);
	if (validation)
	{
		m_debug_messenger = check(m_instance.createDebugUtilsMessengerEXT(make_debug_messenger_create_info()),
								  "Failed to create debug messenger");
		Logger::instance().debug("Created debug messenger");
	}

	m_physical_device = select_physical_device(m_instance, m_config.preferred_device);
	m_queue_family	  = find_queue_family(m_physical_device);
	m_device		  = create_logical_device(m_physical_device, m_queue_family);
	VULKAN_HPP_DEFAULT_DISPATCHER.init(m_device);
	m_queue = m_device.getQueue(m_queue_family, 0);

	m_command_pool = check(m_device.createCommandPool(vk::CommandPoolCreateInfo()
														  .setQueueFamilyIndex(m_queue_family)
														  .setFlags(vk::CommandPoolCreateFlagBits::eTransient)),
						   "Failed to create command pool");

	const auto props = m_physical_device.getProperties();
	m_limits		 = DeviceLimits{.min_copy_alignment		= COPY_BUFFER_ALIGNMENT,
									.max_push_constant_size = props.limits.maxPushConstantsSize,
									.max_bind_groups		= props.limits.maxBoundDescriptorSets,
									.max_texture_dimension	= props.limits.maxImageDimension2D};

	Logger::instance().info("VulkanDevice VK_HEADER_VERSION: {}", VK_HEADER_VERSION);
	Logger::instance().info("VulkanDevice initialized");
}

VulkanDevice::~VulkanDevice()
{
	if (m_device)
	{
		if (auto result = m_device.waitIdle(); result != vk::Result::eSuccess)
		{
			Logger::instance().error("waitIdle failed during shutdown: {}", vk::to_string(result));
		}
		for (const auto& submission : m_in_flight)
		{
			m_device.destroyFence(submission.fence);
		}

		const auto leaked = m_buffers.size() + m_textures.size() + m_samplers.size() + m_shader_modules.size() +
							m_bind_group_layouts.size() + m_pipeline_layouts.size() + m_pipelines.size() +
							m_bind_groups.size();
		if (leaked > 0)
		{
			Logger::instance().warn("VulkanDevice destroyed with {} live objects", leaked);
		}
		for (const auto& [id, record] : m_bind_groups)
			m_device.destroyDescriptorPool(record.pool);
		for (const auto& [id, record] : m_pipelines)
			m_device.destroyPipeline(record.pipeline);
		for (const auto& [id, record] : m_pipeline_layouts)
		{
			m_device.destroyPipelineLayout(record.layout);
			for (auto gap : record.gap_layouts)
				m_device.destroyDescriptorSetLayout(gap);
		}
		for (const auto& [id, record] : m_bind_group_layouts)
			m_device.destroyDescriptorSetLayout(record.layout);
		for (const auto& [id, module] : m_shader_modules)
			m_device.destroyShaderModule(module);
		for (const auto& [id, sampler] : m_samplers)
			m_device.destroySampler(sampler);
		for (const auto& [id, record] : m_textures)
		{
			m_device.destroyImageView(record.view);
			m_device.destroyImage(record.image);
			m_device.freeMemory(record.memory);
		}
		for (const auto& [id, record] : m_buffers)
			release(record);

		if (m_command_pool)
		{
			m_device.destroyCommandPool(m_command_pool);
		}
		m_device.destroy();
		Logger::instance().trace("Destroyed logical device");
	}

	if (m_debug_messenger)
	{
		m_instance.destroyDebugUtilsMessengerEXT(m_debug_messenger);
		Logger::instance().trace("Destroyed debug messenger");
	}

	if (m_instance)
	{
		m_instance.destroy();
		Logger::instance().trace("Destroyed instance");
	}
}

// ============================================================================
// Memory
// ============================================================================

uint32_t VulkanDevice::find_memory_type(uint32_t type_filter, vk::MemoryPropertyFlags properties) const
{
	auto mem_props = m_physical_device.getMemoryProperties();
	for (uint32_t i = 0; i < mem_props.memoryTypeCount; i++)
	{
		if ((type_filter & (1u << i)) && (mem_props.memoryTypes[i].propertyFlags & properties) == properties)
		{
			return i;
		}
	}
	throw DeviceError{fmt::format("No memory type matches {}", vk::to_string(properties))};
}

vk::DeviceMemory VulkanDevice::allocate_memory(vk::MemoryRequirements requirements, vk::MemoryPropertyFlags properties)
{
	auto alloc_info = vk::MemoryAllocateInfo()
						  .setAllocationSize(requirements.size)
						  .setMemoryTypeIndex(find_memory_type(requirements.memoryTypeBits, properties));
	return check(m_device.allocateMemory(alloc_info), "Failed to allocate memory");
}

VulkanDevice::BufferRecord VulkanDevice::make_buffer(uint64_t size, vk::BufferUsageFlags usage, bool host_visible)
{
	auto buffer_info = vk::BufferCreateInfo().setSize(size).setUsage(usage).setSharingMode(vk::SharingMode::eExclusive);
	auto buffer		 = check(m_device.createBuffer(buffer_info), "Failed to create buffer");

	auto properties = host_visible ? vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent
								   : vk::MemoryPropertyFlags{vk::MemoryPropertyFlagBits::eDeviceLocal};
	vk::DeviceMemory memory;
	try
	{
		memory = allocate_memory(m_device.getBufferMemoryRequirements(buffer), properties);
		check(m_device.bindBufferMemory(buffer, memory, 0), "Failed to bind buffer memory");
	} catch (const DeviceError&)
	{
		m_device.destroyBuffer(buffer);
		if (memory)
			m_device.freeMemory(memory);
		throw;
	}
	return BufferRecord{.buffer = buffer, .memory = memory, .size = size, .host_visible = host_visible};
}

void VulkanDevice::release(const BufferRecord& record)
{
	m_device.destroyBuffer(record.buffer);
	m_device.freeMemory(record.memory);
}

// ============================================================================
// Submission
// ============================================================================

vk::CommandBuffer VulkanDevice::begin_commands()
{
	auto alloc_info = vk::CommandBufferAllocateInfo()
						  .setCommandPool(m_command_pool)
						  .setLevel(vk::CommandBufferLevel::ePrimary)
						  .setCommandBufferCount(1);
	auto commands = check(m_device.allocateCommandBuffers(alloc_info), "Failed to allocate command buffer").front();
	auto result	  = commands.begin(vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
	if (result != vk::Result::eSuccess)
	{
		m_device.freeCommandBuffers(m_command_pool, commands);
		check(result, "Failed to begin command buffer");
	}
	// Makes writes of earlier submissions visible to this one.
	full_barrier(commands);
	return commands;
}

void VulkanDevice::submit_commands(vk::CommandBuffer commands)
{
	auto fence	= check(m_device.createFence(vk::FenceCreateInfo()), "Failed to create fence");
	auto result = m_queue.submit(vk::SubmitInfo().setCommandBuffers(commands), fence);
	if (result != vk::Result::eSuccess)
	{
		m_device.destroyFence(fence);
		m_device.freeCommandBuffers(m_command_pool, commands);
		check(result, "Failed to submit command buffer");
	}
	m_in_flight.push_back(Submission{.fence = fence, .commands = commands});
}

void VulkanDevice::run_now(vk::CommandBuffer commands)
{
	if (auto result = commands.end(); result != vk::Result::eSuccess)
	{
		m_device.freeCommandBuffers(m_command_pool, commands);
		check(result, "Failed to end command buffer");
	}
	submit_commands(commands);
	wait_idle(UPLOAD_TIMEOUT);
}

std::unique_ptr<CommandList> VulkanDevice::create_command_list()
{
	return std::make_unique<VulkanCommandList>(*this, begin_commands());
}

void VulkanDevice::submit(CommandList& commands)
{
	auto* list = dynamic_cast<VulkanCommandList*>(&commands);
	if (!list)
	{
		throw DeviceError{"Command list was not created by this VulkanDevice"};
	}
	submit_commands(list->finish());
}

void VulkanDevice::wait_idle(std::chrono::nanoseconds timeout)
{
	if (m_in_flight.empty())
	{
		return;
	}

	std::vector<vk::Fence> fences;
	for (const auto& submission : m_in_flight)
	{
		fences.push_back(submission.fence);
	}
	auto result = m_device.waitForFences(fences, vk::True, static_cast<uint64_t>(timeout.count()));
	if (result == vk::Result::eTimeout)
	{
		throw DeviceTimeoutError{fmt::format("{} submissions still running after {} ms", m_in_flight.size(),
											 std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count())};
	}
	check(result, "Failed to wait for fences");

	for (const auto& submission : m_in_flight)
	{
		m_device.destroyFence(submission.fence);
		m_device.freeCommandBuffers(m_command_pool, submission.commands);
	}
	Logger::instance().trace("Retired {} submissions", m_in_flight.size());
	m_in_flight.clear();
}

// ============================================================================
// Buffers
// ============================================================================

BufferHandle VulkanDevice::create_buffer(const BufferDescriptor& descriptor)
{
	const bool host_visible = descriptor.mapped_at_creation ||
							  has_any(descriptor.usage, BufferUsage::MapRead | BufferUsage::MapWrite);
	auto	   record		= make_buffer(std::max<uint64_t>(descriptor.size, COPY_BUFFER_ALIGNMENT),
										  to_vk(descriptor.usage), host_visible);
	record.size				= descriptor.size;

	BufferHandle handle{next_id()};
	m_buffers.emplace(handle.id, record);
	Logger::instance().debug("Created Vulkan buffer '{}' ({} bytes, {})", descriptor.label, descriptor.size,
							 host_visible ? "host visible" : "device local");
	return handle;
}

BufferHandle VulkanDevice::create_buffer_with_data(const BufferDescriptor& descriptor, std::span<const uint8_t> data)
{
	auto handle = create_buffer(descriptor);
	if (!data.empty())
	{
		try
		{
			write_buffer(handle, 0, data);
		} catch (const DeviceError&)
		{
			destroy(handle);
			throw;
		}
	}
	return handle;
}

void VulkanDevice::write_buffer(BufferHandle handle, uint64_t offset, std::span<const uint8_t> data)
{
	const auto& record = buffer(handle);
	if (offset + data.size() > record.size)
	{
		throw DeviceError{fmt::format("Write of {} bytes at offset {} exceeds buffer size {}", data.size(), offset,
									  record.size)};
	}

	if (record.host_visible)
	{
		wait_idle(UPLOAD_TIMEOUT);
		auto* mapped = check(m_device.mapMemory(record.memory, offset, data.size()), "Failed to map buffer");
		std::memcpy(mapped, data.data(), data.size());
		m_device.unmapMemory(record.memory);
		return;
	}

	auto staging = make_buffer(data.size(), vk::BufferUsageFlagBits::eTransferSrc, true);
	try
	{
		auto* mapped = check(m_device.mapMemory(staging.memory, 0, data.size()), "Failed to map staging buffer");
		std::memcpy(mapped, data.data(), data.size());
		m_device.unmapMemory(staging.memory);

		auto commands = begin_commands();
		commands.copyBuffer(staging.buffer, record.buffer, vk::BufferCopy(0, offset, data.size()));
		full_barrier(commands);
		run_now(commands);
	} catch (const DeviceError&)
	{
		release(staging);
		throw;
	}
	release(staging);
}

std::vector<uint8_t> VulkanDevice::map_read(BufferHandle handle, uint64_t size, std::chrono::nanoseconds timeout)
{
	wait_idle(timeout);

	const auto& record = buffer(handle);
	if (!record.host_visible)
	{
		throw DeviceError{"Buffer is not host visible and cannot be mapped"};
	}
	size = std::min(size, record.size);

	std::vector<uint8_t> bytes(size);
	auto*				 mapped = check(m_device.mapMemory(record.memory, 0, size), "Failed to map buffer");
	std::memcpy(bytes.data(), mapped, size);
	m_device.unmapMemory(record.memory);
	return bytes;
}

// ============================================================================
// Textures and samplers
// ============================================================================

TextureHandle VulkanDevice::create_texture(const TextureDescriptor& descriptor)
{
	const bool depth  = is_depth_format(descriptor.format);
	const auto format = to_vk(descriptor.format);

	auto image_info = vk::ImageCreateInfo()
						  .setImageType(vk::ImageType::e2D)
						  .setFormat(format)
						  .setExtent(vk::Extent3D(descriptor.width, descriptor.height, 1))
						  .setMipLevels(1)
						  .setArrayLayers(1)
						  .setSamples(static_cast<vk::SampleCountFlagBits>(descriptor.sample_count))
						  .setTiling(vk::ImageTiling::eOptimal)
						  .setUsage(to_vk(descriptor.usage, depth))
						  .setSharingMode(vk::SharingMode::eExclusive)
						  .setInitialLayout(vk::ImageLayout::eUndefined);

	TextureRecord record{.image		 = check(m_device.createImage(image_info), "Failed to create image"),
						 .memory	 = nullptr,
						 .view		 = nullptr,
						 .format	 = format,
						 .aspect	 = depth ? vk::ImageAspectFlagBits::eDepth : vk::ImageAspectFlagBits::eColor,
						 .width		 = descriptor.width,
						 .height	 = descriptor.height,
						 .texel_size = bytes_per_pixel(descriptor.format)};
	try
	{
		record.memory = allocate_memory(m_device.getImageMemoryRequirements(record.image),
										vk::MemoryPropertyFlagBits::eDeviceLocal);
		check(m_device.bindImageMemory(record.image, record.memory, 0), "Failed to bind image memory");

		auto view_info = vk::ImageViewCreateInfo()
							 .setImage(record.image)
							 .setViewType(vk::ImageViewType::e2D)
							 .setFormat(format)
							 .setSubresourceRange(vk::ImageSubresourceRange(record.aspect, 0, 1, 0, 1));
		record.view = check(m_device.createImageView(view_info), "Failed to create image view");

		// Every image stays in the general layout for its whole life.
		auto commands = begin_commands();
		auto barrier  = vk::ImageMemoryBarrier()
						   .setOldLayout(vk::ImageLayout::eUndefined)
						   .setNewLayout(vk::ImageLayout::eGeneral)
						   .setSrcAccessMask({})
						   .setDstAccessMask(vk::AccessFlagBits::eMemoryRead | vk::AccessFlagBits::eMemoryWrite)
						   .setSrcQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
						   .setDstQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
						   .setImage(record.image)
						   .setSubresourceRange(vk::ImageSubresourceRange(full_aspect(descriptor.format), 0, 1, 0, 1));
		commands.pipelineBarrier(vk::PipelineStageFlagBits::eTopOfPipe, vk::PipelineStageFlagBits::eAllCommands, {},
								 nullptr, nullptr, barrier);
		run_now(commands);
	} catch (const DeviceError&)
	{
		if (record.view)
			m_device.destroyImageView(record.view);
		m_device.destroyImage(record.image);
		if (record.memory)
			m_device.freeMemory(record.memory);
		throw;
	}

	TextureHandle handle{next_id()};
	m_textures.emplace(handle.id, record);
	Logger::instance().debug("Created Vulkan image '{}' {}x{} {}", descriptor.label, descriptor.width,
							 descriptor.height, vk::to_string(format));
	return handle;
}

void VulkanDevice::write_texture(TextureHandle handle, std::span<const uint8_t> data)
{
	const auto& record	 = texture(handle);
	const auto	expected = static_cast<uint64_t>(record.width) * record.height * record.texel_size;
	if (data.size() != expected)
	{
		throw DeviceError{fmt::format("Texture upload of {} bytes, expected {}", data.size(), expected)};
	}

	auto staging = make_buffer(data.size(), vk::BufferUsageFlagBits::eTransferSrc, true);
	try
	{
		auto* mapped = check(m_device.mapMemory(staging.memory, 0, data.size()), "Failed to map staging buffer");
		std::memcpy(mapped, data.data(), data.size());
		m_device.unmapMemory(staging.memory);

		auto commands = begin_commands();
		commands.copyBufferToImage(staging.buffer, record.image, vk::ImageLayout::eGeneral,
								   VulkanCommandList::image_copy(record));
		full_barrier(commands);
		run_now(commands);
	} catch (const DeviceError&)
	{
		release(staging);
		throw;
	}
	release(staging);
}

SamplerHandle VulkanDevice::create_sampler(const SamplerDescriptor& descriptor)
{
	const bool anisotropy = descriptor.max_anisotropy > 1.0f && m_physical_device.getFeatures().samplerAnisotropy;

	auto sampler_info = vk::SamplerCreateInfo()
							.setMagFilter(to_vk(descriptor.mag_filter))
							.setMinFilter(to_vk(descriptor.min_filter))
							.setMipmapMode(vk::SamplerMipmapMode::eNearest)
							.setAddressModeU(to_vk(descriptor.address_u))
							.setAddressModeV(to_vk(descriptor.address_v))
							.setAddressModeW(to_vk(descriptor.address_w))
							.setAnisotropyEnable(anisotropy)
							.setMaxAnisotropy(anisotropy ? descriptor.max_anisotropy : 1.0f)
							.setCompareEnable(descriptor.compare.has_value())
							.setCompareOp(to_vk(descriptor.compare.value_or(CompareFunction::Always)))
							.setMinLod(0.0f)
							.setMaxLod(VK_LOD_CLAMP_NONE);

	SamplerHandle handle{next_id()};
	m_samplers.emplace(handle.id, check(m_device.createSampler(sampler_info), "Failed to create sampler"));
	Logger::instance().debug("Created Vulkan sampler '{}'", descriptor.label);
	return handle;
}

// ============================================================================
// Shaders and layouts
// ============================================================================

ShaderModuleHandle VulkanDevice::create_shader_module(const ShaderModuleDescriptor& descriptor)
{
	if (descriptor.spirv.empty() || descriptor.spirv.size() % sizeof(uint32_t) != 0)
	{
		throw DeviceError{fmt::format("SPIR-V of '{}' is {} bytes, not a whole number of words", descriptor.label,
									  descriptor.spirv.size())};
	}
	std::vector<uint32_t> code(descriptor.spirv.size() / sizeof(uint32_t));
	std::memcpy(code.data(), descriptor.spirv.data(), descriptor.spirv.size());

	ShaderModuleHandle handle{next_id()};
	m_shader_modules.emplace(handle.id, check(m_device.createShaderModule(vk::ShaderModuleCreateInfo().setCode(code)),
											  "Failed to create shader module"));
	Logger::instance().debug("Created Vulkan shader module '{}' ({} words)", descriptor.label, code.size());
	return handle;
}

BindGroupLayoutHandle VulkanDevice::create_bind_group_layout(const BindGroupLayoutDescriptor& descriptor)
{
	SetLayoutRecord								record;
	std::vector<vk::DescriptorSetLayoutBinding> bindings;
	for (const auto& entry : descriptor.entries)
	{
		auto type = to_vk(entry.type);
		record.types.emplace(entry.binding, type);
		bindings.push_back(vk::DescriptorSetLayoutBinding()
							   .setBinding(entry.binding)
							   .setDescriptorType(type)
							   .setDescriptorCount(1)
							   .setStageFlags(to_vk(entry.visibility)));
	}

	record.layout = check(m_device.createDescriptorSetLayout(vk::DescriptorSetLayoutCreateInfo().setBindings(bindings)),
						  "Failed to create descriptor set layout");

	BindGroupLayoutHandle handle{next_id()};
	m_bind_group_layouts.emplace(handle.id, std::move(record));
	Logger::instance().debug("Created Vulkan descriptor set layout '{}' with {} bindings", descriptor.label,
							 bindings.size());
	return handle;
}

PipelineLayoutHandle VulkanDevice::create_pipeline_layout(const PipelineLayoutDescriptor& descriptor)
{
	PipelineLayoutRecord				 record;
	std::vector<vk::DescriptorSetLayout> set_layouts;
	try
	{
		for (const auto& [group, layout] : descriptor.bind_group_layouts)
		{
			while (set_layouts.size() < group)
			{
				auto gap = check(m_device.createDescriptorSetLayout(vk::DescriptorSetLayoutCreateInfo()),
								 "Failed to create empty descriptor set layout");
				record.gap_layouts.push_back(gap);
				set_layouts.push_back(gap);
			}
			auto it = m_bind_group_layouts.find(layout.id);
			if (it == m_bind_group_layouts.end())
			{
				throw DeviceError{fmt::format("Unknown bind group layout {}", layout.id)};
			}
			set_layouts.push_back(it->second.layout);
		}

		auto layout_info = vk::PipelineLayoutCreateInfo().setSetLayouts(set_layouts);
		vk::PushConstantRange push_range;
		if (descriptor.push_constants)
		{
			push_range = vk::PushConstantRange(to_vk(descriptor.push_constants->stages), 0,
											   descriptor.push_constants->size);
			layout_info.setPushConstantRanges(push_range);
		}
		record.layout = check(m_device.createPipelineLayout(layout_info), "Failed to create pipeline layout");
	} catch (const DeviceError&)
	{
		for (auto gap : record.gap_layouts)
			m_device.destroyDescriptorSetLayout(gap);
		throw;
	}

	PipelineLayoutHandle handle{next_id()};
	m_pipeline_layouts.emplace(handle.id, std::move(record));
	Logger::instance().debug("Created Vulkan pipeline layout '{}' with {} sets", descriptor.label, set_layouts.size());
	return handle;
}

// ============================================================================
// Pipelines
// ============================================================================

PipelineHandle VulkanDevice::create_render_pipeline(const RenderPipelineDescriptor& descriptor)
{
	auto layout_it = m_pipeline_layouts.find(descriptor.layout.id);
	auto vert_it   = m_shader_modules.find(descriptor.vertex_module.id);
	auto frag_it   = m_shader_modules.find(descriptor.fragment_module.id);
	if (layout_it == m_pipeline_layouts.end() || vert_it == m_shader_modules.end() ||
		frag_it == m_shader_modules.end())
	{
		throw DeviceError{fmt::format("Render pipeline '{}' references unknown objects", descriptor.label)};
	}

	// Shader stages
	auto vert_stage = vk::PipelineShaderStageCreateInfo()
						  .setStage(vk::ShaderStageFlagBits::eVertex)
						  .setModule(vert_it->second)
						  .setPName(descriptor.vertex_entry_point.c_str());
	auto frag_stage = vk::PipelineShaderStageCreateInfo()
						  .setStage(vk::ShaderStageFlagBits::eFragment)
						  .setModule(frag_it->second)
						  .setPName(descriptor.fragment_entry_point.c_str());
	std::array shader_stages = {vert_stage, frag_stage};

	// Vertex input
	std::vector<vk::VertexInputAttributeDescription> attributes;
	vk::VertexInputBindingDescription				 vertex_binding;
	auto											 vertex_input = vk::PipelineVertexInputStateCreateInfo();
	if (descriptor.vertex_buffer)
	{
		for (const auto& attribute : descriptor.vertex_buffer->attributes)
		{
			attributes.push_back(vk::VertexInputAttributeDescription()
									 .setLocation(attribute.location)
									 .setBinding(0)
									 .setFormat(to_vk(attribute.type))
									 .setOffset(static_cast<uint32_t>(attribute.offset)));
		}
		vertex_binding = vk::VertexInputBindingDescription()
							 .setBinding(0)
							 .setStride(static_cast<uint32_t>(descriptor.vertex_buffer->stride))
							 .setInputRate(vk::VertexInputRate::eVertex);
		vertex_input.setVertexBindingDescriptions(vertex_binding).setVertexAttributeDescriptions(attributes);
	}

	// Input assembly
	const auto& primitive	   = descriptor.primitive;
	auto		input_assembly = vk::PipelineInputAssemblyStateCreateInfo()
							  .setTopology(to_vk(primitive.topology))
							  .setPrimitiveRestartEnable(false);

	// Viewport and scissor (dynamic)
	auto viewport_state = vk::PipelineViewportStateCreateInfo().setViewportCount(1).setScissorCount(1);

	// Rasterization
	auto rasterizer = vk::PipelineRasterizationStateCreateInfo()
						  .setDepthClampEnable(false)
						  .setRasterizerDiscardEnable(false)
						  .setPolygonMode(to_vk(primitive.polygon_mode))
						  .setLineWidth(1.0f)
						  .setCullMode(to_vk(primitive.cull_mode))
						  .setFrontFace(primitive.front_face == FrontFace::Clockwise ? vk::FrontFace::eClockwise
																					 : vk::FrontFace::eCounterClockwise)
						  .setDepthBiasEnable(false);

	// Multisampling
	auto multisampling = vk::PipelineMultisampleStateCreateInfo()
							 .setSampleShadingEnable(false)
							 .setRasterizationSamples(static_cast<vk::SampleCountFlagBits>(descriptor.sample_count));

	// Depth and stencil
	auto depth_stencil = vk::PipelineDepthStencilStateCreateInfo()
							 .setDepthTestEnable(descriptor.depth_stencil.has_value())
							 .setDepthBoundsTestEnable(false)
							 .setStencilTestEnable(false);
	if (descriptor.depth_stencil)
	{
		depth_stencil.setDepthWriteEnable(descriptor.depth_stencil->depth_write)
			.setDepthCompareOp(to_vk(descriptor.depth_stencil->compare));
	}

	// Color blending
	std::vector<vk::PipelineColorBlendAttachmentState> blend_attachments;
	std::vector<vk::Format>							   color_formats;
	for (const auto& target : descriptor.targets)
	{
		auto attachment = vk::PipelineColorBlendAttachmentState()
							  .setColorWriteMask(vk::ColorComponentFlags(static_cast<uint32_t>(target.write_mask)))
							  .setBlendEnable(target.blend.has_value());
		if (target.blend)
		{
			attachment.setSrcColorBlendFactor(to_vk(target.blend->color.src_factor))
				.setDstColorBlendFactor(to_vk(target.blend->color.dst_factor))
				.setColorBlendOp(to_vk(target.blend->color.operation))
				.setSrcAlphaBlendFactor(to_vk(target.blend->alpha.src_factor))
				.setDstAlphaBlendFactor(to_vk(target.blend->alpha.dst_factor))
				.setAlphaBlendOp(to_vk(target.blend->alpha.operation));
		}
		blend_attachments.push_back(attachment);
		color_formats.push_back(to_vk(target.format));
	}
	auto color_blending = vk::PipelineColorBlendStateCreateInfo().setLogicOpEnable(false).setAttachments(
		blend_attachments);

	// Dynamic state
	std::array dynamic_states = {vk::DynamicState::eViewport, vk::DynamicState::eScissor};
	auto	   dynamic_state  = vk::PipelineDynamicStateCreateInfo().setDynamicStates(dynamic_states);

	// Dynamic rendering
	auto rendering = vk::PipelineRenderingCreateInfo().setColorAttachmentFormats(color_formats);
	if (descriptor.depth_stencil)
	{
		rendering.setDepthAttachmentFormat(to_vk(descriptor.depth_stencil->format));
	}

	auto pipeline_info = vk::GraphicsPipelineCreateInfo()
							 .setPNext(&rendering)
							 .setStages(shader_stages)
							 .setPVertexInputState(&vertex_input)
							 .setPInputAssemblyState(&input_assembly)
							 .setPViewportState(&viewport_state)
							 .setPRasterizationState(&rasterizer)
							 .setPMultisampleState(&multisampling)
							 .setPDepthStencilState(&depth_stencil)
							 .setPColorBlendState(&color_blending)
							 .setPDynamicState(&dynamic_state)
							 .setLayout(layout_it->second.layout);

	auto pipeline = check(m_device.createGraphicsPipeline(nullptr, pipeline_info), "Failed to create graphics pipeline");

	PipelineHandle handle{next_id()};
	m_pipelines.emplace(handle.id, PipelineRecord{.pipeline	  = pipeline,
												  .layout	  = layout_it->second.layout,
												  .bind_point = vk::PipelineBindPoint::eGraphics});
	Logger::instance().debug("Created Vulkan graphics pipeline '{}'", descriptor.label);
	return handle;
}

PipelineHandle VulkanDevice::create_compute_pipeline(const ComputePipelineDescriptor& descriptor)
{
	auto layout_it = m_pipeline_layouts.find(descriptor.layout.id);
	auto module_it = m_shader_modules.find(descriptor.module.id);
	if (layout_it == m_pipeline_layouts.end() || module_it == m_shader_modules.end())
	{
		throw DeviceError{fmt::format("Compute pipeline '{}' references unknown objects", descriptor.label)};
	}

	auto stage = vk::PipelineShaderStageCreateInfo()
					 .setStage(vk::ShaderStageFlagBits::eCompute)
					 .setModule(module_it->second)
					 .setPName(descriptor.entry_point.c_str());
	auto pipeline_info = vk::ComputePipelineCreateInfo().setStage(stage).setLayout(layout_it->second.layout);

	auto pipeline = check(m_device.createComputePipeline(nullptr, pipeline_info), "Failed to create compute pipeline");

	PipelineHandle handle{next_id()};
	m_pipelines.emplace(handle.id, PipelineRecord{.pipeline	  = pipeline,
												  .layout	  = layout_it->second.layout,
												  .bind_point = vk::PipelineBindPoint::eCompute});
	Logger::instance().debug("Created Vulkan compute pipeline '{}'", descriptor.label);
	return handle;
}

// ============================================================================
// Bind groups
// ============================================================================

BindGroupHandle VulkanDevice::create_bind_group(const BindGroupDescriptor& descriptor)
{
	auto layout_it = m_bind_group_layouts.find(descriptor.layout.id);
	if (layout_it == m_bind_group_layouts.end())
	{
		throw DeviceError{fmt::format("Bind group '{}' references an unknown layout", descriptor.label)};
	}
	const auto& layout = layout_it->second;

	std::unordered_map<vk::DescriptorType, uint32_t> counts;
	for (const auto& [binding, type] : layout.types)
	{
		++counts[type];
	}
	std::vector<vk::DescriptorPoolSize> pool_sizes;
	for (const auto& [type, count] : counts)
	{
		pool_sizes.emplace_back(type, count);
	}

	BindGroupRecord record;
	record.pool = check(m_device.createDescriptorPool(vk::DescriptorPoolCreateInfo().setMaxSets(1).setPoolSizes(
							pool_sizes)),
						"Failed to create descriptor pool");
	try
	{
		auto alloc_info = vk::DescriptorSetAllocateInfo().setDescriptorPool(record.pool).setSetLayouts(layout.layout);
		record.set		= check(m_device.allocateDescriptorSets(alloc_info), "Failed to allocate descriptor set").front();

		// Reserved up front, the writes point into these vectors.
		std::vector<vk::DescriptorBufferInfo> buffer_infos;
		std::vector<vk::DescriptorImageInfo>  image_infos;
		buffer_infos.reserve(descriptor.entries.size());
		image_infos.reserve(descriptor.entries.size());

		std::vector<vk::WriteDescriptorSet> writes;
		for (const auto& entry : descriptor.entries)
		{
			auto type_it = layout.types.find(entry.binding);
			if (type_it == layout.types.end())
			{
				throw DeviceError{fmt::format("Binding {} is not part of the layout of '{}'", entry.binding,
											  descriptor.label)};
			}
			auto write = vk::WriteDescriptorSet()
							 .setDstSet(record.set)
							 .setDstBinding(entry.binding)
							 .setDstArrayElement(0)
							 .setDescriptorType(type_it->second);

			std::visit(overloaded{
						   [&](const BufferBinding& binding)
						   {
							   buffer_infos.push_back(vk::DescriptorBufferInfo()
														  .setBuffer(buffer(binding.buffer).buffer)
														  .setOffset(binding.offset)
														  .setRange(binding.size));
							   write.setBufferInfo(buffer_infos.back());
						   },
						   [&](TextureHandle handle)
						   {
							   image_infos.push_back(vk::DescriptorImageInfo()
														 .setImageView(texture(handle).view)
														 .setImageLayout(vk::ImageLayout::eGeneral));
							   write.setImageInfo(image_infos.back());
						   },
						   [&](SamplerHandle handle)
						   {
							   image_infos.push_back(vk::DescriptorImageInfo().setSampler(sampler(handle)));
							   write.setImageInfo(image_infos.back());
						   },
					   },
					   entry.resource);
			writes.push_back(write);
		}
		m_device.updateDescriptorSets(writes, nullptr);
	} catch (const DeviceError&)
	{
		m_device.destroyDescriptorPool(record.pool);
		throw;
	}

	BindGroupHandle handle{next_id()};
	m_bind_groups.emplace(handle.id, record);
	Logger::instance().debug("Created Vulkan descriptor set '{}' with {} entries", descriptor.label,
							 descriptor.entries.size());
	return handle;
}

// ============================================================================
// Destruction
// ============================================================================

void VulkanDevice::destroy(BufferHandle handle)
{
	if (auto it = m_buffers.find(handle.id); it != m_buffers.end())
	{
		wait_idle(UPLOAD_TIMEOUT);
		release(it->second);
		m_buffers.erase(it);
	}
}

void VulkanDevice::destroy(TextureHandle handle)
{
	if (auto it = m_textures.find(handle.id); it != m_textures.end())
	{
		wait_idle(UPLOAD_TIMEOUT);
		m_device.destroyImageView(it->second.view);
		m_device.destroyImage(it->second.image);
		m_device.freeMemory(it->second.memory);
		m_textures.erase(it);
	}
}

void VulkanDevice::destroy(SamplerHandle handle)
{
	if (auto it = m_samplers.find(handle.id); it != m_samplers.end())
	{
		wait_idle(UPLOAD_TIMEOUT);
		m_device.destroySampler(it->second);
		m_samplers.erase(it);
	}
}

void VulkanDevice::destroy(ShaderModuleHandle handle)
{
	if (auto it = m_shader_modules.find(handle.id); it != m_shader_modules.end())
	{
		m_device.destroyShaderModule(it->second);
		m_shader_modules.erase(it);
	}
}

void VulkanDevice::destroy(BindGroupLayoutHandle handle)
{
	if (auto it = m_bind_group_layouts.find(handle.id); it != m_bind_group_layouts.end())
	{
		m_device.destroyDescriptorSetLayout(it->second.layout);
		m_bind_group_layouts.erase(it);
	}
}

void VulkanDevice::destroy(PipelineLayoutHandle handle)
{
	if (auto it = m_pipeline_layouts.find(handle.id); it != m_pipeline_layouts.end())
	{
		wait_idle(UPLOAD_TIMEOUT);
		m_device.destroyPipelineLayout(it->second.layout);
		for (auto gap : it->second.gap_layouts)
		{
			m_device.destroyDescriptorSetLayout(gap);
		}
		m_pipeline_layouts.erase(it);
	}
}

void VulkanDevice::destroy(PipelineHandle handle)
{
	if (auto it = m_pipelines.find(handle.id); it != m_pipelines.end())
	{
		wait_idle(UPLOAD_TIMEOUT);
		m_device.destroyPipeline(it->second.pipeline);
		m_pipelines.erase(it);
	}
}

void VulkanDevice::destroy(BindGroupHandle handle)
{
	if (auto it = m_bind_groups.find(handle.id); it != m_bind_groups.end())
	{
		wait_idle(UPLOAD_TIMEOUT);
		m_device.destroyDescriptorPool(it->second.pool);
		m_bind_groups.erase(it);
	}
}

// ============================================================================
// Lookup
// ============================================================================

const VulkanDevice::BufferRecord& VulkanDevice::buffer(BufferHandle handle) const
{
	auto it = m_buffers.find(handle.id);
	if (it == m_buffers.end())
	{
		throw DeviceError{fmt::format("Unknown buffer handle {}", handle.id)};
	}
	return it->second;
}

const VulkanDevice::TextureRecord& VulkanDevice::texture(TextureHandle handle) const
{
	auto it = m_textures.find(handle.id);
	if (it == m_textures.end())
	{
		throw DeviceError{fmt::format("Unknown texture handle {}", handle.id)};
	}
	return it->second;
}

vk::Sampler VulkanDevice::sampler(SamplerHandle handle) const
{
	auto it = m_samplers.find(handle.id);
	if (it == m_samplers.end())
	{
		throw DeviceError{fmt::format("Unknown sampler handle {}", handle.id)};
	}
	return it->second;
}

const VulkanDevice::PipelineRecord& VulkanDevice::pipeline(PipelineHandle handle) const
{
	auto it = m_pipelines.find(handle.id);
	if (it == m_pipelines.end())
	{
		throw DeviceError{fmt::format("Unknown pipeline handle {}", handle.id)};
	}
	return it->second;
}

vk::DescriptorSet VulkanDevice::bind_group(BindGroupHandle handle) const
{
	auto it = m_bind_groups.find(handle.id);
	if (it == m_bind_groups.end())
	{
		throw DeviceError{fmt::format("Unknown bind group handle {}", handle.id)};
	}
	return it->second.set;
}

} // namespace est
