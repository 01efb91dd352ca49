//
// Created by chris on 1/12/26.
//
#include <est/Logger.hpp>
#include <est/SlangCompiler.hpp>

#include <optional>
#include <string>

#include <slang-com-ptr.h>
#include <slang.h>

namespace est
{

// ============================================================================
// Slang Session Management
// ============================================================================
// The global session is created lazily on first use and lives for the
// application lifetime. All modules are compiled through one SPIR-V session.
// ============================================================================

namespace
{

Slang::ComPtr<slang::IGlobalSession> create_global_session()
{
	Slang::ComPtr<slang::IGlobalSession> session;
	SlangGlobalSessionDesc				 desc = {};
	if (SLANG_FAILED(slang::createGlobalSession(&desc, session.writeRef())))
	{
		Logger::instance().error("Failed to create Slang global session");
		return session;
	}
	Logger::instance().debug("Created Slang global session");
	return session;
}

Slang::ComPtr<slang::ISession> create_spirv_session(slang::IGlobalSession* global)
{
	Slang::ComPtr<slang::ISession> session;
	if (!global)
	{
		return session;
	}

	slang::SessionDesc session_desc = {};

	slang::TargetDesc target_desc = {};
	target_desc.format			  = SLANG_SPIRV;
	target_desc.profile			  = global->findProfile("spirv_1_5");
	session_desc.targets		  = &target_desc;
	session_desc.targetCount	  = 1;

	const char* search_paths[]	 = {SHADER_DIR};
	session_desc.searchPaths	 = search_paths;
	session_desc.searchPathCount = 1;

	global->createSession(session_desc, session.writeRef());
	Logger::instance().debug("Created SPIR-V session with search path: {}", SHADER_DIR);
	return session;
}

slang::ISession* get_session()
{
	static Slang::ComPtr<slang::IGlobalSession> global	= create_global_session();
	static Slang::ComPtr<slang::ISession>		session = create_spirv_session(global);
	return session.get();
}

std::string diagnostics_text(slang::IBlob* diagnostics)
{
	if (!diagnostics || diagnostics->getBufferSize() == 0)
	{
		return {};
	}
	return std::string{static_cast<const char*>(diagnostics->getBufferPointer()), diagnostics->getBufferSize()};
}

/// Warnings are logged, failures are turned into ShaderCompilationFailed.
std::optional<Error> check_result(SlangResult result, slang::IBlob* diagnostics, std::string_view step,
								  std::string_view name)
{
	auto text = diagnostics_text(diagnostics);
	if (SLANG_FAILED(result))
	{
		return make_error(ErrorKind::ShaderCompilationFailed, "{} failed for '{}': {}", step, name, text);
	}
	if (!text.empty())
	{
		Logger::instance().warn("{} for '{}': {}", step, name, text);
	}
	return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// Reflection Lowering
// ============================================================================
// Converts Slang program layout reflection into the module AST consumed by
// est::reflect. Groups and bindings are taken verbatim from the Slang layout.
// ============================================================================

namespace
{

using SlangKind = slang::TypeReflection::Kind;

ast::ScalarKind to_scalar_kind(slang::TypeReflection::ScalarType scalar)
{
	using ST = slang::TypeReflection::ScalarType;
	switch (scalar)
	{
		case ST::Float32: return ast::ScalarKind::Float;
		case ST::Int32: return ast::ScalarKind::Sint;
		case ST::UInt32: return ast::ScalarKind::Uint;
		case ST::Bool: return ast::ScalarKind::Bool;
		case ST::Float64: return ast::ScalarKind::Float64;
		default: return ast::ScalarKind::Other;
	}
}

std::optional<std::string> type_name(slang::TypeReflection* type)
{
	if (const char* name = type ? type->getName() : nullptr; name && name[0] != '\0')
	{
		return std::string{name};
	}
	return std::nullopt;
}

bool is_system_value(const char* semantic)
{
	return semantic && std::string_view{semantic}.starts_with("SV_");
}

StorageAccess to_storage_access(SlangResourceAccess access)
{
	switch (access)
	{
		case SLANG_RESOURCE_ACCESS_READ: return StorageAccess::Read;
		case SLANG_RESOURCE_ACCESS_WRITE: return StorageAccess::Write;
		case SLANG_RESOURCE_ACCESS_READ_WRITE:
		case SLANG_RESOURCE_ACCESS_RASTER_ORDERED: return StorageAccess::Read | StorageAccess::Write;
		default: return StorageAccess::None;
	}
}

std::expected<ast::TypeHandle, Error> lower_type(ast::Module& module, slang::TypeLayoutReflection* layout);

std::expected<ast::TypeHandle, Error> lower_resource(ast::Module& module, slang::TypeLayoutReflection* layout)
{
	auto* type	 = layout->getType();
	auto  shape	 = type->getResourceShape();
	auto  base	 = shape & SLANG_RESOURCE_BASE_SHAPE_MASK;
	auto  access = to_storage_access(type->getResourceAccess());

	switch (base)
	{
		case SLANG_STRUCTURED_BUFFER:
		{
			auto element = lower_type(module, layout->getElementTypeLayout());
			if (!element)
				return std::unexpected{element.error()};
			return module.add_type({.name = type_name(type), .inner = ast::Array{.element = *element}});
		}
		case SLANG_BYTE_ADDRESS_BUFFER:
		{
			auto word = module.add_type({.name = std::nullopt, .inner = ast::Scalar{ast::ScalarKind::Uint}});
			return module.add_type({.name = type_name(type), .inner = ast::Array{.element = word}});
		}
		case SLANG_TEXTURE_1D:
		case SLANG_TEXTURE_2D:
		case SLANG_TEXTURE_3D:
		case SLANG_TEXTURE_CUBE:
		{
			auto image_class = ast::ImageClass::Sampled;
			if (has_flag(access, StorageAccess::Write))
				image_class = ast::ImageClass::Storage;
			else if (shape & SLANG_TEXTURE_SHADOW_FLAG)
				image_class = ast::ImageClass::Depth;

			return module.add_type(
				{.name	= type_name(type),
				 .inner = ast::Image{.image_class  = image_class,
									 .multisampled = (shape & SLANG_TEXTURE_MULTISAMPLE_FLAG) != 0,
									 .access	   = image_class == ast::ImageClass::Storage ? access
																						  : StorageAccess::None}});
		}
		default: break;
	}

	return std::unexpected{make_error(ErrorKind::UnsupportedType, "Unsupported resource type '{}'",
									  type_name(type).value_or("?"))};
}

std::expected<ast::TypeHandle, Error> lower_type(ast::Module& module, slang::TypeLayoutReflection* layout)
{
	if (!layout)
	{
		return std::unexpected{make_error(ErrorKind::UnsupportedType, "Missing type layout")};
	}
	auto* type = layout->getType();

	switch (layout->getKind())
	{
		case SlangKind::Scalar:
			return module.add_type({.name = std::nullopt, .inner = ast::Scalar{to_scalar_kind(type->getScalarType())}});
		case SlangKind::Vector:
			return module.add_type(
				{.name	= std::nullopt,
				 .inner = ast::Vector{.kind = to_scalar_kind(type->getScalarType()),
									  .size = static_cast<uint32_t>(type->getElementCount())}});
		case SlangKind::Matrix:
			return module.add_type(
				{.name	= std::nullopt,
				 .inner = ast::Matrix{.kind	   = to_scalar_kind(type->getScalarType()),
									  .columns = type->getColumnCount(),
									  .rows	   = type->getRowCount()}});
		case SlangKind::Struct:
		{
			ast::Struct lowered;
			for (unsigned f = 0; f < layout->getFieldCount(); ++f)
			{
				auto* field	 = layout->getFieldByIndex(f);
				auto  member = lower_type(module, field->getTypeLayout());
				if (!member)
					return std::unexpected{member.error()};
				lowered.members.push_back({.name = field->getName(), .type = *member, .location = std::nullopt});
			}
			return module.add_type({.name = type_name(type), .inner = std::move(lowered)});
		}
		case SlangKind::Array:
		{
			auto element = lower_type(module, layout->getElementTypeLayout());
			if (!element)
				return std::unexpected{element.error()};
			auto					count = layout->getElementCount();
			std::optional<uint32_t> sized;
			if (count != 0 && count != SLANG_UNBOUNDED_SIZE)
				sized = static_cast<uint32_t>(count);
			return module.add_type({.name = std::nullopt, .inner = ast::Array{.element = *element, .count = sized}});
		}
		case SlangKind::Resource: return lower_resource(module, layout);
		case SlangKind::SamplerState:
		{
			auto name		= type_name(type);
			bool comparison = name && name->find("Comparison") != std::string::npos;
			return module.add_type({.name = name, .inner = ast::Sampler{comparison}});
		}
		default: break;
	}

	return std::unexpected{make_error(ErrorKind::UnsupportedType, "Unsupported Slang type '{}' (kind {})",
									  type_name(type).value_or("?"), static_cast<int>(layout->getKind()))};
}

bool is_push_constant(slang::TypeLayoutReflection* layout)
{
	for (unsigned r = 0; r < layout->getBindingRangeCount(); r++)
	{
		if (layout->getBindingRangeType(r) == slang::BindingType::PushConstant)
		{
			return true;
		}
	}
	return false;
}

std::expected<ast::GlobalVariable, Error> lower_global(ast::Module& module, slang::VariableLayoutReflection* param)
{
	auto*		type_layout = param->getTypeLayout();
	std::string name		= param->getName() ? param->getName() : "";

	ast::GlobalVariable global{.name	= name.empty() ? std::nullopt : std::optional{name},
							   .space	= ast::AddressSpace::Uniform,
							   .access	= StorageAccess::Read,
							   .binding = ast::ResourceBinding{.group	= static_cast<uint32_t>(param->getBindingSpace()),
															   .binding = static_cast<uint32_t>(param->getBindingIndex())},
							   .type	= 0};

	switch (type_layout->getKind())
	{
		case SlangKind::ConstantBuffer:
		{
			auto element = lower_type(module, type_layout->getElementTypeLayout());
			if (!element)
				return std::unexpected{element.error()};
			global.type = *element;
			if (is_push_constant(type_layout))
			{
				global.space		 = ast::AddressSpace::PushConstant;
				global.binding->group = PUSH_CONSTANT_GROUP;
			}
			return global;
		}
		case SlangKind::Resource:
		{
			auto lowered = lower_type(module, type_layout);
			if (!lowered)
				return std::unexpected{lowered.error()};
			global.type = *lowered;

			auto access = to_storage_access(type_layout->getType()->getResourceAccess());
			auto base	= type_layout->getType()->getResourceShape() & SLANG_RESOURCE_BASE_SHAPE_MASK;
			if (base == SLANG_STRUCTURED_BUFFER || base == SLANG_BYTE_ADDRESS_BUFFER)
			{
				global.space  = ast::AddressSpace::Storage;
				global.access = access;
			} else if (has_flag(access, StorageAccess::Write))
			{
				global.space  = ast::AddressSpace::Storage;
				global.access = access;
			} else
			{
				global.space = ast::AddressSpace::Handle;
			}
			return global;
		}
		case SlangKind::SamplerState:
		{
			auto lowered = lower_type(module, type_layout);
			if (!lowered)
				return std::unexpected{lowered.error()};
			global.type	 = *lowered;
			global.space = ast::AddressSpace::Handle;
			return global;
		}
		default: break;
	}

	return std::unexpected{make_error(ErrorKind::UnsupportedType,
									  "Global parameter '{}' is neither a buffer, a texture nor a sampler", name)};
}

std::optional<ast::Stage> to_stage(SlangStage stage)
{
	switch (stage)
	{
		case SLANG_STAGE_VERTEX: return ast::Stage::Vertex;
		case SLANG_STAGE_FRAGMENT: return ast::Stage::Fragment;
		case SLANG_STAGE_COMPUTE: return ast::Stage::Compute;
		case SLANG_STAGE_GEOMETRY: return ast::Stage::Geometry;
		case SLANG_STAGE_HULL: return ast::Stage::TessellationControl;
		case SLANG_STAGE_DOMAIN: return ast::Stage::TessellationEvaluation;
		case SLANG_STAGE_MESH: return ast::Stage::Mesh;
		case SLANG_STAGE_AMPLIFICATION: return ast::Stage::Task;
		default: return std::nullopt;
	}
}

/// Vertex inputs keep their location; system values are dropped.
std::expected<ast::TypeHandle, Error> lower_varying_struct(ast::Module& module, slang::TypeLayoutReflection* layout)
{
	ast::Struct lowered;
	for (unsigned f = 0; f < layout->getFieldCount(); f++)
	{
		auto* field = layout->getFieldByIndex(f);
		if (is_system_value(field->getSemanticName()))
		{
			continue;
		}
		auto member = lower_type(module, field->getTypeLayout());
		if (!member)
			return std::unexpected{member.error()};
		lowered.members.push_back(
			{.name = field->getName(), .type = *member, .location = static_cast<uint32_t>(field->getBindingIndex())});
	}
	return module.add_type({.name = type_name(layout->getType()), .inner = std::move(lowered)});
}

std::expected<ast::EntryPoint, Error> lower_entry_point(ast::Module& module, slang::EntryPointReflection* entry)
{
	auto stage = to_stage(entry->getStage());
	if (!stage)
	{
		return std::unexpected{make_error(ErrorKind::UnsupportedStage, "Entry point '{}' has unsupported Slang stage {}",
										  entry->getName(), static_cast<int>(entry->getStage()))};
	}

	ast::EntryPoint lowered{.name = entry->getName(), .stage = *stage, .arguments = {}};

	if (*stage == ast::Stage::Compute)
	{
		SlangUInt sizes[3] = {1, 1, 1};
		entry->getComputeThreadGroupSize(3, sizes);
		lowered.workgroup_size = {static_cast<uint32_t>(sizes[0]), static_cast<uint32_t>(sizes[1]),
								  static_cast<uint32_t>(sizes[2])};
	}

	// Only vertex inputs feed reflection, other stages keep their varyings opaque.
	if (*stage != ast::Stage::Vertex)
	{
		return lowered;
	}

	for (unsigned p = 0; p < entry->getParameterCount(); p++)
	{
		auto* param		  = entry->getParameterByIndex(p);
		auto* type_layout = param->getTypeLayout();
		auto  name		  = param->getName() ? std::optional<std::string>{param->getName()} : std::nullopt;

		if (is_system_value(param->getSemanticName()))
		{
			auto type = lower_type(module, type_layout);
			if (!type)
				return std::unexpected{type.error()};
			lowered.arguments.push_back({.name = name, .type = *type, .location = std::nullopt, .builtin = true});
			continue;
		}

		auto type = type_layout->getKind() == SlangKind::Struct ? lower_varying_struct(module, type_layout)
																: lower_type(module, type_layout);
		if (!type)
			return std::unexpected{type.error()};
		lowered.arguments.push_back(
			{.name = name, .type = *type, .location = static_cast<uint32_t>(param->getBindingIndex()), .builtin = false});
	}

	return lowered;
}

std::expected<ast::Module, Error> lower_program(slang::ProgramLayout* layout)
{
	ast::Module module;

	for (unsigned i = 0; i < layout->getParameterCount(); i++)
	{
		auto global = lower_global(module, layout->getParameterByIndex(i));
		if (!global)
			return std::unexpected{global.error()};
		module.globals.push_back(std::move(*global));
	}

	for (SlangUInt e = 0; e < layout->getEntryPointCount(); e++)
	{
		auto entry = lower_entry_point(module, layout->getEntryPointByIndex(e));
		if (!entry)
			return std::unexpected{entry.error()};
		module.entry_points.push_back(std::move(*entry));
	}

	Logger::instance().debug("Lowered Slang program: {} globals, {} entry points, {} types", module.globals.size(),
							 module.entry_points.size(), module.types.size());
	return module;
}

} // anonymous namespace

// ============================================================================
// Compilation
// ============================================================================

namespace
{

std::expected<CompiledShader, Error> compile_module(slang::ISession* session, slang::IModule* module,
													std::string_view name)
{
	std::vector<Slang::ComPtr<slang::IEntryPoint>> entries;
	for (SlangInt32 i = 0; i < module->getDefinedEntryPointCount(); i++)
	{
		Slang::ComPtr<slang::IEntryPoint> entry;
		module->getDefinedEntryPoint(i, entry.writeRef());
		if (entry)
			entries.push_back(entry);
	}
	if (entries.empty())
	{
		return std::unexpected{make_error(ErrorKind::MissingEntryPoint,
										  "Slang module '{}' defines no [shader(...)] entry point", name)};
	}

	std::vector<slang::IComponentType*> components{module};
	for (auto& entry : entries)
	{
		components.push_back(entry.get());
	}

	Slang::ComPtr<slang::IBlob>			 diagnostics;
	Slang::ComPtr<slang::IComponentType> program;
	auto result = session->createCompositeComponentType(components.data(), static_cast<SlangInt>(components.size()),
														program.writeRef(), diagnostics.writeRef());
	if (auto error = check_result(result, diagnostics.get(), "Composition", name))
		return std::unexpected{*error};

	Slang::ComPtr<slang::IComponentType> linked;
	result = program->link(linked.writeRef(), diagnostics.writeRef());
	if (auto error = check_result(result, diagnostics.get(), "Linking", name))
		return std::unexpected{*error};

	Slang::ComPtr<slang::IBlob> code;
	result = linked->getTargetCode(0, code.writeRef(), diagnostics.writeRef());
	if (auto error = check_result(result, diagnostics.get(), "SPIR-V generation", name))
		return std::unexpected{*error};

	auto lowered = lower_program(linked->getLayout());
	if (!lowered)
		return std::unexpected{lowered.error()};

	const auto* bytes = static_cast<const uint8_t*>(code->getBufferPointer());
	Logger::instance().debug("Compiled Slang module '{}' ({} entry points, {} bytes of SPIR-V)", name, entries.size(),
							 code->getBufferSize());
	return CompiledShader{.module = std::move(*lowered),
						  .spirv  = std::vector<uint8_t>(bytes, bytes + code->getBufferSize())};
}

slang::ISession* require_session()
{
	auto* session = get_session();
	if (!session)
	{
		fatal(ErrorKind::ShaderCompilationFailed, "Slang session is unavailable");
	}
	return session;
}

} // anonymous namespace

std::expected<CompiledShader, Error> compile_slang_source(std::string_view name, std::string_view source)
{
	Logger::instance().debug("Compiling Slang source '{}'", name);
	auto* session = require_session();

	std::string module_name{name};
	std::string path = module_name + ".slang";
	std::string text{source};

	Slang::ComPtr<slang::IBlob>	  diagnostics;
	Slang::ComPtr<slang::IModule> module(
		session->loadModuleFromSourceString(module_name.c_str(), path.c_str(), text.c_str(), diagnostics.writeRef()));
	if (!module)
	{
		return std::unexpected{make_error(ErrorKind::ShaderCompilationFailed, "Failed to compile '{}': {}", name,
										  diagnostics_text(diagnostics.get()))};
	}
	return compile_module(session, module, name);
}

std::expected<CompiledShader, Error> compile_slang_module(std::string_view name)
{
	Logger::instance().debug("Loading Slang module '{}'", name);
	auto* session = require_session();

	std::string module_name{name};

	Slang::ComPtr<slang::IBlob>	  diagnostics;
	Slang::ComPtr<slang::IModule> module(session->loadModule(module_name.c_str(), diagnostics.writeRef()));
	if (!module)
	{
		return std::unexpected{make_error(ErrorKind::ShaderCompilationFailed, "Failed to load module '{}': {}", name,
										  diagnostics_text(diagnostics.get()))};
	}
	return compile_module(session, module, name);
}

} // namespace est
