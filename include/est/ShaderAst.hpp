//
// Created by chris on 1/9/26.
//

#ifndef ESTRENDER_SHADERAST_HPP
#define ESTRENDER_SHADERAST_HPP
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "ShaderTypes.hpp"

namespace est::ast
{

/// Index into ShaderModule::types.
using TypeHandle = uint32_t;

enum class ScalarKind
{
	Float,
	Sint,
	Uint,
	Bool,
	Float64,
	Other, // half, 8/16/64 bit integers
};

struct Scalar
{
	ScalarKind kind;
};

struct Vector
{
	ScalarKind kind;
	uint32_t   size; // 2, 3 or 4
};

struct Matrix
{
	ScalarKind kind;
	uint32_t   columns;
	uint32_t   rows;
};

struct StructMember
{
	std::string				name;
	TypeHandle				type;
	std::optional<uint32_t> location; // Only meaningful for stage inputs/outputs
};

struct Struct
{
	std::vector<StructMember> members;
};

struct Array
{
	TypeHandle				element;
	std::optional<uint32_t> count;	// nullopt: runtime sized
	std::optional<uint32_t> stride; // nullopt: element size rounded to its alignment
};

enum class ImageClass
{
	Sampled,
	Depth,
	Storage,
};

struct Image
{
	ImageClass	  image_class;
	bool		  multisampled;
	StorageAccess access; // Storage images only
};

struct Sampler
{
	bool comparison;
};

using TypeInner = std::variant<Scalar, Vector, Matrix, Struct, Array, Image, Sampler>;

struct Type
{
	std::optional<std::string> name;
	TypeInner				   inner;
};

enum class AddressSpace
{
	Function,
	Private,
	WorkGroup,
	Uniform,
	Storage,
	Handle,
	PushConstant,
};

struct ResourceBinding
{
	uint32_t group;
	uint32_t binding;
};

struct GlobalVariable
{
	std::optional<std::string>	   name;
	AddressSpace				   space;
	StorageAccess				   access = StorageAccess::Read;
	std::optional<ResourceBinding> binding;
	TypeHandle					   type;
};

enum class Stage
{
	Vertex,
	Fragment,
	Compute,
	Geometry,
	TessellationControl,
	TessellationEvaluation,
	Mesh,
	Task,
};

struct FunctionArgument
{
	std::optional<std::string> name;
	TypeHandle				   type;
	std::optional<uint32_t>	   location;
	bool					   builtin = false;
};

struct EntryPoint
{
	std::string					  name;
	Stage						  stage;
	std::vector<FunctionArgument> arguments;
	std::array<uint32_t, 3>		  workgroup_size{1, 1, 1};
};

/// Parsed shader module, the input of reflection. Produced by the Slang front end,
/// or assembled by hand.
struct Module
{
	std::vector<Type>			types;
	std::vector<GlobalVariable> globals;
	std::vector<EntryPoint>		entry_points;

	TypeHandle add_type(Type type)
	{
		types.push_back(std::move(type));
		return static_cast<TypeHandle>(types.size() - 1);
	}
};

} // namespace est::ast

#endif // ESTRENDER_SHADERAST_HPP
