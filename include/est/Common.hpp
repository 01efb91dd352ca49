//
// Created by chris on 1/6/26.
//

#ifndef ESTRENDER_COMMON_HPP
#define ESTRENDER_COMMON_HPP
#include <cstdint>
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace est
{

template<class... Fs>
struct overloaded : Fs...
{
	using Fs::operator()...;
};

template<class... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

/// Minimum alignment for buffer copies and buffer sizes.
constexpr uint64_t COPY_BUFFER_ALIGNMENT = 4;

/// Bounds are powers of two only.
constexpr uint64_t align_to(uint64_t value, uint64_t alignment)
{
	return (value + alignment - 1) & ~(alignment - 1);
}

/// Boost-style hash mixing, 64 bit variant. Order of calls matters.
inline void hash_combine(uint64_t& seed, uint64_t value)
{
	seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 12) + (seed >> 4);
}

template<class T>
void hash_value(uint64_t& seed, const T& value)
{
	if constexpr (std::is_enum_v<T>)
	{
		hash_combine(seed, static_cast<uint64_t>(value));
	} else if constexpr (std::is_integral_v<T>)
	{
		hash_combine(seed, static_cast<uint64_t>(value));
	} else
	{
		hash_combine(seed, std::hash<T>{}(value));
	}
}

} // namespace est

/// Bitwise operators for `enum class` flag sets.
#define EST_DECLARE_FLAGS(Enum)                                                                                        \
	constexpr Enum operator|(Enum a, Enum b)                                                                           \
	{                                                                                                                  \
		using U = std::underlying_type_t<Enum>;                                                                        \
		return static_cast<Enum>(static_cast<U>(a) | static_cast<U>(b));                                               \
	}                                                                                                                  \
	constexpr Enum operator&(Enum a, Enum b)                                                                           \
	{                                                                                                                  \
		using U = std::underlying_type_t<Enum>;                                                                        \
		return static_cast<Enum>(static_cast<U>(a) & static_cast<U>(b));                                               \
	}                                                                                                                  \
	constexpr Enum& operator|=(Enum& a, Enum b)                                                                        \
	{                                                                                                                  \
		return a = a | b;                                                                                              \
	}                                                                                                                  \
	constexpr bool has_flag(Enum set, Enum flag)                                                                       \
	{                                                                                                                  \
		return (set & flag) == flag;                                                                                   \
	}                                                                                                                  \
	constexpr bool has_any(Enum set, Enum flags)                                                                       \
	{                                                                                                                  \
		return static_cast<std::underlying_type_t<Enum>>(set & flags) != 0;                                            \
	}

#endif // ESTRENDER_COMMON_HPP
