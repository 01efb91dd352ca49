//
// Created by chris on 1/12/26.
//

#ifndef ESTRENDER_GPUOBJECTS_HPP
#define ESTRENDER_GPUOBJECTS_HPP
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "GpuDevice.hpp"
#include "LifetimeCache.hpp"

namespace est
{

enum class PipelineKind
{
	Render,
	Compute,
};

/// Cached backend pipeline. Shared between the cache and every pass that recorded it.
struct PipelineObject
{
	OwnedHandle<PipelineHandle> handle;
	PipelineKind				kind;
	std::string					label;
};

using PipelinePtr = std::shared_ptr<const PipelineObject>;

/// Cached set of bind groups, one per shader group, with the resources they reference kept alive.
struct BindGroupObject
{
	std::vector<std::pair<uint32_t, OwnedHandle<BindGroupHandle>>> groups; // sorted by group
	std::vector<std::shared_ptr<const void>>					   resources;
};

using BindGroupPtr = std::shared_ptr<const BindGroupObject>;

using PipelineCache	 = LifetimeCache<PipelinePtr>;
using BindGroupCache = LifetimeCache<BindGroupPtr>;

constexpr CacheConfig PIPELINE_CACHE_CONFIG	  = {.capacity = 500, .lifetime = 50, .emergency_lifetime = 10};
constexpr CacheConfig BIND_GROUP_CACHE_CONFIG = {.capacity = 500, .lifetime = 100, .emergency_lifetime = 10};

} // namespace est

#endif // ESTRENDER_GPUOBJECTS_HPP
