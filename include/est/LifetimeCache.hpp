//
// Created by chris on 1/11/26.
//

#ifndef ESTRENDER_LIFETIMECACHE_HPP
#define ESTRENDER_LIFETIMECACHE_HPP
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "Error.hpp"
#include "Logger.hpp"

namespace est
{

enum class OverflowPolicy
{
	Fail,		 // Exhaustion is a fatal usage error
	EvictOldest, // Drop the stalest entry regardless of its age
};

struct CacheConfig
{
	std::size_t	   capacity;
	uint32_t	   lifetime;
	uint32_t	   emergency_lifetime;
	OverflowPolicy overflow = OverflowPolicy::Fail;
};

struct CacheStats
{
	uint64_t hits	   = 0;
	uint64_t misses	   = 0;
	uint64_t evictions = 0;
};

/**
 * @brief Hash-keyed object cache with frame based eviction
 *
 * Every hit resets the entry age to 0. cycle() ages all entries by one and drops
 * the ones that reached the configured lifetime. When an insertion finds the cache
 * full, entries at least emergency_lifetime old are dropped first; if that frees
 * nothing the overflow policy decides.
 *
 * T should be cheap to copy (a shared_ptr or a handle).
 */
template<class T>
class LifetimeCache
{
public:
	LifetimeCache(std::string name, CacheConfig config)
		: m_name(std::move(name))
		, m_config(config)
	{}

	/**
	 * @brief Return the cached object for key, building it with factory on a miss
	 *
	 * factory is not called on a hit. If factory throws nothing is inserted.
	 */
	template<class Factory>
	T get_or_create(uint64_t key, Factory&& factory)
	{
		if (auto it = m_entries.find(key); it != m_entries.end())
		{
			it->second.age = 0;
			++m_stats.hits;
			Logger::instance().trace("{} hit for key {:#018x}", m_name, key);
			return it->second.object;
		}

		++m_stats.misses;
		if (m_entries.size() >= m_config.capacity)
		{
			make_room();
		}

		T object = std::forward<Factory>(factory)();
		m_entries.emplace(key, Entry{.object = object, .age = 0});
		Logger::instance().debug("{} miss for key {:#018x}, now holding {} entries", m_name, key, m_entries.size());
		return object;
	}

	/// Advance every entry by one frame and evict the expired ones.
	void cycle()
	{
		for (auto& [key, entry] : m_entries)
		{
			++entry.age;
		}
		auto evicted = evict_aged(m_config.lifetime);
		if (evicted > 0)
		{
			Logger::instance().debug("{} evicted {} idle entries", m_name, evicted);
		}
	}

	[[nodiscard]] bool contains(uint64_t key) const { return m_entries.contains(key); }

	[[nodiscard]] std::optional<uint32_t> age(uint64_t key) const
	{
		auto it = m_entries.find(key);
		if (it == m_entries.end())
			return std::nullopt;
		return it->second.age;
	}

	[[nodiscard]] std::size_t		 size() const { return m_entries.size(); }
	[[nodiscard]] const CacheConfig& config() const { return m_config; }
	[[nodiscard]] const CacheStats&	 stats() const { return m_stats; }

	void clear()
	{
		m_stats.evictions += m_entries.size();
		m_entries.clear();
	}

private:
	struct Entry
	{
		T		 object;
		uint32_t age;
	};

	std::size_t evict_aged(uint32_t threshold)
	{
		auto evicted = std::erase_if(m_entries, [threshold](const auto& item) { return item.second.age >= threshold; });
		m_stats.evictions += evicted;
		return evicted;
	}

	void make_room()
	{
		auto evicted = evict_aged(m_config.emergency_lifetime);
		Logger::instance().warn("{} at capacity ({}), emergency sweep evicted {} entries", m_name, m_config.capacity,
								evicted);
		if (m_entries.size() < m_config.capacity)
		{
			return;
		}

		if (m_config.overflow == OverflowPolicy::EvictOldest && !m_entries.empty())
		{
			auto oldest = m_entries.begin();
			for (auto it = m_entries.begin(); it != m_entries.end(); ++it)
			{
				if (it->second.age > oldest->second.age ||
					(it->second.age == oldest->second.age && it->first < oldest->first))
				{
					oldest = it;
				}
			}
			Logger::instance().warn("{} forced eviction of key {:#018x} (age {})", m_name, oldest->first,
									oldest->second.age);
			m_entries.erase(oldest);
			++m_stats.evictions;
			return;
		}

		fatal(ErrorKind::CacheCapacityExceeded,
			  "{} exceeded its capacity of {} live entries; too many distinct variants are alive at once", m_name,
			  m_config.capacity);
	}

	std::string							m_name;
	CacheConfig							m_config;
	CacheStats							m_stats;
	std::unordered_map<uint64_t, Entry> m_entries;
};

} // namespace est

#endif // ESTRENDER_LIFETIMECACHE_HPP
