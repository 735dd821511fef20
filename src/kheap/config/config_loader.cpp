/**
* @file config_loader.cpp
 * @brief Defaults, TOML layout parsing (toml++) and structural validation.
 */
#include "kheap/config/config_loader.hpp"

#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

#include <toml++/toml.hpp>

namespace kheap::config {
    using namespace kheap::config::constants;

    namespace {

        // Non-negative TOML integer that fits T; nullopt for anything else.
        template <class T>
        std::optional<T> as_unsigned(const toml::node& node) {
            const auto v = node.value_exact<std::int64_t>();
            if (!v || *v < 0 || static_cast<std::uint64_t>(*v) > std::numeric_limits<T>::max()) {
                return std::nullopt;
            }
            return static_cast<T>(*v);
        }

        // One [[pool]] entry: exactly block_size and capacity.
        std::optional<PoolConfig> parse_pool(const toml::node& node) {
            const toml::table* entry = node.as_table();
            if (entry == nullptr) return std::nullopt;

            std::optional<std::size_t> block;
            std::optional<std::size_t> capacity;
            for (auto&& [key, value] : *entry) {
                if (key.str() == "block_size") {
                    block = as_unsigned<std::size_t>(value);
                    if (!block) return std::nullopt;
                } else if (key.str() == "capacity") {
                    capacity = as_unsigned<std::size_t>(value);
                    if (!capacity) return std::nullopt;
                } else {
                    return std::nullopt;
                }
            }
            if (!block || !capacity) return std::nullopt;
            return PoolConfig{*block, *capacity};
        }

    } // namespace

    const char* to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::NoPools:            return "no_pools";
            case ConfigError::BlockTooSmall:      return "block_too_small";
            case ConfigError::ZeroCapacity:       return "zero_capacity";
            case ConfigError::CapacityTooLarge:   return "capacity_too_large";
            case ConfigError::DuplicateBlockSize: return "duplicate_block_size";
            case ConfigError::SizeOverflow:       return "size_overflow";
            case ConfigError::SizeMismatch:       return "size_mismatch";
            case ConfigError::ParseError:         return "parse_error";
            case ConfigError::FileUnreadable:     return "file_unreadable";
            case ConfigError::AllocationFailed:   return "allocation_failed";
        }
        return "unknown";
    }

    kheap_detail::expected<std::size_t, ConfigError> pools_size(const HeapConfig& cfg) noexcept {
        constexpr auto max = std::numeric_limits<std::size_t>::max();
        std::size_t total = 0;
        for (const auto& p : cfg.pools) {
            if (p.capacity != 0 && p.block_size > max / p.capacity) {
                return kheap_detail::unexpected<ConfigError>(ConfigError::SizeOverflow);
            }
            const std::size_t bytes = p.block_size * p.capacity;
            if (bytes > max - total) {
                return kheap_detail::unexpected<ConfigError>(ConfigError::SizeOverflow);
            }
            total += bytes;
        }
        return total;
    }

    kheap_detail::expected<void, ConfigError> validate(const HeapConfig& cfg) noexcept {
        if (cfg.pools.empty()) {
            return kheap_detail::unexpected<ConfigError>(ConfigError::NoPools);
        }
        for (std::size_t i = 0; i < cfg.pools.size(); ++i) {
            const auto& p = cfg.pools[i];
            if (p.block_size < MIN_BLOCK_SIZE) {
                return kheap_detail::unexpected<ConfigError>(ConfigError::BlockTooSmall);
            }
            if (p.capacity == 0) {
                return kheap_detail::unexpected<ConfigError>(ConfigError::ZeroCapacity);
            }
            if (p.capacity > MAX_POOL_CAPACITY) {
                return kheap_detail::unexpected<ConfigError>(ConfigError::CapacityTooLarge);
            }
            for (std::size_t j = 0; j < i; ++j) {
                if (cfg.pools[j].block_size == p.block_size) {
                    return kheap_detail::unexpected<ConfigError>(ConfigError::DuplicateBlockSize);
                }
            }
        }
        const auto total = pools_size(cfg);
        if (!total) {
            return kheap_detail::unexpected<ConfigError>(total.error());
        }
        if (cfg.heap_size != 0 && cfg.heap_size != *total) {
            return kheap_detail::unexpected<ConfigError>(ConfigError::SizeMismatch);
        }
        return {};
    }

    HeapConfig Loader::defaults() {
        HeapConfig cfg;
        cfg.heap_size = DEFAULT_HEAP_SIZE;
        cfg.trace_key = TRACE_KEY_DEFAULT;
        cfg.pools.reserve(DEFAULT_POOL_COUNT);
        for (std::size_t i = 0; i < DEFAULT_POOL_COUNT; ++i) {
            cfg.pools.push_back({DEFAULT_POOL_BLOCKS[i], DEFAULT_POOL_CAPACITIES[i]});
        }
        return cfg;
    }

    kheap_detail::expected<HeapConfig, ConfigError> Loader::from_string(std::string_view text) {
        toml::table doc;
        try {
            doc = toml::parse(text);
        } catch (const toml::parse_error&) {
            return kheap_detail::unexpected<ConfigError>(ConfigError::ParseError);
        }

        HeapConfig cfg;
        for (auto&& [key, value] : doc) {
            if (key.str() == "heap_size") {
                const auto v = as_unsigned<std::size_t>(value);
                if (!v) return kheap_detail::unexpected<ConfigError>(ConfigError::ParseError);
                cfg.heap_size = *v;
            } else if (key.str() == "trace_key") {
                const auto v = as_unsigned<std::uint32_t>(value);
                if (!v) return kheap_detail::unexpected<ConfigError>(ConfigError::ParseError);
                cfg.trace_key = *v;
            } else if (key.str() == "pool") {
                const toml::array* entries = value.as_array();
                if (entries == nullptr) return kheap_detail::unexpected<ConfigError>(ConfigError::ParseError);
                for (const toml::node& entry : *entries) {
                    const auto pool = parse_pool(entry);
                    if (!pool) return kheap_detail::unexpected<ConfigError>(ConfigError::ParseError);
                    cfg.pools.push_back(*pool);
                }
            } else {
                return kheap_detail::unexpected<ConfigError>(ConfigError::ParseError);
            }
        }
        if (auto ok = validate(cfg); !ok) {
            return kheap_detail::unexpected<ConfigError>(ok.error());
        }
        return cfg;
    }

    kheap_detail::expected<HeapConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            return kheap_detail::unexpected<ConfigError>(ConfigError::FileUnreadable);
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        return from_string(buf.str());
    }

} // namespace kheap::config
