#pragma once
/**
 * @file config_loader.hpp
 * @brief Heap layout configuration: defaults, TOML layouts (toml++), validation.
 * @details All defaults reference named constants to avoid magic numbers.
 *
 * Layout file:
 * @code
 *   heap_size = 26624         # total heap bytes; optional, 0 = sum of pools
 *   trace_key = 0x0E7C5F1D    # trace scrambling key; optional
 *
 *   [[pool]]                  # at least one
 *   block_size = 16
 *   capacity   = 128
 * @endcode
 * Unknown keys are rejected.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "kheap/compat/expected.hpp"
#include "kheap/config/constants.hpp"

namespace kheap::config {

    /** @struct PoolConfig
     *  @brief One size class.
     */
    struct PoolConfig {
        std::size_t block_size{0}; ///< Bytes per block
        std::size_t capacity{0};   ///< Number of blocks
    };

    /** @struct HeapConfig
     *  @brief Complete heap description. Pool order is irrelevant; the arena
     *         sorts by block size when laying the pools out.
     */
    struct HeapConfig {
        std::size_t             heap_size{constants::DEFAULT_HEAP_SIZE}; ///< 0 = sum of pools
        std::uint32_t           trace_key{constants::TRACE_KEY_DEFAULT}; ///< Trace scrambling key
        std::vector<PoolConfig> pools;                                   ///< Size classes
    };

    /// @brief Reasons a configuration is rejected.
    enum class ConfigError : std::uint8_t {
        NoPools = 1,         ///< At least one pool is required
        BlockTooSmall,       ///< Block cannot hold the free-list link
        ZeroCapacity,        ///< A pool with no blocks
        CapacityTooLarge,    ///< More blocks than the free-list index can address
        DuplicateBlockSize,  ///< Two pools serve the same size class
        SizeOverflow,        ///< Pool sizes overflow size_t
        SizeMismatch,        ///< Declared heap size differs from the sum of the pools
        ParseError,          ///< Malformed TOML, wrong value type or unknown key
        FileUnreadable,      ///< Configuration file could not be read
        AllocationFailed     ///< Backing memory could not be obtained
    };

    /// Short label for logs.
    const char* to_string(ConfigError e) noexcept;

    /// Total bytes spanned by @p cfg's pools, or SizeOverflow.
    kheap_detail::expected<std::size_t, ConfigError> pools_size(const HeapConfig& cfg) noexcept;

    /// Check every structural rule of a configuration.
    kheap_detail::expected<void, ConfigError> validate(const HeapConfig& cfg) noexcept;

    /** @class Loader
     *  @brief Source of heap configuration (defaults, strings or files).
     */
    class Loader {
    public:
        /// Default pool table from constants.hpp.
        static HeapConfig defaults();

        /// Parse and validate the TOML layout described above.
        static kheap_detail::expected<HeapConfig, ConfigError> from_string(std::string_view text);

        /// Read @p path and parse it with from_string().
        static kheap_detail::expected<HeapConfig, ConfigError> load_from_file(const std::string& path);
    };

} // namespace kheap::config
