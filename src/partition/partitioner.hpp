/**
 * @file partitioner.hpp
 * @brief Splits a dataset into independently executable partitions.
 *
 * Three strategies are supported:
 *   equal_size  contiguous record ranges of (almost) equal length
 *   by_key      distinct values of a key field dealt round-robin
 *   custom      caller-supplied cut points
 *
 * Partitioning is a pure function of its inputs.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace verified_compute {

/**
 * @brief Half-open record range [begin, end).
 */
struct RecordRange {
    uint64_t begin{0};
    uint64_t end{0};

    [[nodiscard]] constexpr uint64_t size() const noexcept { return end - begin; }

    bool operator==(const RecordRange&) const = default;
};

/**
 * @brief Selects the records whose key_field takes one of the listed values.
 */
struct KeyFilter {
    std::string key_field;
    std::vector<std::string> values;

    bool operator==(const KeyFilter&) const = default;
};

using PartitionScope = std::variant<RecordRange, KeyFilter>;

/**
 * @brief One disjoint slice of a dataset. Immutable once created.
 */
struct Partition {
    PartitionId partition_id{0};
    std::string dataset_reference;
    PartitionScope scope;

    bool operator==(const Partition&) const = default;
};

/**
 * @brief What the partitioner needs to know about a dataset.
 *
 * key_domains maps a field name to its distinct values; only required
 * for the by_key strategy.
 */
struct DatasetDescriptor {
    std::string reference;
    uint64_t record_count{0};
    std::map<std::string, std::vector<std::string>> key_domains;
};

enum class PartitionStrategy : uint8_t {
    EqualSize,
    ByKey,
    Custom
};

[[nodiscard]] constexpr std::string_view to_string(PartitionStrategy strategy) noexcept {
    switch (strategy) {
        case PartitionStrategy::EqualSize: return "equal_size";
        case PartitionStrategy::ByKey:     return "by_key";
        case PartitionStrategy::Custom:    return "custom";
    }
    return "unknown";
}

Result<PartitionStrategy> parse_partition_strategy(std::string_view name);

struct PartitionConfig {
    std::string strategy = "equal_size";
    uint32_t num_partitions = 1;
    std::optional<std::string> key_field;
    std::vector<uint64_t> custom_boundaries;   ///< custom: num_partitions - 1 cut points
};

/**
 * @brief Check the dataset-independent parts of a partition config.
 */
Result<PartitionStrategy> validate_partition_config(const PartitionConfig& config);

/**
 * @brief Produce the ordered partitions of a dataset.
 *
 * Fails with ConfigurationError on an invalid config or when the dataset
 * cannot be split as requested.
 */
Result<std::vector<Partition>> partition(const DatasetDescriptor& dataset,
                                         const PartitionConfig& config);

/// Human-readable scope, used in logs and worker outputs.
std::string describe(const PartitionScope& scope);

}  // namespace verified_compute
