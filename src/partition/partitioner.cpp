/**
 * @file partitioner.cpp
 * @brief Partitioning strategies.
 *
 * equal_size: with S records and k partitions, the first S mod k
 * partitions take floor(S/k) + 1 records and the rest floor(S/k), so the
 * ranges tile [0, S) with no gap and no overlap.
 */

#include "partition/partitioner.hpp"

#include <algorithm>

namespace verified_compute {

namespace {

Error config_error(std::string message) {
    return Error{ErrorCode::ConfigurationError, std::move(message)};
}

Result<std::vector<Partition>> equal_size(const DatasetDescriptor& dataset, uint32_t k) {
    const uint64_t total = dataset.record_count;
    const uint64_t base = total / k;
    const uint64_t extra = total % k;

    std::vector<Partition> partitions;
    partitions.reserve(k);

    uint64_t cursor = 0;
    for (uint32_t i = 0; i < k; ++i) {
        uint64_t len = base + (i < extra ? 1 : 0);
        partitions.push_back(Partition{
            .partition_id = i,
            .dataset_reference = dataset.reference,
            .scope = RecordRange{.begin = cursor, .end = cursor + len}
        });
        cursor += len;
    }
    return partitions;
}

Result<std::vector<Partition>> by_key(const DatasetDescriptor& dataset,
                                      const PartitionConfig& config) {
    if (!config.key_field || config.key_field->empty()) {
        return config_error("Strategy by_key requires key_field");
    }
    auto it = dataset.key_domains.find(*config.key_field);
    if (it == dataset.key_domains.end()) {
        return config_error("Dataset " + dataset.reference
                            + " declares no key domain for field " + *config.key_field);
    }

    std::vector<std::string> values = it->second;
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());

    if (values.size() < config.num_partitions) {
        return config_error("Field " + *config.key_field + " has "
                            + std::to_string(values.size()) + " distinct values, fewer than "
                            + std::to_string(config.num_partitions) + " partitions");
    }

    std::vector<KeyFilter> filters(config.num_partitions,
                                   KeyFilter{.key_field = *config.key_field, .values = {}});
    for (size_t i = 0; i < values.size(); ++i) {
        filters[i % config.num_partitions].values.push_back(values[i]);
    }

    std::vector<Partition> partitions;
    partitions.reserve(config.num_partitions);
    for (uint32_t i = 0; i < config.num_partitions; ++i) {
        partitions.push_back(Partition{
            .partition_id = i,
            .dataset_reference = dataset.reference,
            .scope = std::move(filters[i])
        });
    }
    return partitions;
}

Result<std::vector<Partition>> custom(const DatasetDescriptor& dataset,
                                      const PartitionConfig& config) {
    const auto& cuts = config.custom_boundaries;
    if (cuts.size() + 1 != config.num_partitions) {
        return config_error("Strategy custom needs num_partitions - 1 boundaries, got "
                            + std::to_string(cuts.size()));
    }

    uint64_t previous = 0;
    for (uint64_t cut : cuts) {
        if (cut <= previous || cut >= dataset.record_count) {
            return config_error("Custom boundary " + std::to_string(cut)
                                + " is not strictly increasing inside (0, "
                                + std::to_string(dataset.record_count) + ")");
        }
        previous = cut;
    }

    std::vector<Partition> partitions;
    partitions.reserve(config.num_partitions);
    uint64_t begin = 0;
    for (uint32_t i = 0; i < config.num_partitions; ++i) {
        uint64_t end = (i < cuts.size()) ? cuts[i] : dataset.record_count;
        partitions.push_back(Partition{
            .partition_id = i,
            .dataset_reference = dataset.reference,
            .scope = RecordRange{.begin = begin, .end = end}
        });
        begin = end;
    }
    return partitions;
}

}  // anonymous namespace

Result<PartitionStrategy> parse_partition_strategy(std::string_view name) {
    if (name == "equal_size") return PartitionStrategy::EqualSize;
    if (name == "by_key")     return PartitionStrategy::ByKey;
    if (name == "custom")     return PartitionStrategy::Custom;
    return config_error("Unknown partitioning strategy: " + std::string{name});
}

Result<PartitionStrategy> validate_partition_config(const PartitionConfig& config) {
    if (config.num_partitions < 1) {
        return config_error("num_partitions must be at least 1");
    }
    return parse_partition_strategy(config.strategy);
}

Result<std::vector<Partition>> partition(const DatasetDescriptor& dataset,
                                         const PartitionConfig& config) {
    auto strategy = validate_partition_config(config);
    if (!strategy) return strategy.error();

    if (*strategy == PartitionStrategy::ByKey) {
        return by_key(dataset, config);
    }

    // Range strategies
    if (dataset.record_count == 0) {
        return config_error("Dataset " + dataset.reference + " declares no records");
    }
    if (config.num_partitions > dataset.record_count) {
        return config_error("num_partitions " + std::to_string(config.num_partitions)
                            + " exceeds record count "
                            + std::to_string(dataset.record_count));
    }

    if (*strategy == PartitionStrategy::Custom) {
        return custom(dataset, config);
    }
    return equal_size(dataset, config.num_partitions);
}

std::string describe(const PartitionScope& scope) {
    if (const auto* range = std::get_if<RecordRange>(&scope)) {
        return "records[" + std::to_string(range->begin) + ","
               + std::to_string(range->end) + ")";
    }
    const auto& filter = std::get<KeyFilter>(scope);
    std::string out = filter.key_field + " in {";
    for (size_t i = 0; i < filter.values.size(); ++i) {
        if (i > 0) out += ",";
        out += filter.values[i];
    }
    return out + "}";
}

}  // namespace verified_compute
