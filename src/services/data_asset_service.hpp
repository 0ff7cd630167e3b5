/**
 * @file data_asset_service.hpp
 * @brief Interface to the service that stores datasets and algorithms.
 */

#pragma once

#include "core/result.hpp"
#include "partition/partitioner.hpp"

#include <filesystem>
#include <string>

namespace verified_compute {

/**
 * @brief What the asset service knows about one stored asset.
 *
 * For datasets, `dataset` carries the record count and key domains the
 * partitioner needs.
 */
struct AssetMetadata {
    DatasetDescriptor dataset;
    std::string name;
    std::string checksum;       ///< Hex SHA-256 of the asset contents
    std::string owner;
};

/**
 * @brief Resolve, fetch and publish assets by reference.
 *
 * Every failure is reported as AssetUnavailable.
 */
class IDataAssetService {
public:
    virtual ~IDataAssetService() = default;

    virtual Result<AssetMetadata> resolve(const std::string& reference) = 0;
    virtual Result<std::filesystem::path> download(const std::string& reference) = 0;
    virtual Result<std::string> upload(const std::filesystem::path& local_path,
                                       const AssetMetadata& metadata) = 0;
};

}  // namespace verified_compute
