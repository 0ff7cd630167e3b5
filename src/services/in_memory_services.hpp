/**
 * @file in_memory_services.hpp
 * @brief Process-local asset service and ledger for the CLI and tests.
 */

#pragma once

#include "services/data_asset_service.hpp"
#include "services/ledger_service.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace verified_compute {

/**
 * @brief Asset registry backed by a local directory.
 *
 * Datasets are registered with their descriptor only; uploaded files are
 * copied under the storage root and become downloadable.
 */
class InMemoryAssetService : public IDataAssetService {
public:
    explicit InMemoryAssetService(std::filesystem::path storage_root);

    void register_asset(const std::string& reference, AssetMetadata metadata);

    /// Register a dataset of `record_count` records under `reference`.
    void register_dataset(const std::string& reference, uint64_t record_count,
                          std::map<std::string, std::vector<std::string>> key_domains = {});

    /// Simulate an outage: every call fails with AssetUnavailable.
    void set_available(bool available) noexcept { available_ = available; }

    Result<AssetMetadata> resolve(const std::string& reference) override;
    Result<std::filesystem::path> download(const std::string& reference) override;
    Result<std::string> upload(const std::filesystem::path& local_path,
                               const AssetMetadata& metadata) override;

    [[nodiscard]] size_t asset_count() const;

private:
    std::filesystem::path root_;
    std::atomic<bool> available_{true};
    uint64_t next_upload_ = 1;

    mutable std::mutex mutex_;
    std::map<std::string, AssetMetadata> assets_;
    std::map<std::string, std::filesystem::path> files_;
};

/**
 * @brief Ledger that keeps payments and result records in memory.
 */
class InMemoryLedger : public ILedgerService {
public:
    struct RecordEntry {
        std::string result_hash;
        JobId job_id;
        TransactionReference reference;
    };

    void set_fail_payments(bool fail) noexcept { fail_payments_ = fail; }
    void set_fail_records(bool fail) noexcept { fail_records_ = fail; }

    Result<PaymentReceipt> pay(double amount, const std::string& recipient) override;
    Result<TransactionReference> record(const std::string& result_hash,
                                        const JobId& job_id) override;

    [[nodiscard]] std::vector<PaymentReceipt> payments() const;
    [[nodiscard]] std::vector<RecordEntry> records() const;

private:
    std::atomic<bool> fail_payments_{false};
    std::atomic<bool> fail_records_{false};

    mutable std::mutex mutex_;
    std::vector<PaymentReceipt> payments_;
    std::vector<RecordEntry> records_;
};

}  // namespace verified_compute
