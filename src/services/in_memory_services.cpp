/**
 * @file in_memory_services.cpp
 * @brief InMemoryAssetService and InMemoryLedger implementations.
 */

#include "services/in_memory_services.hpp"

#include <system_error>

namespace verified_compute {

// ─────────────────────────────────────────────
// InMemoryAssetService
// ─────────────────────────────────────────────

InMemoryAssetService::InMemoryAssetService(std::filesystem::path storage_root)
    : root_(std::move(storage_root)) {}

void InMemoryAssetService::register_asset(const std::string& reference, AssetMetadata metadata) {
    std::lock_guard lock(mutex_);
    metadata.dataset.reference = reference;
    assets_[reference] = std::move(metadata);
}

void InMemoryAssetService::register_dataset(
    const std::string& reference, uint64_t record_count,
    std::map<std::string, std::vector<std::string>> key_domains) {
    AssetMetadata meta{
        .dataset = DatasetDescriptor{
            .reference = reference,
            .record_count = record_count,
            .key_domains = std::move(key_domains)
        },
        .name = reference,
        .checksum = {},
        .owner = "local"
    };
    register_asset(reference, std::move(meta));
}

Result<AssetMetadata> InMemoryAssetService::resolve(const std::string& reference) {
    if (!available_) {
        return make_error<AssetMetadata>(ErrorCode::AssetUnavailable,
                                         "Asset service unavailable");
    }
    std::lock_guard lock(mutex_);
    auto it = assets_.find(reference);
    if (it == assets_.end()) {
        return make_error<AssetMetadata>(ErrorCode::AssetUnavailable,
                                         "Unknown asset: " + reference);
    }
    return it->second;
}

Result<std::filesystem::path> InMemoryAssetService::download(const std::string& reference) {
    if (!available_) {
        return make_error<std::filesystem::path>(ErrorCode::AssetUnavailable,
                                                 "Asset service unavailable");
    }
    std::lock_guard lock(mutex_);
    auto it = files_.find(reference);
    if (it == files_.end()) {
        return make_error<std::filesystem::path>(ErrorCode::AssetUnavailable,
                                                 "No stored content for asset: " + reference);
    }
    return it->second;
}

Result<std::string> InMemoryAssetService::upload(const std::filesystem::path& local_path,
                                                 const AssetMetadata& metadata) {
    if (!available_) {
        return make_error<std::string>(ErrorCode::AssetUnavailable,
                                       "Asset service unavailable");
    }

    std::lock_guard lock(mutex_);
    std::string reference = "asset-" + std::to_string(next_upload_++);

    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return make_error<std::string>(ErrorCode::AssetUnavailable,
                                       "Cannot create storage root: " + ec.message());
    }
    auto target = root_ / (reference + local_path.extension().string());
    std::filesystem::copy_file(local_path, target,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return make_error<std::string>(ErrorCode::AssetUnavailable,
                                       "Upload of " + local_path.string() + " failed: " +
                                           ec.message());
    }

    AssetMetadata stored = metadata;
    stored.dataset.reference = reference;
    assets_[reference] = std::move(stored);
    files_[reference] = target;
    return reference;
}

size_t InMemoryAssetService::asset_count() const {
    std::lock_guard lock(mutex_);
    return assets_.size();
}

// ─────────────────────────────────────────────
// InMemoryLedger
// ─────────────────────────────────────────────

Result<PaymentReceipt> InMemoryLedger::pay(double amount, const std::string& recipient) {
    if (fail_payments_) {
        return make_error<PaymentReceipt>(ErrorCode::LedgerSubmissionFailed,
                                          "Payment rejected by ledger");
    }
    if (amount < 0.0 || recipient.empty()) {
        return make_error<PaymentReceipt>(ErrorCode::LedgerSubmissionFailed,
                                          "Invalid payment to '" + recipient + "'");
    }

    std::lock_guard lock(mutex_);
    PaymentReceipt receipt{
        .receipt_id = "pay-" + std::to_string(payments_.size() + 1),
        .amount = amount,
        .recipient = recipient
    };
    payments_.push_back(receipt);
    return receipt;
}

Result<TransactionReference> InMemoryLedger::record(const std::string& result_hash,
                                                    const JobId& job_id) {
    if (fail_records_) {
        return make_error<TransactionReference>(ErrorCode::LedgerSubmissionFailed,
                                                "Record rejected by ledger");
    }

    std::lock_guard lock(mutex_);
    TransactionReference ref = "tx-" + std::to_string(records_.size() + 1);
    records_.push_back(RecordEntry{.result_hash = result_hash, .job_id = job_id, .reference = ref});
    return ref;
}

std::vector<PaymentReceipt> InMemoryLedger::payments() const {
    std::lock_guard lock(mutex_);
    return payments_;
}

std::vector<InMemoryLedger::RecordEntry> InMemoryLedger::records() const {
    std::lock_guard lock(mutex_);
    return records_;
}

}  // namespace verified_compute
