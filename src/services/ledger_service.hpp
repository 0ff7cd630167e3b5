/**
 * @file ledger_service.hpp
 * @brief Interface to the ledger that bills compute and records results.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>

namespace verified_compute {

struct PaymentReceipt {
    std::string receipt_id;
    double amount{0.0};
    std::string recipient;

    bool operator==(const PaymentReceipt&) const = default;
};

using TransactionReference = std::string;

/**
 * @brief Ledger submission. Failures are reported as LedgerSubmissionFailed.
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    virtual Result<PaymentReceipt> pay(double amount, const std::string& recipient) = 0;
    virtual Result<TransactionReference> record(const std::string& result_hash,
                                                const JobId& job_id) = 0;
};

}  // namespace verified_compute
