#ifndef FUNDING_OPERATION_HPP_
#define FUNDING_OPERATION_HPP_

#include "core/result.hpp"
#include "core/validation.hpp"
#include "observability/metrics.hpp"
#include "storage/ledger_store.hpp"

namespace ledger {

/**
 * Credits an account from an external funding source.
 *
 * Validation, the ownership check, the account status check, the transaction
 * append and the balance adjustment all happen inside one read-write unit of
 * work holding the account row lock. Both written rows are read back before
 * commit; the balance reported to the caller is the engine's value.
 */
class FundingOperation {
 public:
  FundingOperation(storage::LedgerStore& store,
                   const core::FundingLimits& limits,
                   observability::MetricsCollector& metrics);

  core::Result<core::FundingResult> execute(core::OwnerId caller,
                                            const core::FundingRequest& request);

  static std::string describe(core::FundingSourceType source);

 private:
  core::Result<core::FundingResult> apply(core::OwnerId caller,
                                          const core::FundingRequest& request);

  storage::LedgerStore& store_;
  core::FundingLimits limits_;
  observability::MetricsCollector& metrics_;
};

}  // namespace ledger

#endif  // FUNDING_OPERATION_HPP_
