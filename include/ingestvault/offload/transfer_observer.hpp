#ifndef INGESTVAULT_TRANSFER_OBSERVER_HPP
#define INGESTVAULT_TRANSFER_OBSERVER_HPP

#include "ingestvault/offload/transfer_record.hpp"

namespace ingestvault {

/**
 * @brief Progress subscriber for UI/CLI layers.
 *
 * Called from whichever worker thread owns the record, once per status
 * change. Implementations must be thread-safe and must not block for long.
 */
class TransferObserver {
public:
  virtual ~TransferObserver() = default;
  virtual void onTransferUpdate(const TransferRecord &record) = 0;
};

} // namespace ingestvault

#endif // INGESTVAULT_TRANSFER_OBSERVER_HPP
