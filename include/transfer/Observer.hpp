#pragma once

#include "transfer/model/Transfer.hpp"

#include <string>
#include <vector>

namespace skiff::transfer {

// Lifecycle events for the presentation layer. Handlers run on the thread that
// made the change, after the manager has released the transfer's state lock.
// Events of one transfer are delivered one at a time in the order the changes
// happened; a status or progress event that a newer one has already overtaken
// is dropped. A handler must not wait on another thread that changes the same
// transfer.
class Observer {
public:
    virtual ~Observer() = default;

    virtual void onTransferCreated(const model::Transfer&) {}
    virtual void onFileAdded(const std::string& /*transferId*/, const model::FileTransfer&) {}
    virtual void onStatusChanged(const model::Transfer&) {}
    virtual void onProgress(const std::string& /*transferId*/, double /*fraction*/, double /*bytesPerSecond*/) {}
    virtual void onTransferFinished(const model::Transfer&) {}
    virtual void onTransfersCleared(const std::vector<std::string>& /*transferIds*/) {}
};

}
