#pragma once

#include "transfer/tasks/TransferTask.hpp"

namespace skiff::transfer::tasks {

struct Download final : TransferTask {
    Download(Context ctx, std::string transferId);

protected:
    void run() override;
};

}
