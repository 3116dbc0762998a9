#pragma once

#include "transfer/tasks/TransferTask.hpp"

namespace skiff::transfer::tasks {

struct Upload final : TransferTask {
    Upload(Context ctx, std::string transferId);

protected:
    void run() override;
};

}
