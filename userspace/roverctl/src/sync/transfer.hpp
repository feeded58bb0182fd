// sync/transfer.hpp - Remote file fetch
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "../conf/sync_config.hpp"

namespace roverctl {

struct TransferResult {
    bool ok;
    int exit_code;
    bool timed_out;
    std::string message;
    uint64_t bytes;
};

class Transfer {
public:
    virtual ~Transfer() = default;

    // One copy attempt; never throws
    virtual TransferResult fetch() = 0;
    virtual std::string describe() const = 0;
};

// Copies the remote file with scp into a hidden .part file next to the
// mirror and renames it into place, so a failed copy never truncates the
// last good mirror.
class ScpTransfer : public Transfer {
public:
    explicit ScpTransfer(SyncSettings settings);

    TransferResult fetch() override;
    std::string describe() const override;

    std::vector<std::string> argv() const;
    std::string destination() const;
    std::string part_path() const;

private:
    SyncSettings settings_;
};

}  // namespace roverctl
