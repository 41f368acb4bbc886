#pragma once

namespace vmchecker {

/// Collects kernel messages emitted by the guest while a campaign runs.
/// Neither call reports a status; implementations log their own failures.
class KernelListener
{
public:
    virtual ~KernelListener() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
};

} // namespace vmchecker
