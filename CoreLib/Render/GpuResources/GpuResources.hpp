//============================================================
// GpuResources.hpp
//============================================================
#pragma once

struct RenderFrameContext;

/// Abstract GPU representation of a scene solid.
///
/// Backends provide concrete implementations that own GPU buffers and know
/// how to sync them from the CPU mesh of their owner.
class GpuResources
{
public:
    virtual ~GpuResources() noexcept = default;

    /// Ensure GPU buffers are up-to-date with the CPU mesh.
    ///
    /// Called outside a render pass; implementations may record transfer
    /// commands into fc.cmd and hand temporaries to fc.deferred.
    virtual void update(const RenderFrameContext& fc) = 0;

    /// True when the buffers can be bound for drawing.
    [[nodiscard]] virtual bool ready() const noexcept = 0;
};
