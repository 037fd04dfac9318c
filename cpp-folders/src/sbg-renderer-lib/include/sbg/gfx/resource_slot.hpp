#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: resource_slot.hpp
    MODULE: gfx
    PURPOSE: Front/back render target pair of one pass. Front holds the last completed
            frame and is what other passes sample; back is written by the pass this frame.
*/


#include <array>
#include <cstdint>
#include <string>
#include <utility>

#include "sbg/core/log.hpp"
#include "sbg/core/result.hpp"
#include "sbg/rhi/gpu_device.hpp"

namespace sbg
{
    class ResourceSlot
    {
    public:
        ResourceSlot() = default;

        ResourceSlot(const ResourceSlot&) = delete;
        ResourceSlot& operator=(const ResourceSlot&) = delete;

        ResourceSlot(ResourceSlot&& o) noexcept
        {
            *this = std::move(o);
        }

        ResourceSlot& operator=(ResourceSlot&& o) noexcept
        {
            if (this == &o) return *this;
            release();
            device_ = o.device_;
            desc_ = std::move(o.desc_);
            targets_ = o.targets_;
            front_ = o.front_;
            generation_ = o.generation_;
            o.device_ = nullptr;
            o.targets_ = {};
            return *this;
        }

        ~ResourceSlot()
        {
            release();
        }

        // Both targets are cleared to zero before first use.
        Status allocate(IGpuDevice& device, const RenderTargetDesc& desc)
        {
            release();
            device_ = &device;
            desc_ = desc;
            for (size_t i = 0; i < targets_.size(); ++i)
            {
                Result<TargetHandle> t = device.create_target(desc);
                if (!t.ok)
                {
                    release();
                    t.error.kind = ErrorKind::RuntimeGpu;
                    t.error.code = ErrorCode::ResourceAllocationFailed;
                    return Status::failure(std::move(t.error));
                }
                targets_[i] = t.value;
                device.clear_target(t.value);
            }
            front_ = 0;
            ++generation_;
            return Status::success();
        }

        // Discards content. No-op when the size is unchanged.
        Status resize(int width, int height)
        {
            if (!device_) return Status::success();
            if (desc_.width == width && desc_.height == height) return Status::success();
            RenderTargetDesc d = desc_;
            d.width = width;
            d.height = height;

            // The old targets stay until both new ones exist.
            std::array<TargetHandle, 2> fresh{};
            for (size_t i = 0; i < fresh.size(); ++i)
            {
                Result<TargetHandle> t = device_->create_target(d);
                if (!t.ok)
                {
                    for (TargetHandle& f : fresh)
                    {
                        if (f.valid()) device_->destroy_target(f);
                    }
                    t.error.kind = ErrorKind::RuntimeGpu;
                    t.error.code = ErrorCode::ResourceAllocationFailed;
                    return Status::failure(std::move(t.error));
                }
                fresh[i] = t.value;
                device_->clear_target(t.value);
            }

            IGpuDevice* device = device_;
            release();
            device_ = device;
            desc_ = d;
            targets_ = fresh;
            front_ = 0;
            ++generation_;
            log_debug("slot '" + d.label + "' reallocated at " + std::to_string(width) + "x" + std::to_string(height));
            return Status::success();
        }

        void release()
        {
            if (device_)
            {
                for (TargetHandle& t : targets_)
                {
                    if (t.valid()) device_->destroy_target(t);
                    t = TargetHandle{};
                }
            }
            targets_ = {};
            front_ = 0;
        }

        bool allocated() const { return targets_[0].valid() && targets_[1].valid(); }

        TargetHandle current() const { return targets_[front_]; }
        TargetHandle write_target() const { return targets_[front_ ^ 1u]; }

        void commit() { front_ ^= 1u; }

        const RenderTargetDesc& desc() const { return desc_; }
        glm::vec3 resolution() const { return glm::vec3((float)desc_.width, (float)desc_.height, 1.0f); }

        // Bumped on every (re)allocation.
        uint64_t generation() const { return generation_; }

    private:
        IGpuDevice* device_ = nullptr;
        RenderTargetDesc desc_{};
        std::array<TargetHandle, 2> targets_{};
        uint32_t front_ = 0;
        uint64_t generation_ = 0;
    };
}
