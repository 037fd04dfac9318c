#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: render_canvas.hpp
    MODULE: gfx
    PURPOSE: The set of resource slots one rendered canvas needs: a float slot per buffer
            pass, a fixed-size cube slot, and an RGBA8 image slot kept for cross-fading.
*/


#include <array>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "sbg/core/log.hpp"
#include "sbg/gfx/resource_slot.hpp"
#include "sbg/pipeline/render_graph.hpp"

namespace sbg
{
    inline constexpr int kCubemapFaceResolution = 1024;

    class RenderCanvas
    {
    public:
        explicit RenderCanvas(std::string label = {})
            : label_(std::move(label))
        {}

        Status allocate(IGpuDevice& device, const RenderGraph& graph, glm::ivec2 size)
        {
            size_ = size;
            for (ResourceSlot& s : slots_) s.release();
            for (const GraphPass& p : graph.passes)
            {
                Status st = slot(p.id).allocate(device, slot_desc(p.id, size));
                if (!st.ok) return st;
            }
            return Status::success();
        }

        // Scale or monitor geometry changed. The cube slot keeps its fixed face size.
        Status resize(glm::ivec2 size)
        {
            if (size == size_) return Status::success();
            std::vector<PassId> resized{};
            for (PassId id : kPassOrder)
            {
                ResourceSlot& s = slot(id);
                if (!s.allocated() || id == PassId::CubeA) continue;
                Status st = s.resize(size.x, size.y);
                if (!st.ok)
                {
                    // Slots keep matching sizes: put back the ones already done.
                    for (PassId done : resized)
                    {
                        Status back = slot(done).resize(size_.x, size_.y);
                        if (!back.ok) log_error("slot '" + std::string(pass_id_name(done)) + "' lost: " + back.error.describe());
                    }
                    return st;
                }
                resized.push_back(id);
            }
            size_ = size;
            return Status::success();
        }

        void commit_all()
        {
            for (ResourceSlot& s : slots_)
            {
                if (s.allocated()) s.commit();
            }
        }

        ResourceSlot& slot(PassId id) { return slots_[pass_index(id)]; }
        const ResourceSlot& slot(PassId id) const { return slots_[pass_index(id)]; }

        glm::ivec2 size() const { return size_; }
        const std::string& label() const { return label_; }

        RenderTargetDesc slot_desc(PassId id, glm::ivec2 size) const
        {
            RenderTargetDesc d{};
            d.label = label_ + "/" + pass_id_name(id);
            if (id == PassId::CubeA)
            {
                d.dimension = TextureDimension::Cubemap;
                d.format = TargetFormat::RGBA32F;
                d.width = kCubemapFaceResolution;
                d.height = kCubemapFaceResolution;
                return d;
            }
            d.dimension = TextureDimension::Texture2D;
            d.format = id == PassId::Image ? TargetFormat::RGBA8 : TargetFormat::RGBA32F;
            d.width = size.x;
            d.height = size.y;
            return d;
        }

    private:
        std::string label_{};
        glm::ivec2 size_{0};
        std::array<ResourceSlot, kPassCount> slots_{};
    };
}
