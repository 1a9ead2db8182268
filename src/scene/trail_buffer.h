#pragma once

#include <core/config.h>
#include <core/world.h>

#include <cstddef>
#include <span>
#include <vector>

namespace OrbitView
{
    // ============================================================================
    // TrailBuffer: fixed-capacity ring of scene-space points backing one trail line.
    //
    // All slots start at the origin. record() overwrites the slot under the cursor
    // and advances it modulo capacity; the buffer never grows or shrinks.
    //
    // as_vertex_array() exposes the storage in slot order, not chronological
    // order. Once the ring wraps, the line drawn from it contains one segment
    // joining the newest point to the slot that will be overwritten next.
    // ============================================================================

    class TrailBuffer
    {
    public:
        // Throws std::invalid_argument when capacity is zero or too large to address.
        explicit TrailBuffer(size_t capacity = kDefaultTrailCapacity);

        void record(const SceneVec3 &point);

        // Flat x,y,z floats over the live storage. Valid until the buffer is destroyed.
        std::span<const float> as_vertex_array() const { return _vertices; }

        SceneVec3 point(size_t slot) const;

        size_t capacity() const { return _capacity; }
        size_t cursor() const { return _cursor; }

        // Total record() calls since construction (not bounded by capacity).
        size_t recorded() const { return _recorded; }

    private:
        std::vector<float> _vertices;
        size_t _capacity{0};
        size_t _cursor{0};
        size_t _recorded{0};
    };
} // namespace OrbitView
